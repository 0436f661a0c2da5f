// meter/reading_source.hpp
#pragma once
#include "../common/protocol.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>

// Receives every reading a source produces, on the source's own thread
class ReadingSink {
public:
    virtual ~ReadingSink() = default;
    virtual void on_reading(const MeterReading& reading) = 0;
};

// One synthetic sample: voltage in [210, 240] V, current in [0.1, 10.0] A,
// power = voltage * current, all rounded to 2 decimals.
MeterReading generate_reading(Channel channel, const std::string& ip_addr, std::mt19937& rng);

// Outbound IPv4 address of this host, or 127.0.0.1 if it cannot be determined
std::string local_ip_address();

class ReadingSource {
public:
    enum class State { Stopped, Running, Paused };

private:
    Channel channel;
    std::string ip_addr;
    ReadingSink& sink;
    std::mt19937 rng;   // generation thread only

    mutable std::mutex state_mutex;
    std::condition_variable wake;
    bool started{false};
    bool paused{false};
    bool interval_changed{false};
    bool shutdown{false};
    double interval_lower;
    double interval_upper;
    bool log_readings{true};

    std::thread worker;

    void run();
    void produce();
    std::chrono::steady_clock::duration draw_interval();

public:
    ReadingSource(Channel channel, double lower, double upper, ReadingSink& sink,
                  std::string ip_addr = local_ip_address());
    ~ReadingSource();

    ReadingSource(const ReadingSource&) = delete;
    ReadingSource& operator=(const ReadingSource&) = delete;

    // Spawns the generation thread. Only the first call does anything;
    // later calls log a warning and return false.
    bool start();

    // Readings stop until resume(); the generation thread keeps running.
    void pause();
    void resume();

    // Takes effect for the sleep in progress, measured from the last cycle start.
    // Bounds are clamped to [0, MAX_INTERVAL_SECONDS] when drawn.
    void set_interval(double lower, double upper);
    std::pair<double, double> interval() const;

    State state() const;
    Channel get_channel() const { return channel; }
    const char* name() const { return channel_name(channel); }
    const std::string& address() const { return ip_addr; }

    void set_log_readings(bool enabled);
};
