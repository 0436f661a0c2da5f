// meter/reading_source.cpp
#include "reading_source.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string local_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

}

MeterReading generate_reading(Channel channel, const std::string& ip_addr, std::mt19937& rng) {
    std::uniform_real_distribution<double> voltage_dist(210.0, 240.0);
    std::uniform_real_distribution<double> current_dist(0.1, 10.0);

    MeterReading reading;
    reading.channel = channel;
    reading.ip_addr = ip_addr;
    reading.voltage = std::clamp(round2(voltage_dist(rng)), 210.0, 240.0);
    reading.current = std::clamp(round2(current_dist(rng)), 0.1, 10.0);
    reading.power = round2(reading.voltage * reading.current);
    reading.timestamp = local_timestamp();
    return reading;
}

std::string local_ip_address() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        Logger::warning("Failed to get local IP, defaulting to 127.0.0.1");
        return "127.0.0.1";
    }

    // No packet is sent; connect() only selects the outbound interface
    struct sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    struct sockaddr_in local{};
    socklen_t local_len = sizeof(local);
    char buf[INET_ADDRSTRLEN] = {0};

    bool ok = connect(fd, (struct sockaddr*)&remote, sizeof(remote)) == 0 &&
              getsockname(fd, (struct sockaddr*)&local, &local_len) == 0 &&
              inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) != nullptr;
    close(fd);

    if (!ok) {
        Logger::warning("Failed to get local IP, defaulting to 127.0.0.1");
        return "127.0.0.1";
    }
    return buf;
}

ReadingSource::ReadingSource(Channel ch, double lower, double upper, ReadingSink& s, std::string ip)
    : channel(ch),
      ip_addr(std::move(ip)),
      sink(s),
      rng(std::random_device{}()),
      interval_lower(lower),
      interval_upper(upper) {}

ReadingSource::~ReadingSource() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        shutdown = true;
    }
    wake.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool ReadingSource::start() {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (started) {
        Logger::warning(std::string("[") + name() + "] Reading source already started");
        return false;
    }

    try {
        worker = std::thread(&ReadingSource::run, this);
    } catch (const std::system_error& e) {
        Logger::error(std::string("[") + name() + "] Failed to start generation thread: " + e.what());
        return false;
    }
    started = true;
    Logger::success(std::string("[") + name() + "] Reading source started");
    return true;
}

void ReadingSource::pause() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        paused = true;
    }
    Logger::info(std::string("[") + name() + "] Reading source paused");
}

void ReadingSource::resume() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        paused = false;
    }
    Logger::info(std::string("[") + name() + "] Reading source resumed");
}

void ReadingSource::set_interval(double lower, double upper) {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        interval_lower = lower;
        interval_upper = upper;
        interval_changed = true;
    }
    wake.notify_all();

    std::stringstream ss;
    ss << "[" << name() << "] Interval set to " << lower << "-" << upper << "s";
    Logger::info(ss.str());
}

std::pair<double, double> ReadingSource::interval() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return {interval_lower, interval_upper};
}

ReadingSource::State ReadingSource::state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (!started) return State::Stopped;
    return paused ? State::Paused : State::Running;
}

void ReadingSource::set_log_readings(bool enabled) {
    std::lock_guard<std::mutex> lock(state_mutex);
    log_readings = enabled;
}

// Called with state_mutex held
std::chrono::steady_clock::duration ReadingSource::draw_interval() {
    auto bounded = [](double seconds) {
        if (!(seconds > 0.0)) return 0.0;
        return std::min(seconds, MAX_INTERVAL_SECONDS);
    };
    double lower = bounded(interval_lower);
    double upper = bounded(interval_upper);
    if (lower > upper) std::swap(lower, upper);

    double seconds = lower;
    if (upper > lower) {
        std::uniform_real_distribution<double> dist(lower, upper);
        seconds = dist(rng);
    }
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

void ReadingSource::produce() {
    MeterReading reading = generate_reading(channel, ip_addr, rng);

    // Checked last, so a pause that lands while the sample is generated still wins
    bool log_this;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (paused || shutdown) {
            Logger::debug(std::string("[") + name() + "] Dropped reading generated before pause");
            return;
        }
        log_this = log_readings;
    }

    try {
        sink.on_reading(reading);
    } catch (const std::exception& e) {
        Logger::error(std::string("[") + name() + "] Delivery error: " + e.what());
    }

    if (log_this) {
        std::stringstream ss;
        ss << "[" << name() << "] Reading: "
           << std::fixed << std::setprecision(2)
           << "V=" << reading.voltage << "V, I=" << reading.current
           << "A, P=" << reading.power << "W at " << reading.timestamp;
        Logger::info(ss.str());
    }
}

void ReadingSource::run() {
    Logger::debug(std::string("[") + name() + "] Generation loop started");

    std::unique_lock<std::mutex> lock(state_mutex);
    while (!shutdown) {
        auto cycle_start = std::chrono::steady_clock::now();
        bool produce_now = !paused;

        lock.unlock();
        try {
            if (produce_now) {
                produce();
            }
        } catch (const std::exception& e) {
            Logger::error(std::string("[") + name() + "] Reading source error: " + e.what());
        }
        lock.lock();

        interval_changed = false;
        auto sleep_for = draw_interval();
        auto deadline = cycle_start + sleep_for;
        Logger::debug(std::string("[") + name() + "] Sleeping for " +
                      std::to_string(std::chrono::duration<double>(sleep_for).count()) + "s");

        while (!shutdown) {
            bool woken = wake.wait_until(lock, deadline, [this] { return shutdown || interval_changed; });
            if (!woken || shutdown) break;

            interval_changed = false;
            deadline = cycle_start + draw_interval();
        }
    }

    Logger::debug(std::string("[") + name() + "] Generation loop stopped");
}
