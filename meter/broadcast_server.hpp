// meter/broadcast_server.hpp
#pragma once
#include "broadcast_sink.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

constexpr int DEFAULT_BROADCAST_PORT = 5000;
constexpr size_t MAX_COMMAND_LENGTH = 64 * 1024;

// Newline-delimited JSON over TCP. Every event goes to every connected
// client as {"event": ..., "data": ...}; each line a client sends is a
// command answered with one reply line.
class BroadcastServer : public BroadcastSink {
private:
    std::atomic<int> server_fd{-1};
    int port;
    size_t thread_count;
    std::unique_ptr<ThreadPool> thread_pool;
    std::atomic<ControlSurface*> control{nullptr};
    std::atomic<bool> done{false};

    // Guards the set and every write to a client socket
    std::mutex clients_mutex;
    std::set<int> clients;

    void handle_client(int client_fd);
    bool read_line(int fd, std::string& line);
    bool send_line(int fd, const std::string& line);
    nlohmann::json dispatch(const std::string& line);
    void disconnect_clients();

public:
    explicit BroadcastServer(int port = DEFAULT_BROADCAST_PORT, size_t threads = 8);
    ~BroadcastServer() override;

    BroadcastServer(const BroadcastServer&) = delete;
    BroadcastServer& operator=(const BroadcastServer&) = delete;

    void attach(ControlSurface& surface) { control.store(&surface); }

    bool start();
    // Accepts clients until request_stop(), then disconnects them and joins the workers
    void run();
    // Safe to call from a signal handler
    void request_stop() noexcept;

    int bound_port() const { return port; }
    size_t client_count();

    void emit(const std::string& event, const nlohmann::json& payload) override;
};
