// meter/broadcast_server.cpp
#include "broadcast_server.hpp"
#include "logger.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace {

constexpr int SEND_TIMEOUT_SECONDS = 2;

}

BroadcastServer::BroadcastServer(int p, size_t threads)
    : port(p),
      thread_count(threads > 0 ? threads : 1) {}

BroadcastServer::~BroadcastServer() {
    request_stop();
    disconnect_clients();
    thread_pool.reset();

    int fd = server_fd.exchange(-1);
    if (fd != -1) {
        close(fd);
    }
}

bool BroadcastServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        Logger::error("Socket creation failed: " + std::string(std::strerror(errno)));
        return false;
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Bind failed on port " + std::to_string(port) + ": " + std::strerror(errno));
        close(fd);
        return false;
    }

    if (listen(fd, 16) < 0) {
        Logger::error("Listen failed: " + std::string(std::strerror(errno)));
        close(fd);
        return false;
    }

    // Port 0 asks the kernel for a free one
    socklen_t len = sizeof(address);
    if (getsockname(fd, (struct sockaddr*)&address, &len) == 0) {
        port = ntohs(address.sin_port);
    }

    thread_pool = std::make_unique<ThreadPool>(thread_count);
    server_fd.store(fd);

    Logger::success("Live broadcast server listening on port " + std::to_string(port) +
                    " (threads=" + std::to_string(thread_count) + ")");
    return true;
}

void BroadcastServer::run() {
    if (server_fd.load() == -1) {
        Logger::error("Server not started - call start() first");
        return;
    }

    Logger::info("Server running - waiting for live clients...");

    while (!done.load()) {
        struct sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd.load(), (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (!done.load() && errno != EINTR) {
                Logger::error("Accept failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }
        if (done.load()) {
            close(client_fd);
            break;
        }

        struct timeval timeout{};
        timeout.tv_sec = SEND_TIMEOUT_SECONDS;
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        {
            std::lock_guard<std::mutex> lock(clients_mutex);
            clients.insert(client_fd);
        }

        bool queued = thread_pool->enqueue([this, client_fd]() {
            handle_client(client_fd);
        });
        if (!queued) {
            std::lock_guard<std::mutex> lock(clients_mutex);
            clients.erase(client_fd);
            close(client_fd);
        }
    }

    disconnect_clients();
    thread_pool.reset();
    Logger::info("Server stopped accepting connections");
}

void BroadcastServer::request_stop() noexcept {
    done.store(true);
    int fd = server_fd.load();
    if (fd != -1) {
        shutdown(fd, SHUT_RDWR);
    }
}

void BroadcastServer::disconnect_clients() {
    std::lock_guard<std::mutex> lock(clients_mutex);
    for (int fd : clients) {
        shutdown(fd, SHUT_RDWR);
    }
}

size_t BroadcastServer::client_count() {
    std::lock_guard<std::mutex> lock(clients_mutex);
    return clients.size();
}

void BroadcastServer::handle_client(int client_fd) {
    Logger::info("Live client connected (fd " + std::to_string(client_fd) + ")");

    std::string line;
    while (!done.load() && read_line(client_fd, line)) {
        if (line.empty()) continue;

        nlohmann::json reply = dispatch(line);
        std::lock_guard<std::mutex> lock(clients_mutex);
        if (clients.count(client_fd) == 0 || !send_line(client_fd, reply.dump() + "\n")) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex);
        clients.erase(client_fd);
    }
    close(client_fd);
    Logger::info("Live client disconnected (fd " + std::to_string(client_fd) + ")");
}

nlohmann::json BroadcastServer::dispatch(const std::string& line) {
    ControlSurface* surface = control.load();
    if (!surface) {
        return {{"error", "control surface unavailable"}};
    }

    try {
        nlohmann::json request = nlohmann::json::parse(line);
        return surface->handle_command(request);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::warning("Malformed command from live client: " + std::string(e.what()));
        return {{"error", "invalid JSON"}};
    } catch (const std::exception& e) {
        Logger::error("Command failed: " + std::string(e.what()));
        return {{"error", e.what()}};
    }
}

bool BroadcastServer::read_line(int fd, std::string& line) {
    line.clear();
    char c;
    while (true) {
        ssize_t n = recv(fd, &c, 1, 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        if (c == '\n') return true;
        if (c == '\r') continue;
        if (line.size() >= MAX_COMMAND_LENGTH) {
            Logger::warning("Command too long from live client, dropping it");
            return false;
        }
        line += c;
    }
}

// Called with clients_mutex held
bool BroadcastServer::send_line(int fd, const std::string& line) {
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = send(fd, line.data() + total, line.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

void BroadcastServer::emit(const std::string& event, const nlohmann::json& payload) {
    std::string line;
    try {
        line = nlohmann::json{{"event", event}, {"data", payload}}.dump() + "\n";
    } catch (const std::exception& e) {
        Logger::error("Failed to encode " + event + ": " + e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(clients_mutex);
    std::vector<int> failed;
    for (int fd : clients) {
        if (!send_line(fd, line)) {
            failed.push_back(fd);
        }
    }
    for (int fd : failed) {
        Logger::warning("Dropping live client (fd " + std::to_string(fd) + ") after failed send");
        clients.erase(fd);
        shutdown(fd, SHUT_RDWR);
    }
}
