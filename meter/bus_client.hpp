// meter/bus_client.hpp
#pragma once
#include "bus_transport.hpp"
#include "config_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

constexpr int BUS_KEEPALIVE_SECONDS = 60;

// Receives plain-text payloads from the control topic
class ControlHandler {
public:
    virtual ~ControlHandler() = default;
    virtual void on_control_message(const std::string& payload) = 0;
};

// A live connection together with the settings it was opened with.
// Replaced as a whole on every restart.
struct BusSession {
    std::unique_ptr<BusTransport> transport;
    MeterConfig config;
    std::string client_id;
};

class BusClient : private BusEventHandler {
private:
    BusTransportFactory& factory;
    std::string cert_dir;
    std::atomic<ControlHandler*> control_handler;

    MeterConfig config;
    std::unique_ptr<BusSession> session;
    mutable std::mutex client_mutex;

    void stop_locked();

    void on_connect(BusTransport& transport, int rc) override;
    void on_disconnect(int rc) override;
    void on_message(const std::string& topic, const std::string& payload) override;

public:
    BusClient(BusTransportFactory& factory, MeterConfig config,
              std::string cert_dir = DEFAULT_CERT_DIR,
              ControlHandler* handler = nullptr);
    ~BusClient() override;

    BusClient(const BusClient&) = delete;
    BusClient& operator=(const BusClient&) = delete;

    void set_control_handler(ControlHandler* handler) { control_handler.store(handler); }

    // Settings used by the next start_client() and by safe_publish()
    void configure(const MeterConfig& new_config);
    MeterConfig current_config() const;

    // Drops any existing connection, then connects with the current settings.
    // Returns false when no host is configured or the connection failed.
    bool start_client();
    void stop_client();

    // Sends to PUB_TOPIC if publishing is enabled and a connection is up.
    // JSON strings are sent verbatim, everything else as serialized JSON.
    void safe_publish(const nlohmann::json& payload);

    bool is_connected() const noexcept;
    std::string client_id() const;
};
