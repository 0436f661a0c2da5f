// meter/coordinator.hpp
#pragma once
#include "broadcast_sink.hpp"
#include "bus_client.hpp"
#include "config_store.hpp"
#include "reading_source.hpp"
#include <memory>
#include <mutex>
#include <string>

enum class ControlOrigin { UI, MQTT };

inline const char* origin_name(ControlOrigin origin) {
    return origin == ControlOrigin::UI ? "UI" : "MQTT";
}

// Owns both channels and the bus client, and routes readings, control
// actions and config changes between them.
class Coordinator : public ReadingSink, public ControlHandler, public ControlSurface {
private:
    // Lets a config listener outlive the coordinator it points at
    struct ListenerGuard {
        std::mutex mutex;
        Coordinator* owner{nullptr};
    };

    ConfigStore& config_store;
    BroadcastSink& broadcast;
    std::string cert_dir;

    // Declared ahead of the bus client and the sources, which use them
    // until they are torn down
    std::mutex publish_emit_mutex;   // keeps each reading's publish and emit together
    std::mutex apply_mutex;
    bool started{false};
    std::shared_ptr<ListenerGuard> listener_guard;
    ConfigStore::ListenerId listener_id{0};

    BusClient bus_client;
    ReadingSource consumer;
    ReadingSource generator;

    Coordinator(ConfigStore& store, BroadcastSink& sink, BusTransportFactory& transports,
                const MeterConfig& initial, std::string cert_dir);

    void safe_emit(const std::string& event, const nlohmann::json& payload);
    void apply_config_locked(const MeterConfig& config);
    void on_config_changed();

public:
    Coordinator(ConfigStore& store, BroadcastSink& sink, BusTransportFactory& transports,
                std::string cert_dir = DEFAULT_CERT_DIR);

    // Detaches from the config store and stops the bus client, so no
    // listener or control message reaches the sources while they shut down.
    ~Coordinator() override;

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Subscribes to config changes, starts both channels and the bus client.
    // Only the first call has any effect.
    void start();

    // Pushes interval bounds to both channels and restarts the bus client
    // with the new settings.
    void apply_config(const MeterConfig& config);

    // PAUSE or RESUME (case-insensitive) on both channels, announced to live
    // viewers. Returns false and changes nothing for any other action.
    bool apply_action(const std::string& action, ControlOrigin origin);

    bool bus_connected() const { return bus_client.is_connected(); }
    void set_log_readings(bool enabled);

    ReadingSource& consumer_source() { return consumer; }
    ReadingSource& generator_source() { return generator; }
    BusClient& bus() { return bus_client; }

    void on_reading(const MeterReading& reading) override;
    void on_control_message(const std::string& payload) override;
    nlohmann::json handle_command(const nlohmann::json& request) override;
};
