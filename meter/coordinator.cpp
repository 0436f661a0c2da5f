// meter/coordinator.cpp
#include "coordinator.hpp"
#include "logger.hpp"
#include "../common/protocol.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string normalize_action(const std::string& action) {
    auto begin = std::find_if_not(action.begin(), action.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(action.rbegin(), action.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

nlohmann::json error_reply(const std::string& message) {
    return nlohmann::json{{"error", message}};
}

}

Coordinator::Coordinator(ConfigStore& store, BroadcastSink& sink, BusTransportFactory& transports,
                         std::string dir)
    : Coordinator(store, sink, transports, store.all(), std::move(dir)) {}

Coordinator::Coordinator(ConfigStore& store, BroadcastSink& sink, BusTransportFactory& transports,
                         const MeterConfig& initial, std::string dir)
    : config_store(store),
      broadcast(sink),
      cert_dir(dir),
      bus_client(transports, initial, dir, this),
      consumer(Channel::Load, initial.interval_consumed_lower, initial.interval_consumed_upper, *this),
      generator(Channel::Generator, initial.interval_generated_lower, initial.interval_generated_upper, *this) {}

Coordinator::~Coordinator() {
    if (listener_guard) {
        config_store.remove_listener(listener_id);
        // Waits out a listener that is applying a config right now
        std::lock_guard<std::mutex> lock(listener_guard->mutex);
        listener_guard->owner = nullptr;
    }

    bus_client.set_control_handler(nullptr);
    bus_client.stop_client();
}

void Coordinator::start() {
    {
        std::lock_guard<std::mutex> lock(apply_mutex);
        if (started) {
            Logger::warning("Coordinator already started");
            return;
        }
        started = true;
    }

    listener_guard = std::make_shared<ListenerGuard>();
    listener_guard->owner = this;
    std::shared_ptr<ListenerGuard> guard = listener_guard;
    listener_id = config_store.on_change([guard](const MeterConfig&) {
        std::lock_guard<std::mutex> lock(guard->mutex);
        if (guard->owner) {
            guard->owner->on_config_changed();
        }
    });

    consumer.start();
    generator.start();
    bus_client.start_client();
}

// Concurrent updates may notify out of order, so always apply the latest snapshot
void Coordinator::on_config_changed() {
    std::lock_guard<std::mutex> lock(apply_mutex);
    apply_config_locked(config_store.all());
}

void Coordinator::apply_config(const MeterConfig& config) {
    std::lock_guard<std::mutex> lock(apply_mutex);
    apply_config_locked(config);
}

void Coordinator::apply_config_locked(const MeterConfig& config) {
    try {
        Logger::info("Applying new configuration...");
        consumer.set_interval(config.interval_consumed_lower, config.interval_consumed_upper);
        generator.set_interval(config.interval_generated_lower, config.interval_generated_upper);

        bus_client.stop_client();
        bus_client.configure(config);
        bus_client.start_client();
    } catch (const std::exception& e) {
        Logger::error("Error applying configuration: " + std::string(e.what()));
    }
}

bool Coordinator::apply_action(const std::string& action, ControlOrigin origin) {
    const std::string normalized = normalize_action(action);
    const std::string source = origin_name(origin);

    if (normalized == "RESUME") {
        consumer.resume();
        generator.resume();
    } else if (normalized == "PAUSE") {
        consumer.pause();
        generator.pause();
    } else {
        Logger::warning("Unknown action '" + action + "' from " + source);
        return false;
    }

    Logger::info("Action '" + normalized + "' executed from " + source);
    safe_emit(EVENT_MQTT_MESSAGE, {{"message", "Action: " + normalized + " (" + source + ")"}});
    return true;
}

void Coordinator::set_log_readings(bool enabled) {
    consumer.set_log_readings(enabled);
    generator.set_log_readings(enabled);
}

void Coordinator::safe_emit(const std::string& event, const nlohmann::json& payload) {
    try {
        broadcast.emit(event, payload);
    } catch (const std::exception& e) {
        Logger::error("Failed to emit " + event + " to clients: " + e.what());
    }
}

void Coordinator::on_reading(const MeterReading& reading) {
    nlohmann::json payload = wrap_reading(reading);

    std::lock_guard<std::mutex> lock(publish_emit_mutex);
    bus_client.safe_publish(payload);
    safe_emit(EVENT_METER_READING, payload);
}

void Coordinator::on_control_message(const std::string& payload) {
    apply_action(payload, ControlOrigin::MQTT);
}

nlohmann::json Coordinator::handle_command(const nlohmann::json& request) {
    if (!request.is_object()) {
        return error_reply("command must be a JSON object");
    }

    if (auto it = request.find("action"); it != request.end()) {
        if (!it->is_string()) return error_reply("action must be a string");
        if (apply_action(it->get<std::string>(), ControlOrigin::UI)) {
            return {{"ok", true}};
        }
        return {{"ok", false}, {"error", "unknown action"}};
    }

    if (auto it = request.find("config"); it != request.end()) {
        try {
            config_store.update(*it);
        } catch (const std::invalid_argument& e) {
            Logger::warning("Rejected configuration: " + std::string(e.what()));
            return error_reply(e.what());
        }
        Logger::success("Configuration updated successfully");
        return {{"message", "Configuration updated successfully"}};
    }

    if (auto it = request.find("get"); it != request.end()) {
        if (*it == "config") {
            return nlohmann::json(config_store.all());
        }
        if (*it == "mqtt_status") {
            bool connected = bus_connected();
            Logger::info(std::string("MQTT connection status: ") + (connected ? "true" : "false"));
            return {{"connected", connected}};
        }
        return error_reply("unknown get target");
    }

    if (auto it = request.find("cert"); it != request.end()) {
        if (!it->is_object() || !it->contains("filename") || !it->contains("pem") ||
            !it->at("filename").is_string() || !it->at("pem").is_string()) {
            return error_reply("cert needs string fields filename and pem");
        }
        auto stored = config_store.save_cert_file(it->at("filename").get<std::string>(),
                                                  it->at("pem").get<std::string>(), cert_dir);
        return {{"mqtt_cert_filename", stored ? nlohmann::json(*stored) : nlohmann::json(nullptr)}};
    }

    return error_reply("unknown command");
}
