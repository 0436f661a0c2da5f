// common/protocol.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Bus topics for the simulated meter
constexpr const char* PUB_TOPIC = "mock/energy_meter/id001/data";
constexpr const char* SUB_TOPIC = "mock/energy_meter/id001/control";

// Longest accepted pause between two readings of a channel
constexpr double MAX_INTERVAL_SECONDS = 86400.0;

// Live broadcast event names
constexpr const char* EVENT_METER_READING = "meter_reading";
constexpr const char* EVENT_MQTT_MESSAGE = "mqtt_message";

enum class Channel {
    Load,       // consumption
    Generator   // production
};

inline const char* channel_name(Channel channel) {
    return channel == Channel::Load ? "Load" : "Generator";
}

// Key used to wrap a reading in outbound payloads
inline const char* channel_key(Channel channel) {
    return channel == Channel::Load ? "consumed" : "generated";
}

struct MeterReading {
    Channel channel{Channel::Load};
    std::string ip_addr;
    std::string timestamp;
    double voltage{0.0};
    double current{0.0};
    double power{0.0};
};

inline void to_json(nlohmann::json& j, const MeterReading& reading) {
    j = nlohmann::json{
        {"voltage", reading.voltage},
        {"current", reading.current},
        {"power", reading.power},
        {"ipAddr", reading.ip_addr},
        {"timestamp", reading.timestamp}
    };
}

// {"consumed": {...}} or {"generated": {...}}
inline nlohmann::json wrap_reading(const MeterReading& reading) {
    return nlohmann::json{{channel_key(reading.channel), reading}};
}
