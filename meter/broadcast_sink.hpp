// meter/broadcast_sink.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Live viewers. Best effort: implementations must not throw.
class BroadcastSink {
public:
    virtual ~BroadcastSink() = default;
    virtual void emit(const std::string& event, const nlohmann::json& payload) = 0;
};

// Request/reply commands arriving from live viewers
class ControlSurface {
public:
    virtual ~ControlSurface() = default;
    virtual nlohmann::json handle_command(const nlohmann::json& request) = 0;
};
