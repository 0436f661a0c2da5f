// meter/mosquitto_transport.cpp
#include "mosquitto_transport.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <mosquitto.h>

namespace {

constexpr unsigned int RECONNECT_DELAY_MIN_S = 1;
constexpr unsigned int RECONNECT_DELAY_MAX_S = 2;
constexpr unsigned int MAX_INFLIGHT_MESSAGES = 20;

void check(int rc, const std::string& what) {
    if (rc == MOSQ_ERR_SUCCESS) return;
    std::string reason = rc == MOSQ_ERR_ERRNO ? std::strerror(errno) : mosquitto_strerror(rc);
    throw std::runtime_error(what + ": " + reason);
}

}

MosquittoTransport::MosquittoTransport(const std::string& client_id) {
    mosq = mosquitto_new(client_id.c_str(), true, this);
    if (!mosq) {
        throw std::runtime_error("mosquitto_new failed: " + std::string(std::strerror(errno)));
    }

    mosquitto_reconnect_delay_set(mosq, RECONNECT_DELAY_MIN_S, RECONNECT_DELAY_MAX_S, false);
    mosquitto_max_inflight_messages_set(mosq, MAX_INFLIGHT_MESSAGES);

    mosquitto_connect_callback_set(mosq, &MosquittoTransport::handle_connect);
    mosquitto_disconnect_callback_set(mosq, &MosquittoTransport::handle_disconnect);
    mosquitto_message_callback_set(mosq, &MosquittoTransport::handle_message);
    mosquitto_log_callback_set(mosq, &MosquittoTransport::handle_log);
}

MosquittoTransport::~MosquittoTransport() {
    if (loop_running) {
        mosquitto_disconnect(mosq);
        mosquitto_loop_stop(mosq, true);
    }
    mosquitto_destroy(mosq);
}

void MosquittoTransport::set_credentials(const std::string& username, const std::string& password) {
    check(mosquitto_username_pw_set(mosq, username.c_str(), password.c_str()),
          "Failed to set MQTT credentials");
}

void MosquittoTransport::set_tls(const std::string& ca_file, bool verify_hostname) {
    check(mosquitto_tls_set(mosq, ca_file.c_str(), nullptr, nullptr, nullptr, nullptr),
          "Failed to load CA certificate " + ca_file);
    check(mosquitto_tls_opts_set(mosq, 1, nullptr, nullptr), "Failed to set TLS options");
    check(mosquitto_tls_insecure_set(mosq, !verify_hostname), "Failed to set TLS hostname check");
}

void MosquittoTransport::connect(const std::string& host, int port, int keepalive_seconds) {
    check(mosquitto_connect(mosq, host.c_str(), port, keepalive_seconds),
          "Failed to connect to " + host + ":" + std::to_string(port));
}

void MosquittoTransport::start_loop() {
    check(mosquitto_loop_start(mosq), "Failed to start MQTT network loop");
    loop_running = true;
}

void MosquittoTransport::stop_loop() {
    if (!loop_running) return;
    loop_running = false;
    check(mosquitto_loop_stop(mosq, false), "Failed to stop MQTT network loop");
}

void MosquittoTransport::disconnect() {
    int rc = mosquitto_disconnect(mosq);
    connected.store(false);
    if (rc != MOSQ_ERR_NO_CONN) {
        check(rc, "Failed to disconnect");
    }
}

void MosquittoTransport::publish(const std::string& topic, const std::string& payload) {
    check(mosquitto_publish(mosq, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                            payload.data(), 0, false),
          "Failed to publish to " + topic);
}

void MosquittoTransport::subscribe(const std::string& topic) {
    check(mosquitto_subscribe(mosq, nullptr, topic.c_str(), 0), "Failed to subscribe to " + topic);
}

void MosquittoTransport::handle_connect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MosquittoTransport*>(obj);
    self->connected.store(rc == 0);
    if (!self->handler) return;
    try {
        self->handler->on_connect(*self, rc);
    } catch (const std::exception& e) {
        Logger::error("MQTT connect handler error: " + std::string(e.what()));
    }
}

void MosquittoTransport::handle_disconnect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MosquittoTransport*>(obj);
    self->connected.store(false);
    if (!self->handler) return;
    try {
        self->handler->on_disconnect(rc);
    } catch (const std::exception& e) {
        Logger::error("MQTT disconnect handler error: " + std::string(e.what()));
    }
}

void MosquittoTransport::handle_message(struct mosquitto*, void* obj, const struct mosquitto_message* msg) {
    auto* self = static_cast<MosquittoTransport*>(obj);
    if (!self->handler || !msg) return;
    try {
        std::string topic = msg->topic ? msg->topic : "";
        std::string payload;
        if (msg->payload && msg->payloadlen > 0) {
            payload.assign(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen));
        }
        self->handler->on_message(topic, payload);
    } catch (const std::exception& e) {
        Logger::error("MQTT message handler error: " + std::string(e.what()));
    }
}

void MosquittoTransport::handle_log(struct mosquitto*, void*, int, const char* str) {
    if (str) Logger::debug(std::string("MQTT LOG: ") + str);
}

MosquittoTransportFactory::MosquittoTransportFactory() {
    mosquitto_lib_init();
}

MosquittoTransportFactory::~MosquittoTransportFactory() {
    mosquitto_lib_cleanup();
}

std::unique_ptr<BusTransport> MosquittoTransportFactory::create(const std::string& client_id) {
    return std::make_unique<MosquittoTransport>(client_id);
}
