// meter/bus_client.cpp
#include "bus_client.hpp"
#include "crypto_utils.hpp"
#include "logger.hpp"
#include "../common/protocol.hpp"
#include <filesystem>
#include <stdexcept>

BusClient::BusClient(BusTransportFactory& f, MeterConfig initial, std::string dir, ControlHandler* handler)
    : factory(f),
      cert_dir(std::move(dir)),
      control_handler(handler),
      config(std::move(initial)) {}

BusClient::~BusClient() {
    stop_client();
}

void BusClient::configure(const MeterConfig& new_config) {
    std::lock_guard<std::mutex> lock(client_mutex);
    config = new_config;
}

MeterConfig BusClient::current_config() const {
    std::lock_guard<std::mutex> lock(client_mutex);
    return config;
}

bool BusClient::start_client() {
    std::lock_guard<std::mutex> lock(client_mutex);
    stop_locked();

    if (!config.mqtt_host) {
        Logger::warning("MQTT host not configured. Skipping MQTT startup.");
        return false;
    }

    const std::string host = *config.mqtt_host;
    const int port = config.mqtt_port;

    try {
        std::string id = "mock-meter-" + random_hex(4);
        auto transport = factory.create(id);

        if (config.mqtt_username || config.mqtt_password) {
            transport->set_credentials(config.mqtt_username.value_or(""),
                                       config.mqtt_password.value_or(""));
        }

        std::string cert_path;
        if (config.mqtt_cert_filename) {
            cert_path = (std::filesystem::path(cert_dir) / *config.mqtt_cert_filename).string();
        }
        if (!cert_path.empty() && std::filesystem::exists(cert_path)) {
            if (!is_pem_certificate_file(cert_path)) {
                Logger::error(cert_path + " is not a PEM certificate. Connecting without TLS.");
            } else {
                try {
                    transport->set_tls(cert_path, config.mqtt_tls_verify_hostname);
                    Logger::info("TLS enabled using cert: " + cert_path);
                } catch (const std::exception& e) {
                    Logger::error("Failed to set TLS: " + std::string(e.what()));
                }
            }
        } else {
            Logger::info("No MQTT certificate found. Connecting without TLS.");
        }

        transport->set_handler(*this);
        transport->connect(host, port, BUS_KEEPALIVE_SECONDS);
        transport->start_loop();

        session = std::make_unique<BusSession>();
        session->transport = std::move(transport);
        session->config = config;
        session->client_id = id;

        Logger::success("Connected to MQTT broker " + host + ":" + std::to_string(port) +
                        " (Client ID: " + id + ")");
        return true;
    } catch (const std::exception& e) {
        Logger::error("MQTT connection to " + host + ":" + std::to_string(port) +
                      " failed: " + e.what());
        session.reset();
        return false;
    }
}

void BusClient::stop_client() {
    std::lock_guard<std::mutex> lock(client_mutex);
    stop_locked();
}

// Called with client_mutex held
void BusClient::stop_locked() {
    std::unique_ptr<BusSession> old = std::move(session);
    if (!old) return;

    try {
        old->transport->disconnect();
    } catch (const std::exception& e) {
        Logger::warning("MQTT disconnect failed: " + std::string(e.what()));
    }

    // Joins the network thread, so no callback runs once this returns
    try {
        old->transport->stop_loop();
    } catch (const std::exception& e) {
        Logger::warning("MQTT loop stop failed: " + std::string(e.what()));
    }
    Logger::info("MQTT client stopped.");
}

void BusClient::safe_publish(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(client_mutex);
    if (!config.mqtt_publish_enabled) return;

    if (!session || !session->transport->is_connected()) {
        Logger::warning("MQTT client is null or not connected");
        return;
    }

    try {
        std::string text = payload.is_string() ? payload.get<std::string>() : payload.dump();
        Logger::debug("MQTT Outbound: " + text);
        session->transport->publish(PUB_TOPIC, text);
    } catch (const std::exception& e) {
        Logger::error("MQTT publish error: " + std::string(e.what()));
    }
}

bool BusClient::is_connected() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(client_mutex);
        return session && session->transport->is_connected();
    } catch (const std::exception& e) {
        Logger::error("MQTT status check failed: " + std::string(e.what()));
        return false;
    }
}

std::string BusClient::client_id() const {
    std::lock_guard<std::mutex> lock(client_mutex);
    return session ? session->client_id : std::string();
}

void BusClient::on_connect(BusTransport& transport, int rc) {
    if (rc != 0) {
        Logger::warning("MQTT connect failed: rc=" + std::to_string(rc));
        return;
    }

    Logger::success("Connected to MQTT broker.");
    try {
        transport.subscribe(SUB_TOPIC);
    } catch (const std::exception& e) {
        Logger::error("MQTT subscribe to " + std::string(SUB_TOPIC) + " failed: " + e.what());
    }
}

void BusClient::on_disconnect(int rc) {
    Logger::warning("MQTT disconnected (rc=" + std::to_string(rc) + ")");
}

void BusClient::on_message(const std::string& topic, const std::string& payload) {
    Logger::info("MQTT Received on " + topic + ": " + payload);

    ControlHandler* handler = control_handler.load();
    if (!handler) return;
    try {
        handler->on_control_message(payload);
    } catch (const std::exception& e) {
        Logger::error("Message callback error: " + std::string(e.what()));
    }
}
