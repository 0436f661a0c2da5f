// meter/mosquitto_transport.hpp
#pragma once
#include "bus_transport.hpp"
#include <atomic>
#include <string>

struct mosquitto;
struct mosquitto_message;

class MosquittoTransport : public BusTransport {
private:
    struct mosquitto* mosq{nullptr};
    BusEventHandler* handler{nullptr};
    std::atomic<bool> connected{false};
    bool loop_running{false};

    static void handle_connect(struct mosquitto* m, void* obj, int rc);
    static void handle_disconnect(struct mosquitto* m, void* obj, int rc);
    static void handle_message(struct mosquitto* m, void* obj, const struct mosquitto_message* msg);
    static void handle_log(struct mosquitto* m, void* obj, int level, const char* str);

public:
    explicit MosquittoTransport(const std::string& client_id);
    ~MosquittoTransport() override;

    MosquittoTransport(const MosquittoTransport&) = delete;
    MosquittoTransport& operator=(const MosquittoTransport&) = delete;

    void set_credentials(const std::string& username, const std::string& password) override;
    void set_tls(const std::string& ca_file, bool verify_hostname) override;
    void set_handler(BusEventHandler& h) override { handler = &h; }

    void connect(const std::string& host, int port, int keepalive_seconds) override;
    void start_loop() override;
    void stop_loop() override;
    void disconnect() override;
    bool is_connected() const override { return connected.load(); }

    void publish(const std::string& topic, const std::string& payload) override;
    void subscribe(const std::string& topic) override;
};

// Owns libmosquitto's global init/cleanup
class MosquittoTransportFactory : public BusTransportFactory {
public:
    MosquittoTransportFactory();
    ~MosquittoTransportFactory() override;

    std::unique_ptr<BusTransport> create(const std::string& client_id) override;
};
