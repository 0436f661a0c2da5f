// meter/bus_transport.hpp
#pragma once
#include <memory>
#include <string>

class BusTransport;

// Called from the transport's network thread
class BusEventHandler {
public:
    virtual ~BusEventHandler() = default;
    virtual void on_connect(BusTransport& transport, int rc) = 0;
    virtual void on_disconnect(int rc) = 0;
    virtual void on_message(const std::string& topic, const std::string& payload) = 0;
};

// A single broker connection. Everything except is_connected() throws
// std::runtime_error on failure.
class BusTransport {
public:
    virtual ~BusTransport() = default;

    virtual void set_credentials(const std::string& username, const std::string& password) = 0;
    // Server certificate verification against `ca_file` is always required
    virtual void set_tls(const std::string& ca_file, bool verify_hostname) = 0;
    virtual void set_handler(BusEventHandler& handler) = 0;

    virtual void connect(const std::string& host, int port, int keepalive_seconds) = 0;
    virtual void start_loop() = 0;
    // Returns once the network thread has exited
    virtual void stop_loop() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual void publish(const std::string& topic, const std::string& payload) = 0;
    virtual void subscribe(const std::string& topic) = 0;
};

class BusTransportFactory {
public:
    virtual ~BusTransportFactory() = default;
    virtual std::unique_ptr<BusTransport> create(const std::string& client_id) = 0;
};
