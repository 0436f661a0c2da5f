// tests/test_support.hpp
#pragma once
#undef NDEBUG
#include <cassert>

#include "broadcast_sink.hpp"
#include "bus_transport.hpp"
#include "reading_source.hpp"
#include "../common/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace test_support {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
private:
    std::filesystem::path dir;

public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "meter_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        dir = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string file(const std::string& name) const { return (dir / name).string(); }
    std::string path() const { return dir.string(); }
};

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Self-signed Ed25519 certificate in PEM form
inline std::string make_test_certificate_pem() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
    EVP_PKEY* raw_key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) {
        throw std::runtime_error("key generation failed");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw_key, EVP_PKEY_free);

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("meter-test-ca"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (X509_sign(cert.get(), key.get(), nullptr) <= 0) {
        throw std::runtime_error("certificate signing failed");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    if (PEM_write_bio_X509(bio.get(), cert.get()) != 1) {
        throw std::runtime_error("PEM encoding failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

// Shared, ordered record of side effects across fakes
class EventLog {
private:
    std::mutex mutex;
    std::vector<std::string> entries;

public:
    void add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex);
        entries.push_back(entry);
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }
};

class FakeTransport;

// State shared by every transport a FakeTransportFactory creates
struct FakeBroker {
    std::mutex mutex;
    std::vector<std::string> created_ids;
    std::vector<std::pair<std::string, std::string>> published;
    std::vector<std::string> subscriptions;
    std::vector<std::pair<std::string, bool>> tls;
    std::vector<std::pair<std::string, std::string>> credentials;
    std::vector<std::pair<std::string, int>> connects;
    int live_connections{0};
    int max_live_connections{0};
    std::atomic<bool> fail_connect{false};
    std::atomic<bool> fail_publish{false};
    std::atomic<bool> fail_disconnect{false};
    FakeTransport* last{nullptr};
    EventLog* log{nullptr};

    size_t created() {
        std::lock_guard<std::mutex> lock(mutex);
        return created_ids.size();
    }
    size_t publish_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return published.size();
    }
    int live() {
        std::lock_guard<std::mutex> lock(mutex);
        return live_connections;
    }
};

class FakeTransport : public BusTransport {
private:
    FakeBroker& broker;
    BusEventHandler* handler{nullptr};
    std::atomic<bool> connected{false};
    bool live{false};

    void release() {
        if (live) {
            live = false;
            broker.live_connections--;
        }
    }

public:
    explicit FakeTransport(FakeBroker& b) : broker(b) {}

    ~FakeTransport() override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        release();
        if (broker.last == this) broker.last = nullptr;
    }

    void set_credentials(const std::string& username, const std::string& password) override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        broker.credentials.emplace_back(username, password);
    }

    void set_tls(const std::string& ca_file, bool verify_hostname) override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        broker.tls.emplace_back(ca_file, verify_hostname);
    }

    void set_handler(BusEventHandler& h) override { handler = &h; }

    void connect(const std::string& host, int port, int) override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        broker.connects.emplace_back(host, port);
        if (broker.fail_connect) {
            throw std::runtime_error("connection refused");
        }
        live = true;
        broker.live_connections++;
        if (broker.live_connections > broker.max_live_connections) {
            broker.max_live_connections = broker.live_connections;
        }
    }

    // Acknowledges the connection straight away
    void start_loop() override {
        connected = true;
        if (handler) handler->on_connect(*this, 0);
    }

    void stop_loop() override {}

    void disconnect() override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        connected = false;
        release();
        if (broker.fail_disconnect) {
            throw std::runtime_error("socket already closed");
        }
    }

    bool is_connected() const override { return connected; }

    void publish(const std::string& topic, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        if (broker.fail_publish) {
            throw std::runtime_error("publish failed");
        }
        broker.published.emplace_back(topic, payload);
        if (broker.log) broker.log->add("publish " + payload);
    }

    void subscribe(const std::string& topic) override {
        std::lock_guard<std::mutex> lock(broker.mutex);
        broker.subscriptions.push_back(topic);
    }

    // Simulates the broker pushing a message to us
    void deliver(const std::string& payload) {
        if (handler) handler->on_message(SUB_TOPIC, payload);
    }

    // Simulates the broker dropping the connection
    void drop() {
        connected = false;
        if (handler) handler->on_disconnect(7);
    }
};

class FakeTransportFactory : public BusTransportFactory {
private:
    FakeBroker& broker;

public:
    explicit FakeTransportFactory(FakeBroker& b) : broker(b) {}

    std::unique_ptr<BusTransport> create(const std::string& client_id) override {
        auto transport = std::make_unique<FakeTransport>(broker);
        std::lock_guard<std::mutex> lock(broker.mutex);
        broker.created_ids.push_back(client_id);
        broker.last = transport.get();
        return transport;
    }
};

// Counters shared by every LoopTransport a LoopTransportFactory creates
struct LoopStats {
    std::atomic<int> created{0};
    std::atomic<int> active_loops{0};
    std::atomic<int> deliveries{0};
};

// Transport whose network thread keeps pushing PAUSE/RESUME at the handler
// until stop_loop() joins it
class LoopTransport : public BusTransport {
private:
    LoopStats& stats;
    BusEventHandler* handler{nullptr};
    std::atomic<bool> connected{false};
    std::atomic<bool> running{false};
    std::thread loop;

public:
    explicit LoopTransport(LoopStats& s) : stats(s) {}
    ~LoopTransport() override { stop_loop(); }

    void set_credentials(const std::string&, const std::string&) override {}
    void set_tls(const std::string&, bool) override {}
    void set_handler(BusEventHandler& h) override { handler = &h; }
    void connect(const std::string&, int, int) override {}

    void start_loop() override {
        connected = true;
        running = true;
        stats.active_loops++;
        loop = std::thread([this]() {
            bool pause = true;
            while (running) {
                if (handler) handler->on_message(SUB_TOPIC, pause ? "PAUSE" : "RESUME");
                stats.deliveries++;
                pause = !pause;
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            stats.active_loops--;
        });
    }

    void stop_loop() override {
        running = false;
        if (loop.joinable()) loop.join();
    }

    void disconnect() override { connected = false; }
    bool is_connected() const override { return connected; }
    void publish(const std::string&, const std::string&) override {}
    void subscribe(const std::string&) override {}
};

class LoopTransportFactory : public BusTransportFactory {
private:
    LoopStats& stats;

public:
    explicit LoopTransportFactory(LoopStats& s) : stats(s) {}

    std::unique_ptr<BusTransport> create(const std::string&) override {
        stats.created++;
        return std::make_unique<LoopTransport>(stats);
    }
};

class RecordingBroadcast : public BroadcastSink {
private:
    std::mutex mutex;
    std::vector<std::pair<std::string, nlohmann::json>> events;

public:
    EventLog* log{nullptr};
    std::atomic<bool> fail{false};

    void emit(const std::string& event, const nlohmann::json& payload) override {
        if (fail) throw std::runtime_error("client gone");
        std::lock_guard<std::mutex> lock(mutex);
        events.emplace_back(event, payload);
        if (log && event == EVENT_METER_READING) log->add("emit " + payload.dump());
    }

    std::vector<std::pair<std::string, nlohmann::json>> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    size_t count(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& e : events) {
            if (e.first == event) n++;
        }
        return n;
    }

    // Meter readings wrapped under `key` ("consumed" or "generated")
    size_t readings(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& e : events) {
            if (e.first == EVENT_METER_READING && e.second.contains(key)) n++;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        events.clear();
    }
};

class RecordingSink : public ReadingSink {
private:
    std::mutex mutex;
    std::vector<MeterReading> readings;
    std::vector<std::chrono::steady_clock::time_point> arrivals;

public:
    std::atomic<bool> fail{false};

    void on_reading(const MeterReading& reading) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            readings.push_back(reading);
            arrivals.push_back(std::chrono::steady_clock::now());
        }
        if (fail) throw std::runtime_error("sink failure");
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return readings.size();
    }

    std::vector<MeterReading> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return readings;
    }

    std::vector<std::chrono::steady_clock::time_point> arrival_times() {
        std::lock_guard<std::mutex> lock(mutex);
        return arrivals;
    }
};

}
