// meter/config_store.hpp
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
constexpr const char* DEFAULT_CERT_DIR = "certs";

struct MeterConfig {
    double interval_consumed_lower{2.0};
    double interval_consumed_upper{5.0};
    double interval_generated_lower{2.0};
    double interval_generated_upper{5.0};

    bool mqtt_publish_enabled{false};
    std::optional<std::string> mqtt_host;
    int mqtt_port{1883};
    std::optional<std::string> mqtt_username;
    std::optional<std::string> mqtt_password;
    std::optional<std::string> mqtt_cert_filename;
    bool mqtt_tls_verify_hostname{false};

    bool operator==(const MeterConfig& other) const;
    bool operator!=(const MeterConfig& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const MeterConfig& config);

// Builds a config from `j` on top of the defaults. Throws std::invalid_argument
// on a wrong type, a negative, inverted or over-long (> MAX_INTERVAL_SECONDS)
// interval, a port outside 1..65535,
// or (when `allow_unknown_keys` is false) a key that is not a config field.
MeterConfig config_from_json(const nlohmann::json& j, bool allow_unknown_keys = false);

class ConfigStore {
public:
    using ChangeListener = std::function<void(const MeterConfig&)>;
    using ListenerId = size_t;

private:
    std::string config_file;
    MeterConfig config;
    mutable std::shared_mutex config_mutex;

    std::vector<std::pair<ListenerId, ChangeListener>> listeners;
    ListenerId next_listener_id{1};
    std::mutex listeners_mutex;

    bool persist(const MeterConfig& snapshot);
    void notify(const MeterConfig& snapshot);

public:
    explicit ConfigStore(std::string file = DEFAULT_CONFIG_FILE);

    // Reads the backing file. A missing, unreadable or invalid file is
    // replaced by the defaults, which are written back. Never throws.
    MeterConfig load();

    // Rewrites the backing file from the in-memory config.
    bool save();

    // Value of `key` in the current snapshot. Returns `fallback` both for an
    // unknown key and for a field that is unset (stored as null), so a null
    // result never means "present but null".
    nlohmann::json get(const std::string& key, const nlohmann::json& fallback = nullptr) const;
    MeterConfig all() const;

    // Merges `partial` (a JSON object of config fields) into the stored config,
    // persists it and then, with no lock held, hands the new snapshot to every
    // listener. Throws std::invalid_argument and changes nothing if the merged
    // config is invalid.
    void update(const nlohmann::json& partial);

    // Returns 0 (and registers nothing) for an empty listener.
    ListenerId on_change(ChangeListener listener);
    // A notification already under way may still reach the listener.
    void remove_listener(ListenerId id);

    // Stores an uploaded CA certificate under `cert_dir` and records it as
    // mqtt_cert_filename. Returns the certificate filename in effect afterwards.
    std::optional<std::string> save_cert_file(const std::string& filename,
                                              const std::string& contents,
                                              const std::string& cert_dir = DEFAULT_CERT_DIR);

    const std::string& path() const { return config_file; }
};
