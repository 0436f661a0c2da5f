// meter/config_store.cpp
#include "config_store.hpp"
#include "crypto_utils.hpp"
#include "logger.hpp"
#include "../common/protocol.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

const char* const CONFIG_KEYS[] = {
    "interval_consumed_lower",
    "interval_consumed_upper",
    "interval_generated_lower",
    "interval_generated_upper",
    "mqtt_publish_enabled",
    "mqtt_host",
    "mqtt_port",
    "mqtt_username",
    "mqtt_password",
    "mqtt_cert_filename",
    "mqtt_tls_verify_hostname",
};

bool is_config_key(const std::string& key) {
    for (const char* k : CONFIG_KEYS) {
        if (key == k) return true;
    }
    return false;
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

double read_bound(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number()) {
        throw std::invalid_argument(key + " must be a number");
    }
    double bound = value.get<double>();
    if (!std::isfinite(bound) || bound < 0.0) {
        throw std::invalid_argument(key + " must be a non-negative number");
    }
    if (bound > MAX_INTERVAL_SECONDS) {
        throw std::invalid_argument(key + " must not exceed " +
                                    std::to_string(static_cast<int>(MAX_INTERVAL_SECONDS)) + " seconds");
    }
    return bound;
}

bool read_bool(const nlohmann::json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw std::invalid_argument(key + " must be a boolean");
    }
    return value.get<bool>();
}

// Empty strings are treated as unset
std::optional<std::string> read_optional_string(const nlohmann::json& value, const std::string& key) {
    if (value.is_null()) return std::nullopt;
    if (!value.is_string()) {
        throw std::invalid_argument(key + " must be a string or null");
    }
    std::string s = value.get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

int read_port(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("mqtt_port must be an integer");
    }
    auto port = value.get<long long>();
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("mqtt_port must be within 1..65535");
    }
    return static_cast<int>(port);
}

bool is_valid_cert_name(const std::string& filename) {
    const std::string ext = ".crt";
    if (filename.size() <= ext.size()) return false;
    if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) return false;
    if (filename.front() == '.') return false;
    return filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

}

bool MeterConfig::operator==(const MeterConfig& other) const {
    return interval_consumed_lower == other.interval_consumed_lower &&
           interval_consumed_upper == other.interval_consumed_upper &&
           interval_generated_lower == other.interval_generated_lower &&
           interval_generated_upper == other.interval_generated_upper &&
           mqtt_publish_enabled == other.mqtt_publish_enabled &&
           mqtt_host == other.mqtt_host &&
           mqtt_port == other.mqtt_port &&
           mqtt_username == other.mqtt_username &&
           mqtt_password == other.mqtt_password &&
           mqtt_cert_filename == other.mqtt_cert_filename &&
           mqtt_tls_verify_hostname == other.mqtt_tls_verify_hostname;
}

void to_json(nlohmann::json& j, const MeterConfig& config) {
    j = nlohmann::json{
        {"interval_consumed_lower", config.interval_consumed_lower},
        {"interval_consumed_upper", config.interval_consumed_upper},
        {"interval_generated_lower", config.interval_generated_lower},
        {"interval_generated_upper", config.interval_generated_upper},
        {"mqtt_publish_enabled", config.mqtt_publish_enabled},
        {"mqtt_host", optional_to_json(config.mqtt_host)},
        {"mqtt_port", config.mqtt_port},
        {"mqtt_username", optional_to_json(config.mqtt_username)},
        {"mqtt_password", optional_to_json(config.mqtt_password)},
        {"mqtt_cert_filename", optional_to_json(config.mqtt_cert_filename)},
        {"mqtt_tls_verify_hostname", config.mqtt_tls_verify_hostname}
    };
}

MeterConfig config_from_json(const nlohmann::json& j, bool allow_unknown_keys) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    MeterConfig config;
    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();

        if (key == "interval_consumed_lower") {
            config.interval_consumed_lower = read_bound(value, key);
        } else if (key == "interval_consumed_upper") {
            config.interval_consumed_upper = read_bound(value, key);
        } else if (key == "interval_generated_lower") {
            config.interval_generated_lower = read_bound(value, key);
        } else if (key == "interval_generated_upper") {
            config.interval_generated_upper = read_bound(value, key);
        } else if (key == "mqtt_publish_enabled") {
            config.mqtt_publish_enabled = read_bool(value, key);
        } else if (key == "mqtt_host") {
            config.mqtt_host = read_optional_string(value, key);
        } else if (key == "mqtt_port") {
            config.mqtt_port = read_port(value);
        } else if (key == "mqtt_username") {
            config.mqtt_username = read_optional_string(value, key);
        } else if (key == "mqtt_password") {
            config.mqtt_password = read_optional_string(value, key);
        } else if (key == "mqtt_cert_filename") {
            config.mqtt_cert_filename = read_optional_string(value, key);
        } else if (key == "mqtt_tls_verify_hostname") {
            config.mqtt_tls_verify_hostname = read_bool(value, key);
        } else if (!allow_unknown_keys) {
            throw std::invalid_argument("unknown config key: " + key);
        }
    }

    if (config.interval_consumed_lower > config.interval_consumed_upper) {
        throw std::invalid_argument("interval_consumed_lower exceeds interval_consumed_upper");
    }
    if (config.interval_generated_lower > config.interval_generated_upper) {
        throw std::invalid_argument("interval_generated_lower exceeds interval_generated_upper");
    }
    return config;
}

ConfigStore::ConfigStore(std::string file) : config_file(std::move(file)) {
    load();
}

MeterConfig ConfigStore::load() {
    std::unique_lock<std::shared_mutex> lock(config_mutex);

    std::ifstream in(config_file);
    if (!in) {
        Logger::info("No config at " + config_file + " - writing defaults");
        config = MeterConfig{};
        persist(config);
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        config = config_from_json(j, true);
        Logger::info("Loaded config from " + config_file);
    } catch (const std::exception& e) {
        Logger::warning("Failed to read config " + config_file + ", using defaults: " + e.what());
        config = MeterConfig{};
        persist(config);
    }
    return config;
}

bool ConfigStore::save() {
    std::unique_lock<std::shared_mutex> lock(config_mutex);
    return persist(config);
}

// Called with config_mutex held exclusively
bool ConfigStore::persist(const MeterConfig& snapshot) {
    const std::string tmp_file = config_file + ".tmp";
    try {
        {
            std::ofstream out(tmp_file, std::ios::trunc);
            if (!out) {
                Logger::error("Failed to open " + tmp_file + " for writing");
                return false;
            }
            out << nlohmann::json(snapshot).dump(4) << "\n";
            out.flush();
            if (!out) {
                Logger::error("Failed to write " + tmp_file);
                return false;
            }
        }
        if (std::rename(tmp_file.c_str(), config_file.c_str()) != 0) {
            Logger::error("Failed to replace " + config_file + ": " + std::strerror(errno));
            std::remove(tmp_file.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        Logger::error("Failed to save config: " + std::string(e.what()));
        return false;
    }

    Logger::debug("Config saved to " + config_file);
    return true;
}

nlohmann::json ConfigStore::get(const std::string& key, const nlohmann::json& fallback) const {
    nlohmann::json snapshot = all();
    auto it = snapshot.find(key);
    if (it == snapshot.end() || it->is_null()) {
        return fallback;
    }
    return *it;
}

MeterConfig ConfigStore::all() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex);
    return config;
}

void ConfigStore::update(const nlohmann::json& partial) {
    if (!partial.is_object()) {
        throw std::invalid_argument("config update must be a JSON object");
    }

    MeterConfig snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(config_mutex);

        nlohmann::json merged = config;
        for (const auto& item : partial.items()) {
            if (!is_config_key(item.key())) {
                throw std::invalid_argument("unknown config key: " + item.key());
            }
            merged[item.key()] = item.value();
        }

        config = config_from_json(merged);
        if (!persist(config)) {
            Logger::warning("Config updated in memory only - persisting failed");
        }
        snapshot = config;
    }

    notify(snapshot);
}

ConfigStore::ListenerId ConfigStore::on_change(ChangeListener listener) {
    if (!listener) return 0;
    std::lock_guard<std::mutex> lock(listeners_mutex);
    ListenerId id = next_listener_id++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

void ConfigStore::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex);
    for (auto it = listeners.begin(); it != listeners.end(); ++it) {
        if (it->first == id) {
            listeners.erase(it);
            return;
        }
    }
}

void ConfigStore::notify(const MeterConfig& snapshot) {
    std::vector<std::pair<ListenerId, ChangeListener>> current;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex);
        current = listeners;
    }

    for (const auto& entry : current) {
        try {
            entry.second(snapshot);
        } catch (const std::exception& e) {
            Logger::warning("Config listener error: " + std::string(e.what()));
        }
    }
}

std::optional<std::string> ConfigStore::save_cert_file(const std::string& filename,
                                                       const std::string& contents,
                                                       const std::string& cert_dir) {
    auto current = [this]() { return all().mqtt_cert_filename; };

    if (!is_valid_cert_name(filename)) {
        Logger::warning("Rejected certificate upload '" + filename + "': expected a *.crt file name");
        return current();
    }
    if (!is_pem_certificate(contents)) {
        Logger::warning("Rejected certificate upload '" + filename + "': not a PEM certificate");
        return current();
    }

    try {
        std::filesystem::create_directories(cert_dir);
        const std::string cert_path = (std::filesystem::path(cert_dir) / filename).string();

        std::ofstream out(cert_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            Logger::error("Failed to open " + cert_path + " for writing");
            return current();
        }
        out << contents;
        out.close();
        if (!out) {
            Logger::error("Failed to write " + cert_path);
            return current();
        }

        update(nlohmann::json{{"mqtt_cert_filename", filename}});
        Logger::success("Certificate saved: " + cert_path);
        return filename;
    } catch (const std::exception& e) {
        Logger::error("Failed to save certificate: " + std::string(e.what()));
        return current();
    }
}
