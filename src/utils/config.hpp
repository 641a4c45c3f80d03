#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils/logger.hpp"

namespace blast::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Key/value settings backed by a JSON object
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     * @throws std::runtime_error if the string is not a JSON object
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config, nullopt if missing or of the wrong type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.contains(key)) {
            return std::nullopt;
        }
        try {
            return data_.at(key).get<T>();
        } catch (const json::exception& e) {
            BLAST_LOG_WARN("Config key '{}' has unexpected type: {}", key, e.what());
        }
        return std::nullopt;
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Set a value
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    /**
     * Get underlying JSON object
     */
    const json& data() const { return data_; }

private:
    json data_ = json::object();
};

} // namespace blast::utils
