#pragma once

#include <cgfs/core/error.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cgfs {

// Order matches the ConfigValue variant alternatives
enum class ConfigValueType {
    STRING,
    INTEGER,
    BOOLEAN,
    DOUBLE
};

class ConfigValue {
public:
    using VariantType = std::variant<std::string, int, bool, double>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(T value) : value_(std::move(value))
    {}

    ConfigValue(const char* value) : value_(std::string(value)) {}

    template<typename T>
    T get() const
    {
        try {
            return std::get<T>(value_);
        }
        catch (const std::bad_variant_access&) {
            throw FsError(ErrorCode::INVALID_TYPE, "Type mismatch in configuration value access");
        }
    }

    ConfigValueType getType() const
    {
        return static_cast<ConfigValueType>(value_.index());
    }

    std::string toString() const;

private:
    VariantType value_;
};

using ConfigSchema = std::unordered_map<std::string, ConfigValueType>;

/**
 * @brief Flat key/value configuration store
 *
 * JSON objects are flattened into dotted keys, so {"log": {"level": "debug"}}
 * is addressed as "log.level". Values set later override earlier ones.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    template<typename T>
    void set(const std::string& key, T value);

    template<typename T>
    T get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    void clear();

    bool isEmpty() const;
    size_t size() const;
    std::vector<std::string> getKeys() const;

    // JSON loading
    void loadFromJsonFile(const std::filesystem::path& file_path);
    void loadFromJsonString(const std::string& json_string);
    void mergeFromJsonString(const std::string& json_string);
    std::string toJsonString() const;

    void merge(const ConfigManager& other);

    // Replaces ${VAR} in every string value; unknown variables are left as-is
    ConfigManager expandEnvironmentVariables() const;

    // Throws CONFIG_INVALID when a present key has a different type
    void validate(const ConfigSchema& schema) const;

private:
    std::unordered_map<std::string, ConfigValue> values_;

    std::vector<std::string> splitKey(const std::string& key) const;
    std::string expandValue(const std::string& value) const;
};

template<typename T>
void ConfigManager::set(const std::string& key, T value)
{
    values_[key] = ConfigValue(std::move(value));
}

template<typename T>
T ConfigManager::get(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw FsError(ErrorCode::CONFIG_MISSING, "Configuration key not found: " + key);
    }
    try {
        return it->second.get<T>();
    }
    catch (const FsError&) {
        throw FsError(ErrorCode::CONFIG_INVALID, "Type mismatch for configuration key '" + key + "'");
    }
}

template<typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key)) {
        return default_value;
    }
    return get<T>(key);
}

} // namespace cgfs
