#include <algorithm>
#include <cgfs/config/config_manager.hpp>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

namespace cgfs {

std::string ConfigValue::toString() const
{
    switch (getType()) {
        case ConfigValueType::STRING:
            return get<std::string>();
        case ConfigValueType::INTEGER:
            return std::to_string(get<int>());
        case ConfigValueType::BOOLEAN:
            return get<bool>() ? "true" : "false";
        case ConfigValueType::DOUBLE:
            return std::to_string(get<double>());
    }
    return "";
}

bool ConfigManager::has(const std::string& key) const
{
    return values_.find(key) != values_.end();
}

void ConfigManager::remove(const std::string& key)
{
    values_.erase(key);
}

void ConfigManager::clear()
{
    values_.clear();
}

bool ConfigManager::isEmpty() const
{
    return values_.empty();
}

size_t ConfigManager::size() const
{
    return values_.size();
}

std::vector<std::string> ConfigManager::getKeys() const
{
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::loadFromJsonFile(const std::filesystem::path& file_path)
{
    if (!std::filesystem::exists(file_path)) {
        throw FsError(ErrorCode::CONFIG_MISSING,
                      "Configuration file not found: " + file_path.string());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FsError(ErrorCode::IO_ERROR,
                      "Failed to open configuration file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromJsonString(buffer.str());
}

void ConfigManager::loadFromJsonString(const std::string& json_string)
{
    clear();
    mergeFromJsonString(json_string);
}

void ConfigManager::mergeFromJsonString(const std::string& json_string)
{
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_string);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw FsError(ErrorCode::CONFIG_INVALID,
                      "Invalid JSON configuration: " + std::string(e.what()));
    }

    if (!json.is_object()) {
        throw FsError(ErrorCode::CONFIG_INVALID, "Configuration root must be a JSON object");
    }

    std::function<void(const nlohmann::json&, const std::string&)> process_json =
        [&](const nlohmann::json& j, const std::string& prefix) {
            if (j.is_object()) {
                for (auto& [key, value] : j.items()) {
                    process_json(value, prefix.empty() ? key : prefix + "." + key);
                }
            }
            else if (j.is_string()) {
                set(prefix, j.get<std::string>());
            }
            else if (j.is_boolean()) {
                set(prefix, j.get<bool>());
            }
            else if (j.is_number_integer()) {
                set(prefix, j.get<int>());
            }
            else if (j.is_number_float()) {
                set(prefix, j.get<double>());
            }
            else if (j.is_null()) {
                remove(prefix);
            }
            else {
                throw FsError(ErrorCode::CONFIG_INVALID,
                              "Unsupported value type for configuration key '" + prefix + "'");
            }
        };

    process_json(json, "");
}

std::string ConfigManager::toJsonString() const
{
    nlohmann::json json = nlohmann::json::object();

    for (const auto& key : getKeys()) {
        const ConfigValue& value = values_.at(key);
        auto parts = splitKey(key);
        nlohmann::json* current = &json;

        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            if (!current->contains(parts[i]) || !(*current)[parts[i]].is_object()) {
                (*current)[parts[i]] = nlohmann::json::object();
            }
            current = &(*current)[parts[i]];
        }

        switch (value.getType()) {
            case ConfigValueType::STRING:
                (*current)[parts.back()] = value.get<std::string>();
                break;
            case ConfigValueType::INTEGER:
                (*current)[parts.back()] = value.get<int>();
                break;
            case ConfigValueType::BOOLEAN:
                (*current)[parts.back()] = value.get<bool>();
                break;
            case ConfigValueType::DOUBLE:
                (*current)[parts.back()] = value.get<double>();
                break;
        }
    }

    return json.dump(4);
}

void ConfigManager::merge(const ConfigManager& other)
{
    for (const auto& [key, value] : other.values_) {
        values_[key] = value;
    }
}

ConfigManager ConfigManager::expandEnvironmentVariables() const
{
    ConfigManager expanded;

    for (const auto& [key, value] : values_) {
        if (value.getType() == ConfigValueType::STRING) {
            expanded.set(key, expandValue(value.toString()));
        }
        else {
            expanded.values_[key] = value;
        }
    }

    return expanded;
}

void ConfigManager::validate(const ConfigSchema& schema) const
{
    for (const auto& [key, expected_type] : schema) {
        auto it = values_.find(key);
        if (it != values_.end() && it->second.getType() != expected_type) {
            throw FsError(ErrorCode::CONFIG_INVALID,
                          "Type mismatch for configuration key '" + key + "'");
        }
    }
}

std::vector<std::string> ConfigManager::splitKey(const std::string& key) const
{
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;

    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    if (parts.empty()) {
        parts.push_back(key);
    }

    return parts;
}

std::string ConfigManager::expandValue(const std::string& value) const
{
    std::string result = value;
    std::regex env_pattern(R"(\$\{([^}]+)\})");

    std::sregex_iterator iter(value.begin(), value.end(), env_pattern);
    std::sregex_iterator end;

    struct Replacement {
        size_t position;
        size_t length;
        std::string replacement;
    };
    std::vector<Replacement> replacements;

    for (; iter != end; ++iter) {
        const std::smatch& match = *iter;
        // Configuration is loaded before any worker thread starts
        const char* env_value = std::getenv(match[1].str().c_str());
        if (env_value) {
            replacements.push_back({static_cast<size_t>(match.position()),
                                    static_cast<size_t>(match.length()), env_value});
        }
    }

    // Apply from the back so earlier positions stay valid
    for (auto it = replacements.rbegin(); it != replacements.rend(); ++it) {
        result.replace(it->position, it->length, it->replacement);
    }

    return result;
}

} // namespace cgfs
