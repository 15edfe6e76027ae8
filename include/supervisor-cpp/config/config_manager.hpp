#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <supervisor-cpp/core/error.hpp>

namespace supervisor_cpp {

// Configuration value type enumeration, matches ConfigValue::VariantType order
enum class ConfigValueType {
    STRING,
    INTEGER,
    BOOLEAN,
    DOUBLE
};

// Configuration value wrapper
class ConfigValue {
public:
    using VariantType = std::variant<std::string, int64_t, bool, double>;

    ConfigValue() = default;
    ConfigValue(std::string value) : value_(std::move(value)) {}
    ConfigValue(const char* value) : value_(std::string(value)) {}
    ConfigValue(int64_t value) : value_(value) {}
    ConfigValue(int value) : value_(static_cast<int64_t>(value)) {}
    ConfigValue(bool value) : value_(value) {}
    ConfigValue(double value) : value_(value) {}

    template<typename T>
    T get() const
    {
        try {
            return std::get<T>(value_);
        }
        catch (const std::bad_variant_access&) {
            throw ContainerError(ErrorCode::INVALID_TYPE,
                                 "Type mismatch in configuration value access");
        }
    }

    ConfigValueType getType() const
    {
        return static_cast<ConfigValueType>(value_.index());
    }

private:
    VariantType value_;
};

/**
 * @brief Flat key/value configuration store
 *
 * JSON documents are flattened into dotted keys: {"docker": {"registries":
 * {"ghcr.io": {"username": "x"}}}} becomes "docker.registries.ghcr.io.username".
 * Arrays are stored as comma-joined strings.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    template<typename T>
    void set(const std::string& key, T value)
    {
        values_[key] = ConfigValue(std::move(value));
    }

    template<typename T>
    T get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;
    void clear();

    std::vector<std::string> getKeysWithPrefix(const std::string& prefix) const;

    // Both replace the current contents
    void loadFromJsonFile(const std::filesystem::path& file_path);
    void loadFromJsonString(const std::string& json_string);

    // Replaces ${NAME} in string values with the environment variable, if set
    ConfigManager expandEnvironmentVariables() const;

private:
    const ConfigValue& getValue(const std::string& key) const;
    static std::string expandValue(const std::string& value);

    std::map<std::string, ConfigValue> values_;
};

template<typename T>
T ConfigManager::get(const std::string& key) const
{
    return getValue(key).get<T>();
}

template<typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key)) {
        return default_value;
    }
    return getValue(key).get<T>();
}

} // namespace supervisor_cpp
