#include <cstdlib>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include <supervisor-cpp/config/config_manager.hpp>

namespace supervisor_cpp {

namespace {

std::string joinJsonArray(const nlohmann::json& j)
{
    std::string result;
    for (const auto& item : j) {
        if (!result.empty()) {
            result += ",";
        }
        result += item.is_string() ? item.get<std::string>() : item.dump();
    }
    return result;
}

} // namespace

bool ConfigManager::has(const std::string& key) const
{
    return values_.find(key) != values_.end();
}

void ConfigManager::clear()
{
    values_.clear();
}

std::vector<std::string> ConfigManager::getKeysWithPrefix(const std::string& prefix) const
{
    std::vector<std::string> keys;

    for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
        if (it->first.compare(0, prefix.length(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }

    return keys;
}

void ConfigManager::loadFromJsonFile(const std::filesystem::path& file_path)
{
    if (!std::filesystem::exists(file_path)) {
        throw ContainerError(ErrorCode::FILE_NOT_FOUND,
                             "Configuration file not found: " + file_path.string());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ContainerError(ErrorCode::IO_ERROR,
                             "Failed to open configuration file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromJsonString(buffer.str());
}

void ConfigManager::loadFromJsonString(const std::string& json_string)
{
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_string);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ContainerError(ErrorCode::CONFIG_INVALID,
                             "Invalid JSON configuration: " + std::string(e.what()));
    }

    if (!json.is_object()) {
        throw ContainerError(ErrorCode::CONFIG_INVALID,
                             "Configuration root must be a JSON object");
    }

    std::function<void(const nlohmann::json&, const std::string&)> process_json =
        [&](const nlohmann::json& j, const std::string& prefix) {
            if (j.is_object()) {
                for (const auto& [key, value] : j.items()) {
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
                set(prefix, j.get<int64_t>());
            }
            else if (j.is_number_float()) {
                set(prefix, j.get<double>());
            }
            else if (j.is_array()) {
                set(prefix, joinJsonArray(j));
            }
        };

    clear();
    process_json(json, "");
}

ConfigManager ConfigManager::expandEnvironmentVariables() const
{
    ConfigManager expanded;

    for (const auto& [key, value] : values_) {
        if (value.getType() == ConfigValueType::STRING) {
            expanded.values_[key] = ConfigValue(expandValue(value.get<std::string>()));
        }
        else {
            expanded.values_[key] = value;
        }
    }

    return expanded;
}

const ConfigValue& ConfigManager::getValue(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw ContainerError(ErrorCode::CONFIG_MISSING, "Configuration key not found: " + key);
    }
    return it->second;
}

std::string ConfigManager::expandValue(const std::string& value)
{
    static const std::regex env_pattern(R"(\$\{([^}]+)\})");

    std::string result;
    auto last = value.cbegin();

    for (std::sregex_iterator iter(value.begin(), value.end(), env_pattern), end; iter != end;
         ++iter) {
        const std::smatch& match = *iter;
        result.append(last, match[0].first);

        // Note: std::getenv is not thread-safe; configuration is loaded before
        // any worker thread starts
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match[0].str();

        last = match[0].second;
    }

    result.append(last, value.cend());
    return result;
}

} // namespace supervisor_cpp
