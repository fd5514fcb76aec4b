#include "config.hpp"
#include "logging.hpp"
#include <QString>
#include <fstream>
#include <nlohmann/json.hpp>

namespace usbdeck::core {

namespace {

template <typename T>
void readOptional(const nlohmann::json& json, const char* key, T& target) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

PanelConfig PanelConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    PanelConfig config;
    readOptional(json, "refresh_on_startup", config.refresh_on_startup);
    readOptional(json, "show_hidden_files", config.show_hidden_files);
    readOptional(json, "watch_device_changes", config.watch_device_changes);
    readOptional(json, "logging_rules", config.logging_rules);
    return config;
}

PanelConfig PanelConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }

    PanelConfig config = fromJson(json);
    qCDebug(lcConfig) << "Loaded configuration from" << QString::fromStdString(path.string());
    return config;
}

} // namespace usbdeck::core
