#pragma once

#include "core_export.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace usbdeck::core {

class USBDECK_CORE_EXPORT ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Panel options, read once at startup
 */
struct USBDECK_CORE_EXPORT PanelConfig {
    bool refresh_on_startup = true;
    bool show_hidden_files = false;
    bool watch_device_changes = true;
    std::string logging_rules;  // QLoggingCategory filter rules, ';' or newline separated

    /**
     * @brief Build from a JSON object
     * @throws ConfigError on a value of the wrong type
     */
    static PanelConfig fromJson(const nlohmann::json& json);

    /**
     * @brief Read a JSON configuration file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static PanelConfig load(const std::filesystem::path& path);
};

} // namespace usbdeck::core
