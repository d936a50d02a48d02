#pragma once

/**
 * @file settings_type_handlers.hpp
 * @brief Text form of setting values, as stored in INI files and log lines
 */

#include "McpIDE/editor/settings_registry.hpp"
#include <optional>
#include <string>

namespace McpIDE::editor {

/// Lists come out comma separated; meant for humans, not for parsing back
[[nodiscard]] std::string settingValueToString(const SettingValue &value);

/**
 * @brief Parse stored text as a value of @p type
 *
 * Booleans take true/false/1/0 in any case, integers must be consumed
 * completely and lists are one entry per line. nullopt when the text does not
 * fit the type; range and option checks are left to validation.
 */
[[nodiscard]] std::optional<SettingValue> stringToSettingValue(const std::string &str,
                                                               SettingType type);

[[nodiscard]] const char *settingTypeToString(SettingType type);

} // namespace McpIDE::editor
