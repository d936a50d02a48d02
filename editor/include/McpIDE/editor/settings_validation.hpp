#pragma once

/**
 * @file settings_validation.hpp
 * @brief Checks a candidate value against its SettingDefinition
 */

#include "McpIDE/editor/settings_registry.hpp"
#include <string>

namespace McpIDE::editor {

/**
 * @brief Type, enum membership, range and custom validator checks, in that order
 * @return Empty string when @p value may be stored, otherwise the first problem
 */
[[nodiscard]] std::string validateSettingValue(const SettingValue &value,
                                               const SettingDefinition &definition);

} // namespace McpIDE::editor
