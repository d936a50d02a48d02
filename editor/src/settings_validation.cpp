/**
 * @file settings_validation.cpp
 * @brief Value checks applied by MISettingsRegistry::setValue
 */

#include "McpIDE/editor/settings_validation.hpp"
#include "McpIDE/editor/settings_type_handlers.hpp"
#include <algorithm>
#include <variant>

namespace McpIDE::editor {

namespace {

// SettingValue alternative each SettingType is stored as
constexpr usize storedAlternative(SettingType type) {
  switch (type) {
  case SettingType::Bool:
    return 0;
  case SettingType::Int:
  case SettingType::IntRange:
    return 1;
  case SettingType::String:
  case SettingType::Enum:
    return 2;
  case SettingType::StringList:
    return 3;
  }
  return std::variant_npos;
}

} // namespace

std::string validateSettingValue(const SettingValue &value, const SettingDefinition &definition) {
  if (value.index() != storedAlternative(definition.type)) {
    return std::string("Invalid type for ") + definition.key + " (expected " +
           settingTypeToString(definition.type) + ")";
  }

  if (definition.type == SettingType::Enum) {
    const auto &text = std::get<std::string>(value);
    const auto &options = definition.enumOptions;
    if (std::find(options.begin(), options.end(), text) == options.end()) {
      return "Invalid value '" + text + "' for " + definition.key;
    }
  }

  if (definition.type == SettingType::IntRange) {
    const i32 number = std::get<i32>(value);
    if (number < definition.minValue || number > definition.maxValue) {
      return "Value out of range [" + std::to_string(definition.minValue) + ", " +
             std::to_string(definition.maxValue) + "]";
    }
  }

  return definition.validator ? definition.validator(value) : std::string();
}

} // namespace McpIDE::editor
