/**
 * @file settings_registry.cpp
 * @brief Definitions, validated values and change notification for settings
 */

#include "McpIDE/editor/settings_registry.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/settings_type_handlers.hpp"
#include "McpIDE/editor/settings_validation.hpp"
#include <mutex>

namespace McpIDE::editor {

void MISettingsRegistry::registerSetting(const SettingDefinition &def) {
  std::unique_lock lock(m_mutex);
  auto it = m_entries.find(def.key);
  if (it == m_entries.end()) {
    m_entries.emplace(def.key, Entry{def, def.defaultValue});
    return;
  }

  it->second.definition = def;
  if (it->second.value.index() != def.defaultValue.index()) {
    it->second.value = def.defaultValue;
  }
}

bool MISettingsRegistry::contains(const std::string &key) const {
  std::shared_lock lock(m_mutex);
  return m_entries.count(key) != 0;
}

std::optional<SettingDefinition> MISettingsRegistry::getDefinition(const std::string &key) const {
  std::shared_lock lock(m_mutex);
  auto it = m_entries.find(key);
  if (it == m_entries.end()) {
    return std::nullopt;
  }
  return it->second.definition;
}

std::vector<SettingDefinition> MISettingsRegistry::getAllDefinitions() const {
  std::shared_lock lock(m_mutex);
  std::vector<SettingDefinition> result;
  result.reserve(m_entries.size());
  for (const auto &[key, entry] : m_entries) {
    result.push_back(entry.definition);
  }
  return result;
}

std::vector<SettingDefinition>
MISettingsRegistry::getByCategory(const std::string &category) const {
  std::shared_lock lock(m_mutex);
  std::vector<SettingDefinition> result;
  for (const auto &[key, entry] : m_entries) {
    if (entry.definition.category == category) {
      result.push_back(entry.definition);
    }
  }
  return result;
}

// ============================================================================
// Values
// ============================================================================

std::optional<SettingValue> MISettingsRegistry::getValue(const std::string &key) const {
  std::shared_lock lock(m_mutex);
  auto it = m_entries.find(key);
  if (it == m_entries.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

std::string MISettingsRegistry::setValue(const std::string &key, const SettingValue &value) {
  std::vector<SettingChangeCallback> callbacks;
  {
    std::unique_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
      return "Unknown setting: " + key;
    }

    if (std::string error = validateSettingValue(value, it->second.definition); !error.empty()) {
      MCPIDE_LOG_WARN("Refused value '{}' for setting '{}': {}", settingValueToString(value),
                      key, error);
      return error;
    }
    if (it->second.value == value) {
      return std::string();
    }

    it->second.value = value;
    m_dirtyKeys.insert(key);
    if (auto cbIt = m_callbacks.find(key); cbIt != m_callbacks.end()) {
      callbacks = cbIt->second;
    }
  }

  for (const auto &callback : callbacks) {
    callback(key, value);
  }
  return std::string();
}

void MISettingsRegistry::resetToDefault(const std::string &key) {
  if (auto def = getDefinition(key)) {
    setValue(key, def->defaultValue);
  }
}

void MISettingsRegistry::resetAllToDefaults() {
  for (const auto &def : getAllDefinitions()) {
    setValue(def.key, def.defaultValue);
  }
}

template <typename T>
std::optional<T> MISettingsRegistry::valueAs(const std::string &key) const {
  std::shared_lock lock(m_mutex);
  auto it = m_entries.find(key);
  if (it == m_entries.end()) {
    return std::nullopt;
  }
  if (const auto *typed = std::get_if<T>(&it->second.value)) {
    return *typed;
  }
  return std::nullopt;
}

bool MISettingsRegistry::getBool(const std::string &key, bool fallback) const {
  return valueAs<bool>(key).value_or(fallback);
}

i32 MISettingsRegistry::getInt(const std::string &key, i32 fallback) const {
  return valueAs<i32>(key).value_or(fallback);
}

std::string MISettingsRegistry::getString(const std::string &key,
                                          const std::string &fallback) const {
  return valueAs<std::string>(key).value_or(fallback);
}

std::vector<std::string> MISettingsRegistry::getStringList(const std::string &key) const {
  return valueAs<std::vector<std::string>>(key).value_or(std::vector<std::string>());
}

// ============================================================================
// Change tracking
// ============================================================================

bool MISettingsRegistry::isDirty() const {
  std::shared_lock lock(m_mutex);
  return !m_dirtyKeys.empty();
}

bool MISettingsRegistry::isModified(const std::string &key) const {
  std::shared_lock lock(m_mutex);
  return m_dirtyKeys.count(key) != 0;
}

void MISettingsRegistry::markClean() {
  std::unique_lock lock(m_mutex);
  m_dirtyKeys.clear();
}

void MISettingsRegistry::registerChangeCallback(const std::string &key,
                                                SettingChangeCallback callback) {
  if (!callback) {
    return;
  }
  std::unique_lock lock(m_mutex);
  m_callbacks[key].push_back(std::move(callback));
}

void MISettingsRegistry::unregisterChangeCallback(const std::string &key) {
  std::unique_lock lock(m_mutex);
  m_callbacks.erase(key);
}

} // namespace McpIDE::editor
