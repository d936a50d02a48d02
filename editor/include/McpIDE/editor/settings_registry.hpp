#pragma once

/**
 * @file settings_registry.hpp
 * @brief Typed, validated store for the McpIDE preferences
 *
 * The registry has no storage backend; SettingsPersistence moves values in
 * and out of QSettings and MIAppSettings exposes them to the widgets.
 */

#include "McpIDE/core/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace McpIDE::editor {

enum class SettingType : u8 {
  Bool,
  Int,
  String,
  Enum,       // String restricted to enumOptions
  StringList, // Ordered, e.g. recent workspaces
  IntRange    // Int within [minValue, maxValue]
};

/// Alternative order matters: validation maps each SettingType to an index
using SettingValue = std::variant<bool, i32, std::string, std::vector<std::string>>;

/// Returns an error message, empty when the value is acceptable
using SettingValidator = std::function<std::string(const SettingValue &)>;

using SettingChangeCallback =
    std::function<void(const std::string &key, const SettingValue &newValue)>;

struct SettingDefinition {
  std::string key;         // Also the QSettings key
  std::string displayName;
  std::string description;
  std::string category;    // e.g. "Editor/Font"
  SettingType type = SettingType::String;
  SettingValue defaultValue;

  std::vector<std::string> enumOptions;
  i32 minValue = 0;
  i32 maxValue = 0;
  SettingValidator validator;
};

/**
 * @brief Definitions and current values of every setting
 *
 * Values always hold the alternative that matches their definition's type;
 * setValue() refuses anything else. Thread safe; change callbacks run after
 * the lock is released.
 */
class MISettingsRegistry {
public:
  MISettingsRegistry() = default;

  MISettingsRegistry(const MISettingsRegistry &) = delete;
  MISettingsRegistry &operator=(const MISettingsRegistry &) = delete;

  /**
   * @brief Add or replace a definition
   *
   * The default becomes the current value unless the key already has a
   * value of the right type.
   */
  void registerSetting(const SettingDefinition &def);

  /// Register every application setting with its default
  void registerEditorDefaults();

  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] std::optional<SettingDefinition> getDefinition(const std::string &key) const;

  /// Sorted by key
  [[nodiscard]] std::vector<SettingDefinition> getAllDefinitions() const;
  [[nodiscard]] std::vector<SettingDefinition> getByCategory(const std::string &category) const;

  // ========== Values ==========

  [[nodiscard]] std::optional<SettingValue> getValue(const std::string &key) const;

  /**
   * @brief Validate and store a value
   * @return Empty on success, otherwise why the value was refused
   *
   * Storing the current value again succeeds silently.
   */
  std::string setValue(const std::string &key, const SettingValue &value);

  void resetToDefault(const std::string &key);
  void resetAllToDefaults();

  // Typed getters return the fallback for unknown keys

  [[nodiscard]] bool getBool(const std::string &key, bool fallback = false) const;
  [[nodiscard]] i32 getInt(const std::string &key, i32 fallback = 0) const;
  [[nodiscard]] std::string getString(const std::string &key,
                                      const std::string &fallback = std::string()) const;
  [[nodiscard]] std::vector<std::string> getStringList(const std::string &key) const;

  // ========== Change tracking ==========

  /// True when a value changed since the last markClean()
  [[nodiscard]] bool isDirty() const;
  [[nodiscard]] bool isModified(const std::string &key) const;
  void markClean();

  void registerChangeCallback(const std::string &key, SettingChangeCallback callback);
  void unregisterChangeCallback(const std::string &key);

  static constexpr usize MAX_RECENT_WORKSPACES = 10;

private:
  struct Entry {
    SettingDefinition definition;
    SettingValue value;
  };

  template <typename T> [[nodiscard]] std::optional<T> valueAs(const std::string &key) const;

  std::map<std::string, Entry> m_entries;
  std::set<std::string> m_dirtyKeys;
  std::map<std::string, std::vector<SettingChangeCallback>> m_callbacks;
  mutable std::shared_mutex m_mutex;
};

} // namespace McpIDE::editor
