#pragma once

/**
 * @file settings_persistence.hpp
 * @brief QSettings storage for the settings registry
 */

#include "McpIDE/core/result.hpp"
#include "McpIDE/editor/settings_registry.hpp"
#include <QVariant>
#include <string>

class QSettings;

namespace McpIDE::editor {

/**
 * @brief Handles loading and saving registry values to/from QSettings
 *
 * Every registered key maps to a QSettings key of the same name. Values are
 * converted according to the definition type, so an INI backend (which
 * stores everything as text) reads back the same values as the native one.
 */
class SettingsPersistence {
public:
  /**
   * @brief Apply stored values to the registry
   *
   * Keys missing from the store keep their current value. Stored values that
   * cannot be converted or fail validation are skipped with a warning.
   * @return error when the store itself is unreadable
   */
  static Result<void> load(QSettings &settings, MISettingsRegistry &registry);

  /**
   * @brief Write every registered value and flush the store
   */
  static Result<void> save(QSettings &settings, MISettingsRegistry &registry);

  /**
   * @brief Write the default of every registered key the store lacks
   * @return Number of keys written
   */
  static int writeMissingDefaults(QSettings &settings, const MISettingsRegistry &registry);

  /**
   * @brief Convert a stored QVariant to the definition's value type
   */
  static Result<SettingValue> fromVariant(const QVariant &value, SettingType type);

  /**
   * @brief Convert a registry value to a QVariant suitable for QSettings
   */
  static QVariant toVariant(const SettingValue &value);
};

} // namespace McpIDE::editor
