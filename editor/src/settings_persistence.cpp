/**
 * @file settings_persistence.cpp
 * @brief QSettings storage for the settings registry
 */

#include "McpIDE/editor/settings_persistence.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/settings_type_handlers.hpp"
#include <QSettings>
#include <QStringList>
#include <string>

namespace McpIDE::editor {

namespace {

std::string statusToString(QSettings::Status status) {
  switch (status) {
  case QSettings::NoError:
    return "no error";
  case QSettings::AccessError:
    return "access error";
  case QSettings::FormatError:
    return "format error";
  }
  return "unknown error";
}

} // namespace

Result<SettingValue> SettingsPersistence::fromVariant(const QVariant &value, SettingType type) {
  switch (type) {
  case SettingType::Bool:
  case SettingType::Int:
  case SettingType::IntRange: {
    if (value.typeId() == QMetaType::Bool && type == SettingType::Bool) {
      return Result<SettingValue>::ok(value.toBool());
    }
    if (value.typeId() == QMetaType::Int && type != SettingType::Bool) {
      return Result<SettingValue>::ok(static_cast<i32>(value.toInt()));
    }
    // INI stores and some native backends hand scalars back as text
    auto parsed = stringToSettingValue(value.toString().toStdString(), type);
    if (!parsed) {
      return Result<SettingValue>::error(std::string("Expected ") +
                                         (type == SettingType::Bool ? "a boolean" : "an integer") +
                                         ", got '" + value.toString().toStdString() + "'");
    }
    return Result<SettingValue>::ok(*parsed);
  }
  case SettingType::String:
  case SettingType::Enum:
    if (!value.canConvert<QString>()) {
      return Result<SettingValue>::error("Expected a string");
    }
    return Result<SettingValue>::ok(value.toString().toStdString());
  case SettingType::StringList: {
    // INI files store an empty list as an invalid variant and a one-element
    // list as a plain string
    std::vector<std::string> items;
    if (!value.isValid()) {
      return Result<SettingValue>::ok(items);
    }
    if (value.typeId() == QMetaType::QString) {
      const QString single = value.toString();
      if (!single.isEmpty()) {
        items.push_back(single.toStdString());
      }
      return Result<SettingValue>::ok(items);
    }
    if (!value.canConvert<QStringList>()) {
      return Result<SettingValue>::error("Expected a string list");
    }
    for (const QString &item : value.toStringList()) {
      items.push_back(item.toStdString());
    }
    return Result<SettingValue>::ok(items);
  }
  }
  return Result<SettingValue>::error("Unknown setting type");
}

QVariant SettingsPersistence::toVariant(const SettingValue &value) {
  if (const auto *b = std::get_if<bool>(&value)) {
    return QVariant(*b);
  }
  if (const auto *i = std::get_if<i32>(&value)) {
    return QVariant(static_cast<int>(*i));
  }
  if (const auto *s = std::get_if<std::string>(&value)) {
    return QVariant(QString::fromStdString(*s));
  }

  QStringList list;
  for (const auto &item : std::get<std::vector<std::string>>(value)) {
    list.append(QString::fromStdString(item));
  }
  return QVariant(list);
}

Result<void> SettingsPersistence::load(QSettings &settings, MISettingsRegistry &registry) {
  if (settings.status() != QSettings::NoError) {
    return Result<void>::error("Settings store is unreadable (" +
                               statusToString(settings.status()) + ")");
  }

  int applied = 0;
  for (const auto &def : registry.getAllDefinitions()) {
    const QString qkey = QString::fromStdString(def.key);
    if (!settings.contains(qkey)) {
      continue;
    }

    auto converted = fromVariant(settings.value(qkey), def.type);
    if (converted.isError()) {
      MCPIDE_LOG_WARN("Ignoring stored setting '{}': {}", def.key, converted.error());
      continue;
    }

    const std::string error = registry.setValue(def.key, converted.value());
    if (!error.empty()) {
      MCPIDE_LOG_WARN("Ignoring stored setting '{}': {}", def.key, error);
      continue;
    }
    ++applied;
  }

  registry.markClean();
  MCPIDE_LOG_INFO("Loaded {} settings from: {}", applied, settings.fileName().toStdString());
  return Result<void>::ok();
}

Result<void> SettingsPersistence::save(QSettings &settings, MISettingsRegistry &registry) {
  for (const auto &def : registry.getAllDefinitions()) {
    auto value = registry.getValue(def.key);
    if (!value) {
      continue;
    }
    settings.setValue(QString::fromStdString(def.key), toVariant(*value));
  }

  settings.sync();
  if (settings.status() != QSettings::NoError) {
    return Result<void>::error("Failed to save settings to " +
                               settings.fileName().toStdString() + " (" +
                               statusToString(settings.status()) + ")");
  }

  registry.markClean();
  MCPIDE_LOG_DEBUG("Saved settings to: {}", settings.fileName().toStdString());
  return Result<void>::ok();
}

int SettingsPersistence::writeMissingDefaults(QSettings &settings,
                                              const MISettingsRegistry &registry) {
  int written = 0;
  for (const auto &def : registry.getAllDefinitions()) {
    const QString qkey = QString::fromStdString(def.key);
    if (settings.contains(qkey)) {
      continue;
    }
    settings.setValue(qkey, toVariant(def.defaultValue));
    ++written;
  }
  if (written > 0) {
    MCPIDE_LOG_DEBUG("Wrote {} default settings", written);
  }
  return written;
}

} // namespace McpIDE::editor
