/**
 * @file settings_defaults_editor.cpp
 * @brief Keys, types and defaults of every persisted McpIDE setting
 */

#include "McpIDE/editor/settings_registry.hpp"

#include <utility>

namespace McpIDE::editor {

namespace {

std::string validateNonEmpty(const SettingValue &value) {
  const auto *str = std::get_if<std::string>(&value);
  if (str && str->find_first_not_of(" \t") == std::string::npos) {
    return "Value must not be empty";
  }
  return "";
}

std::string validateRecentList(const SettingValue &value) {
  const auto *list = std::get_if<std::vector<std::string>>(&value);
  if (list && list->size() > MISettingsRegistry::MAX_RECENT_WORKSPACES) {
    return "Too many recent workspaces (max " +
           std::to_string(MISettingsRegistry::MAX_RECENT_WORKSPACES) + ")";
  }
  return "";
}

SettingDefinition describe(const char *key, const char *name, const char *help,
                           const char *category, SettingType type, SettingValue value) {
  SettingDefinition def;
  def.key = key;
  def.displayName = name;
  def.description = help;
  def.category = category;
  def.type = type;
  def.defaultValue = std::move(value);
  return def;
}

SettingDefinition flag(const char *key, const char *name, const char *help,
                       const char *category, bool value) {
  return describe(key, name, help, category, SettingType::Bool, value);
}

SettingDefinition text(const char *key, const char *name, const char *help,
                       const char *category, const char *value) {
  return describe(key, name, help, category, SettingType::String, std::string(value));
}

SettingDefinition range(const char *key, const char *name, const char *help,
                        const char *category, i32 value, i32 min, i32 max) {
  SettingDefinition def = describe(key, name, help, category, SettingType::IntRange, value);
  def.minValue = min;
  def.maxValue = max;
  return def;
}

SettingDefinition choice(const char *key, const char *name, const char *help,
                         const char *category, const char *value,
                         std::vector<std::string> options) {
  SettingDefinition def =
      describe(key, name, help, category, SettingType::Enum, std::string(value));
  def.enumOptions = std::move(options);
  return def;
}

} // namespace

void MISettingsRegistry::registerEditorDefaults() {
  // Appearance
  registerSetting(choice("theme", "Color Theme", "Color theme of the whole application",
                         "Appearance", "dark", {"dark", "light"}));

  // Workspace
  SettingDefinition recent =
      describe("recent_workspaces", "Recent Workspaces",
               "Most recently opened folders, newest first", "Workspace",
               SettingType::StringList, std::vector<std::string>{});
  recent.validator = validateRecentList;
  registerSetting(recent);
  registerSetting(text("last_workspace", "Last Workspace", "Folder reopened on startup",
                       "Workspace", ""));
  registerSetting(flag("show_welcome_screen", "Show Welcome Page",
                       "Show the welcome page on startup", "Workspace", true));
  registerSetting(flag("welcome_tab_closed", "Welcome Tab Closed",
                       "The welcome tab was closed during the last session", "Workspace",
                       false));

  // Editor font
  SettingDefinition family =
      text("font_family", "Font Family", "Font used by code editors", "Editor/Font", "Consolas");
  family.validator = validateNonEmpty;
  registerSetting(family);
  registerSetting(range("font_size", "Font Size", "Point size of the editor font", "Editor/Font",
                        12, 6, 72));

  // Editor behaviour
  registerSetting(range("tab_size", "Tab Size", "Number of columns of one indentation level",
                        "Editor/Behavior", 4, 1, 16));
  registerSetting(flag("use_spaces", "Insert Spaces",
                       "Indent with spaces instead of tab characters", "Editor/Behavior", true));
  registerSetting(flag("show_line_numbers", "Show Line Numbers",
                       "Show line numbers in the editor gutter", "Editor/Behavior", true));
  registerSetting(flag("word_wrap", "Word Wrap", "Wrap long lines at the editor width",
                       "Editor/Behavior", false));
  registerSetting(flag("auto_save", "Auto Save", "Automatically save modified files",
                       "Editor/Behavior", false));
  registerSetting(range("auto_save_interval", "Auto Save Interval (ms)",
                        "Time between automatic saves", "Editor/Behavior", 30000, 1000,
                        3600000));
  registerSetting(choice("editor_layout", "Editor Layout", "Arrangement of the editor area",
                         "Editor/Layout", "single",
                         {"single", "split-horizontal", "split-vertical"}));

  // Window chrome
  registerSetting(flag("show_status_bar", "Show Status Bar",
                       "Show the status bar at the bottom of the window", "Window", true));
  registerSetting(flag("show_menu_bar", "Show Menu Bar", "Show the menu bar", "Window", true));
  registerSetting(flag("show_activity_bar", "Show Activity Bar", "Show the main tool bar",
                       "Window", true));
}

} // namespace McpIDE::editor
