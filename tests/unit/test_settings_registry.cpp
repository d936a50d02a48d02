/**
 * @file test_settings_registry.cpp
 * @brief Tests for the settings registry and its defaults
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/settings_registry.hpp"
#include "McpIDE/editor/settings_type_handlers.hpp"

#include <string>
#include <vector>

using namespace McpIDE::editor;

TEST_CASE("MISettingsRegistry - Register and retrieve settings", "[settings_registry]") {
  MISettingsRegistry registry;

  SettingDefinition def;
  def.key = "test.bool_setting";
  def.displayName = "Test Bool";
  def.description = "A test boolean setting";
  def.category = "Test/General";
  def.type = SettingType::Bool;
  def.defaultValue = true;
  registry.registerSetting(def);

  SECTION("Get definition") {
    auto retrieved = registry.getDefinition("test.bool_setting");
    REQUIRE(retrieved.has_value());
    CHECK(retrieved->displayName == "Test Bool");
    CHECK(retrieved->type == SettingType::Bool);
  }

  SECTION("Default becomes the value") {
    CHECK(registry.getBool("test.bool_setting", false) == true);
    CHECK_FALSE(registry.isDirty());
  }

  SECTION("Unknown keys") {
    CHECK_FALSE(registry.contains("test.missing"));
    CHECK_FALSE(registry.getValue("test.missing").has_value());
    CHECK(registry.getInt("test.missing", 7) == 7);
    CHECK(registry.getString("test.bool_setting", "fallback") == "fallback");
  }
}

TEST_CASE("MISettingsRegistry - Set and get values", "[settings_registry]") {
  MISettingsRegistry registry;

  SettingDefinition intDef;
  intDef.key = "test.range";
  intDef.category = "Test";
  intDef.type = SettingType::IntRange;
  intDef.defaultValue = 4;
  intDef.minValue = 1;
  intDef.maxValue = 16;
  registry.registerSetting(intDef);

  SECTION("Set value marks dirty") {
    CHECK(registry.setValue("test.range", 8).empty());
    CHECK(registry.getInt("test.range") == 8);
    CHECK(registry.isDirty());
    CHECK(registry.isModified("test.range"));
  }

  SECTION("Out of range is rejected") {
    CHECK_FALSE(registry.setValue("test.range", 17).empty());
    CHECK_FALSE(registry.setValue("test.range", 0).empty());
    CHECK(registry.getInt("test.range") == 4);
    CHECK_FALSE(registry.isDirty());
  }

  SECTION("Refusals are logged with the offered value") {
    auto &logger = McpIDE::core::Logger::instance();
    const auto previousLevel = logger.level();
    logger.setLevel(McpIDE::core::LogLevel::Warning);
    std::vector<std::string> warnings;
    const auto sinkId = logger.addSink(
        [&warnings](McpIDE::core::LogLevel level, const std::string &message) {
          if (level == McpIDE::core::LogLevel::Warning) {
            warnings.push_back(message);
          }
        });
    const std::string error = registry.setValue("test.range", 17);
    logger.removeSink(sinkId);
    logger.setLevel(previousLevel);

    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0] == "Refused value '17' for setting 'test.range': " + error);
  }

  SECTION("Wrong type is rejected") {
    CHECK_FALSE(registry.setValue("test.range", std::string("eight")).empty());
    CHECK(registry.getInt("test.range") == 4);
  }

  SECTION("Unknown key is rejected") {
    CHECK_FALSE(registry.setValue("test.missing", 1).empty());
  }

  SECTION("markClean forgets modifications") {
    registry.setValue("test.range", 2);
    registry.markClean();
    CHECK_FALSE(registry.isDirty());
    CHECK_FALSE(registry.isModified("test.range"));
  }

  SECTION("Reset to default") {
    registry.setValue("test.range", 12);
    registry.resetToDefault("test.range");
    CHECK(registry.getInt("test.range") == 4);
  }
}

TEST_CASE("MISettingsRegistry - Change callbacks", "[settings_registry]") {
  MISettingsRegistry registry;
  registry.registerEditorDefaults();

  int calls = 0;
  std::string lastTheme;
  registry.registerChangeCallback("theme", [&](const std::string &, const SettingValue &value) {
    ++calls;
    lastTheme = std::get<std::string>(value);
  });

  SECTION("Fires on change") {
    registry.setValue("theme", std::string("light"));
    CHECK(calls == 1);
    CHECK(lastTheme == "light");
  }

  SECTION("Same value does not fire") {
    registry.setValue("theme", std::string("dark"));
    CHECK(calls == 0);
  }

  SECTION("Rejected value does not fire") {
    registry.setValue("theme", std::string("solarized"));
    CHECK(calls == 0);
    CHECK(registry.getString("theme") == "dark");
  }

  SECTION("Unregistered callback stays silent") {
    registry.unregisterChangeCallback("theme");
    registry.setValue("theme", std::string("light"));
    CHECK(calls == 0);
  }
}

TEST_CASE("MISettingsRegistry - Editor defaults", "[settings_registry]") {
  MISettingsRegistry registry;
  registry.registerEditorDefaults();

  CHECK(registry.getString("theme") == "dark");
  CHECK(registry.getStringList("recent_workspaces").empty());
  CHECK(registry.getString("last_workspace").empty());
  CHECK(registry.getBool("show_welcome_screen") == true);
  CHECK(registry.getBool("welcome_tab_closed") == false);
  CHECK(registry.getString("font_family") == "Consolas");
  CHECK(registry.getInt("font_size") == 12);
  CHECK(registry.getInt("tab_size") == 4);
  CHECK(registry.getBool("use_spaces") == true);
  CHECK(registry.getBool("show_line_numbers") == true);
  CHECK(registry.getBool("word_wrap") == false);
  CHECK(registry.getBool("auto_save") == false);
  CHECK(registry.getInt("auto_save_interval") == 30000);
  CHECK(registry.getString("editor_layout") == "single");
  CHECK(registry.getBool("show_status_bar") == true);

  SECTION("Font size bounds") {
    CHECK(registry.setValue("font_size", 6).empty());
    CHECK(registry.setValue("font_size", 72).empty());
    CHECK_FALSE(registry.setValue("font_size", 5).empty());
    CHECK_FALSE(registry.setValue("font_size", 73).empty());
  }

  SECTION("Empty font family is rejected") {
    CHECK_FALSE(registry.setValue("font_family", std::string()).empty());
  }

  SECTION("Recent list is capped") {
    std::vector<std::string> tooMany;
    for (int i = 0; i < 11; ++i) {
      tooMany.push_back("/work/" + std::to_string(i));
    }
    CHECK_FALSE(registry.setValue("recent_workspaces", tooMany).empty());
    tooMany.pop_back();
    CHECK(registry.setValue("recent_workspaces", tooMany).empty());
  }

  SECTION("Editor layout options") {
    CHECK(registry.setValue("editor_layout", std::string("split-vertical")).empty());
    CHECK_FALSE(registry.setValue("editor_layout", std::string("grid")).empty());
  }
}

TEST_CASE("MISettingsRegistry - Categories", "[settings_registry]") {
  MISettingsRegistry registry;
  registry.registerEditorDefaults();

  const auto fontSettings = registry.getByCategory("Editor/Font");
  CHECK(fontSettings.size() == 2);
  CHECK(registry.getByCategory("Window").size() == 3);
  CHECK(registry.getByCategory("Nowhere").empty());

  const auto all = registry.getAllDefinitions();
  for (size_t i = 1; i < all.size(); ++i) {
    CHECK(all[i - 1].key < all[i].key);
  }
}

TEST_CASE("Setting type handlers - Text conversion", "[settings_registry]") {
  CHECK(settingValueToString(SettingValue{true}) == "true");
  CHECK(settingValueToString(SettingValue{42}) == "42");
  CHECK(settingValueToString(SettingValue{std::vector<std::string>{"a", "b"}}) == "a, b");

  auto parsedBool = stringToSettingValue("TRUE", SettingType::Bool);
  REQUIRE(parsedBool.has_value());
  CHECK(std::get<bool>(*parsedBool) == true);

  auto parsedInt = stringToSettingValue("17", SettingType::IntRange);
  REQUIRE(parsedInt.has_value());
  CHECK(std::get<McpIDE::i32>(*parsedInt) == 17);

  CHECK_FALSE(stringToSettingValue("maybe", SettingType::Bool).has_value());
  CHECK_FALSE(stringToSettingValue("12abc", SettingType::Int).has_value());

  auto parsedList = stringToSettingValue("one\ntwo", SettingType::StringList);
  REQUIRE(parsedList.has_value());
  CHECK(std::get<std::vector<std::string>>(*parsedList).size() == 2);
}
