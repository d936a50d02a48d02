/**
 * @file test_settings_persistence.cpp
 * @brief Tests for moving registry values in and out of QSettings
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/settings_persistence.hpp"
#include "McpIDE/editor/settings_registry.hpp"

#include <QSettings>
#include <QStringList>
#include <QTemporaryDir>

using namespace McpIDE::editor;

namespace {

QString iniPath(const QTemporaryDir &dir) { return dir.filePath("settings.ini"); }

} // namespace

TEST_CASE("SettingsPersistence - Round trip through an INI store", "[settings_persistence]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  {
    MISettingsRegistry registry;
    registry.registerEditorDefaults();
    registry.setValue("theme", std::string("light"));
    registry.setValue("font_size", 16);
    registry.setValue("word_wrap", true);
    registry.setValue("recent_workspaces", std::vector<std::string>{"/a", "/b"});

    QSettings store(iniPath(dir), QSettings::IniFormat);
    auto result = SettingsPersistence::save(store, registry);
    REQUIRE(result.isOk());
    CHECK_FALSE(registry.isDirty());
  }

  MISettingsRegistry loaded;
  loaded.registerEditorDefaults();
  QSettings store(iniPath(dir), QSettings::IniFormat);
  REQUIRE(SettingsPersistence::load(store, loaded).isOk());

  CHECK(loaded.getString("theme") == "light");
  CHECK(loaded.getInt("font_size") == 16);
  CHECK(loaded.getBool("word_wrap") == true);
  CHECK(loaded.getStringList("recent_workspaces") == std::vector<std::string>{"/a", "/b"});
  CHECK_FALSE(loaded.isDirty());
}

TEST_CASE("SettingsPersistence - Invalid stored values are skipped", "[settings_persistence]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  {
    QSettings store(iniPath(dir), QSettings::IniFormat);
    store.setValue("theme", "neon");
    store.setValue("font_size", "huge");
    store.setValue("tab_size", 99);
    store.setValue("use_spaces", "false");
    store.sync();
  }

  MISettingsRegistry registry;
  registry.registerEditorDefaults();
  QSettings store(iniPath(dir), QSettings::IniFormat);
  REQUIRE(SettingsPersistence::load(store, registry).isOk());

  CHECK(registry.getString("theme") == "dark");
  CHECK(registry.getInt("font_size") == 12);
  CHECK(registry.getInt("tab_size") == 4);
  CHECK(registry.getBool("use_spaces") == false);
}

TEST_CASE("SettingsPersistence - Variant conversion", "[settings_persistence]") {
  SECTION("Booleans from text") {
    auto result = SettingsPersistence::fromVariant(QVariant(QString("true")), SettingType::Bool);
    REQUIRE(result.isOk());
    CHECK(std::get<bool>(result.value()) == true);
    CHECK(SettingsPersistence::fromVariant(QVariant(QString("perhaps")), SettingType::Bool)
              .isError());
  }

  SECTION("Integers") {
    auto result =
        SettingsPersistence::fromVariant(QVariant(QString("42")), SettingType::IntRange);
    REQUIRE(result.isOk());
    CHECK(std::get<McpIDE::i32>(result.value()) == 42);

    auto native = SettingsPersistence::fromVariant(QVariant(7), SettingType::Int);
    REQUIRE(native.isOk());
    CHECK(std::get<McpIDE::i32>(native.value()) == 7);

    auto wide = SettingsPersistence::fromVariant(QVariant(qlonglong(30000)), SettingType::IntRange);
    REQUIRE(wide.isOk());
    CHECK(std::get<McpIDE::i32>(wide.value()) == 30000);

    auto trailing =
        SettingsPersistence::fromVariant(QVariant(QString("12abc")), SettingType::Int);
    REQUIRE(trailing.isError());
    CHECK(trailing.error().find("integer") != std::string::npos);
    CHECK(SettingsPersistence::fromVariant(QVariant(QString("99999999999")), SettingType::Int)
              .isError());
  }

  SECTION("String lists in their INI shapes") {
    auto empty = SettingsPersistence::fromVariant(QVariant(), SettingType::StringList);
    REQUIRE(empty.isOk());
    CHECK(std::get<std::vector<std::string>>(empty.value()).empty());

    auto single =
        SettingsPersistence::fromVariant(QVariant(QString("/only")), SettingType::StringList);
    REQUIRE(single.isOk());
    CHECK(std::get<std::vector<std::string>>(single.value()) ==
          std::vector<std::string>{"/only"});

    auto many = SettingsPersistence::fromVariant(QVariant(QStringList{"/x", "/y"}),
                                                 SettingType::StringList);
    REQUIRE(many.isOk());
    CHECK(std::get<std::vector<std::string>>(many.value()).size() == 2);
  }

  SECTION("Registry values become plain QVariants") {
    CHECK(SettingsPersistence::toVariant(SettingValue{true}).toBool() == true);
    CHECK(SettingsPersistence::toVariant(SettingValue{7}).toInt() == 7);
    CHECK(SettingsPersistence::toVariant(SettingValue{std::string("dark")}).toString() ==
          "dark");
    CHECK(SettingsPersistence::toVariant(SettingValue{std::vector<std::string>{"a"}})
              .toStringList() == QStringList{"a"});
  }
}

TEST_CASE("SettingsPersistence - Missing defaults are written once", "[settings_persistence]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  MISettingsRegistry registry;
  registry.registerEditorDefaults();
  QSettings store(iniPath(dir), QSettings::IniFormat);
  store.setValue("theme", "light");

  const int written = SettingsPersistence::writeMissingDefaults(store, registry);
  CHECK(written == static_cast<int>(registry.getAllDefinitions().size()) - 1);
  CHECK(store.value("theme").toString() == "light");
  CHECK(SettingsPersistence::writeMissingDefaults(store, registry) == 0);
}
