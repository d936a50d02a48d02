/**
 * @file test_style_manager.cpp
 * @brief Tests for theme tables and theme switching
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QApplication>
#include <QSignalSpy>

using namespace McpIDE::editor::qt;

namespace {

void ensureQtApp() {
  if (!QApplication::instance()) {
    static int argc = 1;
    static char arg0[] = "integration_tests";
    static char *argv[] = {arg0, nullptr};
    new QApplication(argc, argv);
  }
}

} // namespace

TEST_CASE("MIStyleManager - Theme names", "[style_manager]") {
  CHECK(MIStyleManager::themeFromName("light") == Theme::Light);
  CHECK(MIStyleManager::themeFromName("LIGHT") == Theme::Light);
  CHECK(MIStyleManager::themeFromName("dark") == Theme::Dark);
  CHECK(MIStyleManager::themeFromName("unknown") == Theme::Dark);
  CHECK(MIStyleManager::themeName(Theme::Light) == "light");
  CHECK(MIStyleManager::themeName(Theme::Dark) == "dark");
}

TEST_CASE("MIStyleManager - Named colors", "[style_manager]") {
  SECTION("Dark theme") {
    CHECK(MIStyleManager::color("background", Theme::Dark) == QColor(30, 30, 30));
    CHECK(MIStyleManager::color("foreground", Theme::Dark) == QColor(212, 212, 212));
    CHECK(MIStyleManager::color("line_number", Theme::Dark) == QColor(120, 120, 120));
    CHECK(MIStyleManager::color("no_such_color", Theme::Dark) == QColor(Qt::white));
  }

  SECTION("Light theme") {
    CHECK(MIStyleManager::color("background", Theme::Light) == QColor(255, 255, 255));
    CHECK(MIStyleManager::color("foreground", Theme::Light) == QColor(0, 0, 0));
    CHECK(MIStyleManager::color("no_such_color", Theme::Light) == QColor(Qt::black));
  }

  SECTION("Accent is shared") {
    CHECK(MIStyleManager::color("accent", Theme::Dark) ==
          MIStyleManager::color("accent", Theme::Light));
  }
}

TEST_CASE("MIStyleManager - Palettes", "[style_manager]") {
  const QPalette dark = MIStyleManager::createQPalette(Theme::Dark);
  const QPalette light = MIStyleManager::createQPalette(Theme::Light);

  CHECK(dark.color(QPalette::Base) == QColor(30, 30, 30));
  CHECK(light.color(QPalette::Base) == QColor(Qt::white));
  CHECK(dark.color(QPalette::Text).lightness() > light.color(QPalette::Text).lightness());
}

TEST_CASE("MIStyleManager - Color strings", "[style_manager]") {
  CHECK(MIStyleManager::colorToStyleString(QColor(1, 2, 3)) == "rgb(1, 2, 3)");
  CHECK(MIStyleManager::colorToStyleString(QColor(Qt::white)) == "rgb(255, 255, 255)");
}

TEST_CASE("MIStyleManager - Applying themes", "[style_manager]") {
  ensureQtApp();
  auto &style = MIStyleManager::instance();
  style.initialize(qobject_cast<QApplication *>(QApplication::instance()), Theme::Dark);

  QSignalSpy spy(&style, &MIStyleManager::themeChanged);

  style.applyTheme(QString("light"));
  CHECK(style.currentTheme() == Theme::Light);
  CHECK(style.palette().background == QColor(255, 255, 255));
  CHECK(style.color("sidebar") == QColor(243, 243, 243));
  CHECK(qApp->palette().color(QPalette::Base) == QColor(Qt::white));
  CHECK_FALSE(qApp->styleSheet().isEmpty());

  style.applyTheme(Theme::Dark);
  CHECK(style.currentTheme() == Theme::Dark);
  CHECK(qApp->palette().color(QPalette::Base) == QColor(30, 30, 30));
  CHECK(spy.count() == 2);

  SECTION("Monospace font is fixed pitch") {
    CHECK(style.monospaceFont().fixedPitch());
  }

  SECTION("Typography tokens") {
    CHECK(style.typography().displaySize > style.typography().titleSize);
    CHECK(style.spacing().md == 12);
  }
}

TEST_CASE("MIStyleManager - Theme switch without an application", "[style_manager]") {
  ensureQtApp();
  auto *app = qobject_cast<QApplication *>(QApplication::instance());
  auto &style = MIStyleManager::instance();
  style.initialize(app, Theme::Dark);
  const QString styledSheet = qApp->styleSheet();

  style.initialize(nullptr, Theme::Dark);
  QSignalSpy spy(&style, &MIStyleManager::themeChanged);
  style.applyTheme(Theme::Light);

  CHECK(style.currentTheme() == Theme::Light);
  CHECK(style.palette().sidebar == QColor(243, 243, 243));
  CHECK(spy.count() == 1);
  CHECK(qApp->palette().color(QPalette::Base) == QColor(30, 30, 30));
  CHECK(qApp->styleSheet() == styledSheet);

  style.initialize(app, Theme::Dark);
  CHECK(style.currentTheme() == Theme::Dark);
}
