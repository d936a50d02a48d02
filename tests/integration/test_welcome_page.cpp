/**
 * @file test_welcome_page.cpp
 * @brief Tests for the welcome page and its recent workspace list
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_welcome_page.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QListWidget>
#include <QPushButton>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>

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

QPushButton *buttonWithText(QWidget &parent, const QString &text) {
  for (auto *button : parent.findChildren<QPushButton *>()) {
    if (button->text() == text) {
      return button;
    }
  }
  return nullptr;
}

} // namespace

TEST_CASE("MIWelcomePage - Recent workspaces", "[welcome_page]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QSettings store(dir.filePath("settings.ini"), QSettings::IniFormat);
  MIAppSettings settings(&store);

  MIWelcomePage page(&settings);

  SECTION("Empty list shows a disabled placeholder") {
    CHECK(page.recentCount() == 0);
    REQUIRE(page.recentList()->count() == 1);
    CHECK(page.recentList()->item(0)->text() == "No recent workspaces");
    CHECK(page.recentList()->item(0)->flags() == Qt::NoItemFlags);
  }

  SECTION("List follows the settings") {
    settings.addRecentWorkspace("/projects/alpha");
    settings.addRecentWorkspace("/projects/beta");
    REQUIRE(page.recentCount() == 2);
    QListWidgetItem *first = page.recentList()->item(0);
    CHECK(first->text() == "beta");
    CHECK(first->toolTip() == "/projects/beta");
    CHECK(first->data(Qt::UserRole).toString() == "/projects/beta");

    settings.clearRecentWorkspaces();
    CHECK(page.recentCount() == 0);
  }

  SECTION("Activating an entry selects the workspace") {
    settings.addRecentWorkspace("/projects/alpha");
    QSignalSpy spy(&page, &MIWelcomePage::recentWorkspaceSelected);
    emit page.recentList()->itemActivated(page.recentList()->item(0));
    REQUIRE(spy.count() == 1);
    CHECK(spy.takeFirst().at(0).toString() == "/projects/alpha");
  }

  SECTION("Activating the placeholder does nothing") {
    QSignalSpy spy(&page, &MIWelcomePage::recentWorkspaceSelected);
    emit page.recentList()->itemActivated(page.recentList()->item(0));
    CHECK(spy.count() == 0);
  }
}

TEST_CASE("MIWelcomePage - Start actions", "[welcome_page]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QSettings store(dir.filePath("settings.ini"), QSettings::IniFormat);
  MIAppSettings settings(&store);
  MIWelcomePage page(&settings);

  QSignalSpy newFile(&page, &MIWelcomePage::newFileRequested);
  QSignalSpy openFile(&page, &MIWelcomePage::openFileRequested);
  QSignalSpy openFolder(&page, &MIWelcomePage::openFolderRequested);

  auto *newButton = buttonWithText(page, "New File");
  auto *openButton = buttonWithText(page, "Open File...");
  auto *folderButton = buttonWithText(page, "Open Folder...");
  REQUIRE(newButton != nullptr);
  REQUIRE(openButton != nullptr);
  REQUIRE(folderButton != nullptr);

  newButton->click();
  openButton->click();
  folderButton->click();
  CHECK(newFile.count() == 1);
  CHECK(openFile.count() == 1);
  CHECK(openFolder.count() == 1);
}

TEST_CASE("MIWelcomePage - Startup checkbox", "[welcome_page]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QSettings store(dir.filePath("settings.ini"), QSettings::IniFormat);
  MIAppSettings settings(&store);
  MIWelcomePage page(&settings);

  auto *checkbox = page.findChild<QCheckBox *>();
  REQUIRE(checkbox != nullptr);
  CHECK(checkbox->isChecked());

  checkbox->setChecked(false);
  CHECK_FALSE(settings.shouldShowWelcomeScreen());
  checkbox->setChecked(true);
  CHECK(settings.shouldShowWelcomeScreen());
}
