/**
 * @file test_file_explorer.cpp
 * @brief Tests for the explorer panel against a temporary workspace
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/panels/mi_file_explorer_panel.hpp"

#include <QApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemModel>
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

void touch(const QString &path, const QByteArray &content = {}) {
  QFile file(path);
  REQUIRE(file.open(QIODevice::WriteOnly));
  file.write(content);
}

} // namespace

TEST_CASE("MIFileExplorerPanel - Root path", "[file_explorer]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  MIFileExplorerPanel panel;
  CHECK(panel.panelId() == "Explorer");
  CHECK(panel.rootPath().isEmpty());

  QSignalSpy spy(&panel, &MIFileExplorerPanel::rootPathChanged);
  panel.setRootPath(dir.path() + "/");
  CHECK(panel.rootPath() == QDir::cleanPath(dir.path()));
  REQUIRE(spy.count() == 1);
  CHECK(spy.takeFirst().at(0).toString() == QDir::cleanPath(dir.path()));
}

TEST_CASE("MIFileExplorerPanel - Filter", "[file_explorer]") {
  ensureQtApp();
  MIFileExplorerPanel panel;

  panel.setFilterText("main");
  CHECK(panel.filterText() == "main");
  CHECK(panel.model()->nameFilters() == QStringList{"*main*"});

  panel.setFilterText("   ");
  CHECK(panel.model()->nameFilters().isEmpty());
}

TEST_CASE("MIFileExplorerPanel - Activation", "[file_explorer]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  touch(dir.filePath("app.py"), "print(1)\n");
  REQUIRE(QDir(dir.path()).mkdir("pkg"));

  MIFileExplorerPanel panel;
  panel.setRootPath(dir.path());
  QSignalSpy spy(&panel, &MIFileExplorerPanel::fileActivated);

  SECTION("Files are announced") {
    panel.activatePath(dir.filePath("app.py"));
    REQUIRE(spy.count() == 1);
    CHECK(spy.takeFirst().at(0).toString() == QFileInfo(dir.filePath("app.py")).absoluteFilePath());
  }

  SECTION("Folders are not") {
    panel.activatePath(dir.filePath("pkg"));
    CHECK(spy.count() == 0);
  }

  SECTION("Missing paths are ignored") {
    panel.activatePath(dir.filePath("ghost.py"));
    CHECK(spy.count() == 0);
  }
}

TEST_CASE("MIFileExplorerPanel - File operations", "[file_explorer]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  MIFileExplorerPanel panel;
  panel.setRootPath(dir.path());

  SECTION("Create a file") {
    QSignalSpy spy(&panel, &MIFileExplorerPanel::pathCreated);
    auto result = panel.createFile(dir.path(), "notes.md");
    REQUIRE(result.isOk());
    CHECK(QFileInfo(dir.filePath("notes.md")).isFile());
    CHECK(QFileInfo(dir.filePath("notes.md")).size() == 0);
    CHECK(spy.count() == 1);
  }

  SECTION("Create a folder") {
    auto result = panel.createFolder(dir.path(), "src");
    REQUIRE(result.isOk());
    CHECK(QFileInfo(dir.filePath("src")).isDir());
  }

  SECTION("Existing names are rejected and content kept") {
    touch(dir.filePath("keep.txt"), "keep");
    QSignalSpy spy(&panel, &MIFileExplorerPanel::pathCreated);
    auto result = panel.createFile(dir.path(), "keep.txt");
    REQUIRE(result.isError());
    CHECK(result.error().find("already exists") != std::string::npos);
    CHECK(spy.count() == 0);

    QFile file(dir.filePath("keep.txt"));
    REQUIRE(file.open(QIODevice::ReadOnly));
    CHECK(file.readAll() == "keep");
  }

  SECTION("Rename") {
    touch(dir.filePath("old.txt"), "data");
    QSignalSpy spy(&panel, &MIFileExplorerPanel::pathRenamed);
    auto result = panel.renamePath(dir.filePath("old.txt"), "new.txt");
    REQUIRE(result.isOk());
    CHECK_FALSE(QFileInfo::exists(dir.filePath("old.txt")));
    CHECK(QFileInfo(dir.filePath("new.txt")).isFile());
    REQUIRE(spy.count() == 1);
    CHECK(spy.at(0).at(0).toString() == dir.filePath("old.txt"));
  }

  SECTION("Delete a folder with contents") {
    REQUIRE(QDir(dir.path()).mkpath("build/out"));
    touch(dir.filePath("build/out/a.o"));
    QSignalSpy spy(&panel, &MIFileExplorerPanel::pathRemoved);
    REQUIRE(panel.removePath(dir.filePath("build")).isOk());
    CHECK_FALSE(QFileInfo::exists(dir.filePath("build")));
    CHECK(spy.count() == 1);
  }

  SECTION("Invalid names never reach the disk") {
    CHECK(panel.createFile(dir.path(), "a/b.txt").isError());
    CHECK(panel.createFolder(dir.path(), "..").isError());
    CHECK(QDir(dir.path()).entryList(QDir::AllEntries | QDir::NoDotAndDotDot).isEmpty());
  }
}
