/**
 * @file test_find_replace_dialog.cpp
 * @brief Tests for the find and replace request dialog
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/mi_find_replace_dialog.hpp"

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

TEST_CASE("MIFindReplaceDialog - Defaults", "[find_replace]") {
  ensureQtApp();
  MIFindReplaceDialog dialog;

  CHECK_FALSE(dialog.isModal());
  CHECK(dialog.searchText().isEmpty());
  const MISearchOptions options = dialog.options();
  CHECK_FALSE(options.caseSensitive);
  CHECK_FALSE(options.wholeWords);
  CHECK_FALSE(options.regex);
  CHECK(options.forward);
}

TEST_CASE("MIFindReplaceDialog - Requests", "[find_replace]") {
  ensureQtApp();
  MIFindReplaceDialog dialog;
  QSignalSpy next(&dialog, &MIFindReplaceDialog::findNext);
  QSignalSpy previous(&dialog, &MIFindReplaceDialog::findPrevious);
  QSignalSpy replace(&dialog, &MIFindReplaceDialog::replaceRequested);
  QSignalSpy replaceAll(&dialog, &MIFindReplaceDialog::replaceAllRequested);

  SECTION("Empty text emits nothing") {
    dialog.find();
    dialog.replace();
    dialog.replaceAll();
    CHECK(next.count() == 0);
    CHECK(replace.count() == 0);
    CHECK(replaceAll.count() == 0);
  }

  SECTION("Forward find carries the options") {
    dialog.setSearchText("needle");
    MISearchOptions options;
    options.caseSensitive = true;
    options.wholeWords = true;
    dialog.setOptions(options);
    dialog.find();

    REQUIRE(next.count() == 1);
    const QList<QVariant> args = next.takeFirst();
    CHECK(args.at(0).toString() == "needle");
    CHECK(args.at(1).toBool());
    CHECK(args.at(2).toBool());
    CHECK_FALSE(args.at(3).toBool());
    CHECK(previous.count() == 0);
  }

  SECTION("Backward direction asks for the previous match") {
    dialog.setSearchText("needle");
    MISearchOptions options;
    options.forward = false;
    dialog.setOptions(options);
    CHECK_FALSE(dialog.options().forward);
    dialog.find();
    CHECK(previous.count() == 1);
    CHECK(next.count() == 0);
  }

  SECTION("Replace requests include the replacement") {
    dialog.setSearchText("old");
    dialog.setReplaceText("new");
    dialog.replace();
    dialog.replaceAll();

    REQUIRE(replace.count() == 1);
    CHECK(replace.at(0).at(1).toString() == "new");
    REQUIRE(replaceAll.count() == 1);
    CHECK(replaceAll.at(0).at(0).toString() == "old");
  }

  SECTION("Invalid regular expressions are reported, not sent") {
    dialog.setSearchText("(open");
    MISearchOptions options;
    options.regex = true;
    dialog.setOptions(options);
    dialog.find();
    dialog.replaceAll();
    CHECK(next.count() == 0);
    CHECK(replaceAll.count() == 0);
    CHECK(dialog.statusText() == "Invalid regular expression");
  }
}

TEST_CASE("MIFindReplaceDialog - Status text", "[find_replace]") {
  ensureQtApp();
  MIFindReplaceDialog dialog;
  dialog.setStatusText("3 match(es)");
  CHECK(dialog.statusText() == "3 match(es)");
  dialog.setStatusText(QString());
  CHECK(dialog.statusText().isEmpty());
}
