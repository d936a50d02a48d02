/**
 * @file test_split_view.cpp
 * @brief Tests for the splitter based editor area
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/editor/qt/mi_split_view_container.hpp"

#include <QApplication>
#include <QFile>
#include <QSignalSpy>
#include <QSplitter>
#include <QTabWidget>
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

void flushDeletes() { QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete); }

} // namespace

TEST_CASE("MISplitViewContainer - Initial state", "[split_view]") {
  ensureQtApp();
  MISplitViewContainer container;

  CHECK(container.tabWidgetCount() == 1);
  CHECK(container.splitterDepth() == 1);
  CHECK(container.activeTabWidget() == container.tabWidgets().first());
  CHECK(container.currentEditor() == nullptr);
  CHECK(container.allEditors().isEmpty());
  CHECK(container.rootSplitter()->count() == 1);
}

TEST_CASE("MISplitViewContainer - Adding editors", "[split_view]") {
  ensureQtApp();
  MISplitViewContainer container;
  QSignalSpy created(&container, &MISplitViewContainer::editorCreated);

  auto *first = new MICodeEditor();
  auto *second = new MICodeEditor();
  CHECK(container.addEditor(first, "Untitled") == 0);
  CHECK(container.addEditor(second, "Untitled") == 1);

  CHECK(created.count() == 2);
  CHECK(container.allEditors().size() == 2);
  CHECK(container.currentEditor() == second);

  SECTION("Activating a tab makes its editor current") {
    REQUIRE(container.activateTab(first));
    CHECK(container.currentEditor() == first);
  }

  SECTION("Tab title follows the modified flag") {
    auto [tabs, index] = container.locateWidget(first);
    REQUIRE(tabs != nullptr);
    first->setPlainText("changed");
    first->document()->setModified(true);
    CHECK(tabs->tabText(index) == "Untitled*");
    first->document()->setModified(false);
    CHECK(tabs->tabText(index) == "Untitled");
  }

  SECTION("Locate an unknown widget") {
    QWidget stray;
    auto [tabs, index] = container.locateWidget(&stray);
    CHECK(tabs == nullptr);
    CHECK(index == -1);
    CHECK_FALSE(container.activateTab(&stray));
  }
}

TEST_CASE("MISplitViewContainer - Editor lookup by path", "[split_view]") {
  ensureQtApp();
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  const QString path = dir.filePath("notes.md");
  {
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write("# notes\n");
  }

  MISplitViewContainer container;
  auto *editor = new MICodeEditor();
  REQUIRE(editor->loadFile(path).isOk());
  container.addEditor(editor, editor->displayName());

  CHECK(container.editorByPath(path) == editor);
  CHECK(container.editorByPath(dir.path() + "/./notes.md") == editor);
  CHECK(container.editorByPath(dir.filePath("other.md")) == nullptr);
  CHECK(container.editorByPath(QString()) == nullptr);
}

TEST_CASE("MISplitViewContainer - Splitting", "[split_view]") {
  ensureQtApp();
  MISplitViewContainer container;
  container.resize(800, 600);
  QTabWidget *original = container.tabWidgets().first();

  SECTION("Vertical split goes beside in the root") {
    QTabWidget *right = container.splitVertically(original);
    REQUIRE(right != nullptr);
    CHECK(container.tabWidgetCount() == 2);
    CHECK(container.splitterDepth() == 1);
    CHECK(container.rootSplitter()->indexOf(right) == 1);
    CHECK(container.activeTabWidget() == right);
  }

  SECTION("Horizontal split nests a vertical splitter") {
    QTabWidget *below = container.splitHorizontally(original);
    REQUIRE(below != nullptr);
    CHECK(container.splitterDepth() == 2);
    auto *wrapper = qobject_cast<QSplitter *>(below->parentWidget());
    REQUIRE(wrapper != nullptr);
    CHECK(wrapper->orientation() == Qt::Vertical);
    CHECK(wrapper->indexOf(original) == 0);
    CHECK(wrapper->indexOf(below) == 1);
  }

  SECTION("Closing a split merges tabs and collapses the splitter") {
    QTabWidget *below = container.splitHorizontally(original);
    auto *editor = new MICodeEditor();
    container.addEditor(editor, "moved", below);

    container.closeSplit(below);
    flushDeletes();

    CHECK(container.tabWidgetCount() == 1);
    CHECK(container.splitterDepth() == 1);
    CHECK(original->indexOf(editor) >= 0);
    CHECK(original->parentWidget() == container.rootSplitter());
  }

  SECTION("The last pane cannot be closed") {
    container.closeSplit(original);
    CHECK(container.tabWidgetCount() == 1);
  }
}

TEST_CASE("MISplitViewContainer - Closing tabs", "[split_view]") {
  ensureQtApp();
  MISplitViewContainer container;
  auto *editor = new MICodeEditor();
  container.addEditor(editor, "Untitled");
  QTabWidget *tabs = container.tabWidgets().first();

  QSignalSpy requested(&container, &MISplitViewContainer::tabCloseRequested);
  QSignalSpy closed(&container, &MISplitViewContainer::editorClosed);

  SECTION("A handler can veto the close") {
    int asked = 0;
    container.setCloseHandler([&asked](QTabWidget *, int) {
      ++asked;
      return false;
    });
    emit tabs->tabCloseRequested(0);
    CHECK(asked == 1);
    CHECK(requested.count() == 1);
    CHECK(tabs->count() == 1);
    CHECK(closed.count() == 0);
  }

  SECTION("An approving handler closes the tab") {
    container.setCloseHandler([](QTabWidget *, int) { return true; });
    emit tabs->tabCloseRequested(0);
    CHECK(requested.count() == 1);
    CHECK(tabs->count() == 0);
    CHECK(closed.count() == 1);
    CHECK(container.currentEditor() == nullptr);
  }

  SECTION("An empty pane beside another is removed") {
    QTabWidget *right = container.splitVertically(tabs);
    auto *other = new MICodeEditor();
    container.addEditor(other, "other", right);
    container.closeTab(right, 0);
    flushDeletes();
    CHECK(container.tabWidgetCount() == 1);
  }

  SECTION("Out of range indices are ignored") {
    container.closeTab(tabs, 5);
    container.closeTab(nullptr, 0);
    CHECK(tabs->count() == 1);
  }
}
