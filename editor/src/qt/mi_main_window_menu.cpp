#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/editor/qt/mi_main_window.hpp"
#include "McpIDE/editor/qt/mi_split_view_container.hpp"
#include "McpIDE/editor/qt/panels/mi_file_explorer_panel.hpp"

#include <QAction>
#include <QDir>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>
#include <QStyle>
#include <QToolBar>

namespace McpIDE::editor::qt {

namespace {

QAction *makeAction(QObject *parent, const QString &text, const QString &objectName,
                    const QKeySequence &shortcut = QKeySequence()) {
  auto *action = new QAction(text, parent);
  action->setObjectName(objectName);
  if (!shortcut.isEmpty()) {
    action->setShortcut(shortcut);
  }
  return action;
}

/// Forward an edit action to the current editor
template <typename Fn> void connectToEditor(MIMainWindow *window, QAction *action, Fn fn) {
  QObject::connect(action, &QAction::triggered, window, [window, fn]() {
    if (MICodeEditor *editor = window->currentEditor()) {
      fn(editor);
    }
  });
}

} // namespace

void MIMainWindow::setupActions() {
  QStyle *style = this->style();

  // File
  m_actionNewFile = makeAction(this, tr("&New File"), "actionNewFile", QKeySequence::New);
  m_actionNewFile->setIcon(style->standardIcon(QStyle::SP_FileIcon));
  m_actionOpenFile =
      makeAction(this, tr("&Open File..."), "actionOpenFile", QKeySequence::Open);
  m_actionOpenFile->setIcon(style->standardIcon(QStyle::SP_DialogOpenButton));
  m_actionOpenFolder = makeAction(this, tr("Open &Folder..."), "actionOpenFolder",
                                  QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
  m_actionClearRecent = makeAction(this, tr("Clear Recent"), "actionClearRecent");
  m_actionSave = makeAction(this, tr("&Save"), "actionSave", QKeySequence::Save);
  m_actionSave->setIcon(style->standardIcon(QStyle::SP_DialogSaveButton));
  m_actionSaveAs = makeAction(this, tr("Save &As..."), "actionSaveAs", QKeySequence::SaveAs);
  m_actionCloseTab = makeAction(this, tr("&Close Tab"), "actionCloseTab",
                                QKeySequence(Qt::CTRL | Qt::Key_W));
  m_actionExit = makeAction(this, tr("E&xit"), "actionExit", QKeySequence::Quit);

  // Edit
  m_actionUndo = makeAction(this, tr("&Undo"), "actionUndo", QKeySequence::Undo);
  m_actionUndo->setIcon(style->standardIcon(QStyle::SP_ArrowBack));
  m_actionRedo = makeAction(this, tr("&Redo"), "actionRedo", QKeySequence::Redo);
  m_actionRedo->setIcon(style->standardIcon(QStyle::SP_ArrowForward));
  m_actionCut = makeAction(this, tr("Cu&t"), "actionCut", QKeySequence::Cut);
  m_actionCopy = makeAction(this, tr("&Copy"), "actionCopy", QKeySequence::Copy);
  m_actionPaste = makeAction(this, tr("&Paste"), "actionPaste", QKeySequence::Paste);
  m_actionFind = makeAction(this, tr("&Find..."), "actionFind", QKeySequence::Find);
  m_actionReplace =
      makeAction(this, tr("&Replace..."), "actionReplace", QKeySequence::Replace);
  m_actionFindNext =
      makeAction(this, tr("Find &Next"), "actionFindNext", QKeySequence(Qt::Key_F3));
  m_actionFindPrevious = makeAction(this, tr("Find &Previous"), "actionFindPrevious",
                                    QKeySequence(Qt::SHIFT | Qt::Key_F3));

  // View
  m_actionToggleExplorer = m_explorerPanel->toggleViewAction();
  m_actionToggleExplorer->setText(tr("&Explorer"));
  m_actionToggleExplorer->setObjectName("actionToggleExplorer");
  m_actionSplitHorizontal =
      makeAction(this, tr("Split &Horizontally"), "actionSplitHorizontal",
                 QKeySequence(Qt::CTRL | Qt::Key_Backslash));
  m_actionSplitVertical =
      makeAction(this, tr("Split &Vertically"), "actionSplitVertical",
                 QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_Backslash));
  m_actionToggleTheme = makeAction(this, tr("Toggle &Theme"), "actionToggleTheme");
  m_actionToggleTheme->setIcon(style->standardIcon(QStyle::SP_BrowserReload));
  m_actionShowWelcome = makeAction(this, tr("Show &Welcome Page"), "actionShowWelcome");

  // Help
  m_actionAbout = makeAction(this, tr("&About"), "actionAbout");

  connect(m_actionNewFile, &QAction::triggered, this, [this]() { newFile(); });
  connect(m_actionOpenFile, &QAction::triggered, this, &MIMainWindow::openFile);
  connect(m_actionOpenFolder, &QAction::triggered, this, &MIMainWindow::openFolder);
  connect(m_actionClearRecent, &QAction::triggered, this,
          [this]() { m_settings.clearRecentWorkspaces(); });
  connect(m_actionSave, &QAction::triggered, this, [this]() { saveCurrent(); });
  connect(m_actionSaveAs, &QAction::triggered, this, [this]() { saveCurrentAs(); });
  connect(m_actionCloseTab, &QAction::triggered, this, &MIMainWindow::closeCurrentTab);
  connect(m_actionExit, &QAction::triggered, this, &QMainWindow::close);

  connectToEditor(this, m_actionUndo, [](MICodeEditor *editor) { editor->undo(); });
  connectToEditor(this, m_actionRedo, [](MICodeEditor *editor) { editor->redo(); });
  connectToEditor(this, m_actionCut, [](MICodeEditor *editor) { editor->cut(); });
  connectToEditor(this, m_actionCopy, [](MICodeEditor *editor) { editor->copy(); });
  connectToEditor(this, m_actionPaste, [](MICodeEditor *editor) { editor->paste(); });
  connect(m_actionFind, &QAction::triggered, this, &MIMainWindow::showFindDialog);
  connect(m_actionReplace, &QAction::triggered, this, &MIMainWindow::showFindDialog);
  connect(m_actionFindNext, &QAction::triggered, this, &MIMainWindow::findNext);
  connect(m_actionFindPrevious, &QAction::triggered, this, &MIMainWindow::findPrevious);

  connect(m_actionSplitHorizontal, &QAction::triggered, this,
          [this]() { m_splitView->splitHorizontally(); });
  connect(m_actionSplitVertical, &QAction::triggered, this,
          [this]() { m_splitView->splitVertically(); });
  connect(m_actionToggleTheme, &QAction::triggered, this, &MIMainWindow::toggleTheme);
  connect(m_actionShowWelcome, &QAction::triggered, this, &MIMainWindow::showWelcomePage);

  connect(m_actionAbout, &QAction::triggered, this, &MIMainWindow::showAboutDialog);
}

void MIMainWindow::setupMenuBar() {
  QMenuBar *bar = menuBar();

  m_fileMenu = bar->addMenu(tr("&File"));
  m_fileMenu->addAction(m_actionNewFile);
  m_fileMenu->addAction(m_actionOpenFile);
  m_fileMenu->addAction(m_actionOpenFolder);
  m_recentMenu = m_fileMenu->addMenu(tr("Open &Recent"));
  m_recentMenu->setObjectName("menuOpenRecent");
  rebuildRecentMenu();
  m_fileMenu->addSeparator();
  m_fileMenu->addAction(m_actionSave);
  m_fileMenu->addAction(m_actionSaveAs);
  m_fileMenu->addSeparator();
  m_fileMenu->addAction(m_actionCloseTab);
  m_fileMenu->addSeparator();
  m_fileMenu->addAction(m_actionExit);

  m_editMenu = bar->addMenu(tr("&Edit"));
  m_editMenu->addAction(m_actionUndo);
  m_editMenu->addAction(m_actionRedo);
  m_editMenu->addSeparator();
  m_editMenu->addAction(m_actionCut);
  m_editMenu->addAction(m_actionCopy);
  m_editMenu->addAction(m_actionPaste);
  m_editMenu->addSeparator();
  m_editMenu->addAction(m_actionFind);
  m_editMenu->addAction(m_actionReplace);
  m_editMenu->addAction(m_actionFindNext);
  m_editMenu->addAction(m_actionFindPrevious);

  m_viewMenu = bar->addMenu(tr("&View"));
  m_viewMenu->addAction(m_actionToggleExplorer);
  m_layoutMenu = m_viewMenu->addMenu(tr("Editor &Layout"));
  m_layoutMenu->addAction(m_actionSplitHorizontal);
  m_layoutMenu->addAction(m_actionSplitVertical);
  m_viewMenu->addSeparator();
  m_viewMenu->addAction(m_actionToggleTheme);
  m_viewMenu->addAction(m_actionShowWelcome);

  m_helpMenu = bar->addMenu(tr("&Help"));
  m_helpMenu->addAction(m_actionAbout);
}

void MIMainWindow::rebuildRecentMenu() {
  if (!m_recentMenu) {
    return;
  }
  m_recentMenu->clear();

  const QStringList workspaces = m_settings.recentWorkspaces();
  for (const QString &path : workspaces) {
    QAction *action = m_recentMenu->addAction(QDir::toNativeSeparators(path));
    connect(action, &QAction::triggered, this, [this, path]() { openWorkspace(path); });
  }
  if (workspaces.isEmpty()) {
    QAction *empty = m_recentMenu->addAction(tr("No recent workspaces"));
    empty->setEnabled(false);
  }
  m_recentMenu->addSeparator();
  m_recentMenu->addAction(m_actionClearRecent);
  m_actionClearRecent->setEnabled(!workspaces.isEmpty());
}

void MIMainWindow::setupToolBar() {
  m_mainToolBar = addToolBar(tr("Main Toolbar"));
  m_mainToolBar->setObjectName("MainToolBar");
  m_mainToolBar->setMovable(false);
  m_mainToolBar->setIconSize(QSize(16, 16));

  m_mainToolBar->addAction(m_actionNewFile);
  m_mainToolBar->addAction(m_actionOpenFile);
  m_mainToolBar->addAction(m_actionSave);
  m_mainToolBar->addSeparator();
  m_mainToolBar->addAction(m_actionUndo);
  m_mainToolBar->addAction(m_actionRedo);
  m_mainToolBar->addSeparator();
  m_mainToolBar->addAction(m_actionToggleTheme);
}

void MIMainWindow::setupStatusBar() {
  QStatusBar *bar = statusBar();
  bar->setObjectName("MainStatusBar");

  m_cursorLabel = new QLabel(tr("Line: 1, Column: 1"), bar);
  m_cursorLabel->setObjectName("StatusCursorLabel");
  m_languageLabel = new QLabel(bar);
  m_languageLabel->setObjectName("StatusLanguageLabel");

  bar->addPermanentWidget(m_cursorLabel);
  bar->addPermanentWidget(m_languageLabel);
  bar->showMessage(tr("Ready"));
}

} // namespace McpIDE::editor::qt
