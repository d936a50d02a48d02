#include "McpIDE/editor/qt/mi_main_window.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/language_definitions.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/editor/qt/mi_split_view_container.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"
#include "McpIDE/editor/qt/mi_welcome_page.hpp"
#include "McpIDE/editor/qt/panels/mi_file_explorer_panel.hpp"

#include <QAction>
#include <QFileInfo>
#include <QLabel>
#include <QMenuBar>
#include <QStatusBar>
#include <QTabWidget>
#include <QToolBar>

namespace McpIDE::editor::qt {

MIMainWindow::MIMainWindow(MIAppSettings &settings, QWidget *parent)
    : QMainWindow(parent), m_settings(settings) {
  setObjectName("MainWindow");
  setWindowTitle("McpIDE");
  setMinimumSize(800, 600);
  resize(1200, 800);
  setDockOptions(AnimatedDocks | AllowTabbedDocks);
}

MIMainWindow::~MIMainWindow() = default;

bool MIMainWindow::initialize() {
  if (m_initialized)
    return true;

  setupUi();
  setupActions();
  setupMenuBar();
  setupToolBar();
  setupStatusBar();
  setupConnections();

  MIStyleManager::instance().applyTheme(m_settings.theme());
  applyViewSettings();
  restoreLayout();

  if (m_settings.shouldShowWelcomeScreen() && !m_settings.isWelcomeTabClosed()) {
    showWelcomePage();
  }

  const QString lastWorkspace = m_settings.lastWorkspace();
  if (!lastWorkspace.isEmpty() && QFileInfo(lastWorkspace).isDir()) {
    openWorkspace(lastWorkspace);
  }

  restoreOpenFiles();
  updateStatusLabels(currentEditor());

  m_initialized = true;
  MCPIDE_LOG_INFO("Main window initialized");
  return true;
}

void MIMainWindow::setupUi() {
  m_splitView = new MISplitViewContainer(this);
  m_splitView->setObjectName("EditorArea");
  setCentralWidget(m_splitView);

  m_explorerPanel = new MIFileExplorerPanel(this);
  addDockWidget(Qt::LeftDockWidgetArea, m_explorerPanel);
  resizeDocks({m_explorerPanel}, {260}, Qt::Horizontal);
}

void MIMainWindow::setupConnections() {
  connect(m_splitView, &MISplitViewContainer::editorCreated, this, &MIMainWindow::wireEditor);
  connect(m_splitView, &MISplitViewContainer::currentEditorChanged, this,
          &MIMainWindow::onCurrentEditorChanged);
  m_splitView->setCloseHandler(
      [this](QTabWidget *tabs, int index) { return handleTabClose(tabs, index); });

  connect(m_explorerPanel, &MIFileExplorerPanel::fileActivated, this,
          [this](const QString &path) { openFilePath(path); });

  connect(&m_settings, &MIAppSettings::themeChanged, this, &MIMainWindow::onThemeChanged);
  connect(&m_settings, &MIAppSettings::recentWorkspacesChanged, this,
          [this](const QStringList &) { rebuildRecentMenu(); });
  connect(&m_settings, &MIAppSettings::settingChanged, this, &MIMainWindow::onSettingChanged);
}

void MIMainWindow::wireEditor(MICodeEditor *editor) {
  connect(editor, &MICodeEditor::cursorPositionChanged, this,
          [this, editor](int line, int column) {
            if (editor == currentEditor()) {
              onCursorPositionChanged(line, column);
            }
          });
  connect(editor, &MICodeEditor::fileDropped, this,
          [this](const QString &path) { openFilePath(path); });
  connect(editor, &MICodeEditor::filePathChanged, this, [this, editor](const QString &) {
    if (editor == currentEditor()) {
      updateStatusLabels(editor);
    }
  });
}

MICodeEditor *MIMainWindow::currentEditor() const {
  return m_splitView ? m_splitView->currentEditor() : nullptr;
}

// ============================================================================
// Layout and view settings
// ============================================================================

void MIMainWindow::restoreLayout() {
  const QByteArray geometry = m_settings.windowGeometry();
  if (!geometry.isEmpty()) {
    restoreGeometry(geometry);
  }
  const QByteArray state = m_settings.windowState();
  if (!state.isEmpty()) {
    restoreState(state);
  }

  const QString layout = m_settings.editorLayout();
  if (layout == "split-horizontal") {
    m_splitView->splitHorizontally();
  } else if (layout == "split-vertical") {
    m_splitView->splitVertically();
  }
}

void MIMainWindow::applyViewSettings() {
  statusBar()->setVisible(m_settings.setting("show_status_bar", true).toBool());
  menuBar()->setVisible(m_settings.setting("show_menu_bar", true).toBool());
  m_mainToolBar->setVisible(m_settings.setting("show_activity_bar", true).toBool());
}

void MIMainWindow::onSettingChanged(const QString &key) {
  if (key == "show_status_bar" || key == "show_menu_bar" || key == "show_activity_bar") {
    applyViewSettings();
  }
}

void MIMainWindow::updateWindowTitle() {
  if (m_workspacePath.isEmpty()) {
    setWindowTitle("McpIDE");
  } else {
    setWindowTitle(QString("McpIDE - %1").arg(m_workspacePath));
  }
}

// ============================================================================
// Status bar
// ============================================================================

void MIMainWindow::setStatusMessage(const QString &message, int timeout) {
  statusBar()->showMessage(message, timeout);
}

void MIMainWindow::onCursorPositionChanged(int line, int column) {
  m_cursorLabel->setText(tr("Line: %1, Column: %2").arg(line).arg(column));
}

void MIMainWindow::onCurrentEditorChanged(MICodeEditor *editor) { updateStatusLabels(editor); }

void MIMainWindow::updateStatusLabels(MICodeEditor *editor) {
  if (!m_cursorLabel || !m_languageLabel) {
    return;
  }
  if (!editor) {
    m_cursorLabel->setText(tr("Line: 1, Column: 1"));
    m_languageLabel->setText(QString());
    return;
  }
  const QTextCursor cursor = editor->textCursor();
  onCursorPositionChanged(cursor.blockNumber() + 1, cursor.positionInBlock() + 1);
  m_languageLabel->setText(QString::fromUtf8(languageDisplayName(editor->language())));
}

// ============================================================================
// Theme, welcome and about
// ============================================================================

void MIMainWindow::toggleTheme() {
  const QString next = m_settings.theme() == "dark" ? QString("light") : QString("dark");
  m_settings.setTheme(next);
}

void MIMainWindow::onThemeChanged(const QString &theme) {
  MIStyleManager::instance().applyTheme(theme);
  for (MICodeEditor *editor : m_splitView->allEditors()) {
    editor->viewport()->update();
  }
  MCPIDE_LOG_INFO("Theme switched to {}", theme.toStdString());
}

void MIMainWindow::showWelcomePage() {
  if (m_welcomePage) {
    m_splitView->activateTab(m_welcomePage);
    return;
  }

  auto *page = new MIWelcomePage(&m_settings);
  connect(page, &MIWelcomePage::newFileRequested, this, [this]() { newFile(); });
  connect(page, &MIWelcomePage::openFileRequested, this, &MIMainWindow::openFile);
  connect(page, &MIWelcomePage::openFolderRequested, this, &MIMainWindow::openFolder);
  connect(page, &MIWelcomePage::recentWorkspaceSelected, this,
          [this](const QString &path) { openWorkspace(path); });

  m_welcomePage = page;
  m_splitView->addEditor(page, tr("Welcome"));
  m_settings.setWelcomeTabClosed(false);
}

void MIMainWindow::showAboutDialog() {
  MIMessageDialog::showInfo(this, tr("About McpIDE"),
                            tr("McpIDE - A lightweight code editor\n\nVersion: 0.1.0"));
}

} // namespace McpIDE::editor::qt
