#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/editor/qt/mi_main_window.hpp"
#include "McpIDE/editor/qt/mi_split_view_container.hpp"
#include "McpIDE/editor/qt/mi_welcome_page.hpp"
#include "McpIDE/editor/qt/panels/mi_file_explorer_panel.hpp"

#include <QDir>
#include <QFileInfo>
#include <QTabWidget>

namespace McpIDE::editor::qt {

// ============================================================================
// Files
// ============================================================================

MICodeEditor *MIMainWindow::newFile() {
  auto *editor = new MICodeEditor(&m_settings);
  m_splitView->addEditor(editor, editor->displayName());
  editor->setFocus();
  return editor;
}

void MIMainWindow::openFile() {
  const QString path = MIFileDialog::getOpenFileName(this, tr("Open File"), m_workspacePath);
  if (!path.isEmpty()) {
    openFilePath(path);
  }
}

MICodeEditor *MIMainWindow::openFilePath(const QString &path) {
  const QFileInfo info(path);
  if (!info.exists() || !info.isFile()) {
    reportError(tr("Error"), tr("File does not exist: %1").arg(path));
    return nullptr;
  }

  if (MICodeEditor *existing = m_splitView->editorByPath(path)) {
    m_splitView->activateTab(existing);
    return existing;
  }

  auto *editor = new MICodeEditor(&m_settings);
  const QString absolutePath = info.absoluteFilePath();
  auto result = editor->loadFile(absolutePath);
  if (result.isError()) {
    delete editor;
    reportError(tr("Error"), tr("Could not open file: %1\n%2")
                                 .arg(absolutePath, QString::fromStdString(result.error())));
    return nullptr;
  }

  m_splitView->addEditor(editor, editor->displayName());
  m_splitView->updateTabTitle(editor);
  editor->setFocus();
  setStatusMessage(tr("Opened %1").arg(absolutePath), 3000);
  MCPIDE_LOG_INFO("Opened {}", absolutePath.toStdString());
  return editor;
}

bool MIMainWindow::saveCurrent() {
  MICodeEditor *editor = currentEditor();
  if (!editor) {
    return false;
  }
  return saveEditor(editor, editor->filePath().isEmpty());
}

bool MIMainWindow::saveCurrentAs() {
  MICodeEditor *editor = currentEditor();
  if (!editor) {
    return false;
  }
  return saveEditor(editor, true);
}

bool MIMainWindow::saveEditor(MICodeEditor *editor, bool askForPath) {
  QString target = editor->filePath();
  if (askForPath) {
    const QString dir = target.isEmpty() ? m_workspacePath : target;
    target = MIFileDialog::getSaveFileName(this, tr("Save File"), dir);
    if (target.isEmpty()) {
      return false;
    }
  }

  auto result = editor->saveFile(target);
  if (result.isError()) {
    reportError(tr("Error"), tr("Could not save file: %1\n%2")
                                 .arg(target, QString::fromStdString(result.error())));
    return false;
  }

  m_splitView->updateTabTitle(editor);
  setStatusMessage(tr("Saved %1").arg(target), 3000);
  MCPIDE_LOG_INFO("Saved {}", target.toStdString());
  return true;
}

void MIMainWindow::closeCurrentTab() {
  QTabWidget *tabs = m_splitView->activeTabWidget();
  if (!tabs || tabs->currentIndex() < 0) {
    return;
  }
  const int index = tabs->currentIndex();
  if (handleTabClose(tabs, index)) {
    m_splitView->closeTab(tabs, index);
  }
}

// ============================================================================
// Unsaved changes
// ============================================================================

bool MIMainWindow::confirmClose(MICodeEditor *editor) {
  if (!editor || !editor->isModified()) {
    return true;
  }

  MIDialogButton choice = MIDialogButton::Cancel;
  if (m_promptHandler) {
    choice = m_promptHandler(editor);
  } else {
    m_splitView->activateTab(editor);
    choice = MIMessageDialog::showQuestion(
        this, tr("Unsaved Changes"),
        tr("Do you want to save the changes you made to %1?").arg(editor->displayName()),
        {MIDialogButton::Save, MIDialogButton::Discard, MIDialogButton::Cancel},
        MIDialogButton::Save);
  }

  switch (choice) {
  case MIDialogButton::Save:
    return saveEditor(editor, editor->filePath().isEmpty());
  case MIDialogButton::Discard:
    return true;
  default:
    return false;
  }
}

bool MIMainWindow::handleTabClose(QTabWidget *tabs, int index) {
  QWidget *widget = tabs ? tabs->widget(index) : nullptr;
  if (!widget) {
    return false;
  }
  if (auto *editor = qobject_cast<MICodeEditor *>(widget)) {
    return confirmClose(editor);
  }
  if (widget == m_welcomePage) {
    m_welcomePage = nullptr;
    m_settings.setWelcomeTabClosed(true);
  }
  return true;
}

void MIMainWindow::reportError(const QString &title, const QString &message) {
  MCPIDE_LOG_ERROR("{}", message.toStdString());
  if (m_errorReporter) {
    m_errorReporter(title, message);
    return;
  }
  MIMessageDialog::showError(this, title, message);
}

// ============================================================================
// Workspace
// ============================================================================

void MIMainWindow::openFolder() {
  const QString path =
      MIFileDialog::getExistingDirectory(this, tr("Open Folder"), m_workspacePath);
  if (!path.isEmpty()) {
    openWorkspace(path);
  }
}

bool MIMainWindow::openWorkspace(const QString &path) {
  const QFileInfo info(path);
  if (!info.exists() || !info.isDir()) {
    m_settings.removeRecentWorkspace(path);
    reportError(tr("Error"), tr("Folder does not exist: %1").arg(path));
    return false;
  }

  const QString absolutePath = QDir::cleanPath(info.absoluteFilePath());
  m_workspacePath = absolutePath;
  m_explorerPanel->setRootPath(absolutePath);
  m_settings.addRecentWorkspace(absolutePath);
  updateWindowTitle();
  MCPIDE_LOG_INFO("Opened workspace {}", absolutePath.toStdString());
  setStatusMessage(tr("Opened workspace: %1").arg(absolutePath), 3000);
  return true;
}

} // namespace McpIDE::editor::qt
