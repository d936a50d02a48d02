#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/editor/qt/mi_find_replace_dialog.hpp"
#include "McpIDE/editor/qt/mi_main_window.hpp"
#include "McpIDE/editor/qt/mi_split_view_container.hpp"
#include "McpIDE/editor/qt/mi_welcome_page.hpp"

#include <QCloseEvent>
#include <QFileInfo>

namespace McpIDE::editor::qt {

// ============================================================================
// Session
// ============================================================================

void MIMainWindow::saveSession() {
  QStringList files;
  for (MICodeEditor *editor : m_splitView->allEditors()) {
    const QString path = editor->filePath();
    if (!path.isEmpty() && QFileInfo::exists(path) && !files.contains(path)) {
      files << path;
    }
  }
  m_settings.setOpenFiles(files);
  m_settings.setWelcomeTabClosed(m_welcomePage.isNull());
  m_settings.setWindowGeometry(saveGeometry());
  m_settings.setWindowState(saveState());

  auto result = m_settings.sync();
  if (result.isError()) {
    MCPIDE_LOG_WARN("Failed to save session: {}", result.error());
  }
}

void MIMainWindow::restoreOpenFiles() {
  for (const QString &path : m_settings.openFiles()) {
    if (QFileInfo(path).isFile()) {
      openFilePath(path);
    } else {
      MCPIDE_LOG_DEBUG("Skipping missing session file {}", path.toStdString());
    }
  }
}

void MIMainWindow::closeEvent(QCloseEvent *event) {
  saveSession();

  for (MICodeEditor *editor : m_splitView->allEditors()) {
    if (!confirmClose(editor)) {
      event->ignore();
      return;
    }
  }

  if (m_findDialog) {
    m_findDialog->close();
  }
  event->accept();
}

// ============================================================================
// Find and replace
// ============================================================================

void MIMainWindow::showFindDialog() {
  if (!m_findDialog) {
    m_findDialog = new MIFindReplaceDialog(this);
    connect(m_findDialog, &MIFindReplaceDialog::findNext, this,
            [this](const QString &text, bool cs, bool ww, bool regex) {
              m_lastSearch = text;
              m_lastCaseSensitive = cs;
              m_lastWholeWords = ww;
              m_lastRegex = regex;
              runFind(true);
            });
    connect(m_findDialog, &MIFindReplaceDialog::findPrevious, this,
            [this](const QString &text, bool cs, bool ww, bool regex) {
              m_lastSearch = text;
              m_lastCaseSensitive = cs;
              m_lastWholeWords = ww;
              m_lastRegex = regex;
              runFind(false);
            });
    connect(m_findDialog, &MIFindReplaceDialog::replaceRequested, this,
            &MIMainWindow::runReplace);
    connect(m_findDialog, &MIFindReplaceDialog::replaceAllRequested, this,
            &MIMainWindow::runReplaceAll);
  }

  if (MICodeEditor *editor = currentEditor()) {
    const QString selected = editor->textCursor().selectedText();
    // Multi-line selections are not useful as a search term
    if (!selected.isEmpty() && !selected.contains(QChar::ParagraphSeparator)) {
      m_findDialog->setSearchText(selected);
    }
  }

  m_findDialog->setStatusText(QString());
  m_findDialog->show();
  m_findDialog->raise();
  m_findDialog->activateWindow();
}

void MIMainWindow::findNext() {
  if (m_lastSearch.isEmpty()) {
    showFindDialog();
    return;
  }
  runFind(true);
}

void MIMainWindow::findPrevious() {
  if (m_lastSearch.isEmpty()) {
    showFindDialog();
    return;
  }
  runFind(false);
}

void MIMainWindow::runFind(bool forward) {
  MICodeEditor *editor = currentEditor();
  if (!editor) {
    return;
  }
  const bool found =
      editor->findText(m_lastSearch, m_lastCaseSensitive, m_lastWholeWords, m_lastRegex, forward);
  QString status;
  if (found) {
    const int count =
        editor->countMatches(m_lastSearch, m_lastCaseSensitive, m_lastWholeWords, m_lastRegex);
    status = tr("%1 match(es)").arg(count);
  } else {
    status = tr("Not found");
  }
  if (m_findDialog) {
    m_findDialog->setStatusText(status);
  }
  setStatusMessage(status, 3000);
}

void MIMainWindow::runReplace(const QString &find, const QString &replacement,
                              bool caseSensitive, bool wholeWords, bool regex) {
  MICodeEditor *editor = currentEditor();
  if (!editor) {
    return;
  }
  m_lastSearch = find;
  m_lastCaseSensitive = caseSensitive;
  m_lastWholeWords = wholeWords;
  m_lastRegex = regex;

  if (!editor->replaceText(find, replacement, caseSensitive, wholeWords, regex)) {
    m_findDialog->setStatusText(tr("Not found"));
    return;
  }
  const int remaining = editor->countMatches(find, caseSensitive, wholeWords, regex);
  m_findDialog->setStatusText(tr("%1 match(es)").arg(remaining));
}

void MIMainWindow::runReplaceAll(const QString &find, const QString &replacement,
                                 bool caseSensitive, bool wholeWords, bool regex) {
  MICodeEditor *editor = currentEditor();
  if (!editor) {
    return;
  }
  const int count = editor->replaceAll(find, replacement, caseSensitive, wholeWords, regex);
  const QString status = tr("Replaced %1 occurrence(s)").arg(count);
  m_findDialog->setStatusText(status);
  setStatusMessage(status, 3000);
}

} // namespace McpIDE::editor::qt
