#pragma once

/**
 * @file mi_main_window.hpp
 * @brief Main window for McpIDE
 *
 * The central main window that contains:
 * - Menu bar and toolbar with the editor actions
 * - File explorer dock on the left
 * - Split editor area as the central widget
 * - Status bar with cursor position and language
 */

#include "McpIDE/editor/qt/mi_dialogs.hpp"

#include <QMainWindow>
#include <QPointer>
#include <QString>
#include <functional>

class QAction;
class QCloseEvent;
class QLabel;
class QMenu;
class QTabWidget;
class QToolBar;

namespace McpIDE::editor::qt {

class MIAppSettings;
class MICodeEditor;
class MIFileExplorerPanel;
class MIFindReplaceDialog;
class MISplitViewContainer;
class MIWelcomePage;

/**
 * @brief Main application window for McpIDE
 */
class MIMainWindow : public QMainWindow {
  Q_OBJECT

public:
  /// Answers the unsaved-changes question for one editor
  using PromptHandler = std::function<MIDialogButton(MICodeEditor *)>;
  /// Shows an error to the user
  using ErrorReporter = std::function<void(const QString &title, const QString &message)>;

  explicit MIMainWindow(MIAppSettings &settings, QWidget *parent = nullptr);
  ~MIMainWindow() override;

  /**
   * @brief Build the UI, restore layout and session
   * @return true once initialized; later calls do nothing
   */
  bool initialize();

  // =========================================================================
  // Access
  // =========================================================================

  [[nodiscard]] MISplitViewContainer *splitView() const { return m_splitView; }
  [[nodiscard]] MIFileExplorerPanel *explorerPanel() const { return m_explorerPanel; }
  [[nodiscard]] MIFindReplaceDialog *findDialog() const { return m_findDialog; }
  [[nodiscard]] MIWelcomePage *welcomePage() const { return m_welcomePage; }
  [[nodiscard]] MICodeEditor *currentEditor() const;
  [[nodiscard]] QString workspacePath() const { return m_workspacePath; }

  [[nodiscard]] QLabel *cursorLabel() const { return m_cursorLabel; }
  [[nodiscard]] QLabel *languageLabel() const { return m_languageLabel; }
  [[nodiscard]] QMenu *recentMenu() const { return m_recentMenu; }

  void setPromptHandler(PromptHandler handler) { m_promptHandler = std::move(handler); }
  void setErrorReporter(ErrorReporter reporter) { m_errorReporter = std::move(reporter); }

  // =========================================================================
  // Files
  // =========================================================================

  MICodeEditor *newFile();
  void openFile();

  /**
   * @brief Open @p path in a tab, or focus the tab already showing it
   * @return The editor, or null when the file could not be opened
   */
  MICodeEditor *openFilePath(const QString &path);

  bool saveCurrent();
  bool saveCurrentAs();
  void closeCurrentTab();

  // =========================================================================
  // Workspace
  // =========================================================================

  void openFolder();
  bool openWorkspace(const QString &path);

  // =========================================================================
  // Session and view
  // =========================================================================

  void saveSession();
  void restoreOpenFiles();
  void toggleTheme();
  void showWelcomePage();
  void showFindDialog();
  void showAboutDialog();

  void setStatusMessage(const QString &message, int timeout = 0);

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  void onCurrentEditorChanged(MICodeEditor *editor);
  void onCursorPositionChanged(int line, int column);
  void onThemeChanged(const QString &theme);
  void onSettingChanged(const QString &key);
  void findNext();
  void findPrevious();

private:
  void setupUi();
  void setupActions();
  void setupMenuBar();
  void setupToolBar();
  void setupStatusBar();
  void setupConnections();
  void rebuildRecentMenu();
  void applyViewSettings();
  void restoreLayout();
  void updateWindowTitle();
  void updateStatusLabels(MICodeEditor *editor);
  void wireEditor(MICodeEditor *editor);

  /**
   * @brief Ask about unsaved changes in @p editor
   * @return false when the user cancels or saving fails
   */
  bool confirmClose(MICodeEditor *editor);
  bool handleTabClose(QTabWidget *tabs, int index);
  bool saveEditor(MICodeEditor *editor, bool askForPath);
  void reportError(const QString &title, const QString &message);

  void runFind(bool forward);
  void runReplace(const QString &find, const QString &replacement, bool caseSensitive,
                  bool wholeWords, bool regex);
  void runReplaceAll(const QString &find, const QString &replacement, bool caseSensitive,
                     bool wholeWords, bool regex);

  MIAppSettings &m_settings;
  bool m_initialized = false;
  QString m_workspacePath;

  MISplitViewContainer *m_splitView = nullptr;
  MIFileExplorerPanel *m_explorerPanel = nullptr;
  MIFindReplaceDialog *m_findDialog = nullptr;
  QPointer<MIWelcomePage> m_welcomePage;

  PromptHandler m_promptHandler;
  ErrorReporter m_errorReporter;

  // Last search for Find Next / Find Previous
  QString m_lastSearch;
  bool m_lastCaseSensitive = false;
  bool m_lastWholeWords = false;
  bool m_lastRegex = false;

  // Menus
  QMenu *m_fileMenu = nullptr;
  QMenu *m_recentMenu = nullptr;
  QMenu *m_editMenu = nullptr;
  QMenu *m_viewMenu = nullptr;
  QMenu *m_layoutMenu = nullptr;
  QMenu *m_helpMenu = nullptr;
  QToolBar *m_mainToolBar = nullptr;

  // File actions
  QAction *m_actionNewFile = nullptr;
  QAction *m_actionOpenFile = nullptr;
  QAction *m_actionOpenFolder = nullptr;
  QAction *m_actionClearRecent = nullptr;
  QAction *m_actionSave = nullptr;
  QAction *m_actionSaveAs = nullptr;
  QAction *m_actionCloseTab = nullptr;
  QAction *m_actionExit = nullptr;

  // Edit actions
  QAction *m_actionUndo = nullptr;
  QAction *m_actionRedo = nullptr;
  QAction *m_actionCut = nullptr;
  QAction *m_actionCopy = nullptr;
  QAction *m_actionPaste = nullptr;
  QAction *m_actionFind = nullptr;
  QAction *m_actionReplace = nullptr;
  QAction *m_actionFindNext = nullptr;
  QAction *m_actionFindPrevious = nullptr;

  // View actions
  QAction *m_actionToggleExplorer = nullptr;
  QAction *m_actionSplitHorizontal = nullptr;
  QAction *m_actionSplitVertical = nullptr;
  QAction *m_actionToggleTheme = nullptr;
  QAction *m_actionShowWelcome = nullptr;

  // Help actions
  QAction *m_actionAbout = nullptr;

  // Status bar
  QLabel *m_cursorLabel = nullptr;
  QLabel *m_languageLabel = nullptr;
};

} // namespace McpIDE::editor::qt
