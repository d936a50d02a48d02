#pragma once

/**
 * @file mi_file_explorer_panel.hpp
 * @brief Workspace tree with search filter and file operations
 */

#include "McpIDE/core/result.hpp"
#include "McpIDE/editor/interfaces/QtFileSystem.hpp"
#include "McpIDE/editor/qt/mi_dock_panel.hpp"
#include "McpIDE/editor/workspace_operations.hpp"

#include <QModelIndex>
#include <QString>
#include <string>

class QFileSystemModel;
class QLineEdit;
class QTreeView;

namespace McpIDE::editor::qt {

class MIFileExplorerPanel final : public MIDockPanel {
  Q_OBJECT

public:
  explicit MIFileExplorerPanel(QWidget *parent = nullptr);
  ~MIFileExplorerPanel() override = default;

  void setRootPath(const QString &path);
  [[nodiscard]] QString rootPath() const { return m_rootPath; }

  [[nodiscard]] QString filterText() const;
  void setFilterText(const QString &text);

  [[nodiscard]] QTreeView *treeView() const { return m_tree; }
  [[nodiscard]] QFileSystemModel *model() const { return m_model; }

  /**
   * @brief Open a file or toggle a folder, as a double-click would
   */
  void activatePath(const QString &path);

  // =========================================================================
  // File operations (no prompts)
  // =========================================================================

  Result<std::string> createFile(const QString &directory, const QString &name);
  Result<std::string> createFolder(const QString &directory, const QString &name);
  Result<std::string> renamePath(const QString &path, const QString &newName);
  Result<std::string> removePath(const QString &path);

  // =========================================================================
  // Interactive variants used by the context menu
  // =========================================================================

  void promptNewFile(const QString &directory);
  void promptNewFolder(const QString &directory);
  void promptRename(const QString &path);
  void promptDelete(const QString &path);

signals:
  void fileActivated(const QString &path);
  void rootPathChanged(const QString &path);
  void pathCreated(const QString &path);
  void pathRenamed(const QString &oldPath, const QString &newPath);
  void pathRemoved(const QString &path);

private slots:
  void onItemActivated(const QModelIndex &index);
  void onContextMenuRequested(const QPoint &pos);
  void onFilterChanged(const QString &text);

private:
  void setupUi();
  void reportError(const QString &title, const std::string &message);

  QLineEdit *m_searchEdit = nullptr;
  QTreeView *m_tree = nullptr;
  QFileSystemModel *m_model = nullptr;
  QString m_rootPath;

  QtFileSystem m_fileSystem;
  WorkspaceOperations m_operations{m_fileSystem};
};

} // namespace McpIDE::editor::qt
