#include "McpIDE/editor/qt/panels/mi_file_explorer_panel.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_dialogs.hpp"

#include <QAction>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemModel>
#include <QHeaderView>
#include <QLineEdit>
#include <QMenu>
#include <QTreeView>
#include <QVBoxLayout>

namespace McpIDE::editor::qt {

namespace {

MIInputDialog::Validator nameValidator() {
  return [](const QString &text) {
    return QString::fromStdString(WorkspaceOperations::validateName(text.toStdString()));
  };
}

} // namespace

MIFileExplorerPanel::MIFileExplorerPanel(QWidget *parent)
    : MIDockPanel("Explorer", tr("Explorer"), parent) {
  setupUi();
}

void MIFileExplorerPanel::setupUi() {
  auto *container = new QWidget(this);
  auto *layout = new QVBoxLayout(container);
  layout->setContentsMargins(4, 4, 4, 4);
  layout->setSpacing(4);

  m_searchEdit = new QLineEdit(container);
  m_searchEdit->setPlaceholderText(tr("Search files..."));
  m_searchEdit->setClearButtonEnabled(true);
  connect(m_searchEdit, &QLineEdit::textChanged, this, &MIFileExplorerPanel::onFilterChanged);
  layout->addWidget(m_searchEdit);

  m_model = new QFileSystemModel(this);
  m_model->setReadOnly(false);
  m_model->setFilter(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden);
  m_model->setNameFilterDisables(false);

  m_tree = new QTreeView(container);
  m_tree->setModel(m_model);
  m_tree->setAnimated(true);
  m_tree->setIndentation(16);
  m_tree->setSortingEnabled(true);
  m_tree->sortByColumn(0, Qt::AscendingOrder);
  m_tree->setHeaderHidden(true);
  m_tree->setEditTriggers(QAbstractItemView::NoEditTriggers);
  m_tree->setContextMenuPolicy(Qt::CustomContextMenu);
  for (int column = 1; column < m_model->columnCount(); ++column) {
    m_tree->hideColumn(column);
  }

  connect(m_tree, &QTreeView::activated, this, &MIFileExplorerPanel::onItemActivated);
  connect(m_tree, &QWidget::customContextMenuRequested, this,
          &MIFileExplorerPanel::onContextMenuRequested);
  layout->addWidget(m_tree, 1);

  setContentWidget(container);
}

// ============================================================================
// Root and filter
// ============================================================================

void MIFileExplorerPanel::setRootPath(const QString &path) {
  const QString cleaned = QDir::cleanPath(path);
  const QModelIndex rootIndex = m_model->setRootPath(cleaned);
  m_tree->setRootIndex(rootIndex);
  m_rootPath = cleaned;
  MCPIDE_LOG_INFO("Explorer root set to {}", cleaned.toStdString());
  emit rootPathChanged(cleaned);
}

QString MIFileExplorerPanel::filterText() const { return m_searchEdit->text(); }

void MIFileExplorerPanel::setFilterText(const QString &text) { m_searchEdit->setText(text); }

void MIFileExplorerPanel::onFilterChanged(const QString &text) {
  const QString trimmed = text.trimmed();
  if (trimmed.isEmpty()) {
    m_model->setNameFilters({});
  } else {
    m_model->setNameFilters({QString("*%1*").arg(trimmed)});
  }
}

// ============================================================================
// Activation
// ============================================================================

void MIFileExplorerPanel::onItemActivated(const QModelIndex &index) {
  if (index.isValid()) {
    activatePath(m_model->filePath(index));
  }
}

void MIFileExplorerPanel::activatePath(const QString &path) {
  const QFileInfo info(path);
  if (info.isDir()) {
    const QModelIndex index = m_model->index(path);
    if (index.isValid()) {
      m_tree->setExpanded(index, !m_tree->isExpanded(index));
    }
    return;
  }
  if (info.isFile()) {
    emit fileActivated(info.absoluteFilePath());
  }
}

// ============================================================================
// File operations
// ============================================================================

Result<std::string> MIFileExplorerPanel::createFile(const QString &directory,
                                                    const QString &name) {
  auto result = m_operations.createFile(directory.toStdString(), name.toStdString());
  if (result.isOk()) {
    emit pathCreated(QString::fromStdString(result.value()));
  }
  return result;
}

Result<std::string> MIFileExplorerPanel::createFolder(const QString &directory,
                                                      const QString &name) {
  auto result = m_operations.createFolder(directory.toStdString(), name.toStdString());
  if (result.isOk()) {
    emit pathCreated(QString::fromStdString(result.value()));
  }
  return result;
}

Result<std::string> MIFileExplorerPanel::renamePath(const QString &path, const QString &newName) {
  auto result = m_operations.renamePath(path.toStdString(), newName.toStdString());
  if (result.isOk()) {
    emit pathRenamed(path, QString::fromStdString(result.value()));
  }
  return result;
}

Result<std::string> MIFileExplorerPanel::removePath(const QString &path) {
  auto result = m_operations.removePath(path.toStdString());
  if (result.isOk()) {
    emit pathRemoved(path);
  }
  return result;
}

void MIFileExplorerPanel::reportError(const QString &title, const std::string &message) {
  MCPIDE_LOG_WARN("{}: {}", title.toStdString(), message);
  MIMessageDialog::showError(this, title, QString::fromStdString(message));
}

void MIFileExplorerPanel::promptNewFile(const QString &directory) {
  bool ok = false;
  const QString name = MIInputDialog::getText(this, tr("New File"), tr("File name:"), QString(),
                                              &ok, nameValidator());
  if (!ok) {
    return;
  }
  auto result = createFile(directory, name);
  if (result.isError()) {
    reportError(tr("Could not create file"), result.error());
  }
}

void MIFileExplorerPanel::promptNewFolder(const QString &directory) {
  bool ok = false;
  const QString name = MIInputDialog::getText(this, tr("New Folder"), tr("Folder name:"),
                                              QString(), &ok, nameValidator());
  if (!ok) {
    return;
  }
  auto result = createFolder(directory, name);
  if (result.isError()) {
    reportError(tr("Could not create folder"), result.error());
  }
}

void MIFileExplorerPanel::promptRename(const QString &path) {
  bool ok = false;
  const QString name = MIInputDialog::getText(this, tr("Rename"), tr("New name:"),
                                              QFileInfo(path).fileName(), &ok, nameValidator());
  if (!ok || name == QFileInfo(path).fileName()) {
    return;
  }
  auto result = renamePath(path, name);
  if (result.isError()) {
    reportError(tr("Could not rename"), result.error());
  }
}

void MIFileExplorerPanel::promptDelete(const QString &path) {
  const QFileInfo info(path);
  const QString message = info.isDir()
                              ? tr("Delete folder '%1' and all of its contents?").arg(info.fileName())
                              : tr("Delete file '%1'?").arg(info.fileName());
  const MIDialogButton choice = MIMessageDialog::showQuestion(
      this, tr("Delete"), message, {MIDialogButton::Yes, MIDialogButton::No}, MIDialogButton::No);
  if (choice != MIDialogButton::Yes) {
    return;
  }
  auto result = removePath(path);
  if (result.isError()) {
    reportError(tr("Could not delete"), result.error());
  }
}

// ============================================================================
// Context menu
// ============================================================================

void MIFileExplorerPanel::onContextMenuRequested(const QPoint &pos) {
  const QModelIndex index = m_tree->indexAt(pos);
  QMenu menu(this);

  if (!index.isValid()) {
    if (m_rootPath.isEmpty()) {
      return;
    }
    const QString root = m_rootPath;
    connect(menu.addAction(tr("New File")), &QAction::triggered, this,
            [this, root]() { promptNewFile(root); });
    connect(menu.addAction(tr("New Folder")), &QAction::triggered, this,
            [this, root]() { promptNewFolder(root); });
    menu.exec(m_tree->viewport()->mapToGlobal(pos));
    return;
  }

  const QString path = m_model->filePath(index);
  if (m_model->isDir(index)) {
    connect(menu.addAction(tr("New File")), &QAction::triggered, this,
            [this, path]() { promptNewFile(path); });
    connect(menu.addAction(tr("New Folder")), &QAction::triggered, this,
            [this, path]() { promptNewFolder(path); });
    menu.addSeparator();
    connect(menu.addAction(tr("Open Folder")), &QAction::triggered, this,
            [this, path]() { setRootPath(path); });
  } else {
    connect(menu.addAction(tr("Open")), &QAction::triggered, this,
            [this, path]() { emit fileActivated(path); });
  }

  menu.addSeparator();
  connect(menu.addAction(tr("Rename")), &QAction::triggered, this,
          [this, path]() { promptRename(path); });
  connect(menu.addAction(tr("Delete")), &QAction::triggered, this,
          [this, path]() { promptDelete(path); });

  menu.exec(m_tree->viewport()->mapToGlobal(pos));
}

} // namespace McpIDE::editor::qt
