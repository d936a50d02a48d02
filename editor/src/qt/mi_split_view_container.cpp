#include "McpIDE/editor/qt/mi_split_view_container.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_code_editor.hpp"

#include <QAction>
#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include <QMenu>
#include <QSplitter>
#include <QTabBar>
#include <QTabWidget>
#include <QVBoxLayout>
#include <algorithm>

namespace McpIDE::editor::qt {

namespace {

QString comparablePath(const QString &path) {
  const QFileInfo info(path);
  const QString canonical = info.canonicalFilePath();
  return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
}

int depthOf(const QSplitter *splitter) {
  int deepest = 0;
  for (int i = 0; i < splitter->count(); ++i) {
    if (const auto *child = qobject_cast<const QSplitter *>(splitter->widget(i))) {
      deepest = std::max(deepest, depthOf(child));
    }
  }
  return deepest + 1;
}

} // namespace

MISplitViewContainer::MISplitViewContainer(QWidget *parent) : QWidget(parent) {
  setObjectName("MISplitViewContainer");

  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->setSpacing(0);

  m_rootSplitter = new QSplitter(Qt::Horizontal, this);
  m_rootSplitter->setChildrenCollapsible(false);
  layout->addWidget(m_rootSplitter);

  createTabWidget(m_rootSplitter);

  connect(qApp, &QApplication::focusChanged, this, &MISplitViewContainer::onFocusChanged);
}

MISplitViewContainer::~MISplitViewContainer() {
  // Children die after this body; stop reacting to their focus changes
  disconnect(qApp, &QApplication::focusChanged, this, &MISplitViewContainer::onFocusChanged);
  m_tabWidgets.clear();
}

// ============================================================================
// Tab widgets
// ============================================================================

QTabWidget *MISplitViewContainer::createTabWidget(QSplitter *parentSplitter) {
  auto *tabs = new QTabWidget();
  tabs->setTabsClosable(true);
  tabs->setMovable(true);
  tabs->setDocumentMode(true);
  tabs->setContextMenuPolicy(Qt::CustomContextMenu);

  parentSplitter->addWidget(tabs);
  m_tabWidgets.append(tabs);

  connect(tabs, &QTabWidget::tabCloseRequested, this,
          [this, tabs](int index) { onTabCloseRequested(tabs, index); });
  connect(tabs, &QWidget::customContextMenuRequested, this,
          [this, tabs](const QPoint &pos) { showTabContextMenu(tabs, pos); });
  connect(tabs->tabBar(), &QTabBar::tabBarClicked, this,
          [this, tabs](int) { setLastActive(tabs); });
  connect(tabs, &QTabWidget::currentChanged, this, [this, tabs](int) {
    if (m_tabWidgets.contains(tabs)) {
      emit currentEditorChanged(currentEditor());
    }
  });

  return tabs;
}

QTabWidget *MISplitViewContainer::activeTabWidget() const {
  for (QTabWidget *tabs : m_tabWidgets) {
    QWidget *current = tabs->currentWidget();
    if (tabs->hasFocus() || (current && current->hasFocus())) {
      return tabs;
    }
  }
  if (m_lastActive && m_tabWidgets.contains(m_lastActive.data())) {
    return m_lastActive.data();
  }
  return m_tabWidgets.isEmpty() ? nullptr : m_tabWidgets.first();
}

void MISplitViewContainer::setLastActive(QTabWidget *tabs) {
  if (m_lastActive == tabs) {
    return;
  }
  m_lastActive = tabs;
  emit currentEditorChanged(currentEditor());
}

QTabWidget *MISplitViewContainer::owningTabWidget(QWidget *widget) const {
  for (QWidget *w = widget; w; w = w->parentWidget()) {
    if (auto *tabs = qobject_cast<QTabWidget *>(w); tabs && m_tabWidgets.contains(tabs)) {
      return tabs;
    }
  }
  return nullptr;
}

void MISplitViewContainer::onFocusChanged(QWidget *old, QWidget *now) {
  Q_UNUSED(old);
  if (QTabWidget *tabs = owningTabWidget(now)) {
    setLastActive(tabs);
  }
}

// ============================================================================
// Splitting
// ============================================================================

QTabWidget *MISplitViewContainer::splitHorizontally(QTabWidget *tabs) {
  return split(tabs, Qt::Vertical);
}

QTabWidget *MISplitViewContainer::splitVertically(QTabWidget *tabs) {
  return split(tabs, Qt::Horizontal);
}

QTabWidget *MISplitViewContainer::split(QTabWidget *tabs, Qt::Orientation orientation) {
  if (!tabs) {
    tabs = activeTabWidget();
  }
  if (!tabs) {
    return nullptr;
  }

  auto *parentSplitter = qobject_cast<QSplitter *>(tabs->parentWidget());
  if (!parentSplitter) {
    return nullptr;
  }

  QSplitter *target = parentSplitter;
  if (parentSplitter->orientation() != orientation) {
    const int index = parentSplitter->indexOf(tabs);
    auto *wrapper = new QSplitter(orientation);
    wrapper->setChildrenCollapsible(false);
    parentSplitter->insertWidget(index, wrapper);
    wrapper->addWidget(tabs);
    target = wrapper;
  }

  // The new pane goes right after the original one
  QTabWidget *newTabs = createTabWidget(target);
  target->insertWidget(target->indexOf(tabs) + 1, newTabs);

  equalizeSizes(target);
  setLastActive(newTabs);
  MCPIDE_LOG_DEBUG("Split editor area ({} panes)", m_tabWidgets.size());
  return newTabs;
}

void MISplitViewContainer::equalizeSizes(QSplitter *splitter) {
  const int count = splitter->count();
  if (count == 0) {
    return;
  }
  const int extent =
      splitter->orientation() == Qt::Horizontal ? splitter->width() : splitter->height();
  splitter->setSizes(QList<int>(count, std::max(1, extent / count)));
}

void MISplitViewContainer::closeSplit(QTabWidget *tabs) {
  if (!tabs || m_tabWidgets.size() <= 1 || !m_tabWidgets.contains(tabs)) {
    return;
  }

  const auto position = m_tabWidgets.indexOf(tabs);
  QTabWidget *target =
      position > 0 ? m_tabWidgets.at(position - 1) : m_tabWidgets.at(position + 1);

  while (tabs->count() > 0) {
    QWidget *widget = tabs->widget(0);
    const QString text = tabs->tabText(0);
    tabs->removeTab(0);
    const int index = target->addTab(widget, text);
    target->setCurrentIndex(index);
  }

  removeTabWidget(tabs);
  setLastActive(target);
}

void MISplitViewContainer::removeTabWidget(QTabWidget *tabs) {
  auto *parentSplitter = qobject_cast<QSplitter *>(tabs->parentWidget());

  m_tabWidgets.removeAll(tabs);
  if (m_lastActive == tabs) {
    m_lastActive = nullptr;
  }
  tabs->hide();
  tabs->setParent(nullptr);
  tabs->deleteLater();

  if (parentSplitter) {
    collapseSplitter(parentSplitter);
  }
}

void MISplitViewContainer::collapseSplitter(QSplitter *splitter) {
  if (splitter == m_rootSplitter || splitter->count() != 1) {
    return;
  }
  auto *grandparent = qobject_cast<QSplitter *>(splitter->parentWidget());
  if (!grandparent) {
    return;
  }

  QWidget *remaining = splitter->widget(0);
  const int index = grandparent->indexOf(splitter);
  splitter->hide();
  splitter->setParent(nullptr);
  grandparent->insertWidget(index, remaining);
  splitter->deleteLater();
}

// ============================================================================
// Tabs
// ============================================================================

int MISplitViewContainer::addEditor(QWidget *widget, const QString &title, QTabWidget *tabs) {
  if (!tabs) {
    tabs = activeTabWidget();
  }
  if (!tabs) {
    tabs = createTabWidget(m_rootSplitter);
  }

  const int index = tabs->addTab(widget, title);
  tabs->setCurrentIndex(index);
  setLastActive(tabs);

  if (auto *editor = qobject_cast<MICodeEditor *>(widget)) {
    connect(editor, &MICodeEditor::modificationStateChanged, this,
            [this, editor](bool) { updateTabTitle(editor); });
    connect(editor, &MICodeEditor::filePathChanged, this,
            [this, editor](const QString &) { updateTabTitle(editor); });
    emit editorCreated(editor);
  }
  return index;
}

void MISplitViewContainer::onTabCloseRequested(QTabWidget *tabs, int index) {
  emit tabCloseRequested(tabs, index);
  if (m_closeHandler && !m_closeHandler(tabs, index)) {
    return;
  }
  closeTab(tabs, index);
}

void MISplitViewContainer::closeTab(QTabWidget *tabs, int index) {
  if (!tabs || index < 0 || index >= tabs->count()) {
    return;
  }

  QWidget *widget = tabs->widget(index);
  tabs->removeTab(index);

  if (auto *editor = qobject_cast<MICodeEditor *>(widget)) {
    disconnect(editor, nullptr, this, nullptr);
    emit editorClosed(editor);
  }
  widget->hide();
  widget->setParent(nullptr);
  widget->deleteLater();

  if (tabs->count() == 0 && m_tabWidgets.size() > 1) {
    auto *parentSplitter = qobject_cast<QSplitter *>(tabs->parentWidget());
    if (parentSplitter && parentSplitter->count() > 1) {
      removeTabWidget(tabs);
    }
  }
  emit currentEditorChanged(currentEditor());
}

void MISplitViewContainer::setTabTitle(QWidget *widget, const QString &title) {
  const auto [tabs, index] = locateWidget(widget);
  if (tabs) {
    tabs->setTabText(index, title);
  }
}

void MISplitViewContainer::updateTabTitle(MICodeEditor *editor) {
  if (!editor) {
    return;
  }
  QString title = editor->displayName();
  if (editor->document()->isModified()) {
    title += "*";
  }
  setTabTitle(editor, title);

  const auto [tabs, index] = locateWidget(editor);
  if (tabs) {
    tabs->setTabToolTip(index, editor->filePath());
  }
}

void MISplitViewContainer::showTabContextMenu(QTabWidget *tabs, const QPoint &pos) {
  QMenu menu(this);

  QAction *splitH = menu.addAction(tr("Split Horizontally"));
  connect(splitH, &QAction::triggered, this, [this, tabs]() { splitHorizontally(tabs); });

  QAction *splitV = menu.addAction(tr("Split Vertically"));
  connect(splitV, &QAction::triggered, this, [this, tabs]() { splitVertically(tabs); });

  if (m_tabWidgets.size() > 1) {
    menu.addSeparator();
    QAction *closeSplitAction = menu.addAction(tr("Close Split"));
    connect(closeSplitAction, &QAction::triggered, this, [this, tabs]() { closeSplit(tabs); });
  }

  menu.exec(tabs->mapToGlobal(pos));
}

// ============================================================================
// Queries
// ============================================================================

QList<MICodeEditor *> MISplitViewContainer::allEditors() const {
  QList<MICodeEditor *> editors;
  for (QTabWidget *tabs : m_tabWidgets) {
    for (int i = 0; i < tabs->count(); ++i) {
      if (auto *editor = qobject_cast<MICodeEditor *>(tabs->widget(i))) {
        editors.append(editor);
      }
    }
  }
  return editors;
}

MICodeEditor *MISplitViewContainer::currentEditor() const {
  QTabWidget *tabs = activeTabWidget();
  return tabs ? qobject_cast<MICodeEditor *>(tabs->currentWidget()) : nullptr;
}

MICodeEditor *MISplitViewContainer::editorByPath(const QString &path) const {
  if (path.isEmpty()) {
    return nullptr;
  }
  const QString wanted = comparablePath(path);
  for (MICodeEditor *editor : allEditors()) {
    if (!editor->filePath().isEmpty() && comparablePath(editor->filePath()) == wanted) {
      return editor;
    }
  }
  return nullptr;
}

std::pair<QTabWidget *, int> MISplitViewContainer::locateWidget(QWidget *widget) const {
  if (widget) {
    for (QTabWidget *tabs : m_tabWidgets) {
      const int index = tabs->indexOf(widget);
      if (index >= 0) {
        return {tabs, index};
      }
    }
  }
  return {nullptr, -1};
}

bool MISplitViewContainer::activateTab(QWidget *widget) {
  const auto [tabs, index] = locateWidget(widget);
  if (!tabs) {
    return false;
  }
  tabs->setCurrentIndex(index);
  setLastActive(tabs);
  widget->setFocus();
  return true;
}

int MISplitViewContainer::splitterDepth() const { return depthOf(m_rootSplitter); }

} // namespace McpIDE::editor::qt
