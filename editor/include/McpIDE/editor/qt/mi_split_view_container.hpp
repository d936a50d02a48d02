#pragma once

/**
 * @file mi_split_view_container.hpp
 * @brief Editor area made of nested splitters holding tab widgets
 *
 * The root splitter is never removed. Every non-root splitter keeps at
 * least two children: when one is left with a single child it collapses
 * into its parent.
 */

#include <QList>
#include <QPointer>
#include <QString>
#include <QWidget>
#include <functional>
#include <utility>

class QSplitter;
class QTabWidget;

namespace McpIDE::editor::qt {

class MICodeEditor;

class MISplitViewContainer final : public QWidget {
  Q_OBJECT

public:
  /// Decides whether the widget in a tab may close; false keeps the tab
  using CloseHandler = std::function<bool(QTabWidget *, int)>;

  explicit MISplitViewContainer(QWidget *parent = nullptr);
  ~MISplitViewContainer() override;

  // =========================================================================
  // Splitting
  // =========================================================================

  /**
   * @brief Stack a new pane below @p tabs (vertical splitter)
   * @return The new tab widget, or null when @p tabs is not in a splitter
   */
  QTabWidget *splitHorizontally(QTabWidget *tabs = nullptr);

  /**
   * @brief Place a new pane beside @p tabs (horizontal splitter)
   */
  QTabWidget *splitVertically(QTabWidget *tabs = nullptr);

  /**
   * @brief Merge @p tabs into a neighbour and remove it
   */
  void closeSplit(QTabWidget *tabs);

  // =========================================================================
  // Tabs
  // =========================================================================

  /**
   * @brief Tab widget with focus, else the last activated, else the first
   */
  [[nodiscard]] QTabWidget *activeTabWidget() const;

  /**
   * @brief Append a tab and make it current
   * @return Index of the new tab
   */
  int addEditor(QWidget *widget, const QString &title, QTabWidget *tabs = nullptr);

  /**
   * @brief Remove a tab without asking and delete its widget
   */
  void closeTab(QTabWidget *tabs, int index);

  /**
   * @brief Route close requests from tab buttons through @p handler
   */
  void setCloseHandler(CloseHandler handler) { m_closeHandler = std::move(handler); }

  void setTabTitle(QWidget *widget, const QString &title);

  /**
   * @brief Title is the display name plus "*" while modified
   */
  void updateTabTitle(MICodeEditor *editor);

  // =========================================================================
  // Queries
  // =========================================================================

  [[nodiscard]] const QList<QTabWidget *> &tabWidgets() const { return m_tabWidgets; }
  [[nodiscard]] int tabWidgetCount() const { return static_cast<int>(m_tabWidgets.size()); }
  [[nodiscard]] QSplitter *rootSplitter() const { return m_rootSplitter; }

  [[nodiscard]] QList<MICodeEditor *> allEditors() const;
  [[nodiscard]] MICodeEditor *currentEditor() const;

  /**
   * @brief Find an open editor by path, comparing canonical paths
   */
  [[nodiscard]] MICodeEditor *editorByPath(const QString &path) const;

  /**
   * @brief Tab widget and index holding @p widget; (nullptr, -1) if absent
   */
  [[nodiscard]] std::pair<QTabWidget *, int> locateWidget(QWidget *widget) const;

  /**
   * @brief Make the tab holding @p widget current and focus it
   */
  bool activateTab(QWidget *widget);

  /**
   * @brief Nesting depth of splitters; 1 for the root alone
   */
  [[nodiscard]] int splitterDepth() const;

signals:
  void editorCreated(MICodeEditor *editor);
  void editorClosed(MICodeEditor *editor);
  void currentEditorChanged(MICodeEditor *editor);
  void tabCloseRequested(QTabWidget *tabs, int index);

private:
  QTabWidget *createTabWidget(QSplitter *parentSplitter);
  QTabWidget *split(QTabWidget *tabs, Qt::Orientation orientation);
  void removeTabWidget(QTabWidget *tabs);
  void collapseSplitter(QSplitter *splitter);
  void equalizeSizes(QSplitter *splitter);
  void setLastActive(QTabWidget *tabs);
  void showTabContextMenu(QTabWidget *tabs, const QPoint &pos);
  void onTabCloseRequested(QTabWidget *tabs, int index);
  void onFocusChanged(QWidget *old, QWidget *now);
  [[nodiscard]] QTabWidget *owningTabWidget(QWidget *widget) const;

  QSplitter *m_rootSplitter = nullptr;
  QList<QTabWidget *> m_tabWidgets;
  QPointer<QTabWidget> m_lastActive;
  CloseHandler m_closeHandler;
};

} // namespace McpIDE::editor::qt
