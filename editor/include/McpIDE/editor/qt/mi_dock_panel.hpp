#pragma once

/**
 * @file mi_dock_panel.hpp
 * @brief Common base for the side panels of the main window
 */

#include <QDockWidget>
#include <QSize>
#include <QString>

namespace McpIDE::editor::qt {

/**
 * @brief Dock widget with a stable panel id and a single content widget
 *
 * The id doubles as the object name so QMainWindow::saveState() can put the
 * panel back where the user left it.
 */
class MIDockPanel : public QDockWidget {
  Q_OBJECT

public:
  MIDockPanel(const QString &panelId, const QString &title, QWidget *parent = nullptr);
  ~MIDockPanel() override = default;

  [[nodiscard]] QString panelId() const { return objectName(); }

  static QSize defaultMinimumSize() { return QSize(180, 120); }

protected:
  /// Takes ownership of @p widget and shows it as the panel body
  void setContentWidget(QWidget *widget);
  [[nodiscard]] QWidget *contentWidget() const { return widget(); }
};

} // namespace McpIDE::editor::qt
