#include "McpIDE/editor/qt/mi_dock_panel.hpp"

namespace McpIDE::editor::qt {

MIDockPanel::MIDockPanel(const QString &panelId, const QString &title, QWidget *parent)
    : QDockWidget(title, parent) {
  setObjectName(panelId);
  setFeatures(QDockWidget::DockWidgetClosable | QDockWidget::DockWidgetMovable);
  setAllowedAreas(Qt::LeftDockWidgetArea | Qt::RightDockWidgetArea);
  setMinimumSize(defaultMinimumSize());
}

void MIDockPanel::setContentWidget(QWidget *widget) {
  if (widget) {
    widget->setMinimumWidth(defaultMinimumSize().width());
  }
  setWidget(widget);
}

} // namespace McpIDE::editor::qt
