#include "McpIDE/editor/qt/mi_dialogs.hpp"

#include <QDir>
#include <QFileDialog>

namespace McpIDE::editor::qt {

namespace {

QString startDirectory(const QString &dir) { return dir.isEmpty() ? QDir::homePath() : dir; }

} // namespace

QString MIFileDialog::defaultFilter() { return QFileDialog::tr("All Files (*)"); }

QString MIFileDialog::getOpenFileName(QWidget *parent, const QString &title, const QString &dir,
                                      const QString &filter) {
  return QFileDialog::getOpenFileName(parent, title, startDirectory(dir),
                                      filter.isEmpty() ? defaultFilter() : filter);
}

QString MIFileDialog::getSaveFileName(QWidget *parent, const QString &title, const QString &dir,
                                      const QString &filter) {
  return QFileDialog::getSaveFileName(parent, title, startDirectory(dir),
                                      filter.isEmpty() ? defaultFilter() : filter);
}

QString MIFileDialog::getExistingDirectory(QWidget *parent, const QString &title,
                                           const QString &dir) {
  return QFileDialog::getExistingDirectory(parent, title, startDirectory(dir),
                                           QFileDialog::ShowDirsOnly |
                                               QFileDialog::DontResolveSymlinks);
}

} // namespace McpIDE::editor::qt
