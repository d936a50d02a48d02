/**
 * @file QtFileSystem.cpp
 * @brief Qt implementation of the workspace file system seam
 */

#include "McpIDE/editor/interfaces/QtFileSystem.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace McpIDE::editor {

namespace {

QString toQt(const std::string &path) { return QString::fromStdString(path); }

} // namespace

EntryKind QtFileSystem::entryKind(const std::string &path) const {
  const QFileInfo info(toQt(path));
  if (!info.exists()) {
    return EntryKind::Missing;
  }
  return info.isDir() ? EntryKind::Directory : EntryKind::File;
}

bool QtFileSystem::createEmptyFile(const std::string &path) {
  QFile file(toQt(path));
  // NewOnly refuses to truncate a file that appeared after the caller checked
  return file.open(QIODevice::WriteOnly | QIODevice::NewOnly);
}

bool QtFileSystem::createDirectory(const std::string &path) {
  const QFileInfo info(toQt(path));
  if (info.exists()) {
    return false;
  }
  return QDir(info.absolutePath()).mkdir(info.fileName());
}

bool QtFileSystem::renameEntry(const std::string &from, const std::string &to) {
  if (QFileInfo::exists(toQt(to))) {
    return false;
  }
  return QDir().rename(toQt(from), toQt(to));
}

bool QtFileSystem::removeFile(const std::string &path) { return QFile::remove(toQt(path)); }

bool QtFileSystem::removeTree(const std::string &path) {
  QDir dir(toQt(path));
  return dir.exists() && dir.removeRecursively();
}

std::string QtFileSystem::fileName(const std::string &path) const {
  return QFileInfo(toQt(path)).fileName().toStdString();
}

std::string QtFileSystem::parentPath(const std::string &path) const {
  return QFileInfo(toQt(path)).absolutePath().toStdString();
}

std::string QtFileSystem::cleanPath(const std::string &path) const {
  return QDir::cleanPath(toQt(path)).toStdString();
}

std::string QtFileSystem::childPath(const std::string &directory, const std::string &name) const {
  return QDir::cleanPath(QDir(toQt(directory)).filePath(toQt(name))).toStdString();
}

} // namespace McpIDE::editor
