#include "McpIDE/editor/workspace_operations.hpp"
#include "McpIDE/core/logger.hpp"

namespace McpIDE::editor {

WorkspaceOperations::WorkspaceOperations(IFileSystem &fs) : m_fs(fs) {}

std::string WorkspaceOperations::validateName(const std::string &name) {
  if (name.empty()) {
    return "Name must not be empty";
  }
  if (name.find_first_of("/\\") != std::string::npos) {
    return "Name must not contain path separators";
  }
  if (name == "." || name == "..") {
    return "'" + name + "' is not a valid name";
  }
  if (name.find_first_not_of(" \t") == std::string::npos) {
    return "Name must not be blank";
  }
  return "";
}

Result<std::string> WorkspaceOperations::targetPath(const std::string &directory,
                                                    const std::string &name) const {
  if (std::string error = validateName(name); !error.empty()) {
    return Result<std::string>::error(error);
  }
  if (m_fs.entryKind(directory) != EntryKind::Directory) {
    return Result<std::string>::error("Folder does not exist: " + directory);
  }

  std::string path = m_fs.childPath(directory, name);
  if (m_fs.entryKind(path) != EntryKind::Missing) {
    return Result<std::string>::error("'" + name + "' already exists");
  }
  return Result<std::string>::ok(path);
}

Result<std::string> WorkspaceOperations::createFile(const std::string &directory,
                                                    const std::string &name) {
  auto target = targetPath(directory, name);
  if (target.isError()) {
    return target;
  }

  if (!m_fs.createEmptyFile(target.value())) {
    return Result<std::string>::error("Could not create file: " + target.value());
  }
  MCPIDE_LOG_INFO("Created file {}", target.value());
  return target;
}

Result<std::string> WorkspaceOperations::createFolder(const std::string &directory,
                                                      const std::string &name) {
  auto target = targetPath(directory, name);
  if (target.isError()) {
    return target;
  }

  if (!m_fs.createDirectory(target.value())) {
    return Result<std::string>::error("Could not create folder: " + target.value());
  }
  MCPIDE_LOG_INFO("Created folder {}", target.value());
  return target;
}

Result<std::string> WorkspaceOperations::renamePath(const std::string &path,
                                                    const std::string &newName) {
  if (m_fs.entryKind(path) == EntryKind::Missing) {
    return Result<std::string>::error("Path does not exist: " + path);
  }
  if (m_fs.fileName(path) == newName) {
    return Result<std::string>::ok(m_fs.cleanPath(path));
  }

  auto target = targetPath(m_fs.parentPath(path), newName);
  if (target.isError()) {
    return target;
  }

  if (!m_fs.renameEntry(path, target.value())) {
    return Result<std::string>::error("Could not rename " + path + " to " + newName);
  }
  MCPIDE_LOG_INFO("Renamed {} to {}", path, target.value());
  return target;
}

Result<std::string> WorkspaceOperations::removePath(const std::string &path) {
  bool removed = false;
  switch (m_fs.entryKind(path)) {
  case EntryKind::Directory:
    removed = m_fs.removeTree(path);
    break;
  case EntryKind::File:
    removed = m_fs.removeFile(path);
    break;
  case EntryKind::Missing:
    return Result<std::string>::error("Path does not exist: " + path);
  }

  if (!removed) {
    return Result<std::string>::error("Could not delete " + path);
  }
  MCPIDE_LOG_INFO("Deleted {}", path);
  return Result<std::string>::ok(m_fs.cleanPath(path));
}

} // namespace McpIDE::editor
