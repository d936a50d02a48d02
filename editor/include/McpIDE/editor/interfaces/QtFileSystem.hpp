#pragma once

/**
 * @file QtFileSystem.hpp
 * @brief IFileSystem backed by QFile, QDir and QFileInfo
 */

#include "McpIDE/editor/interfaces/IFileSystem.hpp"

namespace McpIDE::editor {

class QtFileSystem final : public IFileSystem {
public:
  [[nodiscard]] EntryKind entryKind(const std::string &path) const override;

  bool createEmptyFile(const std::string &path) override;
  bool createDirectory(const std::string &path) override;
  bool renameEntry(const std::string &from, const std::string &to) override;
  bool removeFile(const std::string &path) override;
  bool removeTree(const std::string &path) override;

  [[nodiscard]] std::string fileName(const std::string &path) const override;
  [[nodiscard]] std::string parentPath(const std::string &path) const override;
  [[nodiscard]] std::string cleanPath(const std::string &path) const override;
  [[nodiscard]] std::string childPath(const std::string &directory,
                                      const std::string &name) const override;
};

} // namespace McpIDE::editor
