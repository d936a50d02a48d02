#pragma once

/**
 * @file IFileSystem.hpp
 * @brief Workspace file system seam used by the explorer operations
 *
 * WorkspaceOperations talks to disk only through this interface, so its
 * name checks and collision rules run against MockFileSystem in unit tests
 * and against QtFileSystem in the application.
 */

#include "McpIDE/core/types.hpp"

#include <string>

namespace McpIDE::editor {

/**
 * @brief What a workspace path currently refers to
 */
enum class EntryKind : u8 { Missing, File, Directory };

/**
 * @brief Minimal set of entry mutations the explorer performs
 *
 * Paths are absolute and use '/' separators. Every mutation returns false
 * instead of overwriting something that already exists.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual EntryKind entryKind(const std::string &path) const = 0;

  /// Create a zero-length file; the parent folder must exist
  virtual bool createEmptyFile(const std::string &path) = 0;

  /// Create one folder; the parent folder must exist
  virtual bool createDirectory(const std::string &path) = 0;

  /// Rename a file or folder; fails when @p to is taken
  virtual bool renameEntry(const std::string &from, const std::string &to) = 0;

  virtual bool removeFile(const std::string &path) = 0;

  /// Remove a folder together with everything below it
  virtual bool removeTree(const std::string &path) = 0;

  // Path helpers

  [[nodiscard]] virtual std::string fileName(const std::string &path) const = 0;
  [[nodiscard]] virtual std::string parentPath(const std::string &path) const = 0;
  [[nodiscard]] virtual std::string cleanPath(const std::string &path) const = 0;
  [[nodiscard]] virtual std::string childPath(const std::string &directory,
                                              const std::string &name) const = 0;
};

} // namespace McpIDE::editor
