#pragma once

/**
 * @file workspace_operations.hpp
 * @brief File and folder operations behind the explorer context menu
 */

#include "McpIDE/core/result.hpp"
#include "McpIDE/editor/interfaces/IFileSystem.hpp"
#include <string>

namespace McpIDE::editor {

/**
 * @brief Create, rename and delete workspace entries through IFileSystem
 *
 * Every operation returns the path it produced (or removed) so the caller
 * can update open editors and the tree selection.
 */
class WorkspaceOperations {
public:
  explicit WorkspaceOperations(IFileSystem &fs);

  /**
   * @brief Create an empty file named @p name inside @p directory
   */
  Result<std::string> createFile(const std::string &directory, const std::string &name);

  /**
   * @brief Create a folder named @p name inside @p directory
   */
  Result<std::string> createFolder(const std::string &directory, const std::string &name);

  /**
   * @brief Rename a file or folder in place
   * @return New full path
   */
  Result<std::string> renamePath(const std::string &path, const std::string &newName);

  /**
   * @brief Delete a file, or a folder with all of its contents
   */
  Result<std::string> removePath(const std::string &path);

  /**
   * @brief Check an entry name typed by the user
   * @return Empty string when valid, otherwise the reason
   */
  [[nodiscard]] static std::string validateName(const std::string &name);

private:
  Result<std::string> targetPath(const std::string &directory, const std::string &name) const;

  IFileSystem &m_fs;
};

} // namespace McpIDE::editor
