#pragma once

/**
 * @file MockFileSystem.hpp
 * @brief In-memory IFileSystem for unit tests
 *
 * Keeps files (with content) and folders in sorted containers keyed by the
 * cleaned path, counts every successful mutation and can be told to refuse
 * file creation.
 */

#include "McpIDE/editor/interfaces/IFileSystem.hpp"

#include <iterator>
#include <map>
#include <set>
#include <utility>

namespace McpIDE::editor {

class MockFileSystem final : public IFileSystem {
public:
  // =========================================================================
  // IFileSystem
  // =========================================================================

  [[nodiscard]] EntryKind entryKind(const std::string &path) const override {
    const std::string key = cleanPath(path);
    if (m_files.count(key) != 0) {
      return EntryKind::File;
    }
    return m_directories.count(key) != 0 ? EntryKind::Directory : EntryKind::Missing;
  }

  bool createEmptyFile(const std::string &path) override {
    const std::string key = cleanPath(path);
    if (m_refuseFiles || !canCreate(key)) {
      return false;
    }
    m_files[key] = std::string();
    ++m_createdFiles;
    return true;
  }

  bool createDirectory(const std::string &path) override {
    const std::string key = cleanPath(path);
    if (!canCreate(key)) {
      return false;
    }
    m_directories.insert(key);
    ++m_createdDirectories;
    return true;
  }

  bool renameEntry(const std::string &from, const std::string &to) override {
    const std::string src = cleanPath(from);
    const std::string dst = cleanPath(to);
    const EntryKind kind = entryKind(src);
    if (kind == EntryKind::Missing || !canCreate(dst)) {
      return false;
    }

    if (kind == EntryKind::File) {
      m_files[dst] = std::move(m_files[src]);
      m_files.erase(src);
    } else {
      rebase(src, dst);
    }
    ++m_renames;
    return true;
  }

  bool removeFile(const std::string &path) override {
    if (m_files.erase(cleanPath(path)) == 0) {
      return false;
    }
    ++m_removals;
    return true;
  }

  bool removeTree(const std::string &path) override {
    const std::string root = cleanPath(path);
    if (m_directories.erase(root) == 0) {
      return false;
    }
    eraseBelow(m_files, root);
    eraseBelow(m_directories, root);
    ++m_removals;
    return true;
  }

  [[nodiscard]] std::string fileName(const std::string &path) const override {
    const std::string cleaned = cleanPath(path);
    const auto slash = cleaned.rfind('/');
    return slash == std::string::npos ? cleaned : cleaned.substr(slash + 1);
  }

  [[nodiscard]] std::string parentPath(const std::string &path) const override {
    const std::string cleaned = cleanPath(path);
    const auto slash = cleaned.rfind('/');
    if (slash == std::string::npos) {
      return std::string();
    }
    return slash == 0 ? std::string("/") : cleaned.substr(0, slash);
  }

  [[nodiscard]] std::string cleanPath(const std::string &path) const override {
    std::string cleaned;
    cleaned.reserve(path.size());
    for (char c : path) {
      if (c == '\\') {
        c = '/';
      }
      if (c == '/' && !cleaned.empty() && cleaned.back() == '/') {
        continue;
      }
      cleaned.push_back(c);
    }
    if (cleaned.size() > 1 && cleaned.back() == '/') {
      cleaned.pop_back();
    }
    return cleaned;
  }

  [[nodiscard]] std::string childPath(const std::string &directory,
                                      const std::string &name) const override {
    return cleanPath(directory + "/" + name);
  }

  // =========================================================================
  // Test setup and inspection
  // =========================================================================

  /// Seed a file and every folder above it
  void seedFile(const std::string &path, const std::string &content) {
    const std::string key = cleanPath(path);
    m_files[key] = content;
    seedParents(key);
  }

  /// Seed a folder and every folder above it
  void seedDirectory(const std::string &path) {
    const std::string key = cleanPath(path);
    m_directories.insert(key);
    seedParents(key);
  }

  void setRefuseFileCreation(bool refuse) { m_refuseFiles = refuse; }

  /// Content of a file, empty when it does not exist
  [[nodiscard]] std::string content(const std::string &path) const {
    const auto it = m_files.find(cleanPath(path));
    return it == m_files.end() ? std::string() : it->second;
  }

  [[nodiscard]] int createdFiles() const { return m_createdFiles; }
  [[nodiscard]] int createdDirectories() const { return m_createdDirectories; }
  [[nodiscard]] int renames() const { return m_renames; }
  [[nodiscard]] int removals() const { return m_removals; }

private:
  [[nodiscard]] bool canCreate(const std::string &key) const {
    return entryKind(key) == EntryKind::Missing &&
           entryKind(parentPath(key)) == EntryKind::Directory;
  }

  void seedParents(const std::string &key) {
    for (std::string parent = parentPath(key); !parent.empty(); parent = parentPath(parent)) {
      m_directories.insert(parent);
      if (parent == "/") {
        break;
      }
    }
  }

  static bool isBelow(const std::string &entry, const std::string &root) {
    return entry.size() > root.size() + 1 && entry.compare(0, root.size(), root) == 0 &&
           entry[root.size()] == '/';
  }

  template <typename Container> static void eraseBelow(Container &entries, const std::string &root) {
    for (auto it = entries.begin(); it != entries.end();) {
      const std::string &key = keyOf(*it);
      it = isBelow(key, root) ? entries.erase(it) : std::next(it);
    }
  }

  static const std::string &keyOf(const std::string &entry) { return entry; }
  static const std::string &keyOf(const std::pair<const std::string, std::string> &entry) {
    return entry.first;
  }

  // Move a folder and everything below it to a new root
  void rebase(const std::string &src, const std::string &dst) {
    std::map<std::string, std::string> files;
    std::set<std::string> directories{dst};
    for (const auto &[key, data] : m_files) {
      if (isBelow(key, src)) {
        files[dst + key.substr(src.size())] = data;
      }
    }
    for (const auto &key : m_directories) {
      if (isBelow(key, src)) {
        directories.insert(dst + key.substr(src.size()));
      }
    }
    m_directories.erase(src);
    eraseBelow(m_files, src);
    eraseBelow(m_directories, src);
    m_files.insert(files.begin(), files.end());
    m_directories.insert(directories.begin(), directories.end());
  }

  std::map<std::string, std::string> m_files;
  std::set<std::string> m_directories;

  bool m_refuseFiles = false;
  int m_createdFiles = 0;
  int m_createdDirectories = 0;
  int m_renames = 0;
  int m_removals = 0;
};

} // namespace McpIDE::editor
