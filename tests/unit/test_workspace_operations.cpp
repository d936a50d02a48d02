/**
 * @file test_workspace_operations.cpp
 * @brief Tests for explorer file operations against an in-memory file system
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/interfaces/MockFileSystem.hpp"
#include "McpIDE/editor/workspace_operations.hpp"

using namespace McpIDE::editor;

TEST_CASE("WorkspaceOperations - Name validation", "[workspace_operations]") {
  CHECK(WorkspaceOperations::validateName("main.py").empty());
  CHECK(WorkspaceOperations::validateName(".gitignore").empty());
  CHECK_FALSE(WorkspaceOperations::validateName("").empty());
  CHECK_FALSE(WorkspaceOperations::validateName("   ").empty());
  CHECK_FALSE(WorkspaceOperations::validateName(".").empty());
  CHECK_FALSE(WorkspaceOperations::validateName("..").empty());
  CHECK_FALSE(WorkspaceOperations::validateName("src/main.py").empty());
  CHECK_FALSE(WorkspaceOperations::validateName("src\\main.py").empty());
}

TEST_CASE("WorkspaceOperations - Create files and folders", "[workspace_operations]") {
  MockFileSystem fs;
  fs.seedDirectory("/work");
  WorkspaceOperations ops(fs);

  SECTION("Create file") {
    auto result = ops.createFile("/work", "notes.md");
    REQUIRE(result.isOk());
    CHECK(result.value() == "/work/notes.md");
    CHECK(fs.entryKind("/work/notes.md") == EntryKind::File);
    CHECK(fs.content("/work/notes.md").empty());
  }

  SECTION("Create folder") {
    auto result = ops.createFolder("/work", "src");
    REQUIRE(result.isOk());
    CHECK(fs.entryKind("/work/src") == EntryKind::Directory);
    CHECK(fs.createdDirectories() == 1);
  }

  SECTION("Existing name is rejected") {
    fs.seedFile("/work/notes.md", "hello");
    auto result = ops.createFile("/work", "notes.md");
    REQUIRE(result.isError());
    CHECK(result.error().find("already exists") != std::string::npos);
    CHECK(fs.content("/work/notes.md") == "hello");
    CHECK(ops.createFolder("/work", "notes.md").isError());
  }

  SECTION("Missing parent is rejected") {
    CHECK(ops.createFile("/missing", "a.txt").isError());
    CHECK(fs.createdFiles() == 0);
  }

  SECTION("Invalid name is rejected before touching the disk") {
    CHECK(ops.createFile("/work", "a/b").isError());
    CHECK(fs.createdFiles() == 0);
  }

  SECTION("Write failure is reported") {
    fs.setRefuseFileCreation(true);
    auto result = ops.createFile("/work", "a.txt");
    REQUIRE(result.isError());
    CHECK(result.error().find("Could not create file") != std::string::npos);
  }
}

TEST_CASE("WorkspaceOperations - Rename", "[workspace_operations]") {
  MockFileSystem fs;
  fs.seedFile("/work/old.txt", "content");
  fs.seedFile("/work/pkg/module.py", "pass");
  WorkspaceOperations ops(fs);

  SECTION("Rename a file keeps its content") {
    auto result = ops.renamePath("/work/old.txt", "new.txt");
    REQUIRE(result.isOk());
    CHECK(result.value() == "/work/new.txt");
    CHECK(fs.entryKind("/work/old.txt") == EntryKind::Missing);
    CHECK(fs.content("/work/new.txt") == "content");
  }

  SECTION("Rename a folder moves its children") {
    auto result = ops.renamePath("/work/pkg", "lib");
    REQUIRE(result.isOk());
    CHECK(fs.entryKind("/work/lib") == EntryKind::Directory);
    CHECK(fs.entryKind("/work/lib/module.py") == EntryKind::File);
    CHECK(fs.entryKind("/work/pkg") == EntryKind::Missing);
  }

  SECTION("Same name is a no-op") {
    auto result = ops.renamePath("/work/old.txt", "old.txt");
    REQUIRE(result.isOk());
    CHECK(fs.renames() == 0);
  }

  SECTION("Target collision is rejected") {
    fs.seedFile("/work/taken.txt", "");
    CHECK(ops.renamePath("/work/old.txt", "taken.txt").isError());
    CHECK(fs.entryKind("/work/old.txt") == EntryKind::File);
  }

  SECTION("Missing source is rejected") {
    CHECK(ops.renamePath("/work/ghost.txt", "x.txt").isError());
  }
}

TEST_CASE("WorkspaceOperations - Remove", "[workspace_operations]") {
  MockFileSystem fs;
  fs.seedFile("/work/a.txt", "");
  fs.seedFile("/work/dir/nested/b.txt", "");
  WorkspaceOperations ops(fs);

  SECTION("Remove a file") {
    REQUIRE(ops.removePath("/work/a.txt").isOk());
    CHECK(fs.entryKind("/work/a.txt") == EntryKind::Missing);
    CHECK(fs.removals() == 1);
  }

  SECTION("Remove a folder recursively") {
    REQUIRE(ops.removePath("/work/dir").isOk());
    CHECK(fs.entryKind("/work/dir") == EntryKind::Missing);
    CHECK(fs.entryKind("/work/dir/nested") == EntryKind::Missing);
    CHECK(fs.entryKind("/work/dir/nested/b.txt") == EntryKind::Missing);
    CHECK(fs.entryKind("/work/a.txt") == EntryKind::File);
  }

  SECTION("Missing path is an error") {
    auto result = ops.removePath("/work/none");
    REQUIRE(result.isError());
    CHECK(result.error().find("does not exist") != std::string::npos);
  }
}
