/**
 * @file test_logger.cpp
 * @brief Tests for the Logger
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace McpIDE::core;

namespace {

/**
 * @brief Captures log output and restores the logger when a test ends
 */
struct CapturedLog {
  CapturedLog() : previousLevel(Logger::instance().level()) {
    sinkId = Logger::instance().addSink([this](LogLevel level, const std::string &message) {
      lines.emplace_back(level, message);
    });
  }
  ~CapturedLog() {
    Logger::instance().removeSink(sinkId);
    Logger::instance().closeFile();
    Logger::instance().setLevel(previousLevel);
  }

  LogLevel previousLevel;
  Logger::SinkId sinkId = 0;
  std::vector<std::pair<LogLevel, std::string>> lines;
};

} // namespace

TEST_CASE("Logger - Level filtering", "[logger]") {
  CapturedLog log;
  Logger::instance().setLevel(LogLevel::Warning);

  MCPIDE_LOG_INFO("hidden");
  MCPIDE_LOG_WARN("shown");
  MCPIDE_LOG_ERROR("also shown");

  REQUIRE(log.lines.size() == 2);
  CHECK(log.lines[0].first == LogLevel::Warning);
  CHECK(log.lines[0].second == "shown");
  CHECK(log.lines[1].first == LogLevel::Error);
  CHECK_FALSE(Logger::instance().isEnabled(LogLevel::Info));
}

TEST_CASE("Logger - Format arguments", "[logger]") {
  CapturedLog log;
  Logger::instance().setLevel(LogLevel::Trace);

  MCPIDE_LOG_DEBUG("Opened {} ({} bytes)", "main.py", 128);
  REQUIRE(log.lines.size() == 1);
  CHECK(log.lines[0].second == "Opened main.py (128 bytes)");
}

TEST_CASE("Logger - Off suppresses everything", "[logger]") {
  CapturedLog log;
  Logger::instance().setLevel(LogLevel::Off);

  MCPIDE_LOG_FATAL("nothing");
  Logger::instance().log(LogLevel::Off, "never");
  CHECK(log.lines.empty());
}

TEST_CASE("Logger - Removed sinks stop receiving", "[logger]") {
  CapturedLog log;
  Logger::instance().setLevel(LogLevel::Info);

  int calls = 0;
  const auto id = Logger::instance().addSink([&calls](LogLevel, const std::string &) { ++calls; });
  MCPIDE_LOG_INFO("first");
  Logger::instance().removeSink(id);
  MCPIDE_LOG_INFO("second");

  CHECK(calls == 1);
  CHECK(log.lines.size() == 2);
}

TEST_CASE("Logger - Configure with a log file", "[logger]") {
  CapturedLog log;
  const auto path = std::filesystem::temp_directory_path() / "mcpide_logger_test.log";
  std::filesystem::remove(path);

  LoggerConfig config;
  config.level = LogLevel::Info;
  config.useColors = false;
  config.filePath = path.string();
  REQUIRE(Logger::instance().configure(config));

  MCPIDE_LOG_INFO("written to file");
  Logger::instance().closeFile();
  MCPIDE_LOG_INFO("after close");

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  CHECK(content.str().find("[INFO] written to file") != std::string::npos);
  CHECK(content.str().find("after close") == std::string::npos);

  in.close();
  std::filesystem::remove(path);
}

TEST_CASE("Logger - Unwritable log file is reported", "[logger]") {
  CapturedLog log;
  LoggerConfig config;
  config.filePath =
      (std::filesystem::temp_directory_path() / "mcpide_missing_dir" / "x" / "app.log").string();
  CHECK_FALSE(Logger::instance().configure(config));

  // Console logging and sinks keep working
  MCPIDE_LOG_WARN("still logging");
  REQUIRE(log.lines.size() == 1);
  CHECK(log.lines[0].second == "still logging");
}

TEST_CASE("Logger - Level names", "[logger]") {
  CHECK(std::string(Logger::levelName(LogLevel::Trace)) == "TRACE");
  CHECK(std::string(Logger::levelName(LogLevel::Warning)) == "WARN");
  CHECK(std::string(Logger::levelName(LogLevel::Fatal)) == "FATAL");
}
