/**
 * @file test_error_log.cpp
 * @brief Tests for error reporting helpers and the logger.
 */

#include <catch2/catch.hpp>

#include "core/error.hpp"
#include "core/log.hpp"

#include "../../helpers/vpk_test_utils.hpp"

#include <cstring>
#include <fstream>
#include <sstream>

using namespace shared::core;
using test_helpers::TempDir;

TEST_CASE("fail fills the error and returns false", "[core][error]") {
    Error err;
    REQUIRE_FALSE(fail(&err, ErrorKind::NoMapFile, "no map"));
    REQUIRE(err.kind == ErrorKind::NoMapFile);
    REQUIRE(err.message == "no map");

    REQUIRE_FALSE(fail(nullptr, ErrorKind::IoError, "ignored"));
}

TEST_CASE("error_kind_name names every kind", "[core][error]") {
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::InvalidSignature), "InvalidSignature") == 0);
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::IndexCorrupt), "IndexCorrupt") == 0);
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::UnsupportedArchivePart), "UnsupportedArchivePart") == 0);
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::NoMapFile), "NoMapFile") == 0);
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::IoError), "IoError") == 0);
    REQUIRE(std::strcmp(error_kind_name(ErrorKind::SystemError), "SystemError") == 0);
}

TEST_CASE("Logger filters by level and writes to its file sink", "[core][log]") {
    TempDir dir;
    const auto logPath = dir.path() / "terrainmod.log";

    LoggingConfig cfg;
    cfg.level = LogLevel::Warning;
    cfg.file = logPath.string();
    Logger::instance().init(cfg);

    REQUIRE_FALSE(Logger::instance().enabled_for(LogLevel::Info));
    REQUIRE(Logger::instance().enabled_for(LogLevel::Error));
    REQUIRE_FALSE(Logger::instance().enabled_for(LogLevel::None));

    logf(LogLevel::Info, "test", "hidden %d", 1);
    logf(LogLevel::Error, "test", "shown %d", 2);
    Logger::instance().shutdown();

    std::ifstream in(logPath);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[ERROR][test] shown 2") != std::string::npos);

    Logger::instance().init(LoggingConfig{});
}

TEST_CASE("disabled logging suppresses every level", "[core][log]") {
    LoggingConfig cfg;
    cfg.enabled = false;
    Logger::instance().init(cfg);

    REQUIRE_FALSE(Logger::instance().enabled_for(LogLevel::Fatal));

    Logger::instance().init(LoggingConfig{});
    REQUIRE(Logger::instance().enabled_for(LogLevel::Info));
}
