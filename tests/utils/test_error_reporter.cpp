#include <catch2/catch_test_macros.hpp>
#include "transcache/utils/ErrorReporter.hpp"
#include "transcache/utils/LogManager.hpp"
#include "temp_dir.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace transcache::utils;

TEST_CASE("ErrorReporter queues reports until they are collected", "[utils][errors]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Cache, "cache degraded", "disk full");
    ErrorReporter::ReportError(ErrorCategory::Translation, "translation failed");

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].severity == ErrorSeverity::Warning);
    REQUIRE(reports[0].technical_details == "disk full");
    REQUIRE(reports[1].category == ErrorCategory::Translation);
    REQUIRE(reports[1].severity == ErrorSeverity::Error);
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter bounds its queue", "[utils][errors]")
{
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 150; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Unknown, "noise " + std::to_string(i));

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 100);
    REQUIRE(reports.back().user_message == "noise 149");
}

TEST_CASE("ErrorReporter names categories and severities", "[utils][errors]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Configuration) == "Configuration");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Cache) == "Cache");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "Fatal");
}

TEST_CASE("LogManager writes to the configured file", "[utils][logging]")
{
    REQUIRE(LogManager::SeverityFromInt(-3) == plog::none);
    REQUIRE(LogManager::SeverityFromInt(99) == plog::verbose);
    REQUIRE(LogManager::SeverityFromInt(4) == plog::info);

    test_utils::TempDir dir;
    const auto file = dir / "logs" / "transcache.log";

    REQUIRE(LogManager::Initialize(plog::info, false));
    LogManager::LoggerConfig cfg;
    cfg.filepath = file.string();
    cfg.append = false;
    REQUIRE(LogManager::RegisterLogger(cfg));

    PLOG_INFO << "logging smoke line";
    PLOG_DEBUG << "below threshold";
    LogManager::Shutdown();

    std::ifstream ifs(file);
    std::stringstream ss;
    ss << ifs.rdbuf();
    REQUIRE(ss.str().find("logging smoke line") != std::string::npos);
    REQUIRE(ss.str().find("below threshold") == std::string::npos);
}
