#include <catch2/catch.hpp>
#include "core_util/logger.h"

using namespace uicomp::util;

TEST_CASE("ParseLogLevel accepts level names", "[util][logger]") {
    REQUIRE(ParseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(ParseLogLevel("info") == LogLevel::Info);
    REQUIRE(ParseLogLevel("warning") == LogLevel::Warning);
    REQUIRE(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel rejects unknown names", "[util][logger]") {
    REQUIRE_FALSE(ParseLogLevel("").has_value());
    REQUIRE_FALSE(ParseLogLevel("verbose").has_value());
    REQUIRE_FALSE(ParseLogLevel("INFO").has_value());
}

TEST_CASE("Logger level filters lower levels", "[util][logger]") {
    auto& logger = Logger::GetInstance();
    LogLevel previous = logger.GetLogLevel();

    logger.SetLogLevel(LogLevel::Warning);
    REQUIRE_FALSE(logger.IsEnabled(LogLevel::Debug));
    REQUIRE_FALSE(logger.IsEnabled(LogLevel::Info));
    REQUIRE(logger.IsEnabled(LogLevel::Warning));
    REQUIRE(logger.IsEnabled(LogLevel::Error));

    logger.SetLogLevel(previous);
}
