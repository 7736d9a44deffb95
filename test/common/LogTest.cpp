/*
MIT License

Copyright(c) 2020 Futurewei Cloud

    Permission is hereby granted,
    free of charge, to any person obtaining a copy of this software and associated documentation files(the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and / or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions :

    The above copyright notice and this permission notice shall be included in all copies
    or
    substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS",
    WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.IN NO EVENT SHALL THE
    AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
    DAMAGES OR OTHER
    LIABILITY,
    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
    OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
    SOFTWARE.
*/

#define CATCH_CONFIG_MAIN
// std
#include <stdexcept>
#include <string>
#include <vector>
// catch
#include "catch2/catch.hpp"
// tspan
#include <tspan/common/Log.h>

using namespace tspan;
using namespace tspan::logging;

SCENARIO("log level names") {
    REQUIRE(nameToLevel("VERBOSE") == LogLevel::VERBOSE);
    REQUIRE(nameToLevel("DEBUG") == LogLevel::DEBUG);
    REQUIRE(nameToLevel("WARN") == LogLevel::WARN);
    REQUIRE(nameToLevel("FATAL") == LogLevel::FATAL);
    REQUIRE(std::string(LogLevelNames[to_integral(LogLevel::ERROR)]) == "ERROR");
    REQUIRE_THROWS_AS(nameToLevel("debug"), std::runtime_error);
    REQUIRE_THROWS_AS(nameToLevel(""), std::runtime_error);
}

SCENARIO("applying log levels") {
    GIVEN("a module logger without an override") {
        Logger logger("test::plain");
        WHEN("the global level is raised") {
            applyLogLevels({"WARN"});
            THEN("only messages at or above the global level are enabled") {
                REQUIRE_FALSE(logger.isEnabledFor(LogLevel::INFO));
                REQUIRE(logger.isEnabledFor(LogLevel::WARN));
                REQUIRE(logger.isEnabledFor(LogLevel::ERROR));
            }
        }
        WHEN("no levels are given") {
            applyLogLevels({"ERROR"});
            applyLogLevels({});
            THEN("the global level goes back to INFO") {
                REQUIRE(Logger::threadLocalLogLevel == LogLevel::INFO);
                REQUIRE(logger.isEnabledFor(LogLevel::INFO));
                REQUIRE_FALSE(logger.isEnabledFor(LogLevel::DEBUG));
            }
        }
    }

    GIVEN("an existing module logger") {
        Logger logger("test::existing");
        WHEN("a module override is applied") {
            applyLogLevels({"ERROR", "test::existing=DEBUG"});
            THEN("the module level wins over the global level") {
                REQUIRE(logger.moduleLevel == LogLevel::DEBUG);
                REQUIRE(logger.isEnabledFor(LogLevel::DEBUG));
                REQUIRE_FALSE(logger.isEnabledFor(LogLevel::VERBOSE));
            }
        }
    }

    GIVEN("a module override applied before the logger exists") {
        applyLogLevels({"INFO", "test::lazy=VERBOSE"});
        WHEN("the logger is created") {
            Logger logger("test::lazy");
            THEN("it picks up the override") {
                REQUIRE(logger.moduleLevel == LogLevel::VERBOSE);
                REQUIRE(logger.isEnabledFor(LogLevel::VERBOSE));
            }
        }
    }

    GIVEN("malformed entries") {
        THEN("they are rejected") {
            REQUIRE_THROWS_AS(applyLogLevels(std::vector<String>({"LOUD"})), std::runtime_error);
            REQUIRE_THROWS_AS(applyLogLevels(std::vector<String>({"INFO", "test::module"})), std::runtime_error);
            REQUIRE_THROWS_AS(applyLogLevels(std::vector<String>({"INFO", "=DEBUG"})), std::runtime_error);
            REQUIRE_THROWS_AS(applyLogLevels(std::vector<String>({"INFO", "test::module="})), std::runtime_error);
            REQUIRE_THROWS_AS(applyLogLevels(std::vector<String>({"INFO", "test::module=LOUD"})), std::runtime_error);
        }
    }

    Logger::moduleLevels.clear();
    applyLogLevels({});
}

SCENARIO("logging through the macros") {
    Logger logger("test::macros");
    logger.moduleLevel = LogLevel::VERBOSE;
    TSPANLOG_D(logger, "debug message with {} argument", 1);
    TSPANLOG_I(logger, "info message");
    TSPANLOG_W(logger, "warning about {} and {}", "this", 2.5);
    TSPANEXPECT(logger, 1 + 1, 2);
    REQUIRE(logger.isEnabledFor(LogLevel::DEBUG));
}
