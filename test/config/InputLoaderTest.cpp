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
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
// catch
#include "catch2/catch.hpp"
// tspan
#include <tspan/config/Config.h>
#include <tspan/config/InputLoader.h>
#include <tspan/dto/Period.h>

using namespace tspan;
using namespace tspan::config;
using dto::Bounds;
typedef dto::Period<int64_t> P;

SCENARIO("Interval notation")
{
    WHEN("the notation is well formed")
    {
        THEN("the boundaries and points are split")
        {
            auto notation = splitPeriodNotation("[0, 10)");
            REQUIRE(notation.startIncluded);
            REQUIRE_FALSE(notation.endIncluded);
            REQUIRE(notation.start == "0");
            REQUIRE(notation.end == "10");

            notation = splitPeriodNotation("  (-20,-5]  ");
            REQUIRE_FALSE(notation.startIncluded);
            REQUIRE(notation.endIncluded);
            REQUIRE(notation.start == "-20");
            REQUIRE(notation.end == "-5");
        }
    }

    WHEN("the notation is malformed")
    {
        THEN("InputException is raised")
        {
            REQUIRE_THROWS_AS(splitPeriodNotation(""), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("[0,)"), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("{0, 10)"), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("[0, 10}"), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("[0 10 20)"), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("[0, 10, 20)"), InputException);
            REQUIRE_THROWS_AS(splitPeriodNotation("[ , 10)"), InputException);
        }
    }
}

SCENARIO("Loading intervals")
{
    WHEN("the document is a map with a list of intervals")
    {
        const std::string input =
        {R"yaml(---
            intervals:
                - "[0, 10)"
                - "(20, 30]"
                - start: 40
                  end: 50
                  bounds: "[]"
                - start: 60
                  end: 70
        )yaml"};

        THEN("every notation is loaded in document order")
        {
            auto seq = InputLoader::loadString<int64_t>(input);
            REQUIRE(seq.count() == 4);
            REQUIRE(seq.get(0) == P(0, 10));
            REQUIRE(seq.get(1) == P(20, 30, Bounds::OpenClosed));
            REQUIRE(seq.get(2) == P(40, 50, Bounds::Closed));
            REQUIRE(seq.get(3) == P(60, 70, Bounds::ClosedOpen));
        }
    }

    WHEN("the document is a plain list")
    {
        THEN("the list is loaded")
        {
            auto seq = InputLoader::loadString<int64_t>(R"yaml(["(-10, -5)", "[-5, 0]"])yaml");
            REQUIRE(seq.toVector() == std::vector<P>{P(-10, -5, Bounds::Open), P(-5, 0, Bounds::Closed)});
        }
    }

    WHEN("the points are not integers")
    {
        THEN("the point type decides the conversion")
        {
            auto seq = InputLoader::loadString<double>(R"yaml(["[0.5, 1.5)"])yaml");
            REQUIRE(seq.get(0) == dto::Period<double>(0.5, 1.5));
        }
    }

    WHEN("the periods share defaults through merge keys")
    {
        const std::string input =
        {R"yaml(---
            closed: &closed
                bounds: "[]"

            intervals:
                -   start: 0
                    end: 10
                    <<: *closed
                -   start: 20
                    end: 30
                    <<: *closed
                    bounds: "()"
        )yaml"};

        THEN("the merged keys fill in the missing ones")
        {
            auto seq = InputLoader::loadString<int64_t>(input);
            REQUIRE(seq.count() == 2);
            REQUIRE(seq.get(0) == P(0, 10, Bounds::Closed));
            REQUIRE(seq.get(1) == P(20, 30, Bounds::Open));
        }
    }

    WHEN("there are no intervals")
    {
        THEN("the sequence is empty")
        {
            REQUIRE(InputLoader::loadString<int64_t>("intervals:").isEmpty());
            REQUIRE(InputLoader::loadString<int64_t>("name: empty").isEmpty());
            REQUIRE(InputLoader::loadString<int64_t>("[]").isEmpty());
        }
    }

    WHEN("the document is invalid")
    {
        THEN("InputException is raised")
        {
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("intervals: 5"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>(R"yaml(["[a, b)"])yaml"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>(R"yaml(["0, 10"])yaml"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("[[0, 10]]"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("[{start: 0}]"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("[{start: x, end: 10}]"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("[{start: 0, end: 10, bounds: '<>'}]"), InputException);
        }
    }

    WHEN("a period ends before it starts")
    {
        THEN("InputException is raised for both notations")
        {
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>(R"yaml(["[10, 0)"])yaml"), InputException);
            REQUIRE_THROWS_AS(InputLoader::loadString<int64_t>("[{start: 10, end: 0}]"), InputException);
        }
    }
}

SCENARIO("Config variables")
{
    WHEN("the variable is not configured")
    {
        THEN("the default is used")
        {
            ConfigVar<std::string> format("format", "text");
            REQUIRE(format() == "text");
        }
    }

    WHEN("the variable is configured")
    {
        ConfigMap().insert(std::make_pair(std::string("format"),
                                          boost::program_options::variable_value(std::string("json"), false)));
        THEN("the configured value is used")
        {
            ConfigVar<std::string> format("format", "text");
            REQUIRE(format() == "json");
        }
        ConfigMap().clear();
    }
}
