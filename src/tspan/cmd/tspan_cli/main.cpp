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

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <tspan/appbase/Appbase.h>
#include <tspan/config/Config.h>
#include <tspan/config/InputLoader.h>
#include <tspan/dto/Period.h>
#include <tspan/sequence/Sequence.h>
#include <tspan/sequence/Sweep.h>

namespace tspan::log {
inline thread_local tspan::logging::Logger cli("tspan::cli");
}

using namespace tspan;
typedef dto::Period<int64_t> Period;

namespace {

void printSequence(const Sequence<Period>& sequence, const String& format) {
    if (format == "json") {
        auto result = nlohmann::json::array();
        for (const auto& [offset, period] : sequence) {
            (void)offset;
            result.push_back(period);
        }
        std::cout << result.dump() << std::endl;
        return;
    }
    for (const auto& [offset, period] : sequence) {
        (void)offset;
        fmt::print("{}\n", period);
    }
}

void printPeriod(const std::optional<Period>& period, const String& format) {
    if (format == "json") {
        nlohmann::json result = nullptr;
        if (period) {
            result = *period;
        }
        std::cout << result.dump() << std::endl;
        return;
    }
    if (period) {
        fmt::print("{}\n", *period);
    }
}

int run() {
    ConfigVar<String> input("input");
    ConfigVar<String> op("op", "gaps");
    ConfigVar<String> format("format", "text");

    if (input().empty()) {
        throw std::runtime_error("--input is required");
    }
    if (format() != "text" && format() != "json") {
        throw std::runtime_error(fmt::format("unsupported output format: {}", format()));
    }

    auto sequence = config::InputLoader::loadFile<int64_t>(input());
    TSPANLOG_I(log::cli, "running {} over {} intervals", op(), sequence.count());

    if (op() == "gaps") {
        printSequence(getGaps(sequence), format());
    }
    else if (op() == "intersections") {
        printSequence(getIntersections(sequence), format());
    }
    else if (op() == "unions") {
        printSequence(getUnions(sequence), format());
    }
    else if (op() == "sort") {
        printSequence(sequence.sortedCopy(byStartAscending), format());
    }
    else if (op() == "bounds") {
        printPeriod(sequence.getBoundingInterval(), format());
    }
    else {
        throw std::runtime_error(fmt::format("unsupported operation: {}", op()));
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    App app("tspan_cli");
    app.addOptions()
    ("input", bpo::value<String>(), "YAML document with the intervals to process")
    ("op", bpo::value<String>()->default_value("gaps"), "The operation to run: gaps|intersections|unions|bounds|sort")
    ("format", bpo::value<String>()->default_value("text"), "The output format: text|json")
    ;
    return app.start(argc, argv, run);
}
