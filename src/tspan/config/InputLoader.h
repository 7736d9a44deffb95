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

#pragma once

// std
#include <exception>
#include <stdexcept>
#include <vector>
// yaml
#include <yaml-cpp/yaml.h>
// tspan
#include <tspan/common/Common.h>
#include <tspan/common/Log.h>
#include <tspan/dto/Period.h>
#include <tspan/sequence/Sequence.h>
// tspan:config
#include "YamlUtils.h"

namespace tspan {
namespace log {
inline thread_local tspan::logging::Logger input("tspan::input");
}

namespace config {

// Raised for input documents which do not describe a list of periods
class InputException : public std::exception {
public:
    InputException(String msg) : _msg(std::move(msg)) {}

    virtual const char* what() const noexcept override {
        return _msg.c_str();
    }

private:
    String _msg;
};

// The parts of a period written in interval notation, e.g. "[0, 10)"
struct PeriodNotation {
    bool startIncluded = true;
    String start;
    String end;
    bool endIncluded = false;
};

// Split interval notation into its parts. Throws InputException if the text is not of the form
// <'[' or '('> start ',' end <']' or ')'>
PeriodNotation splitPeriodNotation(const String& text);

// Loads sequences of periods from YAML documents. A document is either a list of periods or a map with
// an "intervals" list. Each period is either written in interval notation or as a map:
//
// intervals:
//     - "[0, 10)"
//     - start: 20
//       end: 30
//       bounds: "(]"
//
// The points of the periods are read with the YAML conversion for PointT.
class InputLoader
{
public:
    template <typename PointT>
    static Sequence<dto::Period<PointT>> loadFile(const String& inputFile)
    {
        TSPANLOG_I(log::input, "loading intervals from {}", inputFile);
        return load<PointT>(YAML::LoadFile(inputFile));
    }

    template <typename PointT>
    static Sequence<dto::Period<PointT>> loadString(const String& inputString)
    {
        return load<PointT>(YAML::Load(inputString));
    }

    template <typename PointT>
    static Sequence<dto::Period<PointT>> load(const YAML::Node& node)
    {
        const YAML::Node intervals = node.IsMap() ? node["intervals"] : node;
        if(!intervals || intervals.IsNull()) {
            TSPANLOG_W(log::input, "no intervals in input document");
            return Sequence<dto::Period<PointT>>();
        }
        if(!intervals.IsSequence()) {
            throw InputException("intervals must be a list");
        }

        std::vector<dto::Period<PointT>> periods;
        periods.reserve(intervals.size());
        for(auto interval: intervals) {
            periods.push_back(parsePeriod<PointT>(YamlUtils::mergeAnchors(interval)));
        }
        TSPANLOG_D(log::input, "loaded {} intervals", periods.size());

        return Sequence<dto::Period<PointT>>(std::move(periods));
    }

    template <typename PointT>
    static dto::Period<PointT> parsePeriod(const YAML::Node& node)
    {
        if(node.IsScalar()) {
            PeriodNotation notation = splitPeriodNotation(node.as<String>());
            return makePeriod<PointT>(parsePoint<PointT>(notation.start), parsePoint<PointT>(notation.end),
                                      dto::makeBounds(notation.startIncluded, notation.endIncluded));
        }
        if(!node.IsMap()) {
            throw InputException("a period must be written in interval notation or as a map");
        }
        if(!node["start"] || !node["end"]) {
            throw InputException("a period map requires both start and end");
        }

        const String boundsName = YamlUtils::getOptionalValue(node["bounds"], String("[)"));
        dto::Bounds bounds;
        try {
            bounds = dto::BoundsFromStr(boundsName);
        }
        catch(const std::runtime_error& exc) {
            throw InputException(exc.what());
        }
        return makePeriod<PointT>(parsePoint<PointT>(node["start"]), parsePoint<PointT>(node["end"]), bounds);
    }

    // a period whose end is before its start is reported as a malformed input
    template <typename PointT>
    static dto::Period<PointT> makePeriod(PointT start, PointT end, dto::Bounds bounds)
    {
        try {
            return dto::Period<PointT>(std::move(start), std::move(end), bounds);
        }
        catch(const dto::PeriodException& exc) {
            throw InputException(fmt::format("invalid period: {}", exc.what()));
        }
    }

    template <typename PointT>
    static PointT parsePoint(const YAML::Node& node)
    {
        try {
            return node.as<PointT>();
        }
        catch(const YAML::BadConversion& exc) {
            throw InputException(fmt::format("invalid period boundary: {}", exc.what()));
        }
    }

    template <typename PointT>
    static PointT parsePoint(const String& token)
    {
        try {
            return YAML::Node(token).as<PointT>();
        }
        catch(const YAML::BadConversion&) {
            throw InputException(fmt::format("invalid period boundary: {}", token));
        }
    }

}; // class InputLoader

} // namespace config
} // namespace tspan
