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

#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include <tspan/common/Common.h>
#include <tspan/common/FormattingUtils.h>

namespace tspan {
namespace dto {

// The boundary type of a period, written the way it appears in interval notation
enum class Bounds : uint8_t {
    ClosedOpen,  // [start, end)
    OpenClosed,  // (start, end]
    Closed,      // [start, end]
    Open         // (start, end)
};

inline const char* const BoundsNames[] = {"[)", "(]", "[]", "()"};

inline Bounds BoundsFromStr(const String& str) {
    for (size_t i = 0; i < std::size(BoundsNames); ++i) {
        if (str == BoundsNames[i]) {
            return static_cast<Bounds>(i);
        }
    }
    throw std::runtime_error(fmt::format("unsupported value:{} in enum Bounds", str));
}

inline Bounds makeBounds(bool startIncluded, bool endIncluded) {
    if (startIncluded) {
        return endIncluded ? Bounds::Closed : Bounds::ClosedOpen;
    }
    return endIncluded ? Bounds::OpenClosed : Bounds::Open;
}

inline std::ostream& operator<<(std::ostream& os, const Bounds& b) {
    return os << BoundsNames[to_integral(b)];
}

// Raised when an operation is not defined for the given periods, e.g. the gap between overlapping periods
class PeriodException : public std::exception {
public:
    PeriodException(String msg) : _msg(std::move(msg)) {}

    virtual const char* what() const noexcept override {
        return _msg.c_str();
    }

private:
    String _msg;
};

// Raised when constructing a period whose end is before its start
class InvalidPeriod : public PeriodException {
public:
    InvalidPeriod() : PeriodException("The ending point must be greater or equal to the starting point") {}
};

// An immutable bounded range over a totally ordered domain.
// PointT needs to be copyable and to provide operator< and operator==.
//
// Two periods are equal iff their start, end and boundary type are equal.
// Periods which only touch at a boundary point which is not included by both sides "abut"; they
// never overlap. Periods which share at least one point overlap.
template <typename PointT>
class Period {
public:
    Period(PointT start, PointT end, Bounds bounds = Bounds::ClosedOpen) :
        _start(std::move(start)), _end(std::move(end)), _bounds(bounds) {
        if (_end < _start) {
            throw InvalidPeriod();
        }
    }

    DEFAULT_COPY_MOVE(Period);

    const PointT& start() const { return _start; }
    const PointT& end() const { return _end; }
    Bounds bounds() const { return _bounds; }

    bool isStartIncluded() const {
        return _bounds == Bounds::ClosedOpen || _bounds == Bounds::Closed;
    }
    bool isEndIncluded() const {
        return _bounds == Bounds::OpenClosed || _bounds == Bounds::Closed;
    }

    // three-way comparison of the start points only: <0, 0 or >0
    int compareStart(const Period& o) const {
        if (_start < o._start) return -1;
        if (o._start < _start) return 1;
        return 0;
    }

    bool operator==(const Period& o) const {
        return _start == o._start && _end == o._end && _bounds == o._bounds;
    }
    bool operator!=(const Period& o) const {
        return !operator==(o);
    }
    bool equals(const Period& o) const {
        return operator==(o);
    }

    // true if o ends exactly where this period starts and they do not share that point
    bool bordersOnStart(const Period& o) const {
        return o._end == _start && !(o.isEndIncluded() && isStartIncluded());
    }

    // true if o starts exactly where this period ends and they do not share that point
    bool bordersOnEnd(const Period& o) const {
        return _end == o._start && !(isEndIncluded() && o.isStartIncluded());
    }

    bool abuts(const Period& o) const {
        return bordersOnStart(o) || bordersOnEnd(o);
    }

    bool overlaps(const Period& o) const {
        return !abuts(o) && !(o._end < _start) && !(_end < o._start);
    }

    // true if every point of o is also a point of this period
    bool contains(const Period& o) const {
        bool startOk = _start < o._start ||
            (_start == o._start && (isStartIncluded() || !o.isStartIncluded()));
        bool endOk = o._end < _end ||
            (_end == o._end && (isEndIncluded() || !o.isEndIncluded()));
        return startOk && endOk;
    }

    bool contains(const PointT& point) const {
        bool afterStart = _start < point || (_start == point && isStartIncluded());
        bool beforeEnd = point < _end || (point == _end && isEndIncluded());
        return afterStart && beforeEnd;
    }

    // The period strictly between this period and o. Its bounds complement the bounds of the
    // neighbouring periods, e.g. the gap between [0, 10) and (20, 30] is [10, 20]
    Period gap(const Period& o) const {
        if (overlaps(o)) {
            throw PeriodException("Both periods overlap, there is no gap between them");
        }
        const Period& lower = o._start < _start ? o : *this;
        const Period& upper = o._start < _start ? *this : o;
        return Period(lower._end, upper._start, makeBounds(!lower.isEndIncluded(), !upper.isStartIncluded()));
    }

    // The common part of both periods
    Period intersect(const Period& o) const {
        if (!overlaps(o)) {
            throw PeriodException("Both periods must overlap to compute their intersection");
        }
        const PointT* start = &_start;
        bool startIncluded = isStartIncluded();
        if (_start < o._start) {
            start = &o._start;
            startIncluded = o.isStartIncluded();
        }
        else if (_start == o._start) {
            startIncluded = startIncluded && o.isStartIncluded();
        }

        const PointT* end = &_end;
        bool endIncluded = isEndIncluded();
        if (o._end < _end) {
            end = &o._end;
            endIncluded = o.isEndIncluded();
        }
        else if (_end == o._end) {
            endIncluded = endIncluded && o.isEndIncluded();
        }
        return Period(*start, *end, makeBounds(startIncluded, endIncluded));
    }

    // The smallest period which encloses this period and all the given ones.
    // When boundary points tie, an included bound wins over an excluded one
    template <typename... Rest>
    Period merge(const Period& o, const Rest&... rest) const {
        Period result = _mergeOne(o);
        if constexpr (sizeof...(rest) > 0) {
            return result.merge(rest...);
        }
        else {
            return result;
        }
    }

    friend std::ostream& operator<<(std::ostream& os, const Period& p) {
        fmt::print(os, "{}", p);
        return os;
    }

private:
    Period _mergeOne(const Period& o) const {
        const PointT* start = &_start;
        bool startIncluded = isStartIncluded();
        if (o._start < _start) {
            start = &o._start;
            startIncluded = o.isStartIncluded();
        }
        else if (o._start == _start) {
            startIncluded = startIncluded || o.isStartIncluded();
        }

        const PointT* end = &_end;
        bool endIncluded = isEndIncluded();
        if (_end < o._end) {
            end = &o._end;
            endIncluded = o.isEndIncluded();
        }
        else if (_end == o._end) {
            endIncluded = endIncluded || o.isEndIncluded();
        }
        return Period(*start, *end, makeBounds(startIncluded, endIncluded));
    }

    PointT _start;
    PointT _end;
    Bounds _bounds;
};

} // ns dto
} // ns tspan

template <typename PointT>
struct fmt::formatter<tspan::dto::Period<PointT>> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(tspan::dto::Period<PointT> const& p, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}{}, {}{}",
                              p.isStartIncluded() ? '[' : '(', p.start(),
                              p.end(), p.isEndIncluded() ? ']' : ')');
    }
};

namespace std {
template <typename PointT>
struct hash<tspan::dto::Period<PointT>> {
    size_t operator()(const tspan::dto::Period<PointT>& p) const {
        return tspan::hash_combine(p.start(), p.end(), tspan::to_integral(p.bounds()));
    }
};
} // ns std

// periods have no default constructor so they are (de)serialized through an adl_serializer
// e.g. {"start": 0, "end": 10, "bounds": "[)"}
namespace nlohmann {
template <typename PointT>
struct adl_serializer<tspan::dto::Period<PointT>> {
    static tspan::dto::Period<PointT> from_json(const nlohmann::json& j) {
        tspan::dto::Bounds bounds = tspan::dto::Bounds::ClosedOpen;
        if (j.contains("bounds")) {
            bounds = tspan::dto::BoundsFromStr(j.at("bounds").get<tspan::String>());
        }
        return tspan::dto::Period<PointT>(j.at("start").get<PointT>(), j.at("end").get<PointT>(), bounds);
    }

    static void to_json(nlohmann::json& j, const tspan::dto::Period<PointT>& p) {
        j = nlohmann::json{{"start", p.start()},
                           {"end", p.end()},
                           {"bounds", tspan::dto::BoundsNames[tspan::to_integral(p.bounds())]}};
    }
};
} // ns nlohmann
