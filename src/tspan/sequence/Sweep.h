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

#include <tspan/common/Log.h>

#include "Sequence.h"

// Single ascending passes over start-ordered intervals which compute a derived sequence.
// None of the sweeps modifies its input.
namespace tspan {
namespace log {
inline thread_local tspan::logging::Logger sweep("tspan::sweep");
}

// The holes between the intervals of the sequence, in ascending order.
//
// A rolling envelope starts at the first interval. Each following interval which neither overlaps
// nor abuts the envelope produces the gap between the two. The envelope is then replaced by the
// interval unless it fully contains it. The envelope is never merged with the interval.
template <typename IntervalT>
Sequence<IntervalT> getGaps(const Sequence<IntervalT>& sequence) {
    Sequence<IntervalT> gaps;
    const Sequence<IntervalT> sorted = sequence.sortedCopy(byStartAscending);

    const IntervalT* envelope = nullptr;
    for (const auto& entry : sorted) {
        const IntervalT& current = entry.interval;
        if (envelope == nullptr) {
            envelope = &current;
            continue;
        }

        if (!envelope->overlaps(current) && !envelope->abuts(current)) {
            gaps.push(envelope->gap(current));
        }

        if (!envelope->contains(current)) {
            envelope = &current;
        }
    }

    TSPANLOG_D(log::sweep, "found {} gaps among {} intervals", gaps.count(), sequence.count());
    return gaps;
}

// The intersections between the intervals of the sequence, in ascending order.
//
// A reference interval starts at the first interval and each following interval becomes the comparison
// interval. Their intersection is reported when they overlap. The comparison interval becomes the new
// reference unless the reference contains it. While a comparison interval is pending, intervals contained
// in the reference are skipped.
// This reports one intersection per overlap boundary crossing in the sorted order, not every pairwise
// intersection within a cluster of overlapping intervals.
template <typename IntervalT>
Sequence<IntervalT> getIntersections(const Sequence<IntervalT>& sequence) {
    Sequence<IntervalT> intersections;
    const Sequence<IntervalT> sorted = sequence.sortedCopy(byStartAscending);

    const IntervalT* reference = nullptr;
    const IntervalT* comparison = nullptr;
    for (const auto& entry : sorted) {
        const IntervalT& current = entry.interval;
        if (reference == nullptr) {
            reference = &current;
            continue;
        }

        if (comparison != nullptr && reference->contains(current)) {
            continue;
        }

        comparison = &current;
        if (reference->overlaps(*comparison)) {
            intersections.push(reference->intersect(*comparison));
        }

        if (!reference->contains(*comparison)) {
            reference = comparison;
            comparison = nullptr;
        }
    }

    TSPANLOG_D(log::sweep, "found {} intersections among {} intervals", intersections.count(), sequence.count());
    return intersections;
}

// The unions of the intervals of the sequence, in ascending order: every run of overlapping or
// abutting intervals is merged into one. Shares the storage of the input when nothing merges and the
// input is already in ascending order.
template <typename IntervalT>
Sequence<IntervalT> getUnions(const Sequence<IntervalT>& sequence) {
    std::vector<IntervalT> unions;
    for (const auto& entry : sequence.sortedCopy(byStartAscending)) {
        const IntervalT& current = entry.interval;
        if (!unions.empty() && (unions.back().overlaps(current) || unions.back().abuts(current))) {
            unions.back() = unions.back().merge(current);
            continue;
        }
        unions.push_back(current);
    }

    TSPANLOG_D(log::sweep, "found {} unions among {} intervals", unions.size(), sequence.count());
    return sequence.withIntervals(std::move(unions));
}

} // ns tspan
