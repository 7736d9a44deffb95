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

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <tspan/common/Common.h>
#include <tspan/common/Log.h>

namespace tspan {
namespace log {
inline thread_local tspan::logging::Logger sequence("tspan::sequence");
}

// Raised when accessing an offset which is not currently occupied in a sequence.
// The sequence is left unmodified
class InvalidIndex : public std::exception {
public:
    InvalidIndex(size_t offset) :
        _offset(offset),
        _msg(fmt::format("{} is an invalid offset in the current sequence", offset)) {}

    virtual const char* what() const noexcept override {
        return _msg.c_str();
    }

    size_t offset() const {
        return _offset;
    }

private:
    size_t _offset;
    String _msg;
};

// Three-way comparator which orders intervals by their start boundary
struct ByStartAscending {
    template <typename IntervalT>
    int operator()(const IntervalT& a, const IntervalT& b) const {
        return a.compareStart(b);
    }
};
inline constexpr ByStartAscending byStartAscending{};

// An ordered collection of intervals addressed by a dense, zero-based offset.
//
// IntervalT is an immutable interval value (e.g. dto::Period) providing
// compareStart(), operator==, overlaps(), abuts(), contains(), gap(), intersect() and merge().
//
// Offsets are always contiguous in 0..count()-1. Iteration yields Entry{offset, interval} in the
// current order of the sequence. An in-place sort() changes that order but keeps the offset of each
// interval; every operation producing a new sequence renumbers from 0.
//
// Copies share storage until one of them is modified, so copying is cheap and every copy is
// independently owned. The operations which derive a new sequence (sortedCopy, filteredCopy, map)
// return a sequence sharing the storage of the receiver when the result would be identical to it,
// which is observable via sharesStorageWith().
//
// Comparators are three-way: cmp(a, b) returns <0, 0 or >0. Exceptions thrown by comparators,
// predicates and functions supplied by the caller are propagated and the sequence is left unmodified.
// Mutating the sequence while iterating over it is undefined.
template <typename IntervalT>
class Sequence {
public:
    struct Entry {
        size_t offset;
        IntervalT interval;
    };
    typedef typename std::vector<Entry>::const_iterator const_iterator;

    Sequence() : _storage(std::make_shared<Storage>()) {}

    Sequence(std::initializer_list<IntervalT> intervals) : Sequence(std::vector<IntervalT>(intervals)) {}

    explicit Sequence(std::vector<IntervalT> intervals) : _storage(_makeStorage(std::move(intervals))) {}

    DEFAULT_COPY(Sequence);

    size_t count() const {
        return _storage->entries.size();
    }

    bool isEmpty() const {
        return _storage->entries.empty();
    }

    const_iterator begin() const {
        return _storage->entries.cbegin();
    }

    const_iterator end() const {
        return _storage->entries.cend();
    }

    // the intervals in iteration order, without their offsets
    std::vector<IntervalT> toVector() const {
        std::vector<IntervalT> result;
        result.reserve(count());
        for (const auto& entry : _storage->entries) {
            result.push_back(entry.interval);
        }
        return result;
    }

    void clear() {
        if (isEmpty()) {
            return;
        }
        _storage = std::make_shared<Storage>();
    }

    const IntervalT& get(size_t offset) const {
        return _storage->entries[_position(offset)].interval;
    }

    // Removes the interval at the given offset and returns it.
    // The offsets above the removed one move down by one
    IntervalT remove(size_t offset) {
        size_t pos = _position(offset);
        Storage& storage = _mutableStorage();
        IntervalT removed = std::move(storage.entries[pos].interval);
        storage.entries.erase(storage.entries.begin() + pos);
        for (auto& entry : storage.entries) {
            if (entry.offset > offset) {
                --entry.offset;
            }
        }
        storage.reindex();
        return removed;
    }

    // appends the intervals at the end of the sequence, in argument order
    template <typename... Rest>
    void push(IntervalT interval, Rest&&... rest) {
        Storage& storage = _mutableStorage();
        storage.entries.reserve(storage.entries.size() + 1 + sizeof...(rest));
        storage.append(std::move(interval));
        (storage.append(IntervalT(std::forward<Rest>(rest))), ...);
    }

    // Inserts the intervals before the interval at the given offset. An offset equal to count() appends.
    // The offsets at and above the given one move up by the number of inserted intervals
    template <typename... Rest>
    void insert(size_t offset, IntervalT interval, Rest&&... rest) {
        if (offset > count()) {
            TSPANLOG_D(log::sequence, "cannot insert at offset {} in sequence of size {}", offset, count());
            throw InvalidIndex(offset);
        }
        size_t pos = offset == count() ? count() : _storage->positions[offset];

        std::vector<Entry> added;
        added.reserve(1 + sizeof...(rest));
        added.push_back(Entry{offset, std::move(interval)});
        (added.push_back(Entry{0, IntervalT(std::forward<Rest>(rest))}), ...);
        for (size_t i = 0; i < added.size(); ++i) {
            added[i].offset = offset + i;
        }

        Storage& storage = _mutableStorage();
        storage.entries.insert(storage.entries.begin() + pos,
                               std::make_move_iterator(added.begin()), std::make_move_iterator(added.end()));
        const size_t shift = added.size();
        for (size_t i = 0; i < storage.entries.size(); ++i) {
            if ((i < pos || i >= pos + shift) && storage.entries[i].offset >= offset) {
                storage.entries[i].offset += shift;
            }
        }
        storage.reindex();
    }

    // inserts the intervals at the front of the sequence
    template <typename... Rest>
    void unshift(IntervalT interval, Rest&&... rest) {
        insert(0, std::move(interval), std::forward<Rest>(rest)...);
    }

    // replaces the interval at an existing offset
    void set(size_t offset, IntervalT interval) {
        size_t pos = _position(offset);
        _mutableStorage().entries[pos].interval = std::move(interval);
    }

    // the offset of the first interval equal to the given one
    std::optional<size_t> find(const IntervalT& interval) const {
        for (const auto& entry : _storage->entries) {
            if (entry.interval == interval) {
                return entry.offset;
            }
        }
        return std::nullopt;
    }

    // true if every given interval is present in the sequence
    template <typename... Rest>
    bool contains(const IntervalT& interval, const Rest&... rest) const {
        return find(interval).has_value() && (find(rest).has_value() && ...);
    }

    // the smallest interval enclosing all the intervals of the sequence
    std::optional<IntervalT> getBoundingInterval() const {
        if (isEmpty()) {
            return std::nullopt;
        }
        auto it = begin();
        IntervalT result = it->interval;
        for (++it; it != end(); ++it) {
            result = result.merge(it->interval);
        }
        return result;
    }

    // Sorts the sequence in place. Each interval keeps its offset.
    // Returns true once the new order is committed; a throwing comparator leaves the sequence unchanged
    template <typename CompareT>
    bool sort(CompareT&& cmp) {
        std::vector<Entry> entries = _storage->entries;
        std::stable_sort(entries.begin(), entries.end(), [&cmp](const Entry& a, const Entry& b) {
            return cmp(a.interval, b.interval) < 0;
        });
        auto storage = std::make_shared<Storage>();
        storage->entries = std::move(entries);
        storage->reindex();
        _storage = std::move(storage);
        return true;
    }

    // A sorted sequence, renumbered from 0. The receiver is not modified
    template <typename CompareT>
    Sequence sortedCopy(CompareT&& cmp) const {
        std::vector<IntervalT> intervals = toVector();
        std::stable_sort(intervals.begin(), intervals.end(), [&cmp](const IntervalT& a, const IntervalT& b) {
            return cmp(a, b) < 0;
        });
        return withIntervals(std::move(intervals));
    }

    // The intervals which satisfy the predicate, in their current order, renumbered from 0.
    // If every interval satisfies the predicate, the receiver is returned as is
    template <typename PredicateT>
    Sequence filteredCopy(PredicateT&& pred) const {
        std::vector<IntervalT> intervals;
        for (const auto& entry : _storage->entries) {
            if (pred(entry.interval)) {
                intervals.push_back(entry.interval);
            }
        }
        if (intervals.size() == count()) {
            return *this;
        }
        return withIntervals(std::move(intervals));
    }

    // The result of applying fn to every interval, in the current order, renumbered from 0
    template <typename FuncT>
    Sequence map(FuncT&& fn) const {
        std::vector<IntervalT> intervals;
        intervals.reserve(count());
        for (const auto& entry : _storage->entries) {
            intervals.push_back(fn(entry.interval));
        }
        return withIntervals(std::move(intervals));
    }

    // left fold over the intervals in the current order
    template <typename FuncT, typename ResultT>
    ResultT reduce(FuncT&& fn, ResultT initial) const {
        for (const auto& entry : _storage->entries) {
            initial = fn(std::move(initial), entry.interval);
        }
        return initial;
    }

    template <typename PredicateT>
    bool any(PredicateT&& pred) const {
        return std::any_of(begin(), end(), [&pred](const Entry& entry) { return pred(entry.interval); });
    }

    // NB: an empty sequence returns false
    template <typename PredicateT>
    bool all(PredicateT&& pred) const {
        return !isEmpty() &&
            std::all_of(begin(), end(), [&pred](const Entry& entry) { return pred(entry.interval); });
    }

    // Returns a sequence holding the given intervals, numbered from 0.
    // If the receiver is already numbered from 0 in iteration order and holds equal intervals in the
    // same order, the result shares the storage of the receiver
    Sequence withIntervals(std::vector<IntervalT> intervals) const {
        if (_storage->holds(intervals)) {
            TSPANLOG_V(log::sequence, "result identical to the receiver, sharing storage of {} intervals", count());
            return *this;
        }
        return Sequence(std::move(intervals));
    }

    bool sharesStorageWith(const Sequence& o) const noexcept {
        return _storage == o._storage;
    }

private:
    struct Storage {
        std::vector<Entry> entries;     // in iteration order
        std::vector<size_t> positions;  // offset -> index in entries

        void reindex() {
            positions.assign(entries.size(), 0);
            for (size_t i = 0; i < entries.size(); ++i) {
                positions[entries[i].offset] = i;
            }
        }

        void append(IntervalT interval) {
            entries.push_back(Entry{entries.size(), std::move(interval)});
            positions.push_back(entries.size() - 1);
        }

        bool holds(const std::vector<IntervalT>& intervals) const {
            if (intervals.size() != entries.size()) {
                return false;
            }
            for (size_t i = 0; i < entries.size(); ++i) {
                if (entries[i].offset != i || !(entries[i].interval == intervals[i])) {
                    return false;
                }
            }
            return true;
        }
    };

    static std::shared_ptr<Storage> _makeStorage(std::vector<IntervalT> intervals) {
        auto storage = std::make_shared<Storage>();
        storage->entries.reserve(intervals.size());
        for (auto& interval : intervals) {
            storage->append(std::move(interval));
        }
        return storage;
    }

    size_t _position(size_t offset) const {
        if (offset >= _storage->positions.size()) {
            TSPANLOG_D(log::sequence, "invalid offset {} in sequence of size {}", offset, count());
            throw InvalidIndex(offset);
        }
        return _storage->positions[offset];
    }

    // detach from the storage shared with other copies before modifying it
    Storage& _mutableStorage() {
        if (_storage.use_count() > 1) {
            _storage = std::make_shared<Storage>(*_storage);
        }
        return *_storage;
    }

    std::shared_ptr<Storage> _storage;
};

} // ns tspan
