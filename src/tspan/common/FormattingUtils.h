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
#undef FMT_UNICODE
#define FMT_UNICODE 0
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/printf.h>
#include <fmt/ranges.h>

#include <functional>
#include <string_view>
#include <type_traits>

namespace tspan {
// helper function for converting enum class into an integral type
// e.g. usage: auto integralColor = to_integral(MyEnum::Red);
// or  std::array<MyEnum, to_integral(MyEnum::Red)>;
template <typename T>
inline auto to_integral(T e) { return static_cast<std::underlying_type_t<T>>(e); }

// base case recursion call
inline void hash_combine_seed(size_t&) {
}

// hash-combine hashes for multiple objects over a seed
// this is using boost-like hash combination
template <typename T, typename... Rest>
inline void hash_combine_seed(size_t& seed, const T& v, Rest&&... rest) {
    seed ^= std::hash<T>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    hash_combine_seed(seed, std::forward<Rest>(rest)...);
}

// hash-combine multiple objects
template <typename T, typename... Rest>
inline size_t hash_combine(const T& v, Rest&&... rest) {
    size_t seed = 0;
    hash_combine_seed(seed, v, std::forward<Rest>(rest)...);
    return seed;
}

} // ns tspan
