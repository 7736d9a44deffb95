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

#include "InputLoader.h"

#include <cctype>

namespace tspan {
namespace config {

namespace {
String trim(const String& str) {
    size_t first = 0;
    size_t last = str.size();
    while (first < last && std::isspace(static_cast<unsigned char>(str[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(str[last - 1]))) {
        --last;
    }
    return str.substr(first, last - first);
}
}

PeriodNotation splitPeriodNotation(const String& text) {
    const String token = trim(text);
    if (token.size() < 5) {
        throw InputException(fmt::format("invalid interval notation: '{}'", text));
    }

    PeriodNotation notation;
    const char firstChar = token.front();
    const char lastChar = token.back();
    if (firstChar == '[') {
        notation.startIncluded = true;
    }
    else if (firstChar == '(') {
        notation.startIncluded = false;
    }
    else {
        throw InputException(fmt::format("interval notation must start with '[' or '(': '{}'", text));
    }

    if (lastChar == ']') {
        notation.endIncluded = true;
    }
    else if (lastChar == ')') {
        notation.endIncluded = false;
    }
    else {
        throw InputException(fmt::format("interval notation must end with ']' or ')': '{}'", text));
    }

    const String inner = token.substr(1, token.size() - 2);
    auto pos = inner.find(',');
    if (pos == String::npos || inner.find(',', pos + 1) != String::npos) {
        throw InputException(fmt::format("interval notation needs exactly one ',' between its points: '{}'", text));
    }
    notation.start = trim(inner.substr(0, pos));
    notation.end = trim(inner.substr(pos + 1));
    if (notation.start.empty() || notation.end.empty()) {
        throw InputException(fmt::format("interval notation is missing a point: '{}'", text));
    }
    return notation;
}

} // namespace config
} // namespace tspan
