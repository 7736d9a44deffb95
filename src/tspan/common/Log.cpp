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

#include "Log.h"

#include <iterator>
#include <stdexcept>
#include <tuple>

namespace tspan {
namespace logging {

LogLevel nameToLevel(const String& name) {
    for (size_t i = 0; i < std::size(LogLevelNames); ++i) {
        if (name == LogLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    throw std::runtime_error(fmt::format("unsupported value:{} in enum LogLevel", name));
}

void applyLogLevels(const std::vector<String>& levels) {
    if (levels.size() == 0) {
        Logger::threadLocalLogLevel = LogLevel::INFO;
        return;
    }
    auto split = [](const String& token) {
        auto pos = token.find("=");
        if (pos == String::npos) {
            throw std::runtime_error("log level entry must be separated by '='");
        }
        if (pos == 0) {
            throw std::runtime_error("no module name specified in log level override");
        }
        if (pos == token.size() - 1) {
            throw std::runtime_error("no log level specified for module log level override");
        }
        String first = token.substr(0, pos);
        String second = token.substr(pos + 1);
        return std::make_tuple(std::move(first), std::move(second));
    };
    Logger::threadLocalLogLevel = nameToLevel(levels[0]);
    for (size_t i = 1; i < levels.size(); ++i) {
        auto [module, levelStr] = split(levels[i]);
        auto level = nameToLevel(levelStr);
        Logger::moduleLevels[module] = level;
        auto it = Logger::moduleLoggers.find(module);
        if (it != Logger::moduleLoggers.end()) {
            it->second->moduleLevel = level;
        }
    }
}

}  // namespace logging
}  // namespace tspan
