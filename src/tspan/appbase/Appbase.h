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

#include <functional>

#include <boost/program_options.hpp>

#include <tspan/common/Common.h>
#include <tspan/common/Log.h>
#include <tspan/config/Config.h>

namespace tspan {
namespace log {
inline thread_local tspan::logging::Logger appbase("tspan::appbase");
}

namespace bpo = boost::program_options;

// This is a foundational class used to create command line tools.
// The App parses the command line into the global configuration, applies the log levels
// and then runs the user function.
class App {
public:
    App(String name);

    // Use this method to obtain an options builder for the application. The parsed options
    // are readable through ConfigVar once the user function runs
    bpo::options_description_easy_init addOptions() { return _options.add_options(); }

    // Parses the command line and runs func. Returns the exit code of the process:
    // the result of func, 0 if only help was requested, or 1 if the options were invalid or func threw
    int start(int argc, char** argv, std::function<int()> func);

private:
    String _name;
    bpo::options_description _options;
};

} // ns tspan
