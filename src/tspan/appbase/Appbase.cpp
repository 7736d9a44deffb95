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

#include "Appbase.h"

#include <filesystem>
#include <iostream>
#include <vector>

namespace tspan {

App::App(String name) : _name(std::move(name)), _options(_name + " options") {
}

int App::start(int argc, char** argv, std::function<int()> func) {
    logging::Logger::procName = std::filesystem::path(argv[0]).filename().c_str();

    addOptions()
    ("help,h", "Print this help message")
    ("log_level", bpo::value<std::vector<String>>()->multitoken(), "A list(space-delimited) of log levels. The very first entry must be one of VERBOSE|DEBUG|INFO|WARN|ERROR|FATAL and it sets the global log level. Subsequent entries are of the form <log_module_name>=<log_level> and allow the user to override the log level for particular log modules")
    ;

    try {
        auto& config = ConfigMap();
        bpo::store(bpo::parse_command_line(argc, argv, _options), config);
        bpo::notify(config);

        if (config.count("help")) {
            std::cout << _options << std::endl;
            return 0;
        }

        if (config.count("log_level")) {
            logging::applyLogLevels(config["log_level"].as<std::vector<String>>());
        }
        else {
            // if nothing is specified, default to WARN so that only the results reach stdout
            logging::Logger::threadLocalLogLevel = logging::LogLevel::WARN;
        }
    }
    catch (const std::exception& exc) {
        std::cerr << "invalid options: " << exc.what() << std::endl << _options << std::endl;
        return 1;
    }

    TSPANLOG_I(log::appbase, "Starting {}, with args", argv[0]);
    for (int i = 1; i < argc; i++) {
        TSPANLOG_I(log::appbase, "\t {}", argv[i]);
    }

    try {
        int result = func();
        TSPANLOG_I(log::appbase, "{} finished with exit code {}", _name, result);
        return result;
    }
    catch (const std::exception& exc) {
        TSPANLOG_E(log::appbase, "{} failed: {}", _name, exc.what());
        std::cerr << _name << ": " << exc.what() << std::endl;
        return 1;
    }
}

} // ns tspan
