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

// tspan
#include <tspan/common/Common.h>

// third-party
#include <boost/program_options.hpp>

namespace tspan {
namespace config {
typedef boost::program_options::variables_map BPOVarMap;
}  // ns config

// for convenient access to globally initialized configuration
extern config::BPOVarMap ___config___;
inline config::BPOVarMap& ConfigMap() { return ___config___; }
inline const config::BPOVarMap& Config() { return ___config___; }

// Helper class used to read configuration values in code.
// To use, declare a variable for your configuration, e.g.:
// ConfigVar<String> format("format", "text");
//
// Then later in the code when you want to read the configured value, just use the variable as a functor
// if (format() == "json") {
// }
template<typename T>
class ConfigVar {
public:
    ConfigVar(String name, T defaultValue=T{}) {
        if (Config().count(name)) {
            _val = Config()[name].as<T>();
        }
        else {
            _val = std::move(defaultValue);
        }
    }
    ~ConfigVar(){}
    const T& operator()() const {
        return _val;
    }
private:
    T _val;
};

} //ns tspan
