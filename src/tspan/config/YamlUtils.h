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

// yaml
#include <yaml-cpp/yaml.h>

namespace tspan
{
namespace config
{

class YamlUtils
{
public:
    template<class T>
    static T getOptionalValue(const YAML::Node& node, T defaultValue)
    {
        return node ? node.as<T>(defaultValue) : defaultValue;
    }

    // resolve a "<<" merge key: the keys of the merged map fill in the ones missing from the source
    static YAML::Node mergeAnchors(const YAML::Node& source)
    {
        if(!source) {
            return source;
        }

        if(!source.IsMap()) {
            return source;
        }

        auto node = source["<<"];
        if(!node || !node.IsMap()) {
            return source;
        }

        const YAML::Node base = node["<<"] ? mergeAnchors(node) : node;

        auto merged = YAML::Node(YAML::NodeType::Map);
        for(auto n: source) {
            if(n.first.as<std::string>() == "<<") {
                continue;
            }
            merged[n.first] = n.second;
        }

        for(auto n: base) {
            if(!merged[n.first.as<std::string>()]) {
                merged[n.first.as<std::string>()] = n.second;
            }
        }

        return merged;
    }

}; // class YamlUtils

} // namespace config
} // namespace tspan
