/*##############################################################################

    HPCC SYSTEMS software Copyright (C) 2026 HPCC Systems®.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
############################################################################## */

#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "InteropSpec.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

namespace pt = boost::property_tree;

namespace hadoopDeploy
{

std::string InteropSpec::get(const std::string &key, const std::string &defaultValue) const
{
    auto it = m_fields.find(key);
    return (it != m_fields.end()) ? it->second : defaultValue;
}


bool InteropSpec::matches(const InteropSpec &remote) const
{
    for (auto it = m_fields.begin(); it != m_fields.end(); ++it)
    {
        auto remoteIt = remote.m_fields.find(it->first);
        if (remoteIt == remote.m_fields.end() || remoteIt->second != it->second)
            return false;
    }
    return true;
}


std::string InteropSpec::toJson() const
{
    // an empty tree would be written as an empty string value
    if (m_fields.empty())
        return "{}";

    pt::ptree tree;
    for (auto it = m_fields.begin(); it != m_fields.end(); ++it)
    {
        tree.push_back(std::make_pair(it->first, pt::ptree(it->second)));
    }
    std::ostringstream out;
    pt::write_json(out, tree, false);
    return trimString(out.str());
}


InteropSpec InteropSpec::fromJson(const std::string &json)
{
    pt::ptree tree;
    std::istringstream in(json);
    try
    {
        pt::read_json(in, tree);
    }
    catch (const pt::json_parser_error &e)
    {
        throw ParseException(std::string("Invalid spec: ") + e.what());
    }

    InteropSpec spec;
    for (auto it = tree.begin(); it != tree.end(); ++it)
    {
        if (it->first.empty() || !it->second.empty())
            throw ParseException("Invalid spec, expected a flat object: " + json);
        spec.set(it->first, it->second.data());
    }
    return spec;
}

}
