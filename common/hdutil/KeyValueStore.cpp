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

#include <fstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/filesystem.hpp>

#include "KeyValueStore.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace pt = boost::property_tree;
namespace fs = boost::filesystem;

namespace hadoopDeploy
{

KeyValueStore::KeyValueStore(const std::string &filename) : m_filename(filename), m_dirty(false)
{
    if (!m_filename.empty() && fs::exists(m_filename))
        load();
}


void KeyValueStore::load()
{
    pt::ptree tree;
    try
    {
        pt::read_json(m_filename, tree);
    }
    catch (const pt::json_parser_error &e)
    {
        throw ParseException("Unable to read state file " + m_filename + ": " + e.what());
    }

    //
    // Keys contain dots, so iterate the children rather than using ptree paths
    for (auto it = tree.begin(); it != tree.end(); ++it)
    {
        m_values[it->first] = it->second.get_value<std::string>();
    }
}


bool KeyValueStore::has(const std::string &key) const
{
    return m_values.find(key) != m_values.end();
}


std::string KeyValueStore::get(const std::string &key, const std::string &defaultValue) const
{
    auto it = m_values.find(key);
    return (it != m_values.end()) ? it->second : defaultValue;
}


bool KeyValueStore::getBool(const std::string &key, bool defaultValue) const
{
    auto it = m_values.find(key);
    if (it == m_values.end() || it->second.empty())
        return defaultValue;
    return strToBool(it->second);
}


void KeyValueStore::set(const std::string &key, const std::string &value)
{
    auto it = m_values.find(key);
    if (it == m_values.end() || it->second != value)
    {
        m_values[key] = value;
        m_dirty = true;
    }
}


void KeyValueStore::unset(const std::string &key)
{
    if (m_values.erase(key) > 0)
        m_dirty = true;
}


void KeyValueStore::update(const std::map<std::string, std::string> &values, const std::string &prefix)
{
    for (auto it = values.begin(); it != values.end(); ++it)
    {
        set(prefix + it->first, it->second);
    }
}


std::map<std::string, std::string> KeyValueStore::getRange(const std::string &prefix, bool stripPrefix) const
{
    std::map<std::string, std::string> range;
    for (auto it = m_values.lower_bound(prefix); it != m_values.end() && startsWith(it->first, prefix); ++it)
    {
        std::string key = stripPrefix ? it->first.substr(prefix.length()) : it->first;
        range[key] = it->second;
    }
    return range;
}


void KeyValueStore::unsetRange(const std::vector<std::string> &keys, const std::string &prefix)
{
    for (auto it = keys.begin(); it != keys.end(); ++it)
    {
        unset(prefix + *it);
    }
}


void KeyValueStore::setFlag(const std::string &key)
{
    setBool(key, true);
    flush();
}


void KeyValueStore::flush()
{
    if (!m_dirty)
        return;

    if (!m_filename.empty())
    {
        pt::ptree tree;
        for (auto it = m_values.begin(); it != m_values.end(); ++it)
        {
            tree.push_back(std::make_pair(it->first, pt::ptree(it->second)));
        }

        //
        // Write to a temporary and rename so a crash never leaves a truncated store
        std::string tmpName = m_filename + ".tmp";
        {
            std::ofstream out(tmpName.c_str(), std::ios::out | std::ios::trunc);
            if (!out)
                throw DeployException("Unable to open state file " + tmpName + " for writing");
            pt::write_json(out, tree);
            out.flush();
            if (!out)
                throw DeployException("Unable to write state file " + tmpName);
        }
        boost::system::error_code ec;
        fs::rename(tmpName, m_filename, ec);
        if (ec)
            throw DeployException("Unable to replace state file " + m_filename + ": " + ec.message());
        DBGLOG("Flushed %u state values to %s", static_cast<unsigned>(m_values.size()), m_filename.c_str());
    }
    m_dirty = false;
}

}
