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

#include "PropertyMap.hpp"

namespace hadoopDeploy
{

std::vector<PropertyEntry>::iterator PropertyMap::find(const std::string &name)
{
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        if (it->name == name)
            return it;
    }
    return m_entries.end();
}


std::vector<PropertyEntry>::const_iterator PropertyMap::find(const std::string &name) const
{
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        if (it->name == name)
            return it;
    }
    return m_entries.end();
}


bool PropertyMap::has(const std::string &name) const
{
    return find(name) != m_entries.end();
}


std::string PropertyMap::get(const std::string &name, const std::string &defaultValue) const
{
    auto it = find(name);
    if (it == m_entries.end() || it->noValue)
        return defaultValue;
    return it->value;
}


bool PropertyMap::isNoValue(const std::string &name) const
{
    auto it = find(name);
    return it != m_entries.end() && it->noValue;
}


void PropertyMap::set(const std::string &name, const std::string &value)
{
    auto it = find(name);
    if (it == m_entries.end())
    {
        m_entries.push_back(PropertyEntry(name, value));
    }
    else
    {
        it->value = value;
        it->noValue = false;
    }
}


void PropertyMap::setNoValue(const std::string &name)
{
    auto it = find(name);
    if (it == m_entries.end())
    {
        m_entries.push_back(PropertyEntry(name, ""));
        it = m_entries.end() - 1;
    }
    it->value.clear();
    it->noValue = true;
}


bool PropertyMap::remove(const std::string &name)
{
    auto it = find(name);
    if (it == m_entries.end())
        return false;
    m_entries.erase(it);
    return true;
}


std::vector<std::string> PropertyMap::names() const
{
    std::vector<std::string> result;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        result.push_back(it->name);
    }
    return result;
}


std::string &PropertyMap::operator[](const std::string &name)
{
    auto it = find(name);
    if (it == m_entries.end())
    {
        m_entries.push_back(PropertyEntry(name, ""));
        return m_entries.back().value;
    }
    it->noValue = false;
    return it->value;
}

}
