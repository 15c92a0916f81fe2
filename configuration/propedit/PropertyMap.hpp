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

#ifndef _HADOOPDEPLOY_PROPERTYMAP_HPP_
#define _HADOOPDEPLOY_PROPERTYMAP_HPP_

#include <string>
#include <vector>

namespace hadoopDeploy
{

struct PropertyEntry
{
    PropertyEntry(const std::string &_name, const std::string &_value) : name(_name), value(_value), noValue(false) { }
    std::string name;
    std::string value;
    bool noValue;        // explicitly set to "no value", removed when written
};


//
// Name/value map that remembers insertion order. Names are unique; setting an
// existing name keeps its position.
class PropertyMap
{
    public:

        typedef std::vector<PropertyEntry>::const_iterator const_iterator;

        PropertyMap() { }
        bool has(const std::string &name) const;
        std::string get(const std::string &name, const std::string &defaultValue = "") const;
        bool isNoValue(const std::string &name) const;
        void set(const std::string &name, const std::string &value);
        void setNoValue(const std::string &name);
        bool remove(const std::string &name);
        void clear() { m_entries.clear(); }
        std::vector<std::string> names() const;
        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }
        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }
        std::string &operator[](const std::string &name);


    protected:

        std::vector<PropertyEntry>::iterator find(const std::string &name);
        std::vector<PropertyEntry>::const_iterator find(const std::string &name) const;


    private:

        std::vector<PropertyEntry> m_entries;
};

}

#endif
