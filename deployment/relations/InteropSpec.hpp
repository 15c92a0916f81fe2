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

#ifndef _HADOOPDEPLOY_INTEROPSPEC_HPP_
#define _HADOOPDEPLOY_INTEROPSPEC_HPP_

#include <map>
#include <string>

namespace hadoopDeploy
{

//
// Identity of a node (vendor, Hadoop and Java versions, architecture) that
// related nodes compare before trusting each other. Exchanged as a flat JSON
// object.
class InteropSpec
{
    public:

        InteropSpec() { }
        InteropSpec(const std::map<std::string, std::string> &fields) : m_fields(fields) { }
        bool empty() const { return m_fields.empty(); }
        size_t size() const { return m_fields.size(); }
        bool has(const std::string &key) const { return m_fields.find(key) != m_fields.end(); }
        std::string get(const std::string &key, const std::string &defaultValue = "") const;
        void set(const std::string &key, const std::string &value) { m_fields[key] = value; }
        const std::map<std::string, std::string> &getFields() const { return m_fields; }

        //
        // True when every field of this spec is present in remote with the same
        // value. Extra fields in remote are ignored.
        bool matches(const InteropSpec &remote) const;

        std::string toJson() const;
        static InteropSpec fromJson(const std::string &json);     // ParseException if not a flat JSON object

        bool operator==(const InteropSpec &other) const { return m_fields == other.m_fields; }
        bool operator!=(const InteropSpec &other) const { return m_fields != other.m_fields; }


    private:

        std::map<std::string, std::string> m_fields;
};

}

#endif
