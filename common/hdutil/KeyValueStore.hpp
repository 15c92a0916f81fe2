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

#ifndef _HADOOPDEPLOY_KEYVALUESTORE_HPP_
#define _HADOOPDEPLOY_KEYVALUESTORE_HPP_

#include <map>
#include <string>
#include <vector>

namespace hadoopDeploy
{

//
// Durable per-node state. Keys are namespaced with dots (hdfs.namenode.formatted,
// java.home, etc_host.10.0.0.1). Values are strings; booleans are stored as
// "true"/"false". Changes are held in memory until flush() is called. An empty
// filename gives a memory-only store.
class KeyValueStore
{
    public:

        explicit KeyValueStore(const std::string &filename = "");
        ~KeyValueStore() {}
        bool has(const std::string &key) const;
        std::string get(const std::string &key, const std::string &defaultValue = "") const;
        bool getBool(const std::string &key, bool defaultValue = false) const;
        void set(const std::string &key, const std::string &value);
        void setBool(const std::string &key, bool value) { set(key, value ? "true" : "false"); }
        void unset(const std::string &key);
        void update(const std::map<std::string, std::string> &values, const std::string &prefix = "");
        std::map<std::string, std::string> getRange(const std::string &prefix, bool stripPrefix = false) const;
        void unsetRange(const std::vector<std::string> &keys, const std::string &prefix = "");
        void setFlag(const std::string &key);  // set to true and flush
        void flush();
        bool isDirty() const { return m_dirty; }
        const std::string &getFilename() const { return m_filename; }


    protected:

        void load();


    private:

        std::string m_filename;
        std::map<std::string, std::string> m_values;
        bool m_dirty;
};

}

#endif
