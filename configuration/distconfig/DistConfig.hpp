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

#ifndef _HADOOPDEPLOY_DISTCONFIG_HPP_
#define _HADOOPDEPLOY_DISTCONFIG_HPP_

#include <map>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "HostOperations.hpp"

namespace hadoopDeploy
{

struct DirDefinition
{
    DirDefinition() : owner("root"), group("root"), perms(0755) { }
    std::string path;       // template, may hold {config[key]} and {dirs[name]} placeholders
    std::string owner;
    std::string group;
    unsigned perms;
};


struct UserDefinition
{
    std::vector<std::string> groups;      // first entry is the primary group
};


struct PortDefinition
{
    PortDefinition() : port(0) { }
    unsigned port;
    std::string exposedOn;
};


//
// The distribution descriptor: vendor specific names, directories, users and
// ports that stay fixed for the life of a deployment. Only the external config
// values used to fill placeholders may change between calls.
//
// Descriptor layout (JSON):
//
//   {
//       "vendor": "apache",
//       "hadoop_version": "2.7.1",
//       "packages": ["openjdk-8-jdk-headless"],
//       "groups": ["hadoop"],
//       "users": { "hdfs": { "groups": ["hadoop"] } },
//       "dirs": { "hadoop": { "path": "/usr/lib/hadoop", "perms": "0755" },
//                 "hdfs_log_dir": { "path": "{dirs[hadoop]}/logs", "owner": "hdfs", "group": "hadoop" } },
//       "ports": { "namenode": { "port": 8020, "exposed_on": "hdfs-master" } }
//   }
class DistConfig
{
    public:

        DistConfig(const std::string &filename, const std::vector<std::string> &requiredKeys = defaultRequiredKeys(),
                   const std::vector<std::string> &requiredDirs = defaultRequiredDirs());
        DistConfig(const boost::property_tree::ptree &data, const std::vector<std::string> &requiredKeys = defaultRequiredKeys(),
                   const std::vector<std::string> &requiredDirs = defaultRequiredDirs());

        static std::vector<std::string> defaultRequiredKeys();
        static std::vector<std::string> defaultRequiredDirs();

        const std::string &getVendor() const { return m_vendor; }
        const std::string &getHadoopVersion() const { return m_hadoopVersion; }
        std::string getString(const std::string &key, const std::string &defaultValue = "") const;
        const std::vector<std::string> &getGroups() const { return m_groups; }
        const std::vector<std::string> &getPackages() const { return m_packages; }
        const std::map<std::string, UserDefinition> &getUsers() const { return m_users; }
        const std::map<std::string, DirDefinition> &getDirs() const { return m_dirs; }
        bool hasDir(const std::string &name) const { return m_dirs.find(name) != m_dirs.end(); }

        void setConfigValues(const std::map<std::string, std::string> &values) { m_configValues = values; }
        void setConfigValue(const std::string &key, const std::string &value) { m_configValues[key] = value; }
        const std::map<std::string, std::string> &getConfigValues() const { return m_configValues; }

        std::string resolvePath(const std::string &name) const;
        bool getPort(const std::string &name, unsigned &port) const;
        unsigned getPort(const std::string &name) const;        // ConfigException if not defined
        std::vector<unsigned> getExposedPorts(const std::string &service) const;

        void addUsers(HostOperations &host) const;
        void addDirs(HostOperations &host) const;
        void addPackages(HostOperations &host) const;
        void removeUsers() const;
        void removeDirs() const;
        void removePackages() const;

        static const unsigned c_maxNestingLevels = 100;


    protected:

        void load(const boost::property_tree::ptree &data, const std::vector<std::string> &requiredKeys, const std::vector<std::string> &requiredDirs);
        std::string substitutePlaceholders(const std::string &name, const std::string &path) const;


    private:

        std::string m_source;
        boost::property_tree::ptree m_data;
        std::string m_vendor;
        std::string m_hadoopVersion;
        std::vector<std::string> m_groups;
        std::vector<std::string> m_packages;
        std::map<std::string, UserDefinition> m_users;
        std::map<std::string, DirDefinition> m_dirs;
        std::map<std::string, PortDefinition> m_ports;
        std::map<std::string, std::string> m_configValues;
};

}

#endif
