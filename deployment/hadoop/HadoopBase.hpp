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

#ifndef _HADOOPDEPLOY_HADOOPBASE_HPP_
#define _HADOOPDEPLOY_HADOOPBASE_HPP_

#include <map>
#include <string>
#include <vector>
#include "DistConfig.hpp"
#include "KeyValueStore.hpp"
#include "CommandRunner.hpp"
#include "HostOperations.hpp"
#include "Status.hpp"

namespace hadoopDeploy
{

struct UnitIdentity
{
    UnitIdentity() { }
    UnitIdentity(const std::string &_serviceName, const std::string &_unitName, const std::string &_privateAddress) :
        serviceName(_serviceName), unitName(_unitName), privateAddress(_privateAddress) { }
    std::string serviceName;       // also the HDFS nameservice
    std::string unitName;          // e.g. namenode/0
    std::string privateAddress;
};


struct HostFiles
{
    HostFiles() : hosts("/etc/hosts"), hostname("/etc/hostname"), environment("/etc/environment") { }
    std::string hosts;
    std::string hostname;
    std::string environment;
};


//
// Everything a Hadoop node needs before any role specific work: users,
// directories, Java, the cluster config directory and the system environment.
class HadoopBase
{
    public:

        HadoopBase(DistConfig &distConfig, KeyValueStore &store, CommandRunner &runner, HostOperations &host,
                   Status &status, const UnitIdentity &unit, const HostFiles &files = HostFiles());

        DistConfig &getDistConfig() { return m_distConfig; }
        const DistConfig &getDistConfig() const { return m_distConfig; }
        KeyValueStore &getStore() { return m_store; }
        CommandRunner &getRunner() { return m_runner; }
        HostOperations &getHost() { return m_host; }
        Status &getStatus() { return m_status; }
        const UnitIdentity &getUnit() const { return m_unit; }
        std::string getHostName() const;
        const std::string &getCpuArch() const { return m_cpuArch; }
        std::string getConfigValue(const std::string &key, const std::string &defaultValue = "") const;

        std::map<std::string, std::string> spec() const;          // empty until Java is installed
        std::map<std::string, std::string> clientSpec() const;

        bool isInstalled() const;
        void install(const std::string &javaInstaller, bool force = false);
        void configureHostsFile();
        void installJava(const std::string &javaInstaller);
        void setupHadoopConfig();
        void configureHadoop();
        void registerSlaves(const std::vector<std::string> &slaves);
        std::vector<std::string> findLzoJars() const;
        bool hasLzo() const { return !findLzoJars().empty(); }
        std::string getConfPath(const std::string &filename) const;

        //
        // command is relative to the Hadoop install root, e.g. bin/hdfs
        std::string run(const std::string &user, const std::string &command, const std::vector<std::string> &args);
        CommandResult runUnchecked(const std::string &user, const std::string &command, const std::vector<std::string> &args);


    private:

        DistConfig &m_distConfig;
        KeyValueStore &m_store;
        CommandRunner &m_runner;
        HostOperations &m_host;
        Status &m_status;
        UnitIdentity m_unit;
        HostFiles m_files;
        std::string m_cpuArch;
};

}

#endif
