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

#ifndef _HADOOPDEPLOY_HDFS_HPP_
#define _HADOOPDEPLOY_HDFS_HPP_

#include <chrono>
#include <string>
#include <vector>
#include "HadoopBase.hpp"
#include "Wait.hpp"

namespace hadoopDeploy
{

class Hdfs
{
    public:

        explicit Hdfs(HadoopBase &hadoopBase) : m_hadoopBase(hadoopBase), m_settleDelay(std::chrono::seconds(30)) { }
        HadoopBase &getHadoopBase() { return m_hadoopBase; }

        //
        // Some daemons need time after starting before they accept connections.
        // Restarts also wait this long between the stop and the start.
        void setSettleDelay(std::chrono::milliseconds delay) { m_settleDelay = delay; }

        void startNameNode();
        void stopNameNode();
        void restartNameNode();
        void startSecondaryNameNode();
        void stopSecondaryNameNode();
        void startDataNode();
        void stopDataNode();
        void restartDataNode();
        void startJournalNode();
        void stopJournalNode();
        void restartJournalNode();

        void configureHdfsBase(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort);
        void configureNameNode(const std::vector<std::string> &namenodes);
        void configureDataNode(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort);
        void configureJournalNode();
        void configureClient(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort);
        void registerJournalNodes(const std::vector<std::string> &nodes, unsigned port);
        void registerSlaves(const std::vector<std::string> &slaves) { m_hadoopBase.registerSlaves(slaves); }
        void reloadSlaves();

        // bin/hdfs as the hdfs user; the first throws CommandException on failure
        std::string hdfs(const std::vector<std::string> &args);
        CommandResult hdfsUnchecked(const std::vector<std::string> &args);

        //
        // Waits until the report lists live DataNodes and safe mode is off
        void waitForHdfs(std::chrono::milliseconds timeout, std::chrono::milliseconds interval = defaultPollInterval);


    protected:

        void hadoopDaemon(const std::string &command, const std::string &daemon);
        void settle();


    private:

        HadoopBase &m_hadoopBase;
        std::chrono::milliseconds m_settleDelay;
};

}

#endif
