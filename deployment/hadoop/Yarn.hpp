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

#ifndef _HADOOPDEPLOY_YARN_HPP_
#define _HADOOPDEPLOY_YARN_HPP_

#include <chrono>
#include <string>
#include <vector>
#include "HadoopBase.hpp"

namespace hadoopDeploy
{

// Where NodeManagers and clients find the ResourceManager and JobHistory server
struct ResourceManagerEndpoint
{
    ResourceManagerEndpoint() : port(0), historyHttpPort(0), historyIpcPort(0) { }
    std::string host;
    unsigned port;
    unsigned historyHttpPort;
    unsigned historyIpcPort;
};


class Yarn
{
    public:

        explicit Yarn(HadoopBase &hadoopBase) : m_hadoopBase(hadoopBase), m_settleDelay(std::chrono::seconds(30)) { }
        void setSettleDelay(std::chrono::milliseconds delay) { m_settleDelay = delay; }

        void startResourceManager();
        void stopResourceManager();
        void restartResourceManager();
        void startJobHistory();
        void stopJobHistory();
        void startNodeManager();
        void stopNodeManager();
        void restartNodeManager();

        ResourceManagerEndpoint getLocalEndpoint() const;
        void configureYarnBase(const ResourceManagerEndpoint &endpoint);
        void configureResourceManager();
        void configureJobHistory();
        void configureNodeManager(const ResourceManagerEndpoint &endpoint) { configureYarnBase(endpoint); }
        void configureClient(const ResourceManagerEndpoint &endpoint) { configureYarnBase(endpoint); }

        void installDemo(const std::string &source, const std::string &target = "/home/ubuntu/terasort.sh");
        void registerSlaves(const std::vector<std::string> &slaves);


    protected:

        void yarnDaemon(const std::string &command, const std::string &daemon);
        void jobHistoryDaemon(const std::string &command, const std::string &daemon);
        void settle();


    private:

        HadoopBase &m_hadoopBase;
        std::chrono::milliseconds m_settleDelay;
};

}

#endif
