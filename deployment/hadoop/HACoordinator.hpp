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

#ifndef _HADOOPDEPLOY_HACOORDINATOR_HPP_
#define _HADOOPDEPLOY_HACOORDINATOR_HPP_

#include <string>
#include <vector>
#include "Hdfs.hpp"
#include "KeyValueStore.hpp"

namespace hadoopDeploy
{

//
// Brings the local NameNode from nothing to one half of an active/standby
// pair. The one time operations are guarded by flags in the store so a
// retried run never repeats them, and the recorded state only moves forward.
//
// Without an arbiter, ensureHAActive() is a heuristic that is only defined for
// exactly two NameNodes. Two coordinators running it at the same time can both
// promote; the failover tool has to tolerate promoting a node that is already
// active.
class HACoordinator
{
    public:

        enum HAState
        {
            UNINITIALIZED = 0,
            FORMATTED,
            SHARED_EDITS_READY,
            STANDBY_BOOTSTRAPPED,
            ACTIVE,
            STANDBY
        };

        HACoordinator(Hdfs &hdfs, KeyValueStore &store, const std::string &localNode);
        HAState getState() const;
        static std::string getStateString(HAState state);
        static HAState getStateFromString(const std::string &state);

        void format();
        void initializeSharedEdits();
        void bootstrapStandby();
        void transitionToActive(const std::string &node);
        std::string getServiceState(const std::string &node, int retries = -1);
        bool ensureHAActive(const std::vector<std::string> &candidates, const std::string &preferred, int retries = -1);
        void createClusterDirectories();

        static const char *c_stateKey;
        static const char *c_formattedFlag;
        static const char *c_dirsCreatedFlag;


    protected:

        void advanceState(HAState state);


    private:

        Hdfs &m_hdfs;
        KeyValueStore &m_store;
        std::string m_localNode;
};

}

#endif
