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

#include <algorithm>

#include "HACoordinator.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

const char *HACoordinator::c_stateKey = "hdfs.namenode.ha.state";
const char *HACoordinator::c_formattedFlag = "hdfs.namenode.formatted";
const char *HACoordinator::c_dirsCreatedFlag = "hdfs.namenode.dirs.created";


HACoordinator::HACoordinator(Hdfs &hdfs, KeyValueStore &store, const std::string &localNode) :
    m_hdfs(hdfs), m_store(store), m_localNode(localNode)
{
}


HACoordinator::HAState HACoordinator::getState() const
{
    return getStateFromString(m_store.get(c_stateKey, "uninitialized"));
}


std::string HACoordinator::getStateString(HAState state)
{
    switch (state)
    {
        case UNINITIALIZED:         return "uninitialized";
        case FORMATTED:             return "formatted";
        case SHARED_EDITS_READY:    return "shared_edits_ready";
        case STANDBY_BOOTSTRAPPED:  return "standby_bootstrapped";
        case ACTIVE:                return "active";
        case STANDBY:               return "standby";
    }
    return "uninitialized";
}


HACoordinator::HAState HACoordinator::getStateFromString(const std::string &state)
{
    for (int i = UNINITIALIZED; i <= STANDBY; ++i)
    {
        if (getStateString(static_cast<HAState>(i)) == state)
            return static_cast<HAState>(i);
    }
    throw ConfigException("Unknown NameNode HA state '" + state + "'");
}


//
// Once a role has been taken it can change with a failover, anything earlier
// only ever advances.
void HACoordinator::advanceState(HAState state)
{
    HAState current = getState();
    if (state == current)
        return;
    if (state < current && !(current >= ACTIVE && state >= ACTIVE))
        return;
    DBGLOG("NameNode %s: %s -> %s", m_localNode.c_str(), getStateString(current).c_str(), getStateString(state).c_str());
    m_store.set(c_stateKey, getStateString(state));
    m_store.flush();
}


void HACoordinator::format()
{
    if (m_store.getBool(c_formattedFlag))
        return;

    // formatting the metadata of a running NameNode is not safe
    m_hdfs.stopNameNode();

    // -noninteractive fails rather than prompting if the node was already formatted elsewhere
    m_hdfs.hdfs({"namenode", "-format", "-noninteractive"});
    m_store.setFlag(c_formattedFlag);
    advanceState(FORMATTED);
    PROGLOG("NameNode %s formatted", m_localNode.c_str());
}


void HACoordinator::initializeSharedEdits()
{
    m_hdfs.hdfs({"namenode", "-initializeSharedEdits", "-nonInteractive", "-force"});
    advanceState(SHARED_EDITS_READY);
}


void HACoordinator::bootstrapStandby()
{
    m_hdfs.hdfs({"namenode", "-bootstrapStandby", "-nonInteractive", "-force"});
    advanceState(STANDBY_BOOTSTRAPPED);
}


void HACoordinator::transitionToActive(const std::string &node)
{
    PROGLOG("Transitioning NameNode %s to active", node.c_str());
    m_hdfs.hdfs({"haadmin", "-transitionToActive", node});
}


//
// A failed query is not an error: its output (usually connection refused) is
// returned as the state.
std::string HACoordinator::getServiceState(const std::string &node, int retries)
{
    std::vector<std::string> args = {"haadmin"};
    if (retries >= 0)
        args.push_back("-Dipc.client.connect.max.retries.on.timeouts=" + std::to_string(retries));
    args.push_back("-getServiceState");
    args.push_back(node);
    CommandResult result = m_hdfs.hdfsUnchecked(args);
    return trimString(result.output);
}


static bool reportsState(const std::string &output, const std::string &state)
{
    std::vector<std::string> lines = splitString(output, "\n");
    for (auto it = lines.begin(); it != lines.end(); ++it)
    {
        if (trimString(*it) == state)
            return true;
    }
    return false;
}


bool HACoordinator::ensureHAActive(const std::vector<std::string> &candidates, const std::string &preferred, int retries)
{
    if (candidates.size() != 2 || candidates[0] == candidates[1])
        throw ConfigException("Active NameNode selection is only defined for exactly two NameNodes, got " +
                              std::to_string(candidates.size()) + ": " + joinStrings(candidates, ","));
    if (std::find(candidates.begin(), candidates.end(), preferred) == candidates.end())
        throw ConfigException("Preferred NameNode " + preferred + " is not one of " + joinStrings(candidates, ","));

    bool activeFound = false;
    std::string localState;
    for (auto it = candidates.begin(); it != candidates.end(); ++it)
    {
        std::string state = getServiceState(*it, retries);
        DBGLOG("NameNode %s reports '%s'", it->c_str(), state.c_str());
        if (reportsState(state, "active"))
            activeFound = true;
        if (*it == m_localNode)
            localState = state;
    }

    bool promoted = false;
    if (!activeFound)
    {
        PROGLOG("No active NameNode among %s", joinStrings(candidates, ",").c_str());
        transitionToActive(preferred);
        promoted = true;
    }

    if (!m_localNode.empty() && getState() >= SHARED_EDITS_READY)
    {
        if ((promoted && preferred == m_localNode) || reportsState(localState, "active"))
            advanceState(ACTIVE);
        else if (reportsState(localState, "standby"))
            advanceState(STANDBY);
    }
    return promoted;
}


void HACoordinator::createClusterDirectories()
{
    if (m_store.getBool(c_dirsCreatedFlag))
        return;

    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/tmp/hadoop/mapred/staging"});
    m_hdfs.hdfs({"dfs", "-chmod", "-R", "1777", "/tmp/hadoop/mapred/staging"});
    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/tmp/hadoop-yarn/staging"});
    m_hdfs.hdfs({"dfs", "-chmod", "-R", "1777", "/tmp/hadoop-yarn"});
    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/user/ubuntu"});
    m_hdfs.hdfs({"dfs", "-chown", "-R", "ubuntu", "/user/ubuntu"});

    // JobHistory
    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/mr-history/tmp"});
    m_hdfs.hdfs({"dfs", "-chmod", "-R", "1777", "/mr-history/tmp"});
    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/mr-history/done"});
    m_hdfs.hdfs({"dfs", "-chmod", "-R", "1777", "/mr-history/done"});
    m_hdfs.hdfs({"dfs", "-chown", "-R", "mapred:hdfs", "/mr-history"});

    m_hdfs.hdfs({"dfs", "-mkdir", "-p", "/app-logs"});
    m_hdfs.hdfs({"dfs", "-chmod", "-R", "1777", "/app-logs"});
    m_hdfs.hdfs({"dfs", "-chown", "yarn", "/app-logs"});
    m_store.setFlag(c_dirsCreatedFlag);
}

}
