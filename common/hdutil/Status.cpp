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

#include "Status.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

void Status::set(enum statusMsg::workloadState state, const std::string &msg)
{
    m_state = state;
    m_message = msg;
    m_history.push_back(statusMsg(state, msg));
    if (state == statusMsg::blocked)
        WARNLOG("Status %s: %s", getStateString(state).c_str(), msg.c_str());
    else
        PROGLOG("Status %s: %s", getStateString(state).c_str(), msg.c_str());
}


std::string Status::getStateString(enum statusMsg::workloadState state)
{
    std::string result = "Not found";
    switch (state)
    {
        case statusMsg::maintenance: result = "maintenance"; break;
        case statusMsg::waiting:     result = "waiting";     break;
        case statusMsg::active:      result = "active";      break;
        case statusMsg::blocked:     result = "blocked";     break;
    }
    return result;
}


enum statusMsg::workloadState Status::getStateFromString(const std::string &state)
{
    if (state == "maintenance")
        return statusMsg::maintenance;
    else if (state == "waiting")
        return statusMsg::waiting;
    else if (state == "active")
        return statusMsg::active;
    else if (state == "blocked")
        return statusMsg::blocked;
    throw ConfigException("Unknown workload state '" + state + "'");
}

}
