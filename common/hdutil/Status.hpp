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

#ifndef _HADOOPDEPLOY_STATUS_HPP_
#define _HADOOPDEPLOY_STATUS_HPP_

#include <vector>
#include <string>

namespace hadoopDeploy
{

struct statusMsg {

    enum workloadState
    {
        maintenance = 0,     // unit is busy changing local state
        waiting,             // waiting on a related unit or service
        active,
        blocked              // operator intervention required
    };

    statusMsg(enum workloadState _state, const std::string &_msg) : state(_state), msg(_msg) { }
    workloadState state;
    std::string msg;
};


class Status
{
    public:

        Status() : m_state(statusMsg::maintenance) { }
        ~Status() {}
        void set(enum statusMsg::workloadState state, const std::string &msg);
        enum statusMsg::workloadState getState() const { return m_state; }
        const std::string &getMessage() const { return m_message; }
        bool isBlocked() const { return m_state == statusMsg::blocked; }
        const std::vector<statusMsg> &getHistory() const { return m_history; }
        static std::string getStateString(enum statusMsg::workloadState state);
        static enum statusMsg::workloadState getStateFromString(const std::string &state);


    private:

        enum statusMsg::workloadState m_state;
        std::string m_message;
        std::vector<statusMsg> m_history;
};

}

#endif
