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

#ifndef _HADOOPDEPLOY_ETCHOSTS_HPP_
#define _HADOOPDEPLOY_ETCHOSTS_HPP_

#include <map>
#include <string>
#include <vector>
#include "KeyValueStore.hpp"

namespace hadoopDeploy
{

//
// Host entries learned from related units are recorded in the store as
// etc_host.<ip> = <hostname>, and manage() renders them into the hosts file.
// Lines we did not write are left alone; ours carry a trailing marker.
class EtcHosts
{
    public:

        EtcHosts(KeyValueStore &store, const std::string &hostsFile = "/etc/hosts") : m_store(store), m_hostsFile(hostsFile) { }
        std::map<std::string, std::string> getHosts() const;     // ip -> hostname
        void updateHost(const std::string &ip, const std::string &host);
        void updateHosts(const std::map<std::string, std::string> &ipsToNames);
        void removeHosts(const std::vector<std::string> &hosts);
        void initializeLocalHost(const std::string &privateAddress, const std::string &unitName);
        void manage();

        static const char *c_managedMarker;
        static const char *c_storePrefix;


    private:

        KeyValueStore &m_store;
        std::string m_hostsFile;
};

}

#endif
