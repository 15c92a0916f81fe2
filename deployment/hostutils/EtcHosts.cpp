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

#include <fstream>
#include <sstream>

#include "EtcHosts.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

const char *EtcHosts::c_managedMarker = "# JUJU MANAGED";
const char *EtcHosts::c_storePrefix = "etc_host.";


std::map<std::string, std::string> EtcHosts::getHosts() const
{
    return m_store.getRange(c_storePrefix, true);
}


void EtcHosts::updateHost(const std::string &ip, const std::string &host)
{
    // a host only ever maps to one address
    removeHosts({host});
    std::map<std::string, std::string> entry;
    entry[ip] = host;
    m_store.update(entry, c_storePrefix);
    m_store.flush();
}


void EtcHosts::updateHosts(const std::map<std::string, std::string> &ipsToNames)
{
    m_store.update(ipsToNames, c_storePrefix);
    m_store.flush();
}


void EtcHosts::removeHosts(const std::vector<std::string> &hosts)
{
    std::map<std::string, std::string> current = getHosts();
    std::vector<std::string> toRemove;
    for (auto it = current.begin(); it != current.end(); ++it)
    {
        for (auto hostIt = hosts.begin(); hostIt != hosts.end(); ++hostIt)
        {
            if (it->second == *hostIt)
            {
                toRemove.push_back(it->first);
                break;
            }
        }
    }
    m_store.unsetRange(toRemove, c_storePrefix);
    m_store.flush();
}


void EtcHosts::initializeLocalHost(const std::string &privateAddress, const std::string &unitName)
{
    updateHost(resolvePrivateAddress(privateAddress), unitToHostName(unitName));
}


void EtcHosts::manage()
{
    std::map<std::string, std::string> hosts = getHosts();
    DBGLOG("Updating %s with %u managed entries", m_hostsFile.c_str(), static_cast<unsigned>(hosts.size()));

    std::ostringstream content;
    std::ifstream in(m_hostsFile.c_str());
    if (in)
    {
        std::string line;
        while (std::getline(in, line))
        {
            if (line.find(c_managedMarker) == std::string::npos)
                content << line << "\n";
        }
        in.close();
    }

    // the same host name may have been stored under several addresses
    std::map<std::string, std::string> managed;
    for (auto it = hosts.begin(); it != hosts.end(); ++it)
    {
        managed[it->second] = it->first;
    }

    for (auto it = managed.begin(); it != managed.end(); ++it)
    {
        std::string line = it->second + " " + it->first + "  " + c_managedMarker;
        if (!isIPv4Address(it->second))
        {
            WARNLOG("Invalid address %s for host %s", it->second.c_str(), it->first.c_str());
            line = "# " + line + " (INVALID IP)";
        }
        content << line << "\n";
    }

    std::ofstream out(m_hostsFile.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        throw DeployException("Unable to open " + m_hostsFile + " for writing");
    out << content.str();
    out.flush();
    if (!out)
        throw DeployException("Unable to write " + m_hostsFile);
}

}
