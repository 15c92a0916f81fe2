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

#ifndef _HADOOPDEPLOY_UNITTESTHELPERS_HPP_
#define _HADOOPDEPLOY_UNITTESTHELPERS_HPP_

#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>

#include "CommandRunner.hpp"
#include "HostOperations.hpp"
#include "Utils.hpp"

namespace hadoopDeploy
{

//
// Answers commands from a script instead of running them. The last response
// added whose text appears in the command line wins; anything unmatched
// succeeds with no output.
class FakeCommandRunner : public CommandRunner
{
    public:

        virtual CommandResult execute(const CommandRequest &request)
        {
            std::string command = joinStrings(request.args, " ");
            m_requests.push_back(request);
            m_commands.push_back(command);
            for (auto it = m_responses.rbegin(); it != m_responses.rend(); ++it)
            {
                if (command.find(it->first) != std::string::npos)
                    return it->second;
            }
            return CommandResult();
        }

        void addResponse(const std::string &match, int exitCode, const std::string &output)
        {
            m_responses.push_back(std::make_pair(match, CommandResult(exitCode, output)));
        }

        unsigned countCommands(const std::string &match) const
        {
            unsigned count = 0;
            for (auto it = m_commands.begin(); it != m_commands.end(); ++it)
            {
                if (it->find(match) != std::string::npos)
                    ++count;
            }
            return count;
        }

        const std::vector<std::string> &getCommands() const { return m_commands; }
        const std::vector<CommandRequest> &getRequests() const { return m_requests; }
        void clearCommands() { m_commands.clear(); m_requests.clear(); }


    private:

        std::vector<std::pair<std::string, CommandResult>> m_responses;
        std::vector<std::string> m_commands;
        std::vector<CommandRequest> m_requests;
};


class RecordingHostOperations : public HostOperations
{
    public:

        virtual void addGroup(const std::string &group)
        {
            m_calls.push_back("group " + group);
        }

        virtual void addUser(const std::string &user, const std::string &primaryGroup, const std::vector<std::string> &secondaryGroups)
        {
            m_calls.push_back("user " + user + " " + primaryGroup + " [" + joinStrings(secondaryGroups, ",") + "]");
        }

        virtual void makeDirectory(const std::string &path, const std::string &owner, const std::string &group, unsigned perms)
        {
            std::ostringstream call;
            call << "dir " << path << " " << owner << ":" << group << " " << std::oct << perms;
            m_calls.push_back(call.str());
        }

        virtual void installPackages(const std::vector<std::string> &packages)
        {
            m_calls.push_back("packages " + joinStrings(packages, " "));
        }

        virtual void changeOwner(const std::string &path, const std::string &owner, const std::string &group)
        {
            m_calls.push_back("chown " + path + " " + owner + ":" + group);
        }

        virtual void changeMode(const std::string &path, unsigned perms)
        {
            std::ostringstream call;
            call << "chmod " << path << " " << std::oct << perms;
            m_calls.push_back(call.str());
        }

        const std::vector<std::string> &getCalls() const { return m_calls; }


    private:

        std::vector<std::string> m_calls;
};


// A scratch directory removed with everything in it when the test ends
class TempDir
{
    public:

        TempDir()
        {
            m_path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("hdtest-%%%%-%%%%-%%%%");
            boost::filesystem::create_directories(m_path);
        }

        ~TempDir()
        {
            boost::system::error_code ec;
            boost::filesystem::remove_all(m_path, ec);
        }

        std::string path() const { return m_path.string(); }
        std::string file(const std::string &name) const { return (m_path / name).string(); }


    private:

        boost::filesystem::path m_path;
};


inline void writeTextFile(const std::string &filename, const std::string &content)
{
    std::ofstream out(filename.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
    out << content;
}


inline std::string readTextFile(const std::string &filename)
{
    std::ifstream in(filename.c_str(), std::ios::in | std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}


//
// A descriptor with every required directory rooted under base
inline boost::property_tree::ptree makeDescriptor(const std::string &base)
{
    boost::property_tree::ptree data;
    data.put("vendor", "apache");
    data.put("hadoop_version", "2.7.1");

    const char *dirs[][2] = {
        {"hadoop", "/hadoop"},
        {"hadoop_conf", "/etc/hadoop/conf"},
        {"hdfs_log_dir", "{dirs[hadoop]}/logs/hdfs"},
        {"mapred_log_dir", "{dirs[hadoop]}/logs/mapred"},
        {"yarn_log_dir", "{dirs[hadoop]}/logs/yarn"},
        {"hdfs_dir_base", "/data"}
    };
    for (auto dir : dirs)
    {
        std::string path = dir[1];
        if (path[0] == '/')
            path = base + path;
        data.put(std::string("dirs.") + dir[0] + ".path", path);
    }

    const char *ports[][3] = {
        {"namenode", "8020", "namenode"},
        {"nn_webapp_http", "50070", "namenode"},
        {"dn_webapp_http", "50075", "datanode"},
        {"journalnode", "8485", ""},
        {"jn_webapp_http", "8480", ""},
        {"resourcemanager", "8032", "resourcemanager"},
        {"rm_webapp_http", "8088", "resourcemanager"},
        {"jobhistory", "10020", ""},
        {"jh_webapp_http", "19888", "resourcemanager"}
    };
    for (auto port : ports)
    {
        data.put(std::string("ports.") + port[0] + ".port", port[1]);
        if (port[2][0] != '\0')
            data.put(std::string("ports.") + port[0] + ".exposed_on", port[2]);
    }
    return data;
}

}

#endif
