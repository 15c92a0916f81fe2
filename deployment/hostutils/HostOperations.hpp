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

#ifndef _HADOOPDEPLOY_HOSTOPERATIONS_HPP_
#define _HADOOPDEPLOY_HOSTOPERATIONS_HPP_

#include <string>
#include <vector>
#include "CommandRunner.hpp"

namespace hadoopDeploy
{

//
// OS level provisioning. Every operation converges: asking for a group, user,
// directory or package that already exists is not an error.
class HostOperations
{
    public:

        virtual ~HostOperations() { }
        virtual void addGroup(const std::string &group) = 0;
        virtual void addUser(const std::string &user, const std::string &primaryGroup, const std::vector<std::string> &secondaryGroups) = 0;
        virtual void makeDirectory(const std::string &path, const std::string &owner, const std::string &group, unsigned perms) = 0;
        virtual void installPackages(const std::vector<std::string> &packages) = 0;
        virtual void changeOwner(const std::string &path, const std::string &owner, const std::string &group) = 0;
        virtual void changeMode(const std::string &path, unsigned perms) = 0;
};


class LocalHostOperations : public HostOperations
{
    public:

        explicit LocalHostOperations(CommandRunner &runner) : m_runner(runner) { }
        virtual ~LocalHostOperations() { }
        virtual void addGroup(const std::string &group);
        virtual void addUser(const std::string &user, const std::string &primaryGroup, const std::vector<std::string> &secondaryGroups);
        virtual void makeDirectory(const std::string &path, const std::string &owner, const std::string &group, unsigned perms);
        virtual void installPackages(const std::vector<std::string> &packages);
        virtual void changeOwner(const std::string &path, const std::string &owner, const std::string &group);
        virtual void changeMode(const std::string &path, unsigned perms);


    private:

        CommandRunner &m_runner;
};

}

#endif
