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

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <boost/filesystem.hpp>

#include "HostOperations.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace fs = boost::filesystem;

namespace hadoopDeploy
{

void LocalHostOperations::addGroup(const std::string &group)
{
    if (getgrnam(group.c_str()) != nullptr)
    {
        DBGLOG("Group %s already exists", group.c_str());
        return;
    }
    PROGLOG("Adding group %s", group.c_str());
    m_runner.checkCall("", {"groupadd", group});
}


void LocalHostOperations::addUser(const std::string &user, const std::string &primaryGroup, const std::vector<std::string> &secondaryGroups)
{
    if (getpwnam(user.c_str()) != nullptr)
    {
        DBGLOG("User %s already exists", user.c_str());
        return;
    }

    std::vector<std::string> args = {"useradd", "--create-home", "--shell", "/bin/bash"};
    if (!primaryGroup.empty())
    {
        args.push_back("-g");
        args.push_back(primaryGroup);
    }
    if (!secondaryGroups.empty())
    {
        args.push_back("-G");
        args.push_back(joinStrings(secondaryGroups, ","));
    }
    args.push_back(user);
    PROGLOG("Adding user %s", user.c_str());
    m_runner.checkCall("", args);
}


void LocalHostOperations::makeDirectory(const std::string &path, const std::string &owner, const std::string &group, unsigned perms)
{
    boost::system::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        throw DeployException("Unable to create directory " + path + ": " + ec.message());

    changeOwner(path, owner, group);
    changeMode(path, perms);
    DBGLOG("Directory %s %s:%s %o", path.c_str(), owner.c_str(), group.c_str(), perms);
}


void LocalHostOperations::changeOwner(const std::string &path, const std::string &owner, const std::string &group)
{
    struct passwd *pw = getpwnam(owner.c_str());
    if (pw == nullptr)
        throw DeployException("Unknown user " + owner + " for " + path);
    struct group *gr = getgrnam(group.c_str());
    if (gr == nullptr)
        throw DeployException("Unknown group " + group + " for " + path);

    if (chown(path.c_str(), pw->pw_uid, gr->gr_gid) != 0)
        throw DeployException("Unable to change ownership of " + path + ": " + strerror(errno));
}


void LocalHostOperations::changeMode(const std::string &path, unsigned perms)
{
    if (chmod(path.c_str(), static_cast<mode_t>(perms)) != 0)
        throw DeployException("Unable to change permissions of " + path + ": " + strerror(errno));
}


void LocalHostOperations::installPackages(const std::vector<std::string> &packages)
{
    if (packages.empty())
        return;

    CommandRequest update("", {"apt-get", "update"});
    update.env["DEBIAN_FRONTEND"] = "noninteractive";
    m_runner.checkCall(update);

    std::vector<std::string> args = {"apt-get", "install", "--yes", "--option=Dpkg::Options::=--force-confold"};
    args.insert(args.end(), packages.begin(), packages.end());
    CommandRequest install("", args);
    install.env["DEBIAN_FRONTEND"] = "noninteractive";
    PROGLOG("Installing packages: %s", joinStrings(packages, " ").c_str());
    m_runner.checkCall(install);
}

}
