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

#include <stdexcept>
#include <boost/property_tree/json_parser.hpp>

#include "DistConfig.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace pt = boost::property_tree;

namespace hadoopDeploy
{

static std::vector<std::string> getStringList(const pt::ptree &node)
{
    std::vector<std::string> values;
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        values.push_back(it->second.data());
    }
    return values;
}


static unsigned parseUnsigned(const std::string &value, int base, unsigned maxValue, const std::string &what)
{
    std::string trimmed = trimString(value);
    if (trimmed.empty() || trimmed.find_first_not_of(base == 8 ? "01234567" : "0123456789") != std::string::npos)
        throw ConfigException("Invalid value '" + value + "' for " + what);
    unsigned long parsed = 0;
    try
    {
        parsed = std::stoul(trimmed, nullptr, base);
    }
    catch (const std::out_of_range &)
    {
        throw ConfigException("Value '" + value + "' out of range for " + what);
    }
    if (parsed > maxValue)
        throw ConfigException("Value '" + value + "' out of range for " + what);
    return static_cast<unsigned>(parsed);
}


DistConfig::DistConfig(const std::string &filename, const std::vector<std::string> &requiredKeys, const std::vector<std::string> &requiredDirs) :
    m_source(filename)
{
    pt::ptree data;
    try
    {
        pt::read_json(filename, data);
    }
    catch (const pt::json_parser_error &e)
    {
        throw ParseException("Unable to read distribution descriptor " + filename + ": " + e.what());
    }
    load(data, requiredKeys, requiredDirs);
}


DistConfig::DistConfig(const pt::ptree &data, const std::vector<std::string> &requiredKeys, const std::vector<std::string> &requiredDirs) :
    m_source("distribution descriptor")
{
    load(data, requiredKeys, requiredDirs);
}


std::vector<std::string> DistConfig::defaultRequiredKeys()
{
    return {"vendor", "hadoop_version", "dirs"};
}


std::vector<std::string> DistConfig::defaultRequiredDirs()
{
    return {"hadoop", "hadoop_conf", "hdfs_log_dir", "mapred_log_dir", "yarn_log_dir"};
}


void DistConfig::load(const pt::ptree &data, const std::vector<std::string> &requiredKeys, const std::vector<std::string> &requiredDirs)
{
    std::vector<std::string> missing;
    for (auto it = requiredKeys.begin(); it != requiredKeys.end(); ++it)
    {
        if (data.find(*it) == data.not_found())
            missing.push_back(*it);
    }
    if (!missing.empty())
    {
        throw ConfigException(m_source + " is missing required option" + (missing.size() > 1 ? "s" : "") + ": " + joinStrings(missing, ", "));
    }

    m_data = data;
    m_vendor = data.get<std::string>("vendor", "");
    m_hadoopVersion = data.get<std::string>("hadoop_version", "");

    auto node = data.get_child_optional("groups");
    if (node)
        m_groups = getStringList(*node);

    node = data.get_child_optional("packages");
    if (node)
        m_packages = getStringList(*node);

    node = data.get_child_optional("users");
    if (node)
    {
        for (auto it = node->begin(); it != node->end(); ++it)
        {
            UserDefinition user;
            auto groups = it->second.get_child_optional("groups");
            if (groups)
                user.groups = getStringList(*groups);
            m_users[it->first] = user;
        }
    }

    node = data.get_child_optional("dirs");
    if (node)
    {
        for (auto it = node->begin(); it != node->end(); ++it)
        {
            DirDefinition dir;
            auto path = it->second.get_optional<std::string>("path");
            if (!path)
                throw ConfigException(m_source + ": directory " + it->first + " has no path");
            dir.path = *path;
            dir.owner = it->second.get<std::string>("owner", dir.owner);
            dir.group = it->second.get<std::string>("group", dir.group);

            //
            // perms follow the usual convention, a leading zero means octal
            auto perms = it->second.get_optional<std::string>("perms");
            if (perms)
            {
                std::string value = trimString(*perms);
                int base = (value.size() > 1 && value[0] == '0') ? 8 : 10;
                dir.perms = parseUnsigned(value, base, 07777, "perms of directory " + it->first);
            }
            m_dirs[it->first] = dir;
        }
    }

    node = data.get_child_optional("ports");
    if (node)
    {
        for (auto it = node->begin(); it != node->end(); ++it)
        {
            PortDefinition port;
            port.port = parseUnsigned(it->second.get<std::string>("port", ""), 10, 65535, "port " + it->first);
            port.exposedOn = it->second.get<std::string>("exposed_on", "");
            m_ports[it->first] = port;
        }
    }

    missing.clear();
    for (auto it = requiredDirs.begin(); it != requiredDirs.end(); ++it)
    {
        if (!hasDir(*it))
            missing.push_back(*it);
    }
    if (!missing.empty())
        throw ConfigException(m_source + " is missing required dirs: " + joinStrings(missing, ", "));
}


std::string DistConfig::getString(const std::string &key, const std::string &defaultValue) const
{
    return m_data.get<std::string>(key, defaultValue);
}


//
// One pass over the path, replacing each placeholder once. Text brought in by
// a substitution is not rescanned until the next pass.
std::string DistConfig::substitutePlaceholders(const std::string &name, const std::string &path) const
{
    std::string result;
    size_t pos = 0;
    while (pos < path.size())
    {
        size_t open = path.find('{', pos);
        if (open == std::string::npos)
        {
            result += path.substr(pos);
            break;
        }
        result += path.substr(pos, open - pos);

        size_t close = path.find('}', open);
        if (close == std::string::npos)
            throw ConfigException("Unterminated placeholder in path of " + name + ": " + path);

        std::string token = path.substr(open + 1, close - open - 1);
        size_t bracket = token.find('[');
        if (bracket == std::string::npos || token.empty() || token[token.size() - 1] != ']')
            throw ConfigException("Unknown placeholder {" + token + "} in path of " + name);

        std::string kind = token.substr(0, bracket);
        std::string key = token.substr(bracket + 1, token.size() - bracket - 2);
        if (kind == "config")
        {
            auto it = m_configValues.find(key);
            if (it == m_configValues.end())
                throw ConfigException("Unknown config option " + key + " referenced by " + name);
            result += it->second;
        }
        else if (kind == "dirs")
        {
            auto it = m_dirs.find(key);
            if (it == m_dirs.end())
                throw ConfigException("Unknown directory " + key + " referenced by " + name);
            result += it->second.path;
        }
        else
        {
            throw ConfigException("Unknown placeholder {" + token + "} in path of " + name);
        }
        pos = close + 1;
    }
    return result;
}


std::string DistConfig::resolvePath(const std::string &name) const
{
    auto dirIt = m_dirs.find(name);
    if (dirIt == m_dirs.end())
        throw ConfigException("Unknown directory " + name);

    std::string path = dirIt->second.path;
    std::string oldPath;
    unsigned levels = 0;
    while (path.find('{') != std::string::npos && path != oldPath)
    {
        if (++levels > c_maxNestingLevels)
            throw ConfigException("Maximum level of nested dirs references exceeded for: " + name);
        oldPath = path;
        path = substitutePlaceholders(name, path);
    }

    // a placeholder that substitutes to itself never settles either
    if (path.find('{') != std::string::npos)
        throw ConfigException("Unable to resolve path for " + name + ": " + path);
    return path;
}


bool DistConfig::getPort(const std::string &name, unsigned &port) const
{
    auto it = m_ports.find(name);
    if (it == m_ports.end())
        return false;
    port = it->second.port;
    return true;
}


unsigned DistConfig::getPort(const std::string &name) const
{
    unsigned port = 0;
    if (!getPort(name, port))
        throw ConfigException("Port " + name + " is not defined in " + m_source);
    return port;
}


std::vector<unsigned> DistConfig::getExposedPorts(const std::string &service) const
{
    std::vector<unsigned> ports;
    for (auto it = m_ports.begin(); it != m_ports.end(); ++it)
    {
        if (!it->second.exposedOn.empty() && it->second.exposedOn == service)
            ports.push_back(it->second.port);
    }
    return ports;
}


void DistConfig::addUsers(HostOperations &host) const
{
    for (auto it = m_groups.begin(); it != m_groups.end(); ++it)
    {
        host.addGroup(*it);
    }

    for (auto it = m_users.begin(); it != m_users.end(); ++it)
    {
        std::string primary;
        std::vector<std::string> secondary;
        if (!it->second.groups.empty())
        {
            primary = it->second.groups[0];
            secondary.assign(it->second.groups.begin() + 1, it->second.groups.end());
        }
        PROGLOG("Creating user %s in primary group %s and secondary groups %s", it->first.c_str(),
                primary.c_str(), joinStrings(secondary, ",").c_str());
        host.addUser(it->first, primary, secondary);
    }
}


void DistConfig::addDirs(HostOperations &host) const
{
    for (auto it = m_dirs.begin(); it != m_dirs.end(); ++it)
    {
        host.makeDirectory(resolvePath(it->first), it->second.owner, it->second.group, it->second.perms);
    }
}


void DistConfig::addPackages(HostOperations &host) const
{
    host.installPackages(m_packages);
}


//
// There is nothing to undo these with on the host side yet, so the remove
// operations only report what would go.
void DistConfig::removeDirs() const
{
    for (auto it = m_dirs.begin(); it != m_dirs.end(); ++it)
    {
        PROGLOG("noop: remove directory %s", it->first.c_str());
    }
}


void DistConfig::removePackages() const
{
    for (auto it = m_packages.begin(); it != m_packages.end(); ++it)
    {
        PROGLOG("noop: remove package %s", it->c_str());
    }
}


void DistConfig::removeUsers() const
{
    for (auto it = m_users.begin(); it != m_users.end(); ++it)
    {
        PROGLOG("noop: remove user %s", it->first.c_str());
    }
    for (auto it = m_groups.begin(); it != m_groups.end(); ++it)
    {
        PROGLOG("noop: remove group %s", it->c_str());
    }
}

}
