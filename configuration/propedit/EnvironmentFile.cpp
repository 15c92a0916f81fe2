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

#include "EnvironmentFile.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

extern char **environ;

namespace hadoopDeploy
{

PropertyMap parseEnvironmentFile(const std::string &filename)
{
    PropertyMap env;
    std::ifstream in(filename.c_str());
    if (!in)
        return env;

    std::string line;
    while (std::getline(in, line))
    {
        line = trimString(line);
        if (line.empty() || line[0] == '#')
            continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos)
        {
            WARNLOG("Ignoring malformed line in %s: %s", filename.c_str(), line.c_str());
            continue;
        }
        std::string key = trimString(line.substr(0, eq));
        std::string value = trimString(line.substr(eq + 1), " '\"");
        env.set(key, value);
    }
    return env;
}


EnvironmentEditSession::EnvironmentEditSession(const std::string &filename) :
    m_filename(filename), m_env(parseEnvironmentFile(filename)), m_committed(false)
{
}


EnvironmentEditSession::~EnvironmentEditSession()
{
    if (!m_committed)
    {
        try
        {
            commit();
        }
        catch (const std::exception &e)
        {
            OERRLOG("Unable to write %s: %s", m_filename.c_str(), e.what());
        }
    }
}


void EnvironmentEditSession::commit()
{
    m_committed = true;
    std::ostringstream content;
    for (auto it = m_env.begin(); it != m_env.end(); ++it)
    {
        if (it->noValue)
            continue;
        content << it->name << "=\"" << it->value << "\"\n";
    }

    std::ofstream out(m_filename.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        throw DeployException("Unable to open " + m_filename + " for writing");
    out << content.str();
    out.flush();
    if (!out)
        throw DeployException("Unable to write " + m_filename);
}


void editEnvironmentFile(const std::string &filename, const std::function<void(PropertyMap &)> &editor)
{
    EnvironmentEditSession session(filename);
    editor(session.env());
    session.commit();
}


PropertyMap readEnvironmentFile(const std::string &filename)
{
    PropertyMap env;
    for (char **var = environ; var != nullptr && *var != nullptr; ++var)
    {
        std::string entry(*var);
        size_t eq = entry.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = entry.substr(0, eq);
        if (endsWith(toLowerCase(key), "_proxy"))
            env.set(key, entry.substr(eq + 1));
    }

    PropertyMap fileEnv = parseEnvironmentFile(filename);
    for (auto it = fileEnv.begin(); it != fileEnv.end(); ++it)
    {
        env.set(it->name, it->value);
    }
    return env;
}

}
