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
#include <regex>
#include <sstream>

#include "LineEditor.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

void editLinesInPlace(const std::string &filename, const std::vector<LineSubstitution> &subs, bool appendNonMatches)
{
    std::ifstream in(filename.c_str(), std::ios::in | std::ios::binary);
    if (!in)
        throw ParseException("Unable to open " + filename);
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();
    std::string content = buffer.str();

    std::vector<std::regex> patterns;
    for (auto it = subs.begin(); it != subs.end(); ++it)
    {
        try
        {
            patterns.push_back(std::regex(it->first, std::regex::ECMAScript));
        }
        catch (const std::regex_error &e)
        {
            throw ConfigException("Invalid pattern '" + it->first + "': " + e.what());
        }
    }
    std::vector<bool> matched(subs.size(), false);

    std::string result;
    size_t pos = 0;
    while (pos < content.size())
    {
        size_t nl = content.find('\n', pos);
        size_t lineEnd = (nl == std::string::npos) ? content.size() : nl;
        std::string line = content.substr(pos, lineEnd - pos);
        std::string terminator;
        if (!line.empty() && line[line.size() - 1] == '\r')
        {
            line.erase(line.size() - 1);
            terminator = "\r";
        }
        if (nl != std::string::npos)
            terminator += "\n";

        for (size_t i = 0; i < patterns.size(); ++i)
        {
            if (std::regex_search(line, patterns[i]))
            {
                matched[i] = true;
                line = std::regex_replace(line, patterns[i], subs[i].second);
            }
        }
        result += line;
        result += terminator;
        pos = (nl == std::string::npos) ? content.size() : nl + 1;
    }

    if (appendNonMatches)
    {
        for (size_t i = 0; i < subs.size(); ++i)
        {
            if (matched[i])
                continue;
            if (!result.empty() && result[result.size() - 1] != '\n')
                result += "\n";
            result += subs[i].second;
            result += "\n";
            DBGLOG("Appended '%s' to %s", subs[i].second.c_str(), filename.c_str());
        }
    }

    std::ofstream out(filename.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out)
        throw DeployException("Unable to open " + filename + " for writing");
    out << result;
    out.flush();
    if (!out)
        throw DeployException("Unable to write " + filename);
}

}
