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

#ifndef _HADOOPDEPLOY_UTILS_HPP_
#define _HADOOPDEPLOY_UTILS_HPP_

#include <string>
#include <vector>

namespace hadoopDeploy
{

std::vector<std::string> splitString(const std::string &input, const std::string &delim);
std::string joinStrings(const std::vector<std::string> &items, const std::string &delim);
std::string trimString(const std::string &input, const std::string &chars = " \t\r\n");
bool startsWith(const std::string &input, const std::string &prefix);
bool endsWith(const std::string &input, const std::string &suffix);
std::string toLowerCase(const std::string &input);

//
// Accepts y/yes/t/true/on/1 and n/no/f/false/off/0 in any case, anything
// else is a ConfigException.
bool strToBool(const std::string &value);
std::string normalizeStrBool(const std::string &value);

// unit names such as "namenode/0" become host names such as "namenode-0"
std::string unitToHostName(const std::string &unitName);

bool isIPv4Address(const std::string &addr);
std::string resolvePrivateAddress(const std::string &addr);
std::string cpuArch();

}

#endif
