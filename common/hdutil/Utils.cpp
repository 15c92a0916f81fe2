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

#include <algorithm>
#include <cctype>
#include <regex>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/utsname.h>

#include "Utils.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

std::vector<std::string> splitString(const std::string &input, const std::string &delim)
{
    size_t  start = 0, end = 0, delimLen = delim.length();
    std::vector<std::string> list;

    while (end != std::string::npos)
    {
        end = input.find(delim, start);
        std::string item = input.substr(start, (end == std::string::npos) ? std::string::npos : end - start);
        if (!item.empty())
            list.push_back(item);
        start = ((end > (std::string::npos - delimLen)) ? std::string::npos : end + delimLen);
    }
    return list;
}


std::string joinStrings(const std::vector<std::string> &items, const std::string &delim)
{
    std::string result;
    for (auto it = items.begin(); it != items.end(); ++it)
    {
        if (it != items.begin())
            result += delim;
        result += *it;
    }
    return result;
}


std::string trimString(const std::string &input, const std::string &chars)
{
    size_t start = input.find_first_not_of(chars);
    if (start == std::string::npos)
        return "";
    size_t end = input.find_last_not_of(chars);
    return input.substr(start, end - start + 1);
}


bool startsWith(const std::string &input, const std::string &prefix)
{
    return input.size() >= prefix.size() && input.compare(0, prefix.size(), prefix) == 0;
}


bool endsWith(const std::string &input, const std::string &suffix)
{
    return input.size() >= suffix.size() && input.compare(input.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string toLowerCase(const std::string &input)
{
    std::string lower = input;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}


bool strToBool(const std::string &value)
{
    std::string lower = toLowerCase(trimString(value));
    if (lower == "y" || lower == "yes" || lower == "t" || lower == "true" || lower == "on" || lower == "1")
        return true;
    if (lower == "n" || lower == "no" || lower == "f" || lower == "false" || lower == "off" || lower == "0")
        return false;
    throw ConfigException("Invalid truth value '" + value + "'");
}


std::string normalizeStrBool(const std::string &value)
{
    return strToBool(value) ? "true" : "false";
}


std::string unitToHostName(const std::string &unitName)
{
    std::string host = unitName;
    std::replace(host.begin(), host.end(), '/', '-');
    return host;
}


bool isIPv4Address(const std::string &addr)
{
    static const std::regex ipPattern("^\\d{1,3}\\.\\d{1,3}\\.\\d{1,3}\\.\\d{1,3}");
    return std::regex_search(addr, ipPattern);
}


std::string resolvePrivateAddress(const std::string &addr)
{
    if (isIPv4Address(addr))
        return addr;

    struct addrinfo hints = {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *result = nullptr;
    int rc = getaddrinfo(addr.c_str(), nullptr, &hints, &result);
    if (rc == 0 && result != nullptr)
    {
        char ip[INET_ADDRSTRLEN] = { 0 };
        struct sockaddr_in *sin = reinterpret_cast<struct sockaddr_in *>(result->ai_addr);
        inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
        freeaddrinfo(result);
        return ip;
    }

    OERRLOG("Unable to resolve private IP: %s (will attempt to guess): %s", addr.c_str(), gai_strerror(rc));

    //
    // Provider host names often embed the address, e.g. ip-10-0-0-12
    static const std::regex containsIpPattern("(\\d{1,3})[-.](\\d{1,3})[-.](\\d{1,3})[-.](\\d{1,3})");
    std::smatch match;
    if (!std::regex_search(addr, match, containsIpPattern))
        throw ConfigException("Unable to resolve or guess IP from private-address: " + addr);
    return match[1].str() + "." + match[2].str() + "." + match[3].str() + "." + match[4].str();
}


std::string cpuArch()
{
    struct utsname name;
    if (uname(&name) != 0)
        throw DeployException("Unable to determine the machine architecture");
    return name.machine;
}

}
