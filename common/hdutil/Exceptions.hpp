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

#ifndef _HADOOPDEPLOY_EXCEPTIONS_HPP_
#define _HADOOPDEPLOY_EXCEPTIONS_HPP_

#include <exception>
#include <string>

namespace hadoopDeploy
{

class DeployException : public std::exception
{
    public:

        DeployException(const std::string &reason) : m_reason(reason) { };
        DeployException(const char *reason) : m_reason(reason) { };

        virtual const char *what() const throw()
        {
            return m_reason.c_str();
        }


    private:

        std::string m_reason;
};


// Missing keys, cyclic placeholders, malformed descriptors
class ConfigException : public DeployException
{
    public:

        ConfigException(const std::string &reason) : DeployException(reason) { };
        ConfigException(const char *reason) : DeployException(reason) { };
};


class ParseException : public DeployException
{
    public:

        ParseException(const std::string &reason) : DeployException(reason) { };
        ParseException(const char *reason) : DeployException(reason) { };
};


// Data from a related unit is present but does not match the local spec
class CompatibilityException : public DeployException
{
    public:

        CompatibilityException(const std::string &reason) : DeployException(reason) { };
        CompatibilityException(const char *reason) : DeployException(reason) { };
};


class TimeoutException : public DeployException
{
    public:

        TimeoutException(const std::string &reason) : DeployException(reason) { };
        TimeoutException(const char *reason) : DeployException(reason) { };
};


class CommandException : public DeployException
{
    public:

        CommandException(const std::string &reason, const std::string &command, int exitCode, const std::string &output) :
            DeployException(reason), m_command(command), m_exitCode(exitCode), m_output(output) { };

        const std::string &getCommand() const { return m_command; }
        int getExitCode() const { return m_exitCode; }
        const std::string &getOutput() const { return m_output; }


    private:

        std::string m_command;
        int m_exitCode;
        std::string m_output;
};

}

#endif
