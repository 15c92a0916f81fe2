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

#ifndef _HADOOPDEPLOY_COMMANDRUNNER_HPP_
#define _HADOOPDEPLOY_COMMANDRUNNER_HPP_

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace hadoopDeploy
{

struct CommandRequest
{
    CommandRequest() : hasInput(false) { }
    CommandRequest(const std::string &_user, const std::vector<std::string> &_args) : user(_user), args(_args), hasInput(false) { }
    std::string user;                              // empty runs as the current user
    std::vector<std::string> args;                 // args[0] is the program
    std::map<std::string, std::string> env;        // merged over the base environment
    std::string input;                             // stdin, only when hasInput is set
    bool hasInput;
    std::string toString() const;
};


struct CommandResult
{
    CommandResult() : exitCode(0) { }
    CommandResult(int _exitCode, const std::string &_output) : exitCode(_exitCode), output(_output) { }
    int exitCode;
    std::string output;                            // stdout and stderr, merged
};


class CommandRunner
{
    public:

        virtual ~CommandRunner() { }
        virtual CommandResult execute(const CommandRequest &request) = 0;

        //
        // Both raise CommandException on a non-zero exit, with the captured output attached
        std::string checkOutput(const CommandRequest &request);
        void checkCall(const CommandRequest &request) { checkOutput(request); }
        std::string checkOutput(const std::string &user, const std::vector<std::string> &args);
        void checkCall(const std::string &user, const std::vector<std::string> &args) { checkOutput(user, args); }
};


class LocalCommandRunner : public CommandRunner
{
    public:

        explicit LocalCommandRunner(const std::string &etcEnvironment = "/etc/environment") : m_etcEnvironment(etcEnvironment) { }
        virtual ~LocalCommandRunner() { }
        virtual CommandResult execute(const CommandRequest &request);


    private:

        std::string m_etcEnvironment;
};


std::string quoteShellArg(const std::string &arg);

//
// PIDs of Java processes whose command line ends in the given main class
// name, for any user. An empty list when none are running.
std::vector<std::string> jps(CommandRunner &runner, const std::string &name);
void waitForJps(CommandRunner &runner, const std::string &name, std::chrono::milliseconds timeout);

}

#endif
