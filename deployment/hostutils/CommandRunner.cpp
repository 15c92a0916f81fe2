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

#include <boost/process.hpp>
#include <boost/filesystem.hpp>

#include "CommandRunner.hpp"
#include "EnvironmentFile.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Wait.hpp"
#include "Log.hpp"

namespace bp = boost::process;

namespace hadoopDeploy
{

std::string CommandRequest::toString() const
{
    std::vector<std::string> quoted;
    for (auto it = args.begin(); it != args.end(); ++it)
    {
        quoted.push_back(quoteShellArg(*it));
    }
    std::string cmd = joinStrings(quoted, " ");
    if (!user.empty())
        cmd = "su " + user + " -c " + quoteShellArg(cmd);
    return cmd;
}


std::string CommandRunner::checkOutput(const CommandRequest &request)
{
    CommandResult result = execute(request);
    if (result.exitCode != 0)
    {
        std::string cmd = request.toString();
        throw CommandException("Command '" + cmd + "' returned non-zero exit status " + std::to_string(result.exitCode) + ":\n" + result.output,
                               cmd, result.exitCode, result.output);
    }
    return result.output;
}


std::string CommandRunner::checkOutput(const std::string &user, const std::vector<std::string> &args)
{
    return checkOutput(CommandRequest(user, args));
}


CommandResult LocalCommandRunner::execute(const CommandRequest &request)
{
    if (request.args.empty())
        throw DeployException("No command given");

    std::string program = request.args[0];
    std::vector<std::string> args;
    if (request.user.empty())
    {
        args.assign(request.args.begin() + 1, request.args.end());
    }
    else
    {
        std::vector<std::string> quoted;
        for (auto it = request.args.begin(); it != request.args.end(); ++it)
        {
            quoted.push_back(quoteShellArg(*it));
        }
        program = "su";
        args.push_back(request.user);
        args.push_back("-c");
        args.push_back(joinStrings(quoted, " "));
    }

    boost::filesystem::path exe(program);
    if (program.find('/') == std::string::npos)
        exe = bp::search_path(program);
    if (exe.empty())
        throw CommandException("Command not found: " + program, request.toString(), 127, "");

    //
    // The child sees /etc/environment plus proxy settings, not our own environment
    bp::environment env;
    PropertyMap baseEnv = readEnvironmentFile(m_etcEnvironment);
    for (auto it = baseEnv.begin(); it != baseEnv.end(); ++it)
    {
        env[it->name] = it->value;
    }
    for (auto it = request.env.begin(); it != request.env.end(); ++it)
    {
        env[it->first] = it->second;
    }

    DBGLOG("Running: %s", request.toString().c_str());
    CommandResult result;
    try
    {
        bp::ipstream out;
        bp::opstream in;
        bp::child child(exe, bp::args(args), env, (bp::std_out & bp::std_err) > out, bp::std_in < in);
        if (request.hasInput)
            in << request.input;
        in.flush();
        in.pipe().close();

        std::string line;
        while (std::getline(out, line))
        {
            result.output += line;
            result.output += '\n';
        }
        child.wait();
        result.exitCode = child.exit_code();
    }
    catch (const bp::process_error &e)
    {
        throw CommandException(std::string("Unable to run command: ") + e.what(), request.toString(), -1, "");
    }
    return result;
}


std::string quoteShellArg(const std::string &arg)
{
    std::string quoted = "'";
    for (auto it = arg.begin(); it != arg.end(); ++it)
    {
        if (*it == '\'')
            quoted += "'\\''";
        else
            quoted += *it;
    }
    quoted += "'";
    return quoted;
}


std::vector<std::string> jps(CommandRunner &runner, const std::string &name)
{
    std::vector<std::string> pids;
    if (name.empty())
        return pids;

    //
    // Bracketing the first character keeps pgrep from matching its own command line
    std::string pattern = "^[^ ]*java .*[" + name.substr(0, 1) + "]" + name.substr(1);
    CommandResult result = runner.execute(CommandRequest("", { "sudo", "pgrep", "-f", pattern }));
    if (result.exitCode != 0)
        return pids;

    std::vector<std::string> lines = splitString(result.output, "\n");
    for (auto it = lines.begin(); it != lines.end(); ++it)
    {
        std::string pid = trimString(*it);
        if (!pid.empty())
            pids.push_back(pid);
    }
    return pids;
}


void waitForJps(CommandRunner &runner, const std::string &name, std::chrono::milliseconds timeout)
{
    pollUntil([&runner, &name]() { return !jps(runner, name).empty(); }, timeout, defaultPollInterval, "process " + name);
}

}
