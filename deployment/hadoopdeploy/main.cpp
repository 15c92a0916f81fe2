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

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "Exceptions.hpp"
#include "Log.hpp"
#include "Status.hpp"
#include "Utils.hpp"
#include "KeyValueStore.hpp"
#include "CommandRunner.hpp"
#include "HostOperations.hpp"
#include "EtcHosts.hpp"
#include "DistConfig.hpp"
#include "HadoopBase.hpp"
#include "Hdfs.hpp"
#include "Yarn.hpp"
#include "HACoordinator.hpp"
#include "Relation.hpp"

using namespace hadoopDeploy;

void usage()
{
    const char *version = "1.0";
    printf("Hadoop cluster deployment driver. version %s. Usage:\n", version);
    puts("   hadoopdeploy -dist <descriptor> -state <state file> -action <action> [options]");
    puts("");
    puts("options: ");
    puts("   -dist <file>     : The distribution descriptor (JSON).");
    puts("   -state <file>    : Durable per-node state. Flags recorded here keep one time");
    puts("          operations from running twice.");
    puts("   -config <key=value> : A config value used for {config[key]} placeholders and");
    puts("          role settings such as dfs_replication. May be repeated.");
    puts("   -service <name>  : Service name of this node, also the HDFS nameservice.");
    puts("   -unit <name>     : Unit name of this node, e.g. namenode/0.");
    puts("   -address <addr>  : Private address of this node.");
    puts("   -relations <file>: Data published by related units (JSON).");
    puts("   -log <file>      : Also log to this file.");
    puts("   -v               : Verbose output.");
    puts("   -help            : Print out this usage.");
    puts("");
    puts("actions: ");
    puts("   resolve -dir <name>              : Print the resolved path of a directory.");
    puts("   exposed-ports -target <service>  : Print the ports exposed on a service.");
    puts("   install -java-installer <path> [-force]");
    puts("   manage-hosts                     : Rewrite /etc/hosts from the recorded hosts.");
    puts("   daemon -daemon <name> -command start|stop|restart");
    puts("          names: namenode, secondarynamenode, datanode, journalnode,");
    puts("          resourcemanager, nodemanager, historyserver");
    puts("   configure-namenode -namenodes <a,b>");
    puts("   configure-datanode -cluster <name> -namenodes <a,b> -port <n> -webport <n>");
    puts("   configure-hdfs-client -cluster <name> -namenodes <a,b> -port <n> -webport <n>");
    puts("   configure-journalnode");
    puts("   register-journalnodes -nodes <a,b,c> -port <n>");
    puts("   register-slaves -role hdfs|yarn -slaves <a,b>");
    puts("   format | init-shared-edits | bootstrap-standby | create-dirs");
    puts("   ensure-active -namenodes <a,b> -preferred <a> [-retries <n>]");
    puts("   ha-state                         : Print the recorded NameNode HA state.");
    puts("   wait-hdfs [-timeout <seconds>]");
    puts("   configure-resourcemanager | configure-jobhistory");
    puts("   configure-nodemanager | configure-yarn-client -rmhost <host> -port <n>");
    puts("          -histhttp <n> -histipc <n>");
    puts("   install-demo -source <file>");
    puts("   relation-ready -view <view>      : Exit 0 when ready, 1 when not yet.");
    puts("   relation-provide -view <view> -target <service> [-ready] [-port <n>]");
    puts("          [-ssh-key <public key file>] [-protocol <name>]");
    puts("          views: namenode, namenode-master, resourcemanager,");
    puts("          resourcemanager-master, datanode, nodemanager, hadoop-plugin,");
    puts("          mysql, flume-agent, hive");
    puts("          resourcemanager-master needs -ssh-key, flume-agent publishes");
    puts("          -protocol only when it is avro.");
}


struct Options
{
    Options() : force(false), ready(false), verbose(false) { }
    std::string distFile;
    std::string stateFile;
    std::string action;
    std::map<std::string, std::string> config;
    UnitIdentity unit;
    std::string relationsFile;
    std::string logFile;
    std::map<std::string, std::string> params;     // action specific
    bool force;
    bool ready;
    bool verbose;

    std::string param(const std::string &name, const std::string &defaultValue = "") const
    {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : defaultValue;
    }

    std::string requiredParam(const std::string &name) const
    {
        auto it = params.find(name);
        if (it == params.end() || it->second.empty())
            throw ConfigException("Action " + action + " needs -" + name);
        return it->second;
    }
};


static unsigned toNumber(const std::string &value, unsigned maxValue)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        throw ConfigException("Invalid number '" + value + "'");
    unsigned long parsed = 0;
    try
    {
        parsed = std::stoul(value);
    }
    catch (const std::out_of_range &)
    {
        throw ConfigException("Number '" + value + "' out of range");
    }
    if (parsed > maxValue)
        throw ConfigException("Number '" + value + "' out of range");
    return static_cast<unsigned>(parsed);
}


static unsigned toPort(const std::string &value)
{
    return toNumber(value, 65535);
}


static std::vector<std::string> toList(const std::string &value)
{
    std::vector<std::string> items;
    std::vector<std::string> parts = splitString(value, ",");
    for (auto it = parts.begin(); it != parts.end(); ++it)
    {
        std::string item = trimString(*it);
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}


static Relation::RelationView toView(const std::string &name)
{
    if (name == "namenode")                 return Relation::NameNode;
    if (name == "namenode-master")          return Relation::NameNodeMaster;
    if (name == "resourcemanager")          return Relation::ResourceManager;
    if (name == "resourcemanager-master")   return Relation::ResourceManagerMaster;
    if (name == "datanode")                 return Relation::DataNode;
    if (name == "nodemanager")              return Relation::NodeManager;
    if (name == "hadoop-plugin")            return Relation::HadoopPlugin;
    if (name == "mysql")                    return Relation::MySQL;
    if (name == "flume-agent")              return Relation::FlumeAgent;
    if (name == "hive")                     return Relation::Hive;
    throw ConfigException("Unknown relation view " + name);
}


bool parseArgs(int argc, char *argv[], Options &opts)
{
    static const char *valueParams[] = {"dir", "target", "java-installer", "daemon", "command", "namenodes", "cluster",
                                        "port", "webport", "nodes", "role", "slaves", "preferred", "retries", "timeout",
                                        "rmhost", "histhttp", "histipc", "source", "view", "ssh-key", "protocol", nullptr};
    int i = 1;
    while (i < argc)
    {
        const char *arg = argv[i];
        bool hasValue = (i + 1 < argc);
        if (strcmp(arg, "-help") == 0 || strcmp(arg, "-?") == 0)
        {
            usage();
            return false;
        }
        else if (strcmp(arg, "-v") == 0)
        {
            opts.verbose = true;
            i++;
            continue;
        }
        else if (strcmp(arg, "-force") == 0)
        {
            opts.force = true;
            i++;
            continue;
        }
        else if (strcmp(arg, "-ready") == 0)
        {
            opts.ready = true;
            i++;
            continue;
        }

        if (!hasValue)
        {
            fprintf(stderr, "\nMissing value for %s\n", arg);
            usage();
            return false;
        }
        std::string value = argv[i + 1];
        i += 2;

        if (strcmp(arg, "-dist") == 0)
            opts.distFile = value;
        else if (strcmp(arg, "-state") == 0)
            opts.stateFile = value;
        else if (strcmp(arg, "-action") == 0)
            opts.action = value;
        else if (strcmp(arg, "-service") == 0)
            opts.unit.serviceName = value;
        else if (strcmp(arg, "-unit") == 0)
            opts.unit.unitName = value;
        else if (strcmp(arg, "-address") == 0)
            opts.unit.privateAddress = value;
        else if (strcmp(arg, "-relations") == 0)
            opts.relationsFile = value;
        else if (strcmp(arg, "-log") == 0)
            opts.logFile = value;
        else if (strcmp(arg, "-config") == 0)
        {
            size_t eq = value.find('=');
            if (eq == std::string::npos || eq == 0)
            {
                fprintf(stderr, "\nConfig values must be given as key=value: %s\n", value.c_str());
                return false;
            }
            opts.config[value.substr(0, eq)] = value.substr(eq + 1);
        }
        else
        {
            bool known = false;
            for (const char **name = valueParams; *name != nullptr && !known; ++name)
            {
                if (arg[0] == '-' && strcmp(arg + 1, *name) == 0)
                {
                    opts.params[*name] = value;
                    known = true;
                }
            }
            if (!known)
            {
                fprintf(stderr, "\nUnknown option %s\n", arg);
                usage();
                return false;
            }
        }
    }

    if (opts.action.empty() || opts.distFile.empty() || opts.stateFile.empty())
    {
        fprintf(stderr, "\nMissing -action, -dist or -state\n");
        usage();
        return false;
    }
    return true;
}


static ResourceManagerEndpoint getEndpoint(const Options &opts)
{
    ResourceManagerEndpoint endpoint;
    endpoint.host = opts.requiredParam("rmhost");
    endpoint.port = toPort(opts.requiredParam("port"));
    endpoint.historyHttpPort = toPort(opts.requiredParam("histhttp"));
    endpoint.historyIpcPort = toPort(opts.requiredParam("histipc"));
    return endpoint;
}


static void controlDaemon(Hdfs &hdfs, Yarn &yarn, const std::string &daemon, const std::string &command)
{
    bool start = (command == "start"), stop = (command == "stop"), restart = (command == "restart");
    if (!start && !stop && !restart)
        throw ConfigException("Unknown daemon command " + command);

    if (daemon == "namenode")
        start ? hdfs.startNameNode() : stop ? hdfs.stopNameNode() : hdfs.restartNameNode();
    else if (daemon == "secondarynamenode" && !restart)
        start ? hdfs.startSecondaryNameNode() : hdfs.stopSecondaryNameNode();
    else if (daemon == "datanode")
        start ? hdfs.startDataNode() : stop ? hdfs.stopDataNode() : hdfs.restartDataNode();
    else if (daemon == "journalnode")
        start ? hdfs.startJournalNode() : stop ? hdfs.stopJournalNode() : hdfs.restartJournalNode();
    else if (daemon == "resourcemanager")
        start ? yarn.startResourceManager() : stop ? yarn.stopResourceManager() : yarn.restartResourceManager();
    else if (daemon == "nodemanager")
        start ? yarn.startNodeManager() : stop ? yarn.stopNodeManager() : yarn.restartNodeManager();
    else if (daemon == "historyserver" && !restart)
        start ? yarn.startJobHistory() : yarn.stopJobHistory();
    else
        throw ConfigException("Unable to " + command + " " + daemon);
}


static int runAction(const Options &opts, Status &status)
{
    DistConfig distConfig(opts.distFile);
    distConfig.setConfigValues(opts.config);
    KeyValueStore store(opts.stateFile);
    LocalCommandRunner runner;
    LocalHostOperations host(runner);
    HadoopBase base(distConfig, store, runner, host, status, opts.unit);
    Hdfs hdfs(base);
    Yarn yarn(base);
    HACoordinator coordinator(hdfs, store, base.getHostName());
    StaticRelationDataSource relations;
    if (!opts.relationsFile.empty())
        relations.load(opts.relationsFile);

    const std::string &action = opts.action;
    if (action == "resolve")
        std::cout << distConfig.resolvePath(opts.requiredParam("dir")) << std::endl;
    else if (action == "exposed-ports")
    {
        std::vector<unsigned> ports = distConfig.getExposedPorts(opts.requiredParam("target"));
        for (auto it = ports.begin(); it != ports.end(); ++it)
            std::cout << *it << std::endl;
    }
    else if (action == "install")
        base.install(opts.requiredParam("java-installer"), opts.force);
    else if (action == "manage-hosts")
        EtcHosts(store).manage();
    else if (action == "daemon")
        controlDaemon(hdfs, yarn, opts.requiredParam("daemon"), opts.requiredParam("command"));
    else if (action == "configure-namenode")
        hdfs.configureNameNode(toList(opts.requiredParam("namenodes")));
    else if (action == "configure-datanode")
        hdfs.configureDataNode(opts.requiredParam("cluster"), toList(opts.requiredParam("namenodes")),
                               toPort(opts.requiredParam("port")), toPort(opts.requiredParam("webport")));
    else if (action == "configure-hdfs-client")
        hdfs.configureClient(opts.requiredParam("cluster"), toList(opts.requiredParam("namenodes")),
                             toPort(opts.requiredParam("port")), toPort(opts.requiredParam("webport")));
    else if (action == "configure-journalnode")
        hdfs.configureJournalNode();
    else if (action == "register-journalnodes")
        hdfs.registerJournalNodes(toList(opts.requiredParam("nodes")), toPort(opts.requiredParam("port")));
    else if (action == "register-slaves")
    {
        std::string role = opts.requiredParam("role");
        std::vector<std::string> slaves = toList(opts.param("slaves"));
        if (role == "hdfs")
        {
            hdfs.registerSlaves(slaves);
            hdfs.reloadSlaves();
        }
        else if (role == "yarn")
            yarn.registerSlaves(slaves);
        else
            throw ConfigException("Unknown role " + role);
    }
    else if (action == "format")
        coordinator.format();
    else if (action == "init-shared-edits")
        coordinator.initializeSharedEdits();
    else if (action == "bootstrap-standby")
        coordinator.bootstrapStandby();
    else if (action == "create-dirs")
        coordinator.createClusterDirectories();
    else if (action == "ensure-active")
    {
        std::string retries = opts.param("retries");
        bool promoted = coordinator.ensureHAActive(toList(opts.requiredParam("namenodes")), opts.requiredParam("preferred"),
                                                   retries.empty() ? -1 : static_cast<int>(toNumber(retries, 1000000)));
        std::cout << (promoted ? "promoted " + opts.requiredParam("preferred") : "active namenode present") << std::endl;
    }
    else if (action == "ha-state")
        std::cout << HACoordinator::getStateString(coordinator.getState()) << std::endl;
    else if (action == "wait-hdfs")
    {
        std::string timeout = opts.param("timeout", "400");
        hdfs.waitForHdfs(std::chrono::seconds(toNumber(timeout, 1000000)));
    }
    else if (action == "configure-resourcemanager")
        yarn.configureResourceManager();
    else if (action == "configure-jobhistory")
        yarn.configureJobHistory();
    else if (action == "configure-nodemanager")
        yarn.configureNodeManager(getEndpoint(opts));
    else if (action == "configure-yarn-client")
        yarn.configureClient(getEndpoint(opts));
    else if (action == "install-demo")
        yarn.installDemo(opts.requiredParam("source"));
    else if (action == "relation-ready" || action == "relation-provide")
    {
        Relation::RelationView view = toView(opts.requiredParam("view"));
        // clients only care that the Hadoop version matches
        bool client = (action == "relation-ready" && (view == Relation::NameNode || view == Relation::ResourceManager));
        Relation relation(view, relations, [&base, client]() { return InteropSpec(client ? base.clientSpec() : base.spec()); });
        if (action == "relation-ready")
        {
            bool ready = relation.isReady();
            std::cout << (ready ? "ready" : "not ready") << std::endl;
            return ready ? 0 : 1;
        }

        ProvideContext context;
        unsigned port = 0;
        if (!opts.param("port").empty())
            port = toPort(opts.param("port"));
        else if (view == Relation::NameNode || view == Relation::NameNodeMaster)
            distConfig.getPort("namenode", port);
        else if (view == Relation::ResourceManager || view == Relation::ResourceManagerMaster)
            distConfig.getPort("resourcemanager", port);
        else if (view == Relation::Hive)
            distConfig.getPort("hive", port);
        context.port = port;
        if (view == Relation::ResourceManagerMaster)
            context.sshKey = readSshPublicKey(opts.requiredParam("ssh-key"));
        context.protocol = opts.param("protocol");
        context.hostname = base.getHostName();
        context.hostfqdn = base.getHostName();
        context.waitForHdfs = [&hdfs](std::chrono::milliseconds timeout) { hdfs.waitForHdfs(timeout); };
        UnitData data = relation.provide(opts.requiredParam("target"), opts.ready, context);
        for (auto it = data.begin(); it != data.end(); ++it)
            std::cout << it->first << "=" << it->second << std::endl;
    }
    else
        throw ConfigException("Unknown action " + action);
    return 0;
}


int main(int argc, char *argv[])
{
    Options opts;
    if (!parseArgs(argc, argv, opts))
        return 1;

    initLogging(opts.logFile, opts.verbose);
    Status status;
    int rc = 0;
    try
    {
        rc = runAction(opts, status);
    }
    catch (const CompatibilityException &e)
    {
        status.set(statusMsg::blocked, e.what());
        rc = 2;
    }
    catch (const TimeoutException &e)
    {
        status.set(statusMsg::waiting, e.what());
        rc = 3;
    }
    catch (const CommandException &e)
    {
        OERRLOG("%s", e.what());
        status.set(statusMsg::blocked, "Command failed: " + e.getCommand());
        rc = 4;
    }
    catch (const DeployException &e)
    {
        status.set(statusMsg::blocked, e.what());
        rc = 5;
    }
    catch (const std::exception &e)
    {
        OERRLOG("Unexpected error: %s", e.what());
        rc = 6;
    }
    return rc;
}
