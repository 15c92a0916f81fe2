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

#include <thread>

#include "Hdfs.hpp"
#include "XmlPropertyFile.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

static std::string hostPort(const std::string &host, unsigned port)
{
    return host + ":" + std::to_string(port);
}


void Hdfs::settle()
{
    if (m_settleDelay.count() > 0)
        std::this_thread::sleep_for(m_settleDelay);
}


void Hdfs::hadoopDaemon(const std::string &command, const std::string &daemon)
{
    m_hadoopBase.run("hdfs", "sbin/hadoop-daemon.sh",
                     {"--config", m_hadoopBase.getDistConfig().resolvePath("hadoop_conf"), command, daemon});
}


void Hdfs::startNameNode()
{
    if (!jps(m_hadoopBase.getRunner(), "NameNode").empty())
        return;
    hadoopDaemon("start", "namenode");
    settle();
}


void Hdfs::stopNameNode()
{
    hadoopDaemon("stop", "namenode");
}


void Hdfs::restartNameNode()
{
    stopNameNode();
    settle();
    startNameNode();
}


void Hdfs::startSecondaryNameNode()
{
    if (!jps(m_hadoopBase.getRunner(), "SecondaryNameNode").empty())
        return;
    hadoopDaemon("start", "secondarynamenode");
    settle();
}


void Hdfs::stopSecondaryNameNode()
{
    hadoopDaemon("stop", "secondarynamenode");
}


void Hdfs::startDataNode()
{
    if (jps(m_hadoopBase.getRunner(), "DataNode").empty())
        hadoopDaemon("start", "datanode");
}


void Hdfs::stopDataNode()
{
    hadoopDaemon("stop", "datanode");
}


void Hdfs::restartDataNode()
{
    stopDataNode();
    settle();
    startDataNode();
}


void Hdfs::startJournalNode()
{
    if (jps(m_hadoopBase.getRunner(), "JournalNode").empty())
        hadoopDaemon("start", "journalnode");
}


void Hdfs::stopJournalNode()
{
    hadoopDaemon("stop", "journalnode");
}


void Hdfs::restartJournalNode()
{
    stopJournalNode();
    settle();
    startJournalNode();
}


void Hdfs::configureHdfsBase(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort)
{
    DistConfig &dc = m_hadoopBase.getDistConfig();
    bool lzo = m_hadoopBase.hasLzo();

    editXmlProperties(m_hadoopBase.getConfPath("core-site.xml"), [&](PropertyMap &props)
    {
        props.set("hadoop.proxyuser.hue.hosts", "*");
        props.set("hadoop.proxyuser.hue.groups", "*");
        props.set("hadoop.proxyuser.oozie.groups", "*");
        props.set("hadoop.proxyuser.oozie.hosts", "*");
        std::string codecs = "org.apache.hadoop.io.compress.GzipCodec, "
                             "org.apache.hadoop.io.compress.DefaultCodec, "
                             "org.apache.hadoop.io.compress.BZip2Codec, "
                             "org.apache.hadoop.io.compress.SnappyCodec";
        if (lzo)
        {
            codecs += ", com.hadoop.compression.lzo.LzoCodec, com.hadoop.compression.lzo.LzopCodec";
            props.set("io.compression.codec.lzo.class", "com.hadoop.compression.lzo.LzoCodec");
        }
        props.set("io.compression.codecs", codecs);
        props.set("fs.defaultFS", "hdfs://" + clusterName);
    });

    std::string dirBase = dc.resolvePath("hdfs_dir_base");
    editXmlProperties(m_hadoopBase.getConfPath("hdfs-site.xml"), [&](PropertyMap &props)
    {
        props.set("dfs.webhdfs.enabled", "true");
        props.set("dfs.namenode.name.dir", dirBase + "/cache/hadoop/dfs/name");
        props.set("dfs.datanode.data.dir", dirBase + "/cache/hadoop/dfs/name");
        props.set("dfs.permissions", "false");
        props.set("dfs.nameservices", clusterName);
        props.set("dfs.client.failover.proxy.provider." + clusterName,
                  "org.apache.hadoop.hdfs.server.namenode.ha.ConfiguredFailoverProxyProvider");
        props.set("dfs.ha.fencing.methods", "sshfence");
        props.set("dfs.ha.fencing.ssh.private-key-files", "/home/hdfs/.ssh/id_rsa");
        props.set("dfs.ha.namenodes." + clusterName, joinStrings(namenodes, ","));
        for (auto it = namenodes.begin(); it != namenodes.end(); ++it)
        {
            props.set("dfs.namenode.rpc-address." + clusterName + "." + *it, hostPort(*it, port));
            props.set("dfs.namenode.http-address." + clusterName + "." + *it, hostPort(*it, webPort));
        }
    });
}


void Hdfs::configureNameNode(const std::vector<std::string> &namenodes)
{
    DistConfig &dc = m_hadoopBase.getDistConfig();
    std::string clusterName = m_hadoopBase.getUnit().serviceName;
    std::string host = m_hadoopBase.getHostName();
    unsigned webPort = dc.getPort("nn_webapp_http");
    configureHdfsBase(clusterName, namenodes, dc.getPort("namenode"), webPort);

    std::string replication = m_hadoopBase.getConfigValue("dfs_replication", "3");
    std::string blockSize = m_hadoopBase.getConfigValue("dfs_blocksize", "134217728");
    if (trimString(blockSize).find_first_not_of("0123456789") != std::string::npos || trimString(blockSize).empty())
        throw ConfigException("dfs_blocksize must be a number of bytes: " + blockSize);

    editXmlProperties(m_hadoopBase.getConfPath("hdfs-site.xml"), [&](PropertyMap &props)
    {
        props.set("dfs.replication", replication);
        props.set("dfs.blocksize", trimString(blockSize));
        props.set("dfs.namenode.datanode.registration.ip-hostname-check", "true");
        props.set("dfs.namenode.http-address." + clusterName + "." + host, hostPort(host, webPort));
    });
}


void Hdfs::configureDataNode(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort)
{
    configureHdfsBase(clusterName, namenodes, port, webPort);
    unsigned dnWebPort = m_hadoopBase.getDistConfig().getPort("dn_webapp_http");
    editXmlProperties(m_hadoopBase.getConfPath("hdfs-site.xml"), [&](PropertyMap &props)
    {
        props.set("dfs.datanode.http.address", hostPort("0.0.0.0", dnWebPort));
    });
}


void Hdfs::configureJournalNode()
{
    DistConfig &dc = m_hadoopBase.getDistConfig();
    unsigned rpcPort = dc.getPort("journalnode");
    unsigned httpPort = dc.getPort("jn_webapp_http");
    editXmlProperties(m_hadoopBase.getConfPath("hdfs-site.xml"), [&](PropertyMap &props)
    {
        props.set("dfs.journalnode.rpc-address", hostPort("0.0.0.0", rpcPort));
        props.set("dfs.journalnode.http-address", hostPort("0.0.0.0", httpPort));
    });
}


void Hdfs::configureClient(const std::string &clusterName, const std::vector<std::string> &namenodes, unsigned port, unsigned webPort)
{
    configureHdfsBase(clusterName, namenodes, port, webPort);
}


void Hdfs::registerJournalNodes(const std::vector<std::string> &nodes, unsigned port)
{
    std::vector<std::string> addresses;
    for (auto it = nodes.begin(); it != nodes.end(); ++it)
    {
        addresses.push_back(hostPort(*it, port));
    }
    std::string sharedEdits = "qjournal://" + joinStrings(addresses, ";") + "/" + m_hadoopBase.getUnit().serviceName;
    editXmlProperties(m_hadoopBase.getConfPath("hdfs-site.xml"), [&](PropertyMap &props)
    {
        props.set("dfs.namenode.shared.edits.dir", sharedEdits);
    });
}


void Hdfs::reloadSlaves()
{
    if (!jps(m_hadoopBase.getRunner(), "NameNode").empty())
        hdfs({"dfsadmin", "-refreshNodes"});
}


std::string Hdfs::hdfs(const std::vector<std::string> &args)
{
    return m_hadoopBase.run("hdfs", "bin/hdfs", args);
}


CommandResult Hdfs::hdfsUnchecked(const std::vector<std::string> &args)
{
    return m_hadoopBase.runUnchecked("hdfs", "bin/hdfs", args);
}


void Hdfs::waitForHdfs(std::chrono::milliseconds timeout, std::chrono::milliseconds interval)
{
    std::string lastOutput;
    try
    {
        pollUntil([this, &lastOutput]()
        {
            // failures here are usually "connection refused" while HDFS starts
            CommandResult report = hdfsUnchecked({"dfsadmin", "-report"});
            lastOutput = report.output;
            if (report.exitCode != 0)
                return false;
            bool datanodes = report.output.find("Datanodes available") != std::string::npos ||
                             report.output.find("Live datanodes") != std::string::npos;

            CommandResult safemode = hdfsUnchecked({"dfsadmin", "-safemode", "get"});
            lastOutput = safemode.output;
            if (safemode.exitCode != 0)
                return false;
            return datanodes && safemode.output.find("Safe mode is OFF") != std::string::npos;
        }, timeout, interval, "HDFS");
    }
    catch (const TimeoutException &e)
    {
        throw TimeoutException(std::string(e.what()) + ":\n" + lastOutput);
    }
}

}
