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
#include <boost/filesystem.hpp>

#include "Yarn.hpp"
#include "XmlPropertyFile.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace fs = boost::filesystem;

namespace hadoopDeploy
{

static const char *c_demoInstalledFlag = "yarn.client.demo.installed";


void Yarn::settle()
{
    if (m_settleDelay.count() > 0)
        std::this_thread::sleep_for(m_settleDelay);
}


void Yarn::yarnDaemon(const std::string &command, const std::string &daemon)
{
    m_hadoopBase.run("yarn", "sbin/yarn-daemon.sh",
                     {"--config", m_hadoopBase.getDistConfig().resolvePath("hadoop_conf"), command, daemon});
}


void Yarn::jobHistoryDaemon(const std::string &command, const std::string &daemon)
{
    m_hadoopBase.run("mapred", "sbin/mr-jobhistory-daemon.sh",
                     {"--config", m_hadoopBase.getDistConfig().resolvePath("hadoop_conf"), command, daemon});
}


void Yarn::startResourceManager()
{
    if (jps(m_hadoopBase.getRunner(), "ResourceManager").empty())
        yarnDaemon("start", "resourcemanager");
}


void Yarn::stopResourceManager()
{
    yarnDaemon("stop", "resourcemanager");
}


void Yarn::restartResourceManager()
{
    stopResourceManager();
    settle();
    startResourceManager();
}


void Yarn::startJobHistory()
{
    if (jps(m_hadoopBase.getRunner(), "JobHistoryServer").empty())
        jobHistoryDaemon("start", "historyserver");
}


void Yarn::stopJobHistory()
{
    jobHistoryDaemon("stop", "historyserver");
}


void Yarn::startNodeManager()
{
    if (jps(m_hadoopBase.getRunner(), "NodeManager").empty())
        yarnDaemon("start", "nodemanager");
}


void Yarn::stopNodeManager()
{
    yarnDaemon("stop", "nodemanager");
}


void Yarn::restartNodeManager()
{
    stopNodeManager();
    settle();
    startNodeManager();
}


ResourceManagerEndpoint Yarn::getLocalEndpoint() const
{
    const DistConfig &dc = m_hadoopBase.getDistConfig();
    ResourceManagerEndpoint endpoint;
    endpoint.host = m_hadoopBase.getHostName();
    endpoint.port = dc.getPort("resourcemanager");
    endpoint.historyHttpPort = dc.getPort("jh_webapp_http");
    endpoint.historyIpcPort = dc.getPort("jobhistory");
    return endpoint;
}


void Yarn::configureYarnBase(const ResourceManagerEndpoint &endpoint)
{
    const std::string &host = endpoint.host;
    editXmlProperties(m_hadoopBase.getConfPath("yarn-site.xml"), [&](PropertyMap &props)
    {
        props.set("yarn.nodemanager.aux-services", "mapreduce_shuffle");
        props.set("yarn.nodemanager.vmem-check-enabled", "false");
        if (!host.empty())
        {
            props.set("yarn.resourcemanager.hostname", host);
            props.set("yarn.resourcemanager.address", host + ":" + std::to_string(endpoint.port));
            props.set("yarn.log.server.url", host + ":" + std::to_string(endpoint.historyHttpPort) + "/jobhistory/logs/");
        }
    });

    editXmlProperties(m_hadoopBase.getConfPath("mapred-site.xml"), [&](PropertyMap &props)
    {
        if (!host.empty() && endpoint.historyIpcPort != 0)
            props.set("mapreduce.jobhistory.address", host + ":" + std::to_string(endpoint.historyIpcPort));
        if (!host.empty() && endpoint.historyHttpPort != 0)
            props.set("mapreduce.jobhistory.webapp.address", host + ":" + std::to_string(endpoint.historyHttpPort));
        props.set("mapreduce.framework.name", "yarn");
        props.set("mapreduce.jobhistory.intermediate-done-dir", "/mr-history/tmp");
        props.set("mapreduce.jobhistory.done-dir", "/mr-history/done");
        props.set("mapreduce.map.output.compress", "true");
        props.set("mapred.map.output.compress.codec", "org.apache.hadoop.io.compress.SnappyCodec");
        props.set("mapreduce.application.classpath",
                  "$HADOOP_HOME/share/hadoop/mapreduce/*,"
                  "$HADOOP_HOME/share/hadoop/mapreduce/lib/*,"
                  "$HADOOP_HOME/share/hadoop/tools/lib/*");
    });
}


void Yarn::configureResourceManager()
{
    configureYarnBase(getLocalEndpoint());
    unsigned webPort = m_hadoopBase.getDistConfig().getPort("rm_webapp_http");
    editXmlProperties(m_hadoopBase.getConfPath("yarn-site.xml"), [&](PropertyMap &props)
    {
        // listen on every interface
        props.set("yarn.resourcemanager.webapp.address", "0.0.0.0:" + std::to_string(webPort));
    });
}


void Yarn::configureJobHistory()
{
    configureYarnBase(getLocalEndpoint());
    const DistConfig &dc = m_hadoopBase.getDistConfig();
    unsigned ipcPort = dc.getPort("jobhistory");
    unsigned webPort = dc.getPort("jh_webapp_http");
    editXmlProperties(m_hadoopBase.getConfPath("mapred-site.xml"), [&](PropertyMap &props)
    {
        props.set("mapreduce.jobhistory.address", "0.0.0.0:" + std::to_string(ipcPort));
        props.set("mapreduce.jobhistory.webapp.address", "0.0.0.0:" + std::to_string(webPort));
        props.set("mapreduce.jobhistory.intermediate-done-dir", "/mr-history/tmp");
        props.set("mapreduce.jobhistory.done-dir", "/mr-history/done");
    });
}


void Yarn::installDemo(const std::string &source, const std::string &target)
{
    KeyValueStore &store = m_hadoopBase.getStore();
    if (store.getBool(c_demoInstalledFlag))
        return;

    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    m_hadoopBase.getHost().changeMode(target, 0755);
    m_hadoopBase.getHost().changeOwner(target, "ubuntu", "hadoop");
    store.setFlag(c_demoInstalledFlag);
    PROGLOG("Installed demo %s", target.c_str());
}


void Yarn::registerSlaves(const std::vector<std::string> &slaves)
{
    m_hadoopBase.registerSlaves(slaves);
    if (!jps(m_hadoopBase.getRunner(), "ResourceManager").empty())
        m_hadoopBase.run("mapred", "bin/yarn", {"rmadmin", "-refreshNodes"});
}

}
