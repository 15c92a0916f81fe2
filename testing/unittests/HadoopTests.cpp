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
#include <memory>
#include <boost/filesystem.hpp>
#include <cppunit/extensions/HelperMacros.h>

#include "HadoopBase.hpp"
#include "Hdfs.hpp"
#include "Yarn.hpp"
#include "XmlPropertyFile.hpp"
#include "EnvironmentFile.hpp"
#include "Exceptions.hpp"
#include "UnitTestHelpers.hpp"

using namespace hadoopDeploy;
namespace fs = boost::filesystem;

static const char *c_emptySite = "<?xml version=\"1.0\"?>\n<configuration>\n</configuration>\n";
static const char *c_javaOutput = "/usr/lib/jvm/java-8-openjdk\n1.8.0_151\n";


//
// A Hadoop tarball layout under a scratch directory, with every host file
// redirected into it
class HadoopTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(HadoopTests);
    CPPUNIT_TEST(testInstallJava);
    CPPUNIT_TEST(testInstall);
    CPPUNIT_TEST(testConfigureNameNode);
    CPPUNIT_TEST(testLzo);
    CPPUNIT_TEST(testConfigureDataNodeAndJournalNode);
    CPPUNIT_TEST(testDaemons);
    CPPUNIT_TEST(testWaitForHdfs);
    CPPUNIT_TEST(testRegisterSlaves);
    CPPUNIT_TEST(testYarnConfig);
    CPPUNIT_TEST(testInstallDemo);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp()
    {
        m_tmp.reset(new TempDir());
        std::string base = m_tmp->path();
        fs::path defaults = fs::path(base) / "hadoop" / "etc" / "hadoop";
        fs::create_directories(defaults);
        writeTextFile((defaults / "core-site.xml").string(), c_emptySite);
        writeTextFile((defaults / "hdfs-site.xml").string(), c_emptySite);
        writeTextFile((defaults / "yarn-site.xml").string(), c_emptySite);
        writeTextFile((defaults / "mapred-site.xml.template").string(), c_emptySite);
        writeTextFile((defaults / "slaves").string(), "localhost\n");
        writeTextFile((defaults / "hadoop-env.sh").string(), "# The java implementation to use.\nexport JAVA_HOME=${JAVA_HOME}\n");

        m_dist.reset(new DistConfig(makeDescriptor(base)));
        m_store.reset(new KeyValueStore(m_tmp->file("state.json")));
        m_runner.reset(new FakeCommandRunner());
        m_host.reset(new RecordingHostOperations());
        m_status.reset(new Status());

        HostFiles files;
        files.hosts = m_tmp->file("hosts");
        files.hostname = m_tmp->file("hostname");
        files.environment = m_tmp->file("environment");
        m_base.reset(new HadoopBase(*m_dist, *m_store, *m_runner, *m_host, *m_status,
                                    UnitIdentity("namenode", "namenode/0", "10.0.0.1"), files));
        m_hdfs.reset(new Hdfs(*m_base));
        m_hdfs->setSettleDelay(std::chrono::milliseconds(0));
        m_yarn.reset(new Yarn(*m_base));
        m_yarn->setSettleDelay(std::chrono::milliseconds(0));
    }

    void tearDown()
    {
        m_yarn.reset();
        m_hdfs.reset();
        m_base.reset();
        m_store.reset();
        m_tmp.reset();
    }

    void testInstallJava()
    {
        CPPUNIT_ASSERT(m_base->spec().empty());
        CPPUNIT_ASSERT_EQUAL(std::string("2.7.1"), m_base->clientSpec()["hadoop"]);

        m_runner->addResponse("java-installer", 0, c_javaOutput);
        m_base->installJava("/tmp/java-installer");
        CPPUNIT_ASSERT_EQUAL(std::string("/usr/lib/jvm/java-8-openjdk"), m_store->get("java.home"));
        CPPUNIT_ASSERT_EQUAL(std::string("1.8.0"), m_store->get("java.version"));
        CPPUNIT_ASSERT_EQUAL(std::string("151"), m_store->get("java.version.release"));
        CPPUNIT_ASSERT_EQUAL(std::string("chmod /tmp/java-installer 755"), m_host->getCalls().back());

        std::map<std::string, std::string> spec = m_base->spec();
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(4), spec.size());
        CPPUNIT_ASSERT_EQUAL(std::string("apache"), spec["vendor"]);
        CPPUNIT_ASSERT_EQUAL(std::string("1.8.0"), spec["java"]);
        CPPUNIT_ASSERT(!spec["arch"].empty());

        m_runner->addResponse("java-installer", 0, "/usr/lib/jvm/java-8-openjdk\n");
        CPPUNIT_ASSERT_THROW(m_base->installJava("/tmp/java-installer"), ConfigException);
        m_runner->addResponse("java-installer", 1, "download failed\n");
        CPPUNIT_ASSERT_THROW(m_base->installJava("/tmp/java-installer"), CommandException);
    }

    void testInstall()
    {
        m_runner->addResponse("java-installer", 0, c_javaOutput);
        m_base->install("/tmp/java-installer");

        CPPUNIT_ASSERT(m_base->isInstalled());
        CPPUNIT_ASSERT(m_status->getState() == statusMsg::waiting);
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-0"), readTextFile(m_tmp->file("hostname")));
        CPPUNIT_ASSERT_EQUAL(std::string("10.0.0.1 namenode-0  # JUJU MANAGED\n"), readTextFile(m_tmp->file("hosts")));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("hostname -F " + m_tmp->file("hostname")));

        std::string conf = m_dist->resolvePath("hadoop_conf");
        CPPUNIT_ASSERT(fs::exists(fs::path(conf) / "core-site.xml"));
        CPPUNIT_ASSERT(fs::exists(fs::path(conf) / "mapred-site.xml"));
        CPPUNIT_ASSERT(!fs::exists(fs::path(conf) / "slaves"));
        CPPUNIT_ASSERT_EQUAL(std::string("# The java implementation to use.\nexport JAVA_HOME=/usr/lib/jvm/java-8-openjdk\n"),
                             readTextFile(m_base->getConfPath("hadoop-env.sh")));

        std::string hadoopHome = m_dist->resolvePath("hadoop");
        PropertyMap env = parseEnvironmentFile(m_tmp->file("environment"));
        CPPUNIT_ASSERT_EQUAL(std::string("/usr/lib/jvm/java-8-openjdk"), env.get("JAVA_HOME"));
        CPPUNIT_ASSERT_EQUAL("/usr/lib/jvm/java-8-openjdk/bin:" + hadoopHome + "/bin:" + hadoopHome + "/sbin", env.get("PATH"));
        CPPUNIT_ASSERT_EQUAL(conf, env.get("HADOOP_CONF_DIR"));
        CPPUNIT_ASSERT_EQUAL(hadoopHome + "/logs/hdfs", env.get("HADOOP_LOG_DIR"));
        CPPUNIT_ASSERT(!env.has("HADOOP_EXTRA_CLASSPATH"));

        // users and directories go through the host
        const std::vector<std::string> &calls = m_host->getCalls();
        CPPUNIT_ASSERT(std::find(calls.begin(), calls.end(), "dir " + hadoopHome + "/logs/yarn root:root 755") != calls.end());

        // nothing is repeated once installed
        size_t commands = m_runner->getCommands().size();
        m_base->install("/tmp/java-installer");
        CPPUNIT_ASSERT_EQUAL(commands, m_runner->getCommands().size());

        // PATH entries are not duplicated when forced
        m_base->install("/tmp/java-installer", true);
        env = parseEnvironmentFile(m_tmp->file("environment"));
        CPPUNIT_ASSERT_EQUAL("/usr/lib/jvm/java-8-openjdk/bin:" + hadoopHome + "/bin:" + hadoopHome + "/sbin", env.get("PATH"));
    }

    void testConfigureNameNode()
    {
        m_base->setupHadoopConfig();
        m_hdfs->configureNameNode({"namenode-0", "namenode-1"});

        PropertyMap core = readXmlProperties(m_base->getConfPath("core-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("hdfs://namenode"), core.get("fs.defaultFS"));
        CPPUNIT_ASSERT(core.get("io.compression.codecs").find("SnappyCodec") != std::string::npos);
        CPPUNIT_ASSERT(core.get("io.compression.codecs").find("LzoCodec") == std::string::npos);

        PropertyMap site = readXmlProperties(m_base->getConfPath("hdfs-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode"), site.get("dfs.nameservices"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-0,namenode-1"), site.get("dfs.ha.namenodes.namenode"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-1:8020"), site.get("dfs.namenode.rpc-address.namenode.namenode-1"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-1:50070"), site.get("dfs.namenode.http-address.namenode.namenode-1"));
        CPPUNIT_ASSERT_EQUAL(std::string("sshfence"), site.get("dfs.ha.fencing.methods"));
        CPPUNIT_ASSERT_EQUAL(std::string("3"), site.get("dfs.replication"));
        CPPUNIT_ASSERT_EQUAL(std::string("134217728"), site.get("dfs.blocksize"));
        CPPUNIT_ASSERT_EQUAL(m_dist->resolvePath("hdfs_dir_base") + "/cache/hadoop/dfs/name", site.get("dfs.namenode.name.dir"));

        m_dist->setConfigValue("dfs_replication", "2");
        m_hdfs->configureNameNode({"namenode-0", "namenode-1"});
        CPPUNIT_ASSERT_EQUAL(std::string("2"), readXmlProperties(m_base->getConfPath("hdfs-site.xml")).get("dfs.replication"));

        m_dist->setConfigValue("dfs_blocksize", "128m");
        CPPUNIT_ASSERT_THROW(m_hdfs->configureNameNode({"namenode-0", "namenode-1"}), ConfigException);
    }

    void testLzo()
    {
        m_base->setupHadoopConfig();
        fs::path lib = fs::path(m_dist->resolvePath("hadoop")) / "share" / "hadoop" / "common" / "lib";
        fs::create_directories(lib);
        writeTextFile((lib / "hadoop-lzo-0.4.20.jar").string(), "");
        CPPUNIT_ASSERT(m_base->hasLzo());

        m_hdfs->configureClient("cluster", {"namenode-0"}, 8020, 50070);
        PropertyMap core = readXmlProperties(m_base->getConfPath("core-site.xml"));
        CPPUNIT_ASSERT(core.get("io.compression.codecs").find("com.hadoop.compression.lzo.LzopCodec") != std::string::npos);
        CPPUNIT_ASSERT_EQUAL(std::string("com.hadoop.compression.lzo.LzoCodec"), core.get("io.compression.codec.lzo.class"));
        CPPUNIT_ASSERT_EQUAL(std::string("hdfs://cluster"), core.get("fs.defaultFS"));

        m_store->set("java.home", "/usr/lib/jvm/java-8-openjdk");
        m_base->configureHadoop();
        PropertyMap env = parseEnvironmentFile(m_tmp->file("environment"));
        CPPUNIT_ASSERT_EQUAL((lib / "hadoop-lzo-0.4.20.jar").string(), env.get("HADOOP_EXTRA_CLASSPATH"));
    }

    void testConfigureDataNodeAndJournalNode()
    {
        m_base->setupHadoopConfig();
        m_hdfs->configureDataNode("namenode", {"namenode-0", "namenode-1"}, 8020, 50070);
        m_hdfs->configureJournalNode();
        m_hdfs->registerJournalNodes({"journal-0", "journal-1", "journal-2"}, 8485);

        PropertyMap site = readXmlProperties(m_base->getConfPath("hdfs-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("0.0.0.0:50075"), site.get("dfs.datanode.http.address"));
        CPPUNIT_ASSERT_EQUAL(std::string("0.0.0.0:8485"), site.get("dfs.journalnode.rpc-address"));
        CPPUNIT_ASSERT_EQUAL(std::string("0.0.0.0:8480"), site.get("dfs.journalnode.http-address"));
        CPPUNIT_ASSERT_EQUAL(std::string("qjournal://journal-0:8485;journal-1:8485;journal-2:8485/namenode"),
                             site.get("dfs.namenode.shared.edits.dir"));
        CPPUNIT_ASSERT(!site.has("dfs.replication"));
    }

    void testDaemons()
    {
        m_hdfs->startNameNode();
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("hadoop-daemon.sh --config"));
        const CommandRequest &start = m_runner->getRequests().back();
        CPPUNIT_ASSERT_EQUAL(std::string("hdfs"), start.user);
        CPPUNIT_ASSERT_EQUAL(std::string("namenode"), start.args.back());
        CPPUNIT_ASSERT_EQUAL(std::string("start"), start.args[start.args.size() - 2]);

        m_runner->clearCommands();
        m_runner->addResponse("pgrep", 0, "4242\n");
        m_hdfs->startNameNode();
        m_hdfs->startDataNode();
        m_yarn->startResourceManager();
        CPPUNIT_ASSERT_EQUAL(0U, m_runner->countCommands("daemon.sh"));

        m_hdfs->restartNameNode();
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("stop namenode"));
        CPPUNIT_ASSERT_EQUAL(0U, m_runner->countCommands("start namenode"));

        m_runner->clearCommands();
        m_runner->addResponse("pgrep", 1, "");
        m_yarn->startJobHistory();
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("mr-jobhistory-daemon.sh"));
        CPPUNIT_ASSERT_EQUAL(std::string("mapred"), m_runner->getRequests().back().user);
        m_yarn->restartNodeManager();
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("yarn-daemon.sh --config " + m_dist->resolvePath("hadoop_conf") + " stop nodemanager"));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("start nodemanager"));
    }

    void testWaitForHdfs()
    {
        m_runner->addResponse("-report", 0, "Configured Capacity: 0\nLive datanodes (1):\n");
        m_runner->addResponse("-safemode", 0, "Safe mode is OFF in namenode-0/10.0.0.1:8020\n");
        m_hdfs->waitForHdfs(std::chrono::seconds(5), std::chrono::milliseconds(10));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("-safemode get"));

        m_runner->addResponse("-safemode", 0, "Safe mode is ON\n");
        try
        {
            m_hdfs->waitForHdfs(std::chrono::milliseconds(100), std::chrono::milliseconds(10));
            CPPUNIT_FAIL("Expected TimeoutException");
        }
        catch (const TimeoutException &e)
        {
            CPPUNIT_ASSERT(std::string(e.what()).find("Safe mode is ON") != std::string::npos);
        }

        // a NameNode that is not up yet only delays things
        m_runner->addResponse("-report", 255, "Connection refused\n");
        CPPUNIT_ASSERT_THROW(m_hdfs->waitForHdfs(std::chrono::milliseconds(50), std::chrono::milliseconds(10)), TimeoutException);
    }

    void testRegisterSlaves()
    {
        m_base->setupHadoopConfig();
        m_hdfs->registerSlaves({"slave-0", "slave-1"});
        std::string slaves = m_base->getConfPath("slaves");
        CPPUNIT_ASSERT_EQUAL(std::string("# DO NOT EDIT\n# This file is automatically managed by hadoopdeploy\nslave-0\nslave-1\n"),
                             readTextFile(slaves));
        CPPUNIT_ASSERT_EQUAL("chown " + slaves + " ubuntu:hadoop", m_host->getCalls().back());

        m_hdfs->reloadSlaves();
        CPPUNIT_ASSERT_EQUAL(0U, m_runner->countCommands("-refreshNodes"));

        m_runner->addResponse("pgrep", 0, "4242\n");
        m_hdfs->reloadSlaves();
        m_yarn->registerSlaves({"slave-0"});
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("dfsadmin -refreshNodes"));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("rmadmin -refreshNodes"));
        CPPUNIT_ASSERT_EQUAL(std::string("mapred"), m_runner->getRequests().back().user);
    }

    void testYarnConfig()
    {
        m_base->setupHadoopConfig();
        m_yarn->configureResourceManager();
        m_yarn->configureJobHistory();

        PropertyMap yarnSite = readXmlProperties(m_base->getConfPath("yarn-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-0"), yarnSite.get("yarn.resourcemanager.hostname"));
        CPPUNIT_ASSERT_EQUAL(std::string("namenode-0:8032"), yarnSite.get("yarn.resourcemanager.address"));
        CPPUNIT_ASSERT_EQUAL(std::string("0.0.0.0:8088"), yarnSite.get("yarn.resourcemanager.webapp.address"));
        CPPUNIT_ASSERT_EQUAL(std::string("mapreduce_shuffle"), yarnSite.get("yarn.nodemanager.aux-services"));

        PropertyMap mapredSite = readXmlProperties(m_base->getConfPath("mapred-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("0.0.0.0:10020"), mapredSite.get("mapreduce.jobhistory.address"));
        CPPUNIT_ASSERT_EQUAL(std::string("yarn"), mapredSite.get("mapreduce.framework.name"));

        ResourceManagerEndpoint endpoint;
        endpoint.host = "resourcemanager-0";
        endpoint.port = 8032;
        endpoint.historyHttpPort = 19888;
        endpoint.historyIpcPort = 10020;
        m_yarn->configureNodeManager(endpoint);
        mapredSite = readXmlProperties(m_base->getConfPath("mapred-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("resourcemanager-0:10020"), mapredSite.get("mapreduce.jobhistory.address"));
        CPPUNIT_ASSERT_EQUAL(std::string("resourcemanager-0:19888"), mapredSite.get("mapreduce.jobhistory.webapp.address"));
        yarnSite = readXmlProperties(m_base->getConfPath("yarn-site.xml"));
        CPPUNIT_ASSERT_EQUAL(std::string("resourcemanager-0:19888/jobhistory/logs/"), yarnSite.get("yarn.log.server.url"));
    }

    void testInstallDemo()
    {
        std::string source = m_tmp->file("terasort.sh");
        std::string target = m_tmp->file("home-terasort.sh");
        writeTextFile(source, "#!/bin/bash\n");

        m_yarn->installDemo(source, target);
        CPPUNIT_ASSERT_EQUAL(std::string("#!/bin/bash\n"), readTextFile(target));
        CPPUNIT_ASSERT_EQUAL("chown " + target + " ubuntu:hadoop", m_host->getCalls().back());

        fs::remove(target);
        m_yarn->installDemo(source, target);
        CPPUNIT_ASSERT(!fs::exists(target));
    }


private:
    std::unique_ptr<TempDir> m_tmp;
    std::unique_ptr<DistConfig> m_dist;
    std::unique_ptr<KeyValueStore> m_store;
    std::unique_ptr<FakeCommandRunner> m_runner;
    std::unique_ptr<RecordingHostOperations> m_host;
    std::unique_ptr<Status> m_status;
    std::unique_ptr<HadoopBase> m_base;
    std::unique_ptr<Hdfs> m_hdfs;
    std::unique_ptr<Yarn> m_yarn;
};

CPPUNIT_TEST_SUITE_REGISTRATION(HadoopTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(HadoopTests, "hadoop");
