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

#include <memory>
#include <cppunit/extensions/HelperMacros.h>

#include "HACoordinator.hpp"
#include "Exceptions.hpp"
#include "UnitTestHelpers.hpp"

using namespace hadoopDeploy;

class HACoordinatorTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(HACoordinatorTests);
    CPPUNIT_TEST(testFormatOnce);
    CPPUNIT_TEST(testFormatFailure);
    CPPUNIT_TEST(testStateProgression);
    CPPUNIT_TEST(testServiceState);
    CPPUNIT_TEST(testNoActiveNameNode);
    CPPUNIT_TEST(testActiveNameNodeExists);
    CPPUNIT_TEST(testLocalBecomesStandby);
    CPPUNIT_TEST(testInvalidCandidates);
    CPPUNIT_TEST(testClusterDirectories);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp()
    {
        m_dist.reset(new DistConfig(makeDescriptor("/srv")));
        m_store.reset(new KeyValueStore());
        m_runner.reset(new FakeCommandRunner());
        m_host.reset(new RecordingHostOperations());
        m_status.reset(new Status());
        m_base.reset(new HadoopBase(*m_dist, *m_store, *m_runner, *m_host, *m_status,
                                    UnitIdentity("namenode", "namenode/0", "10.0.0.1")));
        m_hdfs.reset(new Hdfs(*m_base));
        m_hdfs->setSettleDelay(std::chrono::milliseconds(0));
        m_coordinator.reset(new HACoordinator(*m_hdfs, *m_store, "namenode-0"));
    }

    void tearDown()
    {
        m_coordinator.reset();
        m_hdfs.reset();
        m_base.reset();
    }

    void testFormatOnce()
    {
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::UNINITIALIZED);
        m_coordinator->format();
        m_coordinator->format();
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("namenode -format -noninteractive"));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("stop namenode"));
        CPPUNIT_ASSERT(m_store->getBool(HACoordinator::c_formattedFlag));
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::FORMATTED);

        // the stop must come before the format
        const std::vector<std::string> &commands = m_runner->getCommands();
        CPPUNIT_ASSERT(commands[0].find("stop namenode") != std::string::npos);
        CPPUNIT_ASSERT(commands[1].find("-format") != std::string::npos);
    }

    void testFormatFailure()
    {
        m_runner->addResponse("-format", 1, "Running in non-interactive mode, and data appears to exist\n");
        CPPUNIT_ASSERT_THROW(m_coordinator->format(), CommandException);
        CPPUNIT_ASSERT(!m_store->getBool(HACoordinator::c_formattedFlag));
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::UNINITIALIZED);
    }

    void testStateProgression()
    {
        m_coordinator->format();
        m_coordinator->initializeSharedEdits();
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::SHARED_EDITS_READY);
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("namenode -initializeSharedEdits -nonInteractive -force"));

        // recorded state never goes backwards
        m_store->set(HACoordinator::c_formattedFlag, "false");
        m_coordinator->format();
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::SHARED_EDITS_READY);

        m_coordinator->bootstrapStandby();
        CPPUNIT_ASSERT_EQUAL(std::string("standby_bootstrapped"), m_store->get(HACoordinator::c_stateKey));

        CPPUNIT_ASSERT(HACoordinator::getStateFromString("active") == HACoordinator::ACTIVE);
        CPPUNIT_ASSERT_THROW(HACoordinator::getStateFromString("leader"), ConfigException);
        m_store->set(HACoordinator::c_stateKey, "leader");
        CPPUNIT_ASSERT_THROW(m_coordinator->getState(), ConfigException);
    }

    void testServiceState()
    {
        m_runner->addResponse("-getServiceState namenode-1", 0, "standby\n");
        CPPUNIT_ASSERT_EQUAL(std::string("standby"), m_coordinator->getServiceState("namenode-1"));
        CPPUNIT_ASSERT(m_runner->getCommands().back().find("-Dipc.client.connect.max.retries.on.timeouts") == std::string::npos);

        m_runner->addResponse("-getServiceState namenode-1", 255, "Call From namenode-0 to namenode-1:8020 failed\n");
        CPPUNIT_ASSERT_EQUAL(std::string("Call From namenode-0 to namenode-1:8020 failed"), m_coordinator->getServiceState("namenode-1", 0));
        CPPUNIT_ASSERT(m_runner->getCommands().back().find("haadmin -Dipc.client.connect.max.retries.on.timeouts=0 -getServiceState namenode-1")
                       != std::string::npos);
        CPPUNIT_ASSERT_EQUAL(std::string("hdfs"), m_runner->getRequests().back().user);
    }

    void testNoActiveNameNode()
    {
        m_store->set(HACoordinator::c_stateKey, "shared_edits_ready");
        m_runner->addResponse("-getServiceState", 0, "standby\n");

        CPPUNIT_ASSERT(m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-0"));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("haadmin -transitionToActive namenode-0"));
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::ACTIVE);
    }

    void testActiveNameNodeExists()
    {
        m_store->set(HACoordinator::c_stateKey, "standby_bootstrapped");
        m_runner->addResponse("-getServiceState namenode-0", 0, "standby\n");
        m_runner->addResponse("-getServiceState namenode-1", 0, "active\n");

        CPPUNIT_ASSERT(!m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-0"));
        CPPUNIT_ASSERT_EQUAL(0U, m_runner->countCommands("-transitionToActive"));
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::STANDBY);

        // after a failover the roles swap
        m_runner->addResponse("-getServiceState namenode-0", 0, "active\n");
        m_runner->addResponse("-getServiceState namenode-1", 0, "standby\n");
        CPPUNIT_ASSERT(!m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-1"));
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::ACTIVE);
    }

    void testLocalBecomesStandby()
    {
        m_store->set(HACoordinator::c_stateKey, "standby_bootstrapped");
        m_runner->addResponse("-getServiceState", 255, "Connection refused\n");

        CPPUNIT_ASSERT(m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-1"));
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("haadmin -transitionToActive namenode-1"));

        // the local node did not answer, so its role is still unknown
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::STANDBY_BOOTSTRAPPED);

        // an uninitialized node never records a role
        m_store->set(HACoordinator::c_stateKey, "formatted");
        m_runner->addResponse("-getServiceState", 0, "standby\n");
        m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-0");
        CPPUNIT_ASSERT(m_coordinator->getState() == HACoordinator::FORMATTED);
    }

    void testInvalidCandidates()
    {
        CPPUNIT_ASSERT_THROW(m_coordinator->ensureHAActive({"namenode-0"}, "namenode-0"), ConfigException);
        CPPUNIT_ASSERT_THROW(m_coordinator->ensureHAActive({"namenode-0", "namenode-0"}, "namenode-0"), ConfigException);
        CPPUNIT_ASSERT_THROW(m_coordinator->ensureHAActive({"namenode-0", "namenode-1", "namenode-2"}, "namenode-0"), ConfigException);
        CPPUNIT_ASSERT_THROW(m_coordinator->ensureHAActive({"namenode-0", "namenode-1"}, "namenode-2"), ConfigException);
        CPPUNIT_ASSERT(m_runner->getCommands().empty());
    }

    void testClusterDirectories()
    {
        m_coordinator->createClusterDirectories();
        m_coordinator->createClusterDirectories();
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(14), m_runner->getCommands().size());
        CPPUNIT_ASSERT(m_runner->getCommands()[0].find("dfs -mkdir -p /tmp/hadoop/mapred/staging") != std::string::npos);
        CPPUNIT_ASSERT(m_runner->getCommands()[13].find("dfs -chown yarn /app-logs") != std::string::npos);
        CPPUNIT_ASSERT_EQUAL(1U, m_runner->countCommands("-chown -R mapred:hdfs /mr-history"));

        m_store->unset(HACoordinator::c_dirsCreatedFlag);
        m_runner->clearCommands();
        m_runner->addResponse("/mr-history/tmp", 1, "mkdir: Permission denied\n");
        CPPUNIT_ASSERT_THROW(m_coordinator->createClusterDirectories(), CommandException);
        CPPUNIT_ASSERT(!m_store->getBool(HACoordinator::c_dirsCreatedFlag));
    }


private:
    std::unique_ptr<DistConfig> m_dist;
    std::unique_ptr<KeyValueStore> m_store;
    std::unique_ptr<FakeCommandRunner> m_runner;
    std::unique_ptr<RecordingHostOperations> m_host;
    std::unique_ptr<Status> m_status;
    std::unique_ptr<HadoopBase> m_base;
    std::unique_ptr<Hdfs> m_hdfs;
    std::unique_ptr<HACoordinator> m_coordinator;
};

CPPUNIT_TEST_SUITE_REGISTRATION(HACoordinatorTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(HACoordinatorTests, "hacoordinator");
