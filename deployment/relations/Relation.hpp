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

#ifndef _HADOOPDEPLOY_RELATION_HPP_
#define _HADOOPDEPLOY_RELATION_HPP_

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "InteropSpec.hpp"

namespace hadoopDeploy
{

typedef std::map<std::string, std::string> UnitData;            // key -> value published by one unit
typedef std::map<std::string, UnitData> RelationUnits;          // unit name -> its data


//
// Supplies what the units on the other end of a relation have published. How
// that data travels between nodes is not our concern.
class RelationDataSource
{
    public:

        virtual ~RelationDataSource() { }
        virtual RelationUnits getUnits(const std::string &relationName) const = 0;
};


class StaticRelationDataSource : public RelationDataSource
{
    public:

        StaticRelationDataSource() { }
        virtual ~StaticRelationDataSource() { }
        virtual RelationUnits getUnits(const std::string &relationName) const;
        void setUnitData(const std::string &relationName, const std::string &unitName, const UnitData &data);
        void removeUnit(const std::string &relationName, const std::string &unitName);

        //
        // { "<relation>": { "<unit>": { "<key>": "<value>", ... }, ... }, ... }
        void load(const std::string &filename);


    private:

        std::map<std::string, RelationUnits> m_relations;
};


//
// Reads the public key published on the nodemanager relation. Throws
// ParseException when the file cannot be read, ConfigException when it is empty.
std::string readSshPublicKey(const std::string &filename);


// Local facts a view may need to publish
struct ProvideContext
{
    ProvideContext() : port(0) { }
    unsigned port;
    std::string hostname;
    std::string hostfqdn;
    std::string sshKey;                 // public key NodeManagers authorize
    std::string protocol;               // flume agent protocol, only avro is published
    std::function<void(std::chrono::milliseconds)> waitForHdfs;     // throws TimeoutException
};


class Relation
{
    public:

        enum RelationView
        {
            NameNode,                // namenode, clients of HDFS
            NameNodeMaster,          // datanode, as seen by DataNodes
            ResourceManager,         // resourcemanager, clients of YARN
            ResourceManagerMaster,   // nodemanager, as seen by NodeManagers
            DataNode,                // datanode, as seen by NameNodes
            NodeManager,             // nodemanager, as seen by ResourceManagers
            HadoopPlugin,            // hadoop-plugin
            MySQL,                   // db
            FlumeAgent,              // flume-agent
            Hive                     // hive
        };

        enum RelationRole
        {
            provider,                // publishes a service endpoint
            consumer                 // publishes its own identity, if anything
        };

        Relation(RelationView view, const RelationDataSource &source, const InteropSpec &spec = InteropSpec());
        Relation(RelationView view, const RelationDataSource &source, const std::function<InteropSpec()> &specProvider);

        RelationView getView() const { return m_view; }
        RelationRole getRole() const;
        std::string getRelationName() const;
        std::vector<std::string> getRequiredKeys() const;
        bool isSpecMatching() const;
        InteropSpec getSpec() const;

        RelationUnits filteredData() const;

        //
        // False while no unit has published everything we need. Throws
        // CompatibilityException when a unit has, but its spec does not match
        // ours.
        bool isReady() const;

        UnitData provide(const std::string &remoteService, bool allReady, const ProvideContext &context) const;

        static const std::chrono::milliseconds c_hdfsReadyTimeout;


    private:

        RelationView m_view;
        const RelationDataSource &m_source;
        std::function<InteropSpec()> m_specProvider;
};

}

#endif
