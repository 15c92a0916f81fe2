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

#include <fstream>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "Relation.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace pt = boost::property_tree;

namespace hadoopDeploy
{

const std::chrono::milliseconds Relation::c_hdfsReadyTimeout(std::chrono::seconds(400));


RelationUnits StaticRelationDataSource::getUnits(const std::string &relationName) const
{
    auto it = m_relations.find(relationName);
    return (it != m_relations.end()) ? it->second : RelationUnits();
}


void StaticRelationDataSource::setUnitData(const std::string &relationName, const std::string &unitName, const UnitData &data)
{
    m_relations[relationName][unitName] = data;
}


void StaticRelationDataSource::removeUnit(const std::string &relationName, const std::string &unitName)
{
    auto it = m_relations.find(relationName);
    if (it != m_relations.end())
        it->second.erase(unitName);
}


void StaticRelationDataSource::load(const std::string &filename)
{
    pt::ptree tree;
    try
    {
        pt::read_json(filename, tree);
    }
    catch (const pt::json_parser_error &e)
    {
        throw ParseException("Unable to read relation data " + filename + ": " + e.what());
    }

    for (auto relIt = tree.begin(); relIt != tree.end(); ++relIt)
    {
        for (auto unitIt = relIt->second.begin(); unitIt != relIt->second.end(); ++unitIt)
        {
            UnitData data;
            for (auto keyIt = unitIt->second.begin(); keyIt != unitIt->second.end(); ++keyIt)
            {
                data[keyIt->first] = keyIt->second.data();
            }
            setUnitData(relIt->first, unitIt->first, data);
        }
    }
}


std::string readSshPublicKey(const std::string &filename)
{
    std::ifstream in(filename.c_str());
    if (!in)
        throw ParseException("Unable to read SSH public key " + filename);
    std::ostringstream content;
    content << in.rdbuf();
    std::string key = trimString(content.str());
    if (key.empty())
        throw ConfigException("SSH public key " + filename + " is empty");
    return key;
}


Relation::Relation(RelationView view, const RelationDataSource &source, const InteropSpec &spec) :
    m_view(view), m_source(source)
{
    m_specProvider = [spec]() { return spec; };
}


Relation::Relation(RelationView view, const RelationDataSource &source, const std::function<InteropSpec()> &specProvider) :
    m_view(view), m_source(source), m_specProvider(specProvider)
{
}


Relation::RelationRole Relation::getRole() const
{
    return (m_view == DataNode || m_view == NodeManager || m_view == MySQL) ? consumer : provider;
}


std::string Relation::getRelationName() const
{
    switch (m_view)
    {
        case NameNode:               return "namenode";
        case ResourceManager:        return "resourcemanager";
        case NameNodeMaster:
        case DataNode:               return "datanode";
        case ResourceManagerMaster:
        case NodeManager:            return "nodemanager";
        case HadoopPlugin:           return "hadoop-plugin";
        case MySQL:                  return "db";
        case FlumeAgent:             return "flume-agent";
        case Hive:                   return "hive";
    }
    return "";
}


std::vector<std::string> Relation::getRequiredKeys() const
{
    switch (m_view)
    {
        case NameNode:
        case NameNodeMaster:
        case ResourceManager:
        case Hive:
            return {"private-address", "port", "ready"};
        case ResourceManagerMaster:
            return {"private-address", "ssh-key", "ready"};
        case DataNode:
        case NodeManager:
            return {"private-address", "hostname", "hostfqdn"};
        case HadoopPlugin:
            return {"private-address", "hdfs-ready"};
        case MySQL:
            return {"host", "database", "user", "password"};
        case FlumeAgent:
            return {"private-address", "port"};
    }
    return {};
}


// The views that talk to a Hadoop service compare specs, the identity views do not
bool Relation::isSpecMatching() const
{
    return m_view == NameNode || m_view == NameNodeMaster || m_view == ResourceManager || m_view == ResourceManagerMaster;
}


InteropSpec Relation::getSpec() const
{
    if (!isSpecMatching() || !m_specProvider)
        return InteropSpec();
    return m_specProvider();
}


RelationUnits Relation::filteredData() const
{
    std::vector<std::string> required = getRequiredKeys();
    if (!getSpec().empty())
        required.push_back("spec");

    RelationUnits filtered;
    RelationUnits units = m_source.getUnits(getRelationName());
    for (auto unitIt = units.begin(); unitIt != units.end(); ++unitIt)
    {
        bool complete = true;
        for (auto keyIt = required.begin(); keyIt != required.end() && complete; ++keyIt)
        {
            auto value = unitIt->second.find(*keyIt);
            complete = (value != unitIt->second.end() && !value->second.empty());
        }
        if (complete)
            filtered[unitIt->first] = unitIt->second;
    }
    return filtered;
}


bool Relation::isReady() const
{
    RelationUnits units = filteredData();
    if (units.empty())
        return false;

    InteropSpec local = getSpec();
    if (local.empty())
        return true;

    std::string localJson = local.toJson();
    for (auto it = units.begin(); it != units.end(); ++it)
    {
        const std::string &remoteJson = it->second["spec"];
        InteropSpec remote;
        try
        {
            remote = InteropSpec::fromJson(remoteJson);
        }
        catch (const ParseException &e)
        {
            throw CompatibilityException("Invalid spec from related unit " + it->first + ": " + e.what());
        }
        if (!local.matches(remote))
            throw CompatibilityException("Spec mismatch with related unit " + it->first + ": " + remoteJson + " != " + localJson);
    }
    return true;
}


UnitData Relation::provide(const std::string &remoteService, bool allReady, const ProvideContext &context) const
{
    UnitData data;
    InteropSpec spec = getSpec();
    if (!spec.empty())
        data["spec"] = spec.toJson();

    switch (m_view)
    {
        case NameNode:
        case NameNodeMaster:
        {
            // only advertise HDFS once DataNodes have reported in and it has left safe mode
            if (allReady && Relation(DataNode, m_source).isReady())
            {
                if (context.waitForHdfs)
                    context.waitForHdfs(c_hdfsReadyTimeout);
                data["ready"] = "true";
                data["port"] = std::to_string(context.port);
            }
            if (m_view == NameNodeMaster && allReady)
                data["ready"] = "true";
            break;
        }
        case ResourceManager:
        case ResourceManagerMaster:
        {
            if (allReady)
            {
                data["ready"] = "true";
                data["port"] = std::to_string(context.port);
            }
            if (m_view == ResourceManagerMaster)
            {
                // NodeManagers treat an empty key as not published
                if (context.sshKey.empty())
                    throw ConfigException("No SSH public key to publish on " + getRelationName());
                data["ssh-key"] = context.sshKey;
            }
            break;
        }
        case DataNode:
        case NodeManager:
        {
            data["hostname"] = context.hostname;
            data["hostfqdn"] = context.hostfqdn;
            break;
        }
        case HadoopPlugin:
        {
            if (!allReady)
                return UnitData();
            if (context.waitForHdfs)
                context.waitForHdfs(c_hdfsReadyTimeout);
            data["hdfs-ready"] = "true";
            break;
        }
        case Hive:
        {
            if (allReady)
            {
                data["ready"] = "true";
                data["port"] = std::to_string(context.port);
            }
            break;
        }
        case FlumeAgent:
        {
            if (context.protocol != "avro")
            {
                OERRLOG("Invalid flume protocol %s", context.protocol.c_str());
                return data;
            }
            data["protocol"] = context.protocol;
            break;
        }
        case MySQL:
            break;
    }
    DBGLOG("Providing %u keys to %s on %s", static_cast<unsigned>(data.size()), remoteService.c_str(), getRelationName().c_str());
    return data;
}

}
