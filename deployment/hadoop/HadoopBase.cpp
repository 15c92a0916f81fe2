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
#include <boost/filesystem.hpp>

#include "HadoopBase.hpp"
#include "EnvironmentFile.hpp"
#include "LineEditor.hpp"
#include "EtcHosts.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace fs = boost::filesystem;

namespace hadoopDeploy
{

static const char *c_installedFlag = "hadoop.base.installed";


HadoopBase::HadoopBase(DistConfig &distConfig, KeyValueStore &store, CommandRunner &runner, HostOperations &host,
                       Status &status, const UnitIdentity &unit, const HostFiles &files) :
    m_distConfig(distConfig), m_store(store), m_runner(runner), m_host(host), m_status(status), m_unit(unit), m_files(files)
{
    m_cpuArch = cpuArch();
}


std::string HadoopBase::getHostName() const
{
    return unitToHostName(m_unit.unitName);
}


std::string HadoopBase::getConfigValue(const std::string &key, const std::string &defaultValue) const
{
    const std::map<std::string, std::string> &values = m_distConfig.getConfigValues();
    auto it = values.find(key);
    return (it != values.end()) ? it->second : defaultValue;
}


//
// The interop spec can only be complete once Java is installed, which may happen
// during the same run that asks for it.
std::map<std::string, std::string> HadoopBase::spec() const
{
    std::map<std::string, std::string> result;
    std::string javaVersion = m_store.get("java.version");
    if (!javaVersion.empty())
    {
        result["vendor"] = m_distConfig.getVendor();
        result["hadoop"] = m_distConfig.getHadoopVersion();
        result["java"] = javaVersion;
        result["arch"] = m_cpuArch;
    }
    return result;
}


std::map<std::string, std::string> HadoopBase::clientSpec() const
{
    std::map<std::string, std::string> result;
    result["hadoop"] = m_distConfig.getHadoopVersion();
    return result;
}


bool HadoopBase::isInstalled() const
{
    return m_store.getBool(c_installedFlag);
}


void HadoopBase::install(const std::string &javaInstaller, bool force)
{
    if (!force && isInstalled())
        return;

    m_status.set(statusMsg::maintenance, "Installing Apache Hadoop base");
    configureHostsFile();
    m_distConfig.addUsers(m_host);
    m_distConfig.addDirs(m_host);
    m_distConfig.addPackages(m_host);
    installJava(javaInstaller);
    setupHadoopConfig();
    configureHadoop();
    m_store.setFlag(c_installedFlag);
    m_status.set(statusMsg::waiting, "Apache Hadoop base installed");
}


//
// Java must be able to resolve our host name to the private address, and the
// host name has to match what is in the hosts file or Hadoop gets confused
// about where things run.
void HadoopBase::configureHostsFile()
{
    std::string localIp = resolvePrivateAddress(m_unit.privateAddress);
    std::string hostName = getHostName();
    EtcHosts etcHosts(m_store, m_files.hosts);
    std::map<std::string, std::string> entry;
    entry[localIp] = hostName;
    etcHosts.updateHosts(entry);
    etcHosts.manage();

    std::ofstream out(m_files.hostname.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        throw DeployException("Unable to open " + m_files.hostname + " for writing");
    out << hostName;
    out.close();
    m_runner.checkCall("", {"hostname", "-F", m_files.hostname});
}


//
// The installer must be idempotent and print exactly two lines: JAVA_HOME
// and the Java version.
void HadoopBase::installJava(const std::string &javaInstaller)
{
    m_host.changeMode(javaInstaller, 0755);
    std::string output = m_runner.checkOutput("", {javaInstaller});
    std::vector<std::string> lines = splitString(trimString(output), "\n");
    if (lines.size() != 2)
        throw ConfigException("Unexpected output from java-installer: " + output);

    std::string javaHome = trimString(lines[0]);
    std::string javaVersion = trimString(lines[1]);
    std::string javaRelease;
    size_t underscore = javaVersion.find('_');
    if (underscore != std::string::npos)
    {
        javaRelease = javaVersion.substr(underscore + 1);
        javaVersion = javaVersion.substr(0, underscore);
    }
    m_store.set("java.home", javaHome);
    m_store.set("java.version", javaVersion);
    m_store.set("java.version.release", javaRelease);
    m_store.flush();
    PROGLOG("Java %s installed in %s", javaVersion.c_str(), javaHome.c_str());
}


void HadoopBase::setupHadoopConfig()
{
    fs::path source = fs::path(m_distConfig.resolvePath("hadoop")) / "etc" / "hadoop";
    fs::path target = m_distConfig.resolvePath("hadoop_conf");
    if (!fs::is_directory(source))
        throw DeployException("Default Hadoop configuration not found in " + source.string());

    fs::remove_all(target);
    fs::create_directories(target);
    for (fs::recursive_directory_iterator it(source), end; it != end; ++it)
    {
        fs::path relative = fs::relative(it->path(), source);
        if (fs::is_directory(it->path()))
            fs::create_directories(target / relative);
        else
            fs::copy_file(it->path(), target / relative, fs::copy_options::overwrite_existing);
    }

    fs::remove(target / "slaves");
    fs::path mapredSite = target / "mapred-site.xml";
    if (!fs::exists(mapredSite))
        fs::copy_file(target / "mapred-site.xml.template", mapredSite);
}


void HadoopBase::configureHadoop()
{
    std::string javaHome = m_store.get("java.home");
    if (javaHome.empty())
        throw ConfigException("java.home is not known, Java has not been installed");

    std::string javaBin = javaHome + "/bin";
    std::string hadoopHome = m_distConfig.resolvePath("hadoop");
    std::string hadoopBin = hadoopHome + "/bin";
    std::string hadoopSbin = hadoopHome + "/sbin";
    std::vector<std::string> extraClasspath = findLzoJars();

    editEnvironmentFile(m_files.environment, [&](PropertyMap &env)
    {
        env.set("JAVA_HOME", javaHome);
        std::string path = env.get("PATH");
        if (path.find(javaBin) == std::string::npos)
            path = path.empty() ? javaBin : javaBin + ":" + path;   // the right java must come first
        if (path.find(hadoopBin) == std::string::npos)
            path = path.empty() ? hadoopBin : path + ":" + hadoopBin;
        if (path.find(hadoopSbin) == std::string::npos)
            path += ":" + hadoopSbin;
        env.set("PATH", path);
        if (!extraClasspath.empty())
            env.set("HADOOP_EXTRA_CLASSPATH", joinStrings(extraClasspath, ":"));
        env.set("HADOOP_LIBEXEC_DIR", hadoopHome + "/libexec");
        env.set("HADOOP_INSTALL", hadoopHome);
        env.set("HADOOP_HOME", hadoopHome);
        env.set("HADOOP_COMMON_HOME", hadoopHome);
        env.set("HADOOP_HDFS_HOME", hadoopHome);
        env.set("HADOOP_MAPRED_HOME", hadoopHome);
        env.set("HADOOP_MAPRED_LOG_DIR", m_distConfig.resolvePath("mapred_log_dir"));
        env.set("HADOOP_YARN_HOME", hadoopHome);
        env.set("HADOOP_CONF_DIR", m_distConfig.resolvePath("hadoop_conf"));
        env.set("YARN_LOG_DIR", m_distConfig.resolvePath("yarn_log_dir"));
        env.set("HADOOP_LOG_DIR", m_distConfig.resolvePath("hdfs_log_dir"));
    });

    editLinesInPlace(getConfPath("hadoop-env.sh"), {LineSubstitution("export JAVA_HOME *=.*", "export JAVA_HOME=" + javaHome)});
}


void HadoopBase::registerSlaves(const std::vector<std::string> &slaves)
{
    std::string slavesFile = getConfPath("slaves");
    std::ofstream out(slavesFile.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        throw DeployException("Unable to open " + slavesFile + " for writing");
    out << "# DO NOT EDIT\n";
    out << "# This file is automatically managed by hadoopdeploy\n";
    for (auto it = slaves.begin(); it != slaves.end(); ++it)
    {
        out << *it << "\n";
    }
    out.close();
    if (!out)
        throw DeployException("Unable to write " + slavesFile);
    m_host.changeOwner(slavesFile, "ubuntu", "hadoop");
}


// LZO support is shipped separately and may have been unpacked into the install root
std::vector<std::string> HadoopBase::findLzoJars() const
{
    std::vector<std::string> jars;
    fs::path root = m_distConfig.resolvePath("hadoop");
    if (!fs::is_directory(root))
        return jars;

    boost::system::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
    {
        std::string name = it->path().filename().string();
        if (startsWith(name, "hadoop-lzo-") && endsWith(name, ".jar") && fs::is_regular_file(it->path()))
            jars.push_back(it->path().string());
    }
    return jars;
}


std::string HadoopBase::getConfPath(const std::string &filename) const
{
    return (fs::path(m_distConfig.resolvePath("hadoop_conf")) / filename).string();
}


std::string HadoopBase::run(const std::string &user, const std::string &command, const std::vector<std::string> &args)
{
    std::vector<std::string> cmd;
    cmd.push_back((fs::path(m_distConfig.resolvePath("hadoop")) / command).string());
    cmd.insert(cmd.end(), args.begin(), args.end());
    return m_runner.checkOutput(user, cmd);
}


CommandResult HadoopBase::runUnchecked(const std::string &user, const std::string &command, const std::vector<std::string> &args)
{
    std::vector<std::string> cmd;
    cmd.push_back((fs::path(m_distConfig.resolvePath("hadoop")) / command).string());
    cmd.insert(cmd.end(), args.begin(), args.end());
    return m_runner.execute(CommandRequest(user, cmd));
}

}
