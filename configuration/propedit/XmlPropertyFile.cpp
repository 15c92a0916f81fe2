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
#include <boost/property_tree/xml_parser.hpp>

#include "XmlPropertyFile.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace pt = boost::property_tree;

namespace hadoopDeploy
{

static const char *c_propertyElement = "property";


//
// Text collected on an element with children is the layout between them. Leaf
// text is left untouched, whitespace included.
static void dropLayoutWhitespace(pt::ptree &tree)
{
    if (tree.empty())
        return;
    if (tree.data().find_first_not_of(" \t\r\n") == std::string::npos)
        tree.data().clear();
    for (auto it = tree.begin(); it != tree.end(); ++it)
    {
        dropLayoutWhitespace(it->second);
    }
}


static std::string getChildText(const pt::ptree &tree, const std::string &childName)
{
    auto it = tree.find(childName);
    if (it == tree.not_found())
        return "";
    return it->second.data();
}


XmlPropertyEditSession::XmlPropertyEditSession(const std::string &filename) :
    m_filename(filename), m_committed(false)
{
    load();
}


XmlPropertyEditSession::~XmlPropertyEditSession()
{
    if (!m_committed)
    {
        try
        {
            commit();
        }
        catch (const std::exception &e)
        {
            OERRLOG("Unable to write %s: %s", m_filename.c_str(), e.what());
        }
    }
}


static void loadPropertyDocument(const std::string &filename, pt::ptree &document, std::string &rootName, PropertyMap &props)
{
    std::ifstream in(filename.c_str());
    if (!in)
        throw ParseException("Unable to open property file " + filename);

    try
    {
        pt::read_xml(in, document, pt::xml_parser::no_comments);
    }
    catch (const pt::xml_parser_error &e)
    {
        throw ParseException("Unable to read/parse property file " + filename + ". Error = " + e.what());
    }
    dropLayoutWhitespace(document);

    //
    // The first element is the configuration root; declarations and processing
    // instructions are not kept by the parser
    for (auto it = document.begin(); it != document.end() && rootName.empty(); ++it)
    {
        if (it->first.empty() || it->first[0] != '<')
            rootName = it->first;
    }
    if (rootName.empty())
        throw ParseException("No root element found in property file " + filename);

    const pt::ptree &root = document.find(rootName)->second;
    for (auto it = root.begin(); it != root.end(); ++it)
    {
        if (it->first != c_propertyElement)
            continue;
        std::string name = getChildText(it->second, "name");
        if (name.empty())
            throw ParseException("Property without a name found in " + filename);
        props.set(name, getChildText(it->second, "value"));
    }
}


void XmlPropertyEditSession::load()
{
    loadPropertyDocument(m_filename, m_document, m_rootName, m_props);
    for (auto it = m_props.begin(); it != m_props.end(); ++it)
    {
        m_originalValues[it->name] = it->value;
    }
}


void XmlPropertyEditSession::applyChanges(pt::ptree &root) const
{
    //
    // Update or drop the existing entries in place, keeping their position and
    // any other child elements (description, final, ...)
    for (auto it = root.begin(); it != root.end(); )
    {
        if (it->first != c_propertyElement)
        {
            ++it;
            continue;
        }
        std::string name = getChildText(it->second, "name");
        if (!m_props.has(name) || m_props.isNoValue(name))
        {
            it = root.erase(it);
            continue;
        }
        std::string value = m_props.get(name);
        if (value != getChildText(it->second, "value"))
            it->second.put("value", value);
        ++it;
    }

    for (auto it = m_props.begin(); it != m_props.end(); ++it)
    {
        if (it->noValue || m_originalValues.find(it->name) != m_originalValues.end())
            continue;
        pt::ptree prop;
        prop.put("name", it->name);
        prop.put("value", it->value);
        root.push_back(std::make_pair(c_propertyElement, prop));
    }
}


std::string XmlPropertyEditSession::render() const
{
    pt::ptree root = m_document.find(m_rootName)->second;
    applyChanges(root);

    pt::ptree document;
    document.push_back(std::make_pair(m_rootName, root));
    std::ostringstream out;
    pt::write_xml(out, document, pt::xml_writer_make_settings<std::string>(' ', 4));
    return out.str();
}


void XmlPropertyEditSession::commit()
{
    //
    // Marked first so a failed write is not retried from the destructor
    m_committed = true;
    std::string content = render();

    std::ofstream out(m_filename.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        throw DeployException("Unable to open " + m_filename + " for writing");
    out << content;
    out.flush();
    if (!out)
        throw DeployException("Unable to write " + m_filename);
    DBGLOG("Updated property file %s", m_filename.c_str());
}


void editXmlProperties(const std::string &filename, const std::function<void(PropertyMap &)> &editor)
{
    XmlPropertyEditSession session(filename);
    editor(session.props());
    session.commit();
}


PropertyMap readXmlProperties(const std::string &filename)
{
    pt::ptree document;
    std::string rootName;
    PropertyMap props;
    loadPropertyDocument(filename, document, rootName, props);
    return props;
}

}
