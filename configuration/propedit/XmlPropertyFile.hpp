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

#ifndef _HADOOPDEPLOY_XMLPROPERTYFILE_HPP_
#define _HADOOPDEPLOY_XMLPROPERTYFILE_HPP_

#include <functional>
#include <map>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include "PropertyMap.hpp"

namespace hadoopDeploy
{

//
// Edits a Hadoop XML property file of the form
//
//     <configuration>
//         <property>
//             <name>property-name</name>
//             <value>property-value</value>
//             <description>Optional property description</description>
//         </property>
//     </configuration>
//
// The session parses the file on construction and exposes the name/value pairs
// through props(). On commit the original and final name sets are compared:
// added names become new properties (no description), changed values are updated
// in place, removed names are dropped and everything else is written back as it
// was. Indentation between elements is dropped and rewritten with a 4-space
// layout; the text of leaf elements (values, descriptions) is kept verbatim.
// The file is not locked; callers serialize access.
class XmlPropertyEditSession
{
    public:

        explicit XmlPropertyEditSession(const std::string &filename);
        ~XmlPropertyEditSession();
        PropertyMap &props() { return m_props; }
        void commit();
        bool isCommitted() const { return m_committed; }


    protected:

        void load();
        void applyChanges(boost::property_tree::ptree &root) const;
        std::string render() const;


    private:

        std::string m_filename;
        std::string m_rootName;
        boost::property_tree::ptree m_document;
        PropertyMap m_props;
        std::map<std::string, std::string> m_originalValues;
        bool m_committed;

        XmlPropertyEditSession(const XmlPropertyEditSession &);
        XmlPropertyEditSession &operator=(const XmlPropertyEditSession &);
};


//
// Runs editor inside a session and commits. Errors from the editor or from
// writing the file propagate; the file is still rewritten if the editor throws.
void editXmlProperties(const std::string &filename, const std::function<void(PropertyMap &)> &editor);
PropertyMap readXmlProperties(const std::string &filename);

}

#endif
