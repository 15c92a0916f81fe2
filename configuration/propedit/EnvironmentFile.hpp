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

#ifndef _HADOOPDEPLOY_ENVIRONMENTFILE_HPP_
#define _HADOOPDEPLOY_ENVIRONMENTFILE_HPP_

#include <functional>
#include <string>
#include "PropertyMap.hpp"

namespace hadoopDeploy
{

//
// Edits a flat KEY=value file such as /etc/environment. Values may be quoted
// on read; every value is written back double quoted, and the whole file is
// regenerated from the final map. The file is not locked.
class EnvironmentEditSession
{
    public:

        explicit EnvironmentEditSession(const std::string &filename = "/etc/environment");
        ~EnvironmentEditSession();
        PropertyMap &env() { return m_env; }
        void commit();


    private:

        std::string m_filename;
        PropertyMap m_env;
        bool m_committed;

        EnvironmentEditSession(const EnvironmentEditSession &);
        EnvironmentEditSession &operator=(const EnvironmentEditSession &);
};


void editEnvironmentFile(const std::string &filename, const std::function<void(PropertyMap &)> &editor);
PropertyMap parseEnvironmentFile(const std::string &filename);

//
// The file's entries over the *_proxy variables of this process, as used for
// the environment of commands run on behalf of other users
PropertyMap readEnvironmentFile(const std::string &filename = "/etc/environment");

}

#endif
