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

#ifndef _HADOOPDEPLOY_LINEEDITOR_HPP_
#define _HADOOPDEPLOY_LINEEDITOR_HPP_

#include <string>
#include <utility>
#include <vector>

namespace hadoopDeploy
{

// (ECMAScript pattern, replacement using $1 group references)
typedef std::pair<std::string, std::string> LineSubstitution;

//
// Applies every substitution to each line of the file, in order. Line endings
// are kept as they were. When appendNonMatches is set, the replacement of any
// pattern that matched no line is appended to the end of the file.
void editLinesInPlace(const std::string &filename, const std::vector<LineSubstitution> &subs, bool appendNonMatches = false);

}

#endif
