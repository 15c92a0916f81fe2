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

#ifndef _HADOOPDEPLOY_WAIT_HPP_
#define _HADOOPDEPLOY_WAIT_HPP_

#include <chrono>
#include <functional>
#include <string>

namespace hadoopDeploy
{

const std::chrono::milliseconds defaultPollInterval(2000);

//
// Calls condition until it returns true, sleeping interval between attempts. Raises
// TimeoutException (with description in the message) once timeout has elapsed.
// The last sleep is cut short at the deadline, so the overrun is bounded by one
// evaluation of condition. Exceptions thrown by condition propagate.
void pollUntil(const std::function<bool()> &condition, std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval, const std::string &description);

//
// waitForConnect caps each connection attempt at 10 seconds and at the time left
// before timeout expires.
bool checkConnect(const std::string &addr, unsigned port, std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));
void waitForConnect(const std::string &addr, unsigned port, std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval = defaultPollInterval);

}

#endif
