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

#ifndef _HADOOPDEPLOY_LOG_HPP_
#define _HADOOPDEPLOY_LOG_HPP_

#include <string>

namespace hadoopDeploy
{

enum LogMsgClass
{
    MSGCLS_debug = 0,
    MSGCLS_progress,
    MSGCLS_warning,
    MSGCLS_error
};

//
// Adds a file sink (if logFile is not empty) alongside the console. Debug
// messages are only emitted when verbose is set.
void initLogging(const std::string &logFile, bool verbose);
void logMessage(LogMsgClass msgClass, const char *format, ...) __attribute__((format(printf, 2, 3)));

}

#define DBGLOG(...)  hadoopDeploy::logMessage(hadoopDeploy::MSGCLS_debug, __VA_ARGS__)
#define PROGLOG(...) hadoopDeploy::logMessage(hadoopDeploy::MSGCLS_progress, __VA_ARGS__)
#define WARNLOG(...) hadoopDeploy::logMessage(hadoopDeploy::MSGCLS_warning, __VA_ARGS__)
#define OERRLOG(...) hadoopDeploy::logMessage(hadoopDeploy::MSGCLS_error, __VA_ARGS__)

#endif
