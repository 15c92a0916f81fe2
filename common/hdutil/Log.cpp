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

#include <stdarg.h>
#include <stdio.h>
#include <vector>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include "Log.hpp"

namespace logging = boost::log;

namespace hadoopDeploy
{

void initLogging(const std::string &logFile, bool verbose)
{
    logging::add_common_attributes();
    const char *format = "%TimeStamp% [%Severity%] %Message%";
    logging::add_console_log(std::clog, logging::keywords::format = format);
    if (!logFile.empty())
    {
        logging::add_file_log(logging::keywords::file_name = logFile,
                              logging::keywords::open_mode = std::ios_base::app,
                              logging::keywords::auto_flush = true,
                              logging::keywords::format = format);
    }
    logging::core::get()->set_filter(logging::trivial::severity >= (verbose ? logging::trivial::debug : logging::trivial::info));
}


void logMessage(LogMsgClass msgClass, const char *format, ...)
{
    va_list args;
    va_start(args, format);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int len = vsnprintf(nullptr, 0, format, args);
    va_end(args);

    std::string msg;
    if (len > 0)
    {
        std::vector<char> buffer(len + 1);
        vsnprintf(&buffer[0], buffer.size(), format, argsCopy);
        msg.assign(&buffer[0], len);
    }
    va_end(argsCopy);

    switch (msgClass)
    {
        case MSGCLS_debug:    BOOST_LOG_TRIVIAL(debug) << msg;   break;
        case MSGCLS_progress: BOOST_LOG_TRIVIAL(info) << msg;    break;
        case MSGCLS_warning:  BOOST_LOG_TRIVIAL(warning) << msg; break;
        case MSGCLS_error:    BOOST_LOG_TRIVIAL(error) << msg;   break;
    }
}

}
