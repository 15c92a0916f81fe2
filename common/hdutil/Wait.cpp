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

#include <algorithm>
#include <thread>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Wait.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

namespace hadoopDeploy
{

void pollUntil(const std::function<bool()> &condition, std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval, const std::string &description)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return;
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero())
            break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(interval, remaining));
    }
    throw TimeoutException("Timed-out waiting for " + description);
}


static int millisecondsUntil(std::chrono::steady_clock::time_point deadline)
{
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
}


static bool connectAddress(const struct addrinfo *ai, std::chrono::steady_clock::time_point deadline)
{
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
        return false;

    bool connected = false;
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0)
    {
        connected = true;
    }
    else if (errno == EINPROGRESS)
    {
        struct pollfd pfd = { fd, POLLOUT, 0 };
        if (::poll(&pfd, 1, millisecondsUntil(deadline)) == 1)
        {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
                connected = true;
        }
    }
    ::close(fd);
    return connected;
}


//
// Every address shares the one deadline, so a name resolving to several
// addresses cannot multiply the wait
static bool connectBefore(const std::string &addr, unsigned port, std::chrono::steady_clock::time_point deadline)
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(addr.c_str(), service.c_str(), &hints, &result);
    if (rc != 0)
    {
        DBGLOG("Unable to resolve %s: %s", addr.c_str(), gai_strerror(rc));
        return false;
    }

    bool connected = false;
    for (struct addrinfo *ai = result; ai != nullptr && !connected && millisecondsUntil(deadline) > 0; ai = ai->ai_next)
    {
        connected = connectAddress(ai, deadline);
    }
    freeaddrinfo(result);
    return connected;
}


bool checkConnect(const std::string &addr, unsigned port, std::chrono::milliseconds connectTimeout)
{
    return connectBefore(addr, port, std::chrono::steady_clock::now() + connectTimeout);
}


void waitForConnect(const std::string &addr, unsigned port, std::chrono::milliseconds timeout, std::chrono::milliseconds interval)
{
    DBGLOG("Waiting for connection to %s on port %u", addr.c_str(), port);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto condition = [&]()
    {
        // one attempt never runs past the overall deadline
        auto attemptDeadline = std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(10000));
        return connectBefore(addr, port, attemptDeadline);
    };
    pollUntil(condition, timeout, interval, "connection to " + addr + " on port " + std::to_string(port));
}

}
