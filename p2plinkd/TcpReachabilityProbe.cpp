/*
 * MIT License
 * 
 * Copyright (c) 2022 Robin E. R. Davies
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "includes/ReachabilityProbe.h"
#include "includes/Ipv4Subnet.h"
#include "includes/P2pUtil.h"
#include "cotask/CoExceptions.h"
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "ss.h"

using namespace p2plink;
using namespace cotask;

TcpReachabilityProbe::TcpReachabilityProbe(int port)
    : port(port)
{
}

static bool HostAnswered(int error)
{
    return error == 0 || error == ECONNREFUSED;
}

bool TcpReachabilityProbe::Probe(const std::string &ip, std::chrono::milliseconds timeout)
{
    auto address = ParseIpv4Address(ip);
    if (!address)
    {
        throw std::invalid_argument("Not an IPv4 address: " + ip);
    }
    struct sockaddr_in sa;
    memset(&sa, 0, sizeof(sa));
    sa.sin_family = AF_INET;
    sa.sin_port = htons((uint16_t)port);
    sa.sin_addr.s_addr = htonl(*address);

    int s = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (s == -1)
    {
        CoIoException::ThrowErrno("socket");
    }
    auto closeSocket = finally([s]() {
        close(s);
    });

    if (connect(s, (struct sockaddr *)&sa, sizeof(sa)) == 0)
    {
        return true;
    }
    if (errno != EINPROGRESS)
    {
        // EHOSTUNREACH, ENETUNREACH &c.
        return HostAnswered(errno);
    }

    struct pollfd pfd;
    pfd.fd = s;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int rc;
    do
    {
        rc = poll(&pfd, 1, (int)timeout.count());
    } while (rc == -1 && errno == EINTR);

    if (rc == -1)
    {
        CoIoException::ThrowErrno("poll");
    }
    if (rc == 0)
    {
        return false;
    }
    int soError = 0;
    socklen_t soErrorLength = sizeof(soError);
    if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soError, &soErrorLength) != 0)
    {
        CoIoException::ThrowErrno("getsockopt");
    }
    return HostAnswered(soError);
}

CoTask<bool> TcpReachabilityProbe::IsReachable(const std::string ip, std::chrono::milliseconds timeout)
{
    bool result = false;
    std::exception_ptr exception;

    co_await CoBackground();
    try
    {
        result = Probe(ip, timeout);
    }
    catch (...)
    {
        exception = std::current_exception();
    }
    co_await CoForeground();

    if (exception)
    {
        std::rethrow_exception(exception);
    }
    co_return result;
}
