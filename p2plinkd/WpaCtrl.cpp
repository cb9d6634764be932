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

#include "includes/WpaCtrl.h"
#include "includes/WpaExceptions.h"
#include "includes/P2pUtil.h"
#include "cotask/Os.h"
#include <stdexcept>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/time.h>
#include <unistd.h>
#include "ss.h"

using namespace p2plink;

#define CTRL_IFACE_CLIENT_DIR "/tmp"
#define CTRL_IFACE_CLIENT_PREFIX "p2plink-"

static WpaIoException ErrnoException(const std::string &context)
{
    int errNo = errno;
    return WpaIoException(errNo, SS(context << ": " << strerror(errNo)));
}

WpaCtrl::~WpaCtrl()
{
    Close();
}

void WpaCtrl::Open(const std::filesystem::path &socketPath, std::chrono::milliseconds timeout)
{
    Close();
    this->socketName = socketPath.string();

    struct sockaddr_un local;
    struct sockaddr_un dest;
    memset(&local, 0, sizeof(local));
    memset(&dest, 0, sizeof(dest));

    std::string clientPath = SS(CTRL_IFACE_CLIENT_DIR "/" CTRL_IFACE_CLIENT_PREFIX << cotask::os::MakeUuid());
    if (clientPath.length() >= sizeof(local.sun_path) - 1)
    {
        throw std::invalid_argument("Socket name too long: " + clientPath);
    }
    if (socketName.length() >= sizeof(dest.sun_path) - 1)
    {
        throw std::invalid_argument("Socket name too long: " + socketName);
    }

    int s = socket(PF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (s == -1)
    {
        throw ErrnoException("socket");
    }
    bool bound = false;
    auto socketCleanup = finally([&]() {
        close(s);
        if (bound)
        {
            std::error_code ec;
            std::filesystem::remove(clientPath, ec);
        }
    });

    local.sun_family = AF_UNIX;
    memcpy(local.sun_path, clientPath.c_str(), clientPath.length());
    if (bind(s, (struct sockaddr *)&local, sizeof(local)) < 0)
    {
        throw ErrnoException("bind " + clientPath);
    }
    bound = true;

    dest.sun_family = AF_UNIX;
    memcpy(dest.sun_path, socketName.c_str(), socketName.length());
    if (connect(s, (struct sockaddr *)&dest, sizeof(dest)) < 0)
    {
        throw ErrnoException("connect " + socketName);
    }

    struct timeval tv;
    tv.tv_sec = (time_t)(timeout.count() / 1000);
    tv.tv_usec = (suseconds_t)((timeout.count() % 1000) * 1000);
    if (setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        throw ErrnoException("setsockopt");
    }

    socketCleanup.disable();
    this->sock = s;
    this->localPath = clientPath;
}

void WpaCtrl::Close()
{
    if (sock != -1)
    {
        close(sock);
        sock = -1;
        std::error_code ec;
        std::filesystem::remove(localPath, ec);
        localPath.clear();
    }
}

std::string WpaCtrl::Request(const std::string &command)
{
    std::lock_guard lock{requestMutex};
    if (sock == -1)
    {
        throw WpaIoException(EBADF, "Not open: " + socketName);
    }
    if (send(sock, command.c_str(), command.length(), 0) < 0)
    {
        throw ErrnoException(SS("send " << socketName));
    }
    while (true)
    {
        ssize_t received = recv(sock, replyBuffer, sizeof(replyBuffer) - 1, 0);
        if (received < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                throw WpaTimedOutException();
            }
            throw ErrnoException(SS("recv " << socketName));
        }
        replyBuffer[received] = '\0';
        if ((received > 0 && replyBuffer[0] == '<') || (received > 6 && strncmp(replyBuffer, "IFNAME=", 7) == 0))
        {
            throw std::logic_error("Received event message on a request socket.");
        }
        return std::string(replyBuffer, (size_t)received);
    }
}
