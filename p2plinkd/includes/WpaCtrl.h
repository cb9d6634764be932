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

#pragma once

#include <string>
#include <filesystem>
#include <chrono>
#include <mutex>

namespace p2plink
{
    /**
     * @brief Request channel to a wpa_supplicant control socket.
     *
     * Unix datagram socket, after wpa_ctrl.c. Requests block the calling thread, so call
     * Request() from a worker-pool thread. Requests on one instance are serialized.
     * Event messages are not supported: the channel never ATTACHes.
     */
    class WpaCtrl
    {
        WpaCtrl(const WpaCtrl &) = delete;
        WpaCtrl &operator=(const WpaCtrl &) = delete;

    public:
        WpaCtrl() {}
        ~WpaCtrl();

        /**
         * @brief Open a connection to wpa_supplicant.
         *
         * @param socketPath Full path of the interface's control socket (e.g. /var/run/wpa_supplicant/wlan0).
         * @param timeout Maximum wait for a reply.
         * @throws WpaIoException on failure.
         */
        void Open(const std::filesystem::path &socketPath, std::chrono::milliseconds timeout);
        void Close();
        bool IsOpen() const { return sock != -1; }

        /**
         * @brief Send a request and wait for the reply.
         *
         * @param command A request, without trailing '\n'.
         * @return The reply text.
         * @throws WpaIoException on socket errors.
         * @throws WpaTimedOutException if wpa_supplicant does not reply in time.
         */
        std::string Request(const std::string &command);

    private:
        int sock = -1;
        std::string socketName;
        std::filesystem::path localPath;
        std::mutex requestMutex;
        char replyBuffer[4096];
    };
}
