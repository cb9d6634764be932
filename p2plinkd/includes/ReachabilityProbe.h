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

#include "cotask/CoTask.h"
#include <string>
#include <chrono>

namespace p2plink
{
    using namespace cotask;

    /**
     * @brief Checks whether a host answers on the network.
     */
    class IReachabilityProbe
    {
    public:
        virtual ~IReachabilityProbe() {}

        /**
         * @brief Probe a host.
         *
         * Completes on the foreground dispatcher.
         * @param ip Dotted-quad IPv4 address.
         * @param timeout Maximum time to wait for an answer.
         * @return true if the host answered within the timeout.
         */
        virtual CoTask<bool> IsReachable(const std::string ip, std::chrono::milliseconds timeout) = 0;
    };

    /**
     * @brief Reachability via a non-blocking TCP connect.
     *
     * A completed connection or a refused connection (RST) both mean that the host answered.
     * The blocking part of the probe runs on the dispatcher's worker pool.
     */
    class TcpReachabilityProbe : public IReachabilityProbe
    {
    public:
        TcpReachabilityProbe(int port = 7);

        virtual CoTask<bool> IsReachable(const std::string ip, std::chrono::milliseconds timeout) override;

        /**
         * @brief Synchronous form of IsReachable(); blocks the calling thread.
         *
         * @throws CoIoException if a socket can't be created.
         * @throws std::invalid_argument if ip is not an IPv4 address.
         */
        bool Probe(const std::string &ip, std::chrono::milliseconds timeout);

    private:
        int port;
    };
}
