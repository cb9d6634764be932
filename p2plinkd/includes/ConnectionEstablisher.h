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

#include "PeerConnectionApi.h"
#include "GroupFormationWatcher.h"
#include "ClientAddressResolver.h"
#include "RetryScheduler.h"
#include "LinkConfiguration.h"
#include "LinkResult.h"
#include <set>
#include <memory>

namespace p2plink
{
    /**
     * @brief Establishes a P2P link to a peer and determines the peer's IP address.
     *
     * connect() failures are retried up to config.maxConnectRetries times, with a peer discovery
     * refresh before each retry. Once a group forms: if this device is the group owner, the
     * connected client is located and its address resolved; otherwise the group owner's address
     * is the result. Failures after the group has formed remove the group.
     *
     * At most one link per peer is established at a time. Must be used from the foreground thread.
     */
    class ConnectionEstablisher
    {
    public:
        ConnectionEstablisher(
            IPeerConnectionApi &api,
            GroupFormationWatcher &groupFormationWatcher,
            ClientAddressResolver &clientAddressResolver,
            RetryScheduler &retryScheduler,
            const LinkConfiguration &config);
        ~ConnectionEstablisher();

        /**
         * @brief Start establishing a link.
         *
         * Exactly one of onConnected(ip) or onFailure(message) is called from the message loop.
         */
        void InitiateConnection(const std::string &peerAddress, ConnectedCallback onConnected, FailureCallback onFailure);

        /**
         * @brief Remove any stale group, wait for the P2P stack to settle, then InitiateConnection().
         */
        void Connect(const std::string &peerAddress, ConnectedCallback onConnected, FailureCallback onFailure);

        /**
         * @brief Remove the current group.
         *
         * Failures are logged. onComplete is always called, once.
         */
        void Disconnect(std::function<void(void)> onComplete);

        /**
         * @brief Establish a link.
         *
         * @return The peer's IP address.
         * @throws ConnectionInProgressException if a link to the peer is already being established.
         * @throws ConnectFailedException if every connect attempt failed.
         * @throws LinkException for failures after the group formed.
         */
        CoTask<std::string> CoEstablishLink(const std::string peerAddress);

        /**
         * @brief Remove a group left over from a previous session.
         *
         * @return How long to wait before connecting.
         */
        CoTask<std::chrono::milliseconds> CoRemoveStaleGroup();

        CoTask<> CoDisconnect();

        bool IsInProgress(const std::string &peerAddress) const;

    private:
        CoTask<> ConnectWithRetries(const std::string peerAddress);
        CoTask<std::string> ResolveGroupClient(const std::string peerAddress);
        CoTask<> Rediscover();
        CoTask<bool> TryRemoveGroup();

        CoTask<> RunLink(const std::string peerAddress, std::shared_ptr<LinkResult> result);
        CoTask<> RunConnect(const std::string peerAddress, ConnectedCallback onConnected, FailureCallback onFailure);
        CoTask<> RunDisconnect(std::function<void(void)> onComplete);

        static std::string PeerKey(const std::string &peerAddress);

        IPeerConnectionApi &api;
        GroupFormationWatcher &groupFormationWatcher;
        ClientAddressResolver &clientAddressResolver;
        RetryScheduler &retryScheduler;
        const LinkConfiguration config;

        std::set<std::string> linksInProgress;
        std::set<uint64_t> pendingConnects;
    };
}
