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
#include "RetryScheduler.h"
#include "LinkConfiguration.h"

namespace p2plink
{
    /**
     * @brief Waits for a P2P group to form, and for its client list.
     */
    class GroupFormationWatcher
    {
    public:
        GroupFormationWatcher(IPeerConnectionApi &api, RetryScheduler &retryScheduler, const LinkConfiguration &config);

        /**
         * @brief Poll connection info until a group has formed.
         *
         * Up to config.maxConnectionAttempts polls, config.connectionRetryDelay apart.
         * @throws GroupFormationException when the attempts run out.
         */
        CoTask<ConnectionInfo> AwaitGroupFormation();

        /**
         * @brief Fetch group info, retrying until the group lists at least one client.
         *
         * Up to config.maxGroupInfoAttempts fetches, config.connectionRetryDelay apart.
         * @throws GroupInfoUnavailableException if no group info was ever returned.
         * @throws NoClientsException if the group never listed a client.
         */
        CoTask<GroupInfo> AwaitGroupInfo();

        /**
         * @brief Find the client whose device address matches peerAddress (case-insensitive).
         *
         * @throws ClientNotFoundException if the peer is not in the group.
         */
        static ConnectedClient &LocateClient(GroupInfo &groupInfo, const std::string &peerAddress);

    private:
        CoTask<std::optional<ConnectionInfo>> PollConnectionInfo(int attempt, bool *pSawConnectionInfo);
        CoTask<std::optional<GroupInfo>> PollGroupInfo(int attempt, bool *pSawGroup);

        IPeerConnectionApi &api;
        RetryScheduler &retryScheduler;
        const LinkConfiguration config;
    };
}
