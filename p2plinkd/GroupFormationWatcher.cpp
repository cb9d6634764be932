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

#include "includes/GroupFormationWatcher.h"
#include "includes/LinkExceptions.h"
#include "includes/P2pUtil.h"
#include "ss.h"

using namespace p2plink;
using namespace cotask;

GroupFormationWatcher::GroupFormationWatcher(IPeerConnectionApi &api, RetryScheduler &retryScheduler, const LinkConfiguration &config)
    : api(api), retryScheduler(retryScheduler), config(config)
{
}

CoTask<std::optional<ConnectionInfo>> GroupFormationWatcher::PollConnectionInfo(int attempt, bool *pSawConnectionInfo)
{
    std::optional<ConnectionInfo> info;
    try
    {
        info = co_await api.RequestConnectionInfo();
    }
    catch (const std::exception &e)
    {
        Dispatcher().Log().Warning(SS("Connection info request failed. " << e.what()));
    }
    *pSawConnectionInfo = info.has_value();
    if (!info)
    {
        Dispatcher().Log().Debug(SS("Connection info not available (" << attempt << "/" << config.maxConnectionAttempts << ")"));
        co_return std::nullopt;
    }
    Dispatcher().Log().Debug(SS("Connection info: groupFormed=" << info->groupFormed
                                << " isGroupOwner=" << info->isGroupOwner
                                << " groupOwnerAddress=" << info->groupOwnerAddress));
    if (!info->groupFormed)
    {
        Dispatcher().Log().Debug(SS("Group not formed yet (" << attempt << "/" << config.maxConnectionAttempts << ")"));
        co_return std::nullopt;
    }
    co_return info;
}

CoTask<ConnectionInfo> GroupFormationWatcher::AwaitGroupFormation()
{
    bool sawConnectionInfo = false;
    std::optional<ConnectionInfo> info = co_await retryScheduler.RetryUntilValue<ConnectionInfo>(
        config.maxConnectionAttempts,
        config.connectionRetryDelay,
        [this, &sawConnectionInfo](int attempt) {
            return PollConnectionInfo(attempt, &sawConnectionInfo);
        });
    if (!info)
    {
        if (sawConnectionInfo)
        {
            Dispatcher().Log().Error(SS("Group not formed after " << config.maxConnectionAttempts << " attempts."));
            throw GroupFormationException("P2P group not formed");
        }
        Dispatcher().Log().Error(SS("Connection info unavailable after " << config.maxConnectionAttempts << " attempts."));
        throw GroupFormationException("Connection info unavailable");
    }
    co_return *info;
}

CoTask<std::optional<GroupInfo>> GroupFormationWatcher::PollGroupInfo(int attempt, bool *pSawGroup)
{
    std::optional<GroupInfo> groupInfo;
    try
    {
        groupInfo = co_await api.RequestGroupInfo();
    }
    catch (const std::exception &e)
    {
        Dispatcher().Log().Warning(SS("Group info request failed. " << e.what()));
    }
    if (!groupInfo)
    {
        Dispatcher().Log().Debug(SS("Group info not available (" << attempt << "/" << config.maxGroupInfoAttempts << ")"));
        co_return std::nullopt;
    }
    *pSawGroup = true;
    Dispatcher().Log().Debug(SS("Group " << groupInfo->interfaceName << ": " << groupInfo->clients.size() << " client(s)"));
    if (groupInfo->clients.empty())
    {
        Dispatcher().Log().Debug(SS("No clients in group yet (" << attempt << "/" << config.maxGroupInfoAttempts << ")"));
        co_return std::nullopt;
    }
    co_return groupInfo;
}

CoTask<GroupInfo> GroupFormationWatcher::AwaitGroupInfo()
{
    bool sawGroup = false;
    std::optional<GroupInfo> groupInfo = co_await retryScheduler.RetryUntilValue<GroupInfo>(
        config.maxGroupInfoAttempts,
        config.connectionRetryDelay,
        [this, &sawGroup](int attempt) {
            return PollGroupInfo(attempt, &sawGroup);
        });
    if (!groupInfo)
    {
        if (sawGroup)
        {
            Dispatcher().Log().Error(SS("No clients connected after " << config.maxGroupInfoAttempts << " attempts."));
            throw NoClientsException();
        }
        Dispatcher().Log().Error(SS("Group info unavailable after " << config.maxGroupInfoAttempts << " attempts."));
        throw GroupInfoUnavailableException();
    }
    co_return std::move(*groupInfo);
}

ConnectedClient &GroupFormationWatcher::LocateClient(GroupInfo &groupInfo, const std::string &peerAddress)
{
    for (auto &client : groupInfo.clients)
    {
        if (caseInsensitiveEquals(client.DeviceAddress(), peerAddress))
        {
            return client;
        }
    }
    throw ClientNotFoundException(peerAddress);
}
