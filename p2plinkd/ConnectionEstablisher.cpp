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

#include "includes/ConnectionEstablisher.h"
#include "includes/LinkExceptions.h"
#include "includes/P2pUtil.h"
#include "ss.h"

using namespace p2plink;
using namespace cotask;

ConnectionEstablisher::ConnectionEstablisher(
    IPeerConnectionApi &api,
    GroupFormationWatcher &groupFormationWatcher,
    ClientAddressResolver &clientAddressResolver,
    RetryScheduler &retryScheduler,
    const LinkConfiguration &config)
    : api(api),
      groupFormationWatcher(groupFormationWatcher),
      clientAddressResolver(clientAddressResolver),
      retryScheduler(retryScheduler),
      config(config)
{
}

ConnectionEstablisher::~ConnectionEstablisher()
{
    for (uint64_t handle : pendingConnects)
    {
        retryScheduler.Cancel(handle);
    }
}

std::string ConnectionEstablisher::PeerKey(const std::string &peerAddress)
{
    return ansiToLower(peerAddress);
}

bool ConnectionEstablisher::IsInProgress(const std::string &peerAddress) const
{
    return linksInProgress.contains(PeerKey(peerAddress));
}

CoTask<> ConnectionEstablisher::Rediscover()
{
    try
    {
        co_await api.DiscoverPeers();
        Dispatcher().Log().Debug("Peer discovery refresh triggered.");
    }
    catch (const std::exception &e)
    {
        Dispatcher().Log().Warning(SS("Peer discovery refresh failed: " << e.what()));
    }
}

CoTask<> ConnectionEstablisher::ConnectWithRetries(const std::string peerAddress)
{
    for (int attempt = 1;; ++attempt)
    {
        int goIntent = config.GoIntentForAttempt(attempt);
        Dispatcher().Log().Info(SS("connect() attempt " << attempt << "/" << config.maxConnectRetries << " (GO intent=" << goIntent << ")"));

        int errorCode = P2pErrorCode::ERROR;
        try
        {
            co_await api.Connect(peerAddress, goIntent);
            Dispatcher().Log().Info(SS("Connection initiated (attempt " << attempt << "), waiting for group."));
            co_return;
        }
        catch (const P2pOperationException &e)
        {
            errorCode = e.code();
        }

        if (attempt >= config.maxConnectRetries)
        {
            Dispatcher().Log().Error(SS("Connection failed: " << ErrorCodeName(errorCode) << " (after " << attempt << " attempt(s))"));
            throw ConnectFailedException(errorCode);
        }
        Dispatcher().Log().Warning(SS("connect() returned " << ErrorCodeName(errorCode) << " (attempt " << attempt << "/" << config.maxConnectRetries << ")"));

        if (config.rediscoverPeersOnRetry)
        {
            // The peer may have dropped out of the discovered peer cache.
            Dispatcher().StartThread(Rediscover());
            co_await retryScheduler.Delay(config.peerRediscoveryDelay);
        }
        else
        {
            co_await retryScheduler.Delay(config.connectRetryDelay);
        }
    }
}

CoTask<bool> ConnectionEstablisher::TryRemoveGroup()
{
    try
    {
        co_await api.RemoveGroup();
        Dispatcher().Log().Info("P2P group removed.");
        co_return true;
    }
    catch (const std::exception &e)
    {
        Dispatcher().Log().Error(SS("Failed to remove P2P group. " << e.what()));
    }
    co_return false;
}

CoTask<std::string> ConnectionEstablisher::ResolveGroupClient(const std::string peerAddress)
{
    GroupInfo groupInfo = co_await groupFormationWatcher.AwaitGroupInfo();
    ConnectedClient &client = GroupFormationWatcher::LocateClient(groupInfo, peerAddress);
    std::optional<std::string> ip = co_await clientAddressResolver.Resolve(client);
    if (!ip)
    {
        throw AddressResolutionFailedException();
    }
    co_return *ip;
}

CoTask<std::string> ConnectionEstablisher::CoEstablishLink(const std::string peerAddress)
{
    std::string key = PeerKey(peerAddress);
    if (linksInProgress.contains(key))
    {
        Dispatcher().Log().Warning(SS("Connection already in progress: " << peerAddress));
        throw ConnectionInProgressException(peerAddress);
    }
    linksInProgress.insert(key);
    auto inProgressGuard = finally([this, key]() {
        linksInProgress.erase(key);
    });

    co_await ConnectWithRetries(peerAddress);

    co_await retryScheduler.Delay(config.connectionRetryDelay);
    ConnectionInfo connectionInfo = co_await groupFormationWatcher.AwaitGroupFormation();

    if (!connectionInfo.isGroupOwner)
    {
        if (connectionInfo.groupOwnerAddress.empty())
        {
            Dispatcher().Log().Error("Group owner address is not available.");
            throw GroupFormationException("Group owner address unavailable");
        }
        Dispatcher().Log().Info(SS("Connected (client mode). Peer IP: " << connectionInfo.groupOwnerAddress));
        co_return connectionInfo.groupOwnerAddress;
    }

    Dispatcher().Log().Info("This device is group owner. Resolving the client's address.");
    std::string ip;
    std::exception_ptr failure;
    std::string cleanupFailedMessage;
    try
    {
        ip = co_await ResolveGroupClient(peerAddress);
    }
    catch (const LinkException &e)
    {
        failure = std::current_exception();
        cleanupFailedMessage = e.CleanupFailedMessage();
    }
    catch (const std::exception &e)
    {
        failure = std::current_exception();
        cleanupFailedMessage = SS(e.what() << ", cleanup failed");
    }
    if (failure)
    {
        bool removed = co_await TryRemoveGroup();
        if (!removed)
        {
            throw CleanupFailedException(cleanupFailedMessage);
        }
        std::rethrow_exception(failure);
    }
    Dispatcher().Log().Info(SS("Connected (GO mode). Client IP: " << ip));
    co_return ip;
}

CoTask<> ConnectionEstablisher::RunLink(const std::string peerAddress, std::shared_ptr<LinkResult> result)
{
    std::string ip;
    std::string failureMessage;
    bool succeeded = false;
    try
    {
        ip = co_await CoEstablishLink(peerAddress);
        succeeded = true;
    }
    catch (const std::exception &e)
    {
        failureMessage = e.what();
    }
    if (succeeded)
    {
        result->Connected(ip);
    }
    else
    {
        result->Failed(failureMessage);
    }
}

void ConnectionEstablisher::InitiateConnection(const std::string &peerAddress, ConnectedCallback onConnected, FailureCallback onFailure)
{
    auto result = std::make_shared<LinkResult>(std::move(onConnected), std::move(onFailure));
    Dispatcher().StartThread(RunLink(peerAddress, result));
}

CoTask<std::chrono::milliseconds> ConnectionEstablisher::CoRemoveStaleGroup()
{
    int errorCode = P2pErrorCode::ERROR;
    try
    {
        co_await api.RemoveGroup();
        Dispatcher().Log().Info(SS("Previous group removed. Waiting " << config.postRemoveGroupDelay.count() << "ms."));
        co_return config.postRemoveGroupDelay;
    }
    catch (const P2pOperationException &e)
    {
        errorCode = e.code();
    }
    if (errorCode == P2pErrorCode::BUSY)
    {
        Dispatcher().Log().Warning(SS("Group removal returned BUSY. Waiting " << config.postRemoveBusyDelay.count() << "ms."));
        co_return config.postRemoveBusyDelay;
    }
    // ERROR usually means there was no previous group.
    Dispatcher().Log().Debug(SS("No previous group (" << ErrorCodeName(errorCode) << ")."));
    co_return config.postRemoveGroupDelay / 2;
}

CoTask<> ConnectionEstablisher::RunConnect(const std::string peerAddress, ConnectedCallback onConnected, FailureCallback onFailure)
{
    std::string key = PeerKey(peerAddress);
    if (linksInProgress.contains(key))
    {
        Dispatcher().Log().Warning(SS("Connection already in progress: " << peerAddress));
        LinkResult result{std::move(onConnected), std::move(onFailure)};
        result.Failed(ConnectionInProgressException(peerAddress).what());
        co_return;
    }
    // The peer stays reserved until the link flow takes over.
    linksInProgress.insert(key);

    std::chrono::milliseconds settleDelay{0};
    std::string failureMessage;
    bool failed = false;
    try
    {
        settleDelay = co_await CoRemoveStaleGroup();
    }
    catch (const std::exception &e)
    {
        failureMessage = e.what();
        failed = true;
    }
    if (failed)
    {
        linksInProgress.erase(key);
        LinkResult result{std::move(onConnected), std::move(onFailure)};
        result.Failed(failureMessage);
        co_return;
    }

    auto handle = std::make_shared<uint64_t>(0);
    *handle = retryScheduler.Schedule(
        settleDelay,
        [this, handle, key, peerAddress, onConnected = std::move(onConnected), onFailure = std::move(onFailure)]() {
            pendingConnects.erase(*handle);
            linksInProgress.erase(key);
            InitiateConnection(peerAddress, onConnected, onFailure);
        });
    pendingConnects.insert(*handle);
}

void ConnectionEstablisher::Connect(const std::string &peerAddress, ConnectedCallback onConnected, FailureCallback onFailure)
{
    Dispatcher().StartThread(RunConnect(peerAddress, std::move(onConnected), std::move(onFailure)));
}

CoTask<> ConnectionEstablisher::CoDisconnect()
{
    Dispatcher().Log().Info("Disconnecting P2P group.");
    co_await api.RemoveGroup();
    Dispatcher().Log().Info("P2P group removed.");
}

CoTask<> ConnectionEstablisher::RunDisconnect(std::function<void(void)> onComplete)
{
    try
    {
        co_await CoDisconnect();
    }
    catch (const std::exception &e)
    {
        Dispatcher().Log().Warning(SS("Failed to remove P2P group. " << e.what()));
    }
    if (onComplete)
    {
        Dispatcher().PostDelayedFunction(0ms, std::move(onComplete));
    }
}

void ConnectionEstablisher::Disconnect(std::function<void(void)> onComplete)
{
    Dispatcher().StartThread(RunDisconnect(std::move(onComplete)));
}
