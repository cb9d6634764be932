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
#include "TestFakes.h"
#include <iostream>
#include <cassert>

using namespace p2plink;
using namespace p2plink::test;
using namespace std;

static const std::string PEER = "aa:bb:cc:dd:ee:ff";

template <typename SCHEDULER>
struct EstablisherFixture
{
    EstablisherFixture(const LinkConfiguration &config = LinkConfiguration())
        : config(config)
    {
        api.defaultConnectionInfo = FakePeerConnectionApi::GroupOwnerInfo();
        api.defaultGroupInfo = FakePeerConnectionApi::GroupWithClient(PEER);
    }
    LinkConfiguration config;
    FakePeerConnectionApi api;
    FakeArpTableReader arp;
    FakeProbe probe;
    SCHEDULER retryScheduler;
    SubnetScanner scanner{probe, config.scanBatchSize, config.probeTimeout};
    GroupFormationWatcher watcher{api, retryScheduler, config};
    ClientAddressResolver resolver{arp, scanner, retryScheduler, config};
    ConnectionEstablisher establisher{api, watcher, resolver, retryScheduler, config};

    int connectedCount = 0;
    int failedCount = 0;
    std::string result;

    void Initiate(const std::string &peer = PEER)
    {
        establisher.InitiateConnection(
            peer,
            [this](const std::string &ip) {
                ++connectedCount;
                result = ip;
            },
            [this](const std::string &message) {
                ++failedCount;
                result = message;
            });
    }
    void Connect(const std::string &peer = PEER)
    {
        establisher.Connect(
            peer,
            [this](const std::string &ip) {
                ++connectedCount;
                result = ip;
            },
            [this](const std::string &message) {
                ++failedCount;
                result = message;
            });
    }
    void PumpUntilFired()
    {
        while (connectedCount + failedCount == 0)
        {
            Dispatcher().PumpMessages(true);
        }
        // Nothing else may arrive afterwards.
        Dispatcher().PumpUntilIdle();
        assert(connectedCount + failedCount == 1);
    }
};

using RecordingFixture = EstablisherFixture<RecordingRetryScheduler>;

static void PumpFor(std::chrono::milliseconds duration)
{
    auto end = CoDispatcher::Now() + duration;
    while (CoDispatcher::Now() < end)
    {
        Dispatcher().PumpMessages(true);
    }
}

static LinkConfiguration ClientModeConfig()
{
    LinkConfiguration config;
    config.connectionRetryDelay = 20ms;
    config.postRemoveGroupDelay = 200ms;
    config.postRemoveBusyDelay = 300ms;
    return config;
}

void RetryAfterRediscoveryTest()
{
    cout << "--- RetryAfterRediscoveryTest" << endl;
    {
        LinkConfiguration config;
        config.maxConnectRetries = 3;
        RecordingFixture f(config);
        f.api.connectResults = {7};
        f.arp.tables = {std::string(ARP_HEADER) +
                        ArpRow("192.168.49.1", "11:11:11:11:11:11") +
                        ArpRow("192.168.49.12", "de:ad:be:ef:00:01")};

        f.Initiate();
        f.PumpUntilFired();

        assert(f.connectedCount == 1);
        assert(f.result == "192.168.49.12");
        assert(f.api.connectPeers.size() == 2);
        assert(f.api.discoverCount == 1);
        assert(f.retryScheduler.CountDelays(config.peerRediscoveryDelay) == 1);
        assert(f.api.removeGroupCount == 0);
        assert(!f.establisher.IsInProgress(PEER));
        assert(ErrorCodeName(7) == "UNKNOWN_7");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- RetryAfterRediscoveryTest Done" << endl;
}

void RetriesExhaustedTest()
{
    cout << "--- RetriesExhaustedTest" << endl;
    {
        RecordingFixture f;
        f.api.connectResults = {P2pErrorCode::BUSY, P2pErrorCode::ERROR, P2pErrorCode::ERROR, P2pErrorCode::P2P_UNSUPPORTED, P2pErrorCode::BUSY};
        bool thrown = false;
        try
        {
            f.establisher.CoEstablishLink(PEER).GetResult();
        }
        catch (const ConnectFailedException &e)
        {
            thrown = true;
            assert(e.code() == P2pErrorCode::BUSY);
            assert(std::string(e.what()) == "Connection failed: BUSY");
        }
        assert(thrown);
        // Low group owner intent for the first two attempts, high afterwards.
        assert((f.api.goIntents == std::vector<int>{0, 0, 15, 15, 15}));
        assert(f.api.discoverCount == 4);
        assert(f.retryScheduler.CountDelays(f.config.peerRediscoveryDelay) == 4);
        assert(f.api.connectionInfoRequests == 0);
        assert(f.api.removeGroupCount == 0);
    }
    {
        LinkConfiguration config;
        config.rediscoverPeersOnRetry = false;
        RecordingFixture f(config);
        f.api.connectResults = {P2pErrorCode::ERROR, P2pErrorCode::ERROR};
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};

        assert(f.establisher.CoEstablishLink(PEER).GetResult() == "192.168.49.1");
        assert(f.api.connectPeers.size() == 3);
        assert(f.api.discoverCount == 0);
        assert(f.retryScheduler.CountDelays(config.connectRetryDelay) == 2);
    }
    {
        // A failed rediscovery doesn't stop the retry.
        RecordingFixture f;
        f.api.connectResults = {P2pErrorCode::BUSY};
        f.api.discoverResults = {P2pErrorCode::ERROR};
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};
        assert(f.establisher.CoEstablishLink(PEER).GetResult() == "192.168.49.1");
        assert(f.api.discoverCount == 1);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- RetriesExhaustedTest Done" << endl;
}

void ScanFallbackTest()
{
    cout << "--- ScanFallbackTest" << endl;
    {
        RecordingFixture f;
        f.probe.reachable = {"192.168.49.40"};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.connectedCount == 1);
        assert(f.result == "192.168.49.40");
        assert(f.retryScheduler.CountDelays(f.config.arpRetryDelay) == 3);
        assert(f.api.removeGroupCount == 0);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- ScanFallbackTest Done" << endl;
}

void ResolutionFailedTest()
{
    cout << "--- ResolutionFailedTest" << endl;
    {
        RecordingFixture f;
        f.Initiate();
        f.PumpUntilFired();
        assert(f.failedCount == 1);
        assert(f.result == "Could not resolve client IP");
        assert(f.api.removeGroupCount == 1);
        assert(f.probe.probed.size() == 253);
        assert(!f.establisher.IsInProgress(PEER));
    }
    {
        RecordingFixture f;
        f.api.removeGroupResults = {P2pErrorCode::BUSY};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.failedCount == 1);
        assert(f.result == "Could not resolve client IP, cleanup failed");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- ResolutionFailedTest Done" << endl;
}

void GroupFailuresTest()
{
    cout << "--- GroupFailuresTest" << endl;
    {
        RecordingFixture f;
        f.api.defaultGroupInfo->clients.clear();
        f.Initiate();
        f.PumpUntilFired();
        assert(f.result == "GO with no clients, removed group");
        assert(f.api.removeGroupCount == 1);
        assert(f.api.groupInfoRequests == f.config.maxGroupInfoAttempts);
    }
    {
        RecordingFixture f;
        f.api.defaultGroupInfo->clients.clear();
        f.api.removeGroupResults = {P2pErrorCode::ERROR};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.result == "GO with no clients, cleanup failed");
    }
    {
        RecordingFixture f;
        f.api.defaultGroupInfo = std::nullopt;
        f.Initiate();
        f.PumpUntilFired();
        assert(f.result == "GO mode: group info unavailable");
        assert(f.api.removeGroupCount == 1);
    }
    {
        RecordingFixture f;
        f.api.defaultGroupInfo = FakePeerConnectionApi::GroupWithClient("11:22:33:44:55:66");
        f.Initiate();
        f.PumpUntilFired();
        assert(f.result == "Client not found in group: " + PEER);
        assert(f.api.removeGroupCount == 1);
    }
    {
        RecordingFixture f;
        f.api.defaultConnectionInfo = ConnectionInfo{};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.failedCount == 1);
        assert(f.result == "P2P group not formed");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- GroupFailuresTest Done" << endl;
}

void ClientModeTest()
{
    cout << "--- ClientModeTest" << endl;
    {
        RecordingFixture f;
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.connectedCount == 1);
        assert(f.result == "192.168.49.1");
        assert(f.api.groupInfoRequests == 0);
        assert(f.arp.readCount == 0);
    }
    {
        RecordingFixture f;
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, ""};
        f.Initiate();
        f.PumpUntilFired();
        assert(f.failedCount == 1);
        assert(f.result == "Group owner address unavailable");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- ClientModeTest Done" << endl;
}

void InProgressTest()
{
    cout << "--- InProgressTest" << endl;
    {
        EstablisherFixture<RetryScheduler> f(ClientModeConfig());
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};

        // Suspends in the group formation delay.
        CoTask<std::string> first = f.establisher.CoEstablishLink(PEER);
        assert(f.establisher.IsInProgress("AA:BB:CC:DD:EE:FF"));

        CoTask<std::string> second = f.establisher.CoEstablishLink("AA:BB:CC:DD:EE:FF");
        bool thrown = false;
        try
        {
            second.GetResult();
        }
        catch (const ConnectionInProgressException &e)
        {
            thrown = true;
            assert(std::string(e.what()) == "Connection already in progress: AA:BB:CC:DD:EE:FF");
        }
        assert(thrown);

        assert(first.GetResult() == "192.168.49.1");
        assert(!f.establisher.IsInProgress(PEER));
        assert(f.api.connectPeers.size() == 1);

        // The peer can be linked again once the first attempt is over.
        assert(f.establisher.CoEstablishLink(PEER).GetResult() == "192.168.49.1");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- InProgressTest Done" << endl;
}

void ConnectWhileInProgressTest()
{
    cout << "--- ConnectWhileInProgressTest" << endl;
    {
        // A link in flight keeps its group.
        EstablisherFixture<RetryScheduler> f(ClientModeConfig());
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};

        CoTask<std::string> first = f.establisher.CoEstablishLink(PEER);
        assert(f.establisher.IsInProgress(PEER));

        f.Connect("AA:BB:CC:DD:EE:FF");
        f.PumpUntilFired();
        assert(f.failedCount == 1);
        assert(f.result == "Connection already in progress: AA:BB:CC:DD:EE:FF");
        assert(f.api.removeGroupCount == 0);

        assert(first.GetResult() == "192.168.49.1");
        assert(f.api.connectPeers.size() == 1);
    }
    {
        // A connect waiting out the stale group settle delay holds the peer too.
        EstablisherFixture<RetryScheduler> f(ClientModeConfig());
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};

        f.Connect();
        assert(f.api.removeGroupCount == 1);
        assert(f.establisher.IsInProgress(PEER));

        f.Connect();
        while (f.connectedCount == 0)
        {
            Dispatcher().PumpMessages(true);
        }
        Dispatcher().PumpUntilIdle();
        assert(f.failedCount == 1);
        assert(f.connectedCount == 1);
        assert(f.result == "192.168.49.1");
        assert(f.api.removeGroupCount == 1);
        assert(f.api.connectPeers.size() == 1);
        assert(!f.establisher.IsInProgress(PEER));
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- ConnectWhileInProgressTest Done" << endl;
}

void RemoveStaleGroupTest()
{
    cout << "--- RemoveStaleGroupTest" << endl;
    {
        RecordingFixture f(ClientModeConfig());
        f.api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};
        f.api.removeGroupResults = {P2pErrorCode::BUSY};
        f.Connect();
        f.PumpUntilFired();
        assert(f.connectedCount == 1);
        assert(f.api.removeGroupCount == 1);
        assert(f.retryScheduler.scheduled.size() == 1);
        assert(f.retryScheduler.scheduled[0] == f.config.postRemoveBusyDelay);
    }
    {
        RecordingFixture f(ClientModeConfig());
        assert(f.establisher.CoRemoveStaleGroup().GetResult() == f.config.postRemoveGroupDelay);
        f.api.removeGroupResults = {P2pErrorCode::ERROR};
        assert(f.establisher.CoRemoveStaleGroup().GetResult() == f.config.postRemoveGroupDelay / 2);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- RemoveStaleGroupTest Done" << endl;
}

void CancelPendingConnectTest()
{
    cout << "--- CancelPendingConnectTest" << endl;
    {
        LinkConfiguration config = ClientModeConfig();
        FakePeerConnectionApi api;
        api.defaultConnectionInfo = ConnectionInfo{true, false, "192.168.49.1"};
        FakeArpTableReader arp;
        FakeProbe probe;
        RetryScheduler retryScheduler;
        SubnetScanner scanner{probe, config.scanBatchSize, config.probeTimeout};
        GroupFormationWatcher watcher{api, retryScheduler, config};
        ClientAddressResolver resolver{arp, scanner, retryScheduler, config};

        int callbacks = 0;
        {
            ConnectionEstablisher establisher{api, watcher, resolver, retryScheduler, config};
            establisher.Connect(
                PEER,
                [&callbacks](const std::string &) { ++callbacks; },
                [&callbacks](const std::string &) { ++callbacks; });
            assert(api.removeGroupCount == 1);
            assert(api.connectPeers.empty());
        }
        // The scheduled connect died with the establisher.
        PumpFor(400ms);
        assert(api.connectPeers.empty());
        assert(callbacks == 0);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- CancelPendingConnectTest Done" << endl;
}

void DisconnectTest()
{
    cout << "--- DisconnectTest" << endl;
    {
        RecordingFixture f;
        int completed = 0;
        f.api.removeGroupResults = {P2pErrorCode::ERROR};
        f.establisher.Disconnect([&completed]() { ++completed; });
        while (completed == 0)
        {
            Dispatcher().PumpMessages(true);
        }
        f.establisher.Disconnect([&completed]() { ++completed; });
        while (completed == 1)
        {
            Dispatcher().PumpMessages(true);
        }
        Dispatcher().PumpUntilIdle();
        assert(completed == 2);
        assert(f.api.removeGroupCount == 2);

        bool thrown = false;
        f.api.removeGroupResults = {P2pErrorCode::BUSY};
        try
        {
            f.establisher.CoDisconnect().GetResult();
        }
        catch (const P2pOperationException &e)
        {
            thrown = true;
            assert(e.code() == P2pErrorCode::BUSY);
        }
        assert(thrown);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- DisconnectTest Done" << endl;
}

int main(int argc, char **argv)
{
    RetryAfterRediscoveryTest();
    RetriesExhaustedTest();
    ScanFallbackTest();
    ResolutionFailedTest();
    GroupFailuresTest();
    ClientModeTest();
    InProgressTest();
    ConnectWhileInProgressTest();
    RemoveStaleGroupTest();
    CancelPendingConnectTest();
    DisconnectTest();
    return 0;
}
