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
#include "TestFakes.h"
#include <iostream>
#include <cassert>

using namespace p2plink;
using namespace p2plink::test;
using namespace std;

struct WatcherFixture
{
    LinkConfiguration config;
    FakePeerConnectionApi api;
    RecordingRetryScheduler retryScheduler;
    GroupFormationWatcher watcher{api, retryScheduler, config};
};

void GroupFormedTest()
{
    cout << "--- GroupFormedTest" << endl;
    {
        WatcherFixture f;
        f.api.connectionInfos = {std::nullopt, ConnectionInfo{}, FakePeerConnectionApi::GroupOwnerInfo()};
        ConnectionInfo info = f.watcher.AwaitGroupFormation().GetResult();
        assert(info.groupFormed);
        assert(info.isGroupOwner);
        assert(f.api.connectionInfoRequests == 3);
        assert(f.retryScheduler.CountDelays(f.config.connectionRetryDelay) == 2);
    }
    {
        WatcherFixture f;
        f.api.connectionInfos = {ConnectionInfo{true, false, "192.168.49.1"}};
        ConnectionInfo info = f.watcher.AwaitGroupFormation().GetResult();
        assert(!info.isGroupOwner);
        assert(info.groupOwnerAddress == "192.168.49.1");
        assert(f.retryScheduler.delays.empty());
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- GroupFormedTest Done" << endl;
}

static std::string GroupFormationFailure(WatcherFixture &f)
{
    try
    {
        f.watcher.AwaitGroupFormation().GetResult();
    }
    catch (const GroupFormationException &e)
    {
        return e.what();
    }
    return "";
}

void GroupNotFormedTest()
{
    cout << "--- GroupNotFormedTest" << endl;
    {
        WatcherFixture f;
        f.api.defaultConnectionInfo = ConnectionInfo{};
        assert(GroupFormationFailure(f) == "P2P group not formed");
        assert(f.api.connectionInfoRequests == f.config.maxConnectionAttempts);
        assert(f.retryScheduler.delays.size() == (size_t)(f.config.maxConnectionAttempts - 1));
    }
    {
        WatcherFixture f;
        assert(GroupFormationFailure(f) == "Connection info unavailable");
        assert(f.api.connectionInfoRequests == f.config.maxConnectionAttempts);
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- GroupNotFormedTest Done" << endl;
}

void GroupInfoTest()
{
    cout << "--- GroupInfoTest" << endl;
    {
        WatcherFixture f;
        GroupInfo emptyGroup = FakePeerConnectionApi::GroupWithClient("x");
        emptyGroup.clients.clear();
        f.api.groupInfos = {std::nullopt, emptyGroup, FakePeerConnectionApi::GroupWithClient("aa:bb:cc:dd:ee:ff")};

        GroupInfo groupInfo = f.watcher.AwaitGroupInfo().GetResult();
        assert(groupInfo.clients.size() == 1);
        assert(f.api.groupInfoRequests == 3);
    }
    {
        WatcherFixture f;
        bool thrown = false;
        try
        {
            f.watcher.AwaitGroupInfo().GetResult();
        }
        catch (const GroupInfoUnavailableException &e)
        {
            thrown = true;
            assert(std::string(e.what()) == "GO mode: group info unavailable");
        }
        assert(thrown);
        assert(f.api.groupInfoRequests == f.config.maxGroupInfoAttempts);
    }
    {
        WatcherFixture f;
        f.api.defaultGroupInfo = FakePeerConnectionApi::GroupWithClient("x");
        f.api.defaultGroupInfo->clients.clear();
        bool thrown = false;
        try
        {
            f.watcher.AwaitGroupInfo().GetResult();
        }
        catch (const NoClientsException &e)
        {
            thrown = true;
            assert(std::string(e.what()) == "GO with no clients, removed group");
            assert(e.CleanupFailedMessage() == "GO with no clients, cleanup failed");
        }
        assert(thrown);
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- GroupInfoTest Done" << endl;
}

void LocateClientTest()
{
    cout << "--- LocateClientTest" << endl;
    GroupInfo groupInfo = FakePeerConnectionApi::GroupWithClient("11:22:33:44:55:66");
    groupInfo.clients.push_back(ConnectedClient("AA:BB:CC:DD:EE:FF"));

    ConnectedClient &client = GroupFormationWatcher::LocateClient(groupInfo, "aa:bb:cc:dd:ee:ff");
    assert(&client == &groupInfo.clients[1]);

    bool thrown = false;
    try
    {
        GroupFormationWatcher::LocateClient(groupInfo, "99:99:99:99:99:99");
    }
    catch (const ClientNotFoundException &e)
    {
        thrown = true;
        assert(std::string(e.what()) == "Client not found in group: 99:99:99:99:99:99");
    }
    assert(thrown);
    cout << "--- LocateClientTest Done" << endl;
}

int main(int argc, char **argv)
{
    GroupFormedTest();
    GroupNotFormedTest();
    GroupInfoTest();
    LocateClientTest();
    return 0;
}
