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

#include "includes/PeerConnectionApi.h"
#include "includes/LinkExceptions.h"
#include "includes/ReachabilityProbe.h"
#include "includes/RetryScheduler.h"
#include "includes/ArpTableReader.h"
#include <deque>
#include <set>
#include <vector>
#include <atomic>
#include <thread>
#include <stdexcept>

// Scripted stand-ins for the platform, used by the unit tests.

namespace p2plink::test
{
    using namespace cotask;
    using namespace std::chrono_literals;

    class FakePeerConnectionApi : public IPeerConnectionApi
    {
    public:
        static constexpr int SUCCEED = -1;

        // Results of successive calls. Once a queue runs dry, calls succeed (or return the default).
        std::deque<int> connectResults;
        std::deque<int> discoverResults;
        std::deque<int> removeGroupResults;
        std::deque<std::optional<ConnectionInfo>> connectionInfos;
        std::optional<ConnectionInfo> defaultConnectionInfo;
        std::deque<std::optional<GroupInfo>> groupInfos;
        std::optional<GroupInfo> defaultGroupInfo;

        std::vector<std::string> connectPeers;
        std::vector<int> goIntents;
        int discoverCount = 0;
        int removeGroupCount = 0;
        int connectionInfoRequests = 0;
        int groupInfoRequests = 0;

        virtual CoTask<> Connect(const std::string peerAddress, int goIntent) override
        {
            connectPeers.push_back(peerAddress);
            goIntents.push_back(goIntent);
            ThrowIfFailed(connectResults, "connect");
            co_return;
        }
        virtual CoTask<> DiscoverPeers() override
        {
            ++discoverCount;
            ThrowIfFailed(discoverResults, "discoverPeers");
            co_return;
        }
        virtual CoTask<std::optional<ConnectionInfo>> RequestConnectionInfo() override
        {
            ++connectionInfoRequests;
            if (connectionInfos.empty())
            {
                co_return defaultConnectionInfo;
            }
            auto result = connectionInfos.front();
            connectionInfos.pop_front();
            co_return result;
        }
        virtual CoTask<std::optional<GroupInfo>> RequestGroupInfo() override
        {
            ++groupInfoRequests;
            if (groupInfos.empty())
            {
                co_return defaultGroupInfo;
            }
            auto result = groupInfos.front();
            groupInfos.pop_front();
            co_return result;
        }
        virtual CoTask<> RemoveGroup() override
        {
            ++removeGroupCount;
            ThrowIfFailed(removeGroupResults, "removeGroup");
            co_return;
        }

        static ConnectionInfo GroupOwnerInfo()
        {
            return ConnectionInfo{true, true, ""};
        }
        static GroupInfo GroupWithClient(const std::string &deviceAddress)
        {
            GroupInfo result;
            result.isGroupOwner = true;
            result.interfaceName = "p2p-wlan0-0";
            result.clients.push_back(ConnectedClient(deviceAddress));
            return result;
        }

    private:
        static void ThrowIfFailed(std::deque<int> &results, const char *operation)
        {
            if (results.empty())
            {
                return;
            }
            int result = results.front();
            results.pop_front();
            if (result != SUCCEED)
            {
                throw P2pOperationException(result, operation);
            }
        }
    };

    /**
     * Completes delays immediately, recording what was asked for.
     */
    class RecordingRetryScheduler : public RetryScheduler
    {
    public:
        std::vector<milliseconds> delays;
        std::vector<milliseconds> scheduled;

        virtual CoTask<> Delay(milliseconds delay) override
        {
            delays.push_back(delay);
            co_return;
        }
        virtual uint64_t Schedule(milliseconds delay, std::function<void(void)> continuation) override
        {
            scheduled.push_back(delay);
            return Dispatcher().PostDelayedFunction(0ms, std::move(continuation));
        }

        size_t CountDelays(milliseconds delay) const
        {
            size_t count = 0;
            for (auto d : delays)
            {
                if (d == delay)
                    ++count;
            }
            return count;
        }
    };

    class FakeProbe : public IReachabilityProbe
    {
    public:
        std::set<std::string> reachable;
        std::set<std::string> failing;
        std::vector<std::string> probed;

        virtual CoTask<bool> IsReachable(const std::string ip, std::chrono::milliseconds timeout) override
        {
            probed.push_back(ip);
            if (failing.contains(ip))
            {
                throw std::runtime_error("Network unreachable");
            }
            co_return reachable.contains(ip);
        }
    };

    /**
     * Probes that block a worker thread for a while, tracking how many run at once.
     */
    class BackgroundProbe : public IReachabilityProbe
    {
    public:
        std::atomic<int> inFlight = 0;
        std::atomic<int> maxInFlight = 0;
        std::atomic<int> probeCount = 0;

        virtual CoTask<bool> IsReachable(const std::string ip, std::chrono::milliseconds timeout) override
        {
            co_await CoBackground();
            int current = ++inFlight;
            int observed = maxInFlight.load();
            while (current > observed && !maxInFlight.compare_exchange_weak(observed, current))
            {
            }
            ++probeCount;
            std::this_thread::sleep_for(20ms);
            --inFlight;
            co_await CoForeground();
            co_return false;
        }
    };

    class FakeArpTableReader : public ArpTableReader
    {
    public:
        // Successive reads return successive tables; the last one repeats.
        std::deque<std::string> tables;
        int readCount = 0;

        virtual std::vector<ArpEntry> ReadArpTable() override
        {
            ++readCount;
            if (tables.empty())
            {
                return std::vector<ArpEntry>();
            }
            std::string table = tables.front();
            if (tables.size() > 1)
            {
                tables.pop_front();
            }
            return ParseArpTable(table);
        }
    };

    inline const char *ARP_HEADER = "IP address       HW type     Flags       HW address            Mask     Device\n";

    inline std::string ArpRow(const std::string &ip, const std::string &hwAddress, const std::string &device = "p2p-wlan0-0")
    {
        return ip + "    0x1         0x2         " + hwAddress + "     *        " + device + "\n";
    }
}
