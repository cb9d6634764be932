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

#include "includes/ClientAddressResolver.h"
#include "TestFakes.h"
#include <iostream>
#include <cassert>

using namespace p2plink;
using namespace p2plink::test;
using namespace std;

static const std::string PEER = "aa:bb:cc:dd:ee:ff";

struct ResolverFixture
{
    LinkConfiguration config;
    FakeArpTableReader arp;
    FakeProbe probe;
    RecordingRetryScheduler retryScheduler;
    SubnetScanner scanner{probe, config.scanBatchSize, config.probeTimeout};
    ClientAddressResolver resolver{arp, scanner, retryScheduler, config};
};

void MacLookupTest()
{
    cout << "--- MacLookupTest" << endl;
    {
        ResolverFixture f;
        f.arp.tables = {std::string(ARP_HEADER) +
                        ArpRow("192.168.49.30", "22:22:22:22:22:22") +
                        ArpRow("192.168.49.12", "AA:BB:CC:DD:EE:FF")};
        ConnectedClient client(PEER);
        auto ip = f.resolver.Resolve(client).GetResult();
        assert(ip == "192.168.49.12");
        assert(client.ResolvedIp() == "192.168.49.12");
        assert(f.arp.readCount == 1);
        assert(f.retryScheduler.delays.size() == 1);
        assert(f.retryScheduler.delays[0] == f.config.dhcpSettleDelay);
        assert(f.probe.probed.empty());
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- MacLookupTest Done" << endl;
}

void AnyClientLookupTest()
{
    cout << "--- AnyClientLookupTest" << endl;
    {
        // The client's interface address differs from its device address.
        ResolverFixture f;
        f.arp.tables = {std::string(ARP_HEADER) +
                        ArpRow("192.168.49.1", "11:11:11:11:11:11") +
                        ArpRow("192.168.49.12", "de:ad:be:ef:00:01")};
        ConnectedClient client(PEER);
        auto ip = f.resolver.Resolve(client).GetResult();
        assert(ip == "192.168.49.12");
        assert(f.arp.readCount == 2);
        assert(f.retryScheduler.delays.size() == 1);
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- AnyClientLookupTest Done" << endl;
}

void ArpRetryTest()
{
    cout << "--- ArpRetryTest" << endl;
    {
        ResolverFixture f;
        std::string empty = ARP_HEADER;
        f.arp.tables = {empty, empty, empty,
                        std::string(ARP_HEADER) + ArpRow("192.168.49.77", "de:ad:be:ef:00:01")};
        ConnectedClient client(PEER);
        auto ip = f.resolver.Resolve(client).GetResult();
        assert(ip == "192.168.49.77");
        assert(f.arp.readCount == 4);
        assert(f.retryScheduler.delays.size() == 3);
        assert(f.retryScheduler.CountDelays(f.config.arpRetryDelay) == 2);
        assert(f.probe.probed.empty());
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- ArpRetryTest Done" << endl;
}

void ScanFallbackTest()
{
    cout << "--- ScanFallbackTest" << endl;
    {
        ResolverFixture f;
        f.arp.tables = {std::string(ARP_HEADER) + ArpRow("192.168.49.1", "11:11:11:11:11:11")};
        f.probe.reachable = {"192.168.49.40"};
        ConnectedClient client(PEER);
        auto ip = f.resolver.Resolve(client).GetResult();
        assert(ip == "192.168.49.40");
        assert(client.ResolvedIp() == "192.168.49.40");
        // MAC lookup, any-client lookup, then three retries.
        assert(f.arp.readCount == 5);
        assert(f.retryScheduler.CountDelays(f.config.arpRetryDelay) == 3);
        assert(f.probe.probed.size() == 50);
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- ScanFallbackTest Done" << endl;
}

void UnresolvedTest()
{
    cout << "--- UnresolvedTest" << endl;
    {
        ResolverFixture f;
        ConnectedClient client(PEER);
        auto ip = f.resolver.Resolve(client).GetResult();
        assert(!ip.has_value());
        assert(!client.ResolvedIp().has_value());
        assert(f.probe.probed.size() == 253);
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- UnresolvedTest Done" << endl;
}

void AlreadyResolvedTest()
{
    cout << "--- AlreadyResolvedTest" << endl;
    {
        ResolverFixture f;
        ConnectedClient client(PEER);
        client.SetResolvedIp("192.168.49.9");
        client.SetResolvedIp("192.168.49.9");

        auto ip = f.resolver.Resolve(client).GetResult();
        assert(ip == "192.168.49.9");
        assert(f.arp.readCount == 0);
        assert(f.retryScheduler.delays.empty());

        bool thrown = false;
        try
        {
            client.SetResolvedIp("192.168.49.10");
        }
        catch (const std::logic_error &)
        {
            thrown = true;
        }
        assert(thrown);
        assert(client.ResolvedIp() == "192.168.49.9");
    }
    cotask::CoDispatcher::DestroyDispatcher();
    cout << "--- AlreadyResolvedTest Done" << endl;
}

int main(int argc, char **argv)
{
    MacLookupTest();
    AnyClientLookupTest();
    ArpRetryTest();
    ScanFallbackTest();
    UnresolvedTest();
    AlreadyResolvedTest();
    return 0;
}
