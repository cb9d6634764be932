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

#include "includes/SubnetScanner.h"
#include <stdexcept>
#include <cstdint>
#include "ss.h"

using namespace p2plink;
using namespace cotask;

SubnetScanner::SubnetScanner(IReachabilityProbe &probe, int batchSize, std::chrono::milliseconds probeTimeout)
    : probe(probe), batchSize(batchSize), probeTimeout(probeTimeout)
{
    if (batchSize <= 0)
    {
        throw std::invalid_argument("batchSize must be greater than zero.");
    }
}

std::vector<ScanBatch> SubnetScanner::MakeBatches(int firstHost, int lastHost, int batchSize)
{
    std::vector<ScanBatch> result;
    for (int64_t host = firstHost; host <= lastHost; host += batchSize)
    {
        int64_t last = host + batchSize - 1;
        if (last > lastHost)
            last = lastHost;
        result.push_back(ScanBatch{(int)host, (int)last});
    }
    return result;
}

CoTask<std::vector<ScanResult>> SubnetScanner::ProbeBatch(const Ipv4Subnet subnet, ScanBatch batch)
{
    std::vector<std::string> addresses;
    std::vector<CoTask<bool>> probes;
    probes.reserve((size_t)((int64_t)batch.lastHost - batch.firstHost + 1));

    for (int64_t host = batch.firstHost; host <= batch.lastHost; ++host)
    {
        addresses.push_back(subnet.HostAddress((uint32_t)host));
        probes.push_back(probe.IsReachable(addresses.back(), probeTimeout));
    }

    std::vector<ScanResult> results;
    results.reserve(probes.size());
    for (size_t i = 0; i < probes.size(); ++i)
    {
        bool reachable = false;
        try
        {
            CoTask<bool> &probeTask = probes[i];
            reachable = co_await probeTask;
        }
        catch (const std::exception &e)
        {
            Dispatcher().Log().Warning(SS("Probe of " << addresses[i] << " failed. " << e.what()));
        }
        results.push_back(ScanResult{addresses[i], reachable});
    }
    co_return results;
}

CoTask<std::optional<std::string>> SubnetScanner::Scan(const Ipv4Subnet subnet, int firstHost, int lastHost)
{
    auto &dispatcher = Dispatcher();
    if (dispatcher.GetThreadPoolSize() < (size_t)batchSize)
    {
        dispatcher.SetThreadPoolSize((size_t)batchSize);
    }

    for (const ScanBatch &batch : MakeBatches(firstHost, lastHost, batchSize))
    {
        Dispatcher().Log().Debug(SS("Scanning " << subnet.HostAddress((uint32_t)batch.firstHost) << " - " << subnet.HostAddress((uint32_t)batch.lastHost)));

        std::vector<ScanResult> results = co_await ProbeBatch(subnet, batch);
        for (const auto &result : results)
        {
            if (result.reachable)
            {
                Dispatcher().Log().Info(SS("Found reachable client at " << result.ip << " (subnet scan)"));
                co_return result.ip;
            }
        }
    }
    Dispatcher().Log().Warning(SS("No client found in subnet scan (" << firstHost << "-" << lastHost << ")"));
    co_return std::nullopt;
}
