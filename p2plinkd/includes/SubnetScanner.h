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
#include "ReachabilityProbe.h"
#include "Ipv4Subnet.h"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace p2plink
{
    using namespace cotask;

    struct ScanResult
    {
        std::string ip;
        bool reachable = false;
    };

    struct ScanBatch
    {
        int firstHost;
        int lastHost;
    };

    /**
     * @brief Finds a reachable host on a subnet by probing in parallel batches.
     *
     * One batch of probes is in flight at a time. The worker pool is grown to at least
     * the batch size before the first batch starts.
     */
    class SubnetScanner
    {
    public:
        SubnetScanner(IReachabilityProbe &probe, int batchSize, std::chrono::milliseconds probeTimeout);

        /**
         * @brief Probe hosts firstHost..lastHost (inclusive) of subnet.
         *
         * @return The lowest reachable address in the first batch that contains one, or
         * std::nullopt if no host answered.
         */
        CoTask<std::optional<std::string>> Scan(const Ipv4Subnet subnet, int firstHost, int lastHost);

        /**
         * @brief Probe one batch of hosts concurrently.
         *
         * Results are in ascending host order. A probe that throws is logged and reported as unreachable.
         */
        CoTask<std::vector<ScanResult>> ProbeBatch(const Ipv4Subnet subnet, ScanBatch batch);

        /**
         * @brief Partition firstHost..lastHost into batches of batchSize.
         */
        static std::vector<ScanBatch> MakeBatches(int firstHost, int lastHost, int batchSize);

    private:
        IReachabilityProbe &probe;
        int batchSize;
        std::chrono::milliseconds probeTimeout;
    };
}
