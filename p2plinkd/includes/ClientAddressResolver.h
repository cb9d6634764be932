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
#include "ArpTableReader.h"
#include "SubnetScanner.h"
#include "RetryScheduler.h"
#include "LinkConfiguration.h"

namespace p2plink
{
    /**
     * @brief Determines the IP address of a client of a group owned by this device.
     *
     * Stages, in order, stopping at the first that succeeds:
     *   1. wait for the client's DHCP lease to settle;
     *   2. ARP lookup by the client's device address;
     *   3. any ARP entry on the group subnet other than our own address;
     *   4. stage 3 again, up to arpRetryCount times;
     *   5. a parallel scan of the group subnet.
     */
    class ClientAddressResolver
    {
    public:
        ClientAddressResolver(
            ArpTableReader &arpTableReader,
            SubnetScanner &subnetScanner,
            RetryScheduler &retryScheduler,
            const LinkConfiguration &config);

        /**
         * @brief Resolve the client's IP address.
         *
         * A client that already has an IP address returns it without running any stage. Otherwise
         * a successful result is stored in the client. `client` must outlive the returned task.
         * @return The address, or std::nullopt if every stage failed.
         */
        CoTask<std::optional<std::string>> Resolve(ConnectedClient &client);

        std::optional<std::string> LookupByMac(const std::string &hwAddress);
        std::optional<std::string> LookupAnyClient();

    private:
        CoTask<std::optional<std::string>> RunStages(const std::string deviceAddress);

        ArpTableReader &arpTableReader;
        SubnetScanner &subnetScanner;
        RetryScheduler &retryScheduler;
        const LinkConfiguration config;
    };
}
