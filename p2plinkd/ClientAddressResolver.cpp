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
#include "ss.h"

using namespace p2plink;
using namespace cotask;

ClientAddressResolver::ClientAddressResolver(
    ArpTableReader &arpTableReader,
    SubnetScanner &subnetScanner,
    RetryScheduler &retryScheduler,
    const LinkConfiguration &config)
    : arpTableReader(arpTableReader),
      subnetScanner(subnetScanner),
      retryScheduler(retryScheduler),
      config(config)
{
}

std::optional<std::string> ClientAddressResolver::LookupByMac(const std::string &hwAddress)
{
    auto entry = ArpTableReader::FindByMac(
        arpTableReader.ReadArpTable(), hwAddress, config.groupSubnet, config.groupOwnerAddress);
    if (!entry)
    {
        Dispatcher().Log().Debug(SS(hwAddress << " not found in ARP table."));
        return std::nullopt;
    }
    Dispatcher().Log().Info(SS("Resolved client IP from ARP: " << entry->ip << " (" << hwAddress << ")"));
    return entry->ip;
}

std::optional<std::string> ClientAddressResolver::LookupAnyClient()
{
    auto entry = ArpTableReader::FindAnyInSubnet(
        arpTableReader.ReadArpTable(), config.groupSubnet, config.groupOwnerAddress);
    if (!entry)
    {
        Dispatcher().Log().Debug(SS("No client on " << config.groupSubnet << " in ARP table."));
        return std::nullopt;
    }
    Dispatcher().Log().Info(SS("Found client IP in ARP table: " << entry->ip << " on " << entry->device));
    return entry->ip;
}

CoTask<std::optional<std::string>> ClientAddressResolver::RunStages(const std::string deviceAddress)
{
    Dispatcher().Log().Debug(SS("Waiting " << config.dhcpSettleDelay.count() << "ms for client DHCP to settle."));
    co_await retryScheduler.Delay(config.dhcpSettleDelay);

    std::optional<std::string> ip = LookupByMac(deviceAddress);
    if (ip)
    {
        co_return ip;
    }
    // Device addresses and interface addresses differ when the client randomizes its MAC.
    ip = LookupAnyClient();
    if (ip)
    {
        co_return ip;
    }
    for (int retry = 1; retry <= config.arpRetryCount; ++retry)
    {
        Dispatcher().Log().Debug(SS("ARP miss. Retrying in " << config.arpRetryDelay.count() << "ms (" << retry << "/" << config.arpRetryCount << ")"));
        co_await retryScheduler.Delay(config.arpRetryDelay);
        ip = LookupAnyClient();
        if (ip)
        {
            co_return ip;
        }
    }
    co_return co_await subnetScanner.Scan(config.groupSubnet, config.scanFirstHost, config.scanLastHost);
}

CoTask<std::optional<std::string>> ClientAddressResolver::Resolve(ConnectedClient &client)
{
    if (client.ResolvedIp())
    {
        co_return client.ResolvedIp();
    }
    std::optional<std::string> ip = co_await RunStages(client.DeviceAddress());
    if (ip)
    {
        client.SetResolvedIp(*ip);
    }
    else
    {
        Dispatcher().Log().Error(SS("Could not resolve IP address of " << client.DeviceAddress()));
    }
    co_return ip;
}
