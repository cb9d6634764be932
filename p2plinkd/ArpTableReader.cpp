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

#include "includes/ArpTableReader.h"
#include "includes/P2pUtil.h"
#include "cotask/CoTask.h"
#include <fstream>
#include <sstream>
#include "ss.h"

using namespace p2plink;
using namespace cotask;

std::vector<ArpEntry> p2plink::ParseArpTable(const std::string &text)
{
    // IP address       HW type     Flags       HW address            Mask     Device
    // 192.168.49.23    0x1         0x2         a2:15:e5:0d:91:b2     *        p2p-wlan0-0

    std::vector<ArpEntry> result;
    std::istringstream s(text);
    std::string line;
    bool header = true;
    while (std::getline(s, line))
    {
        if (header)
        {
            header = false;
            continue;
        }
        auto fields = splitWhitespace(line);
        if (fields.size() < 6)
        {
            continue;
        }
        if (!ParseIpv4Address(fields[0]))
        {
            continue;
        }
        ArpEntry entry;
        entry.ip = fields[0];
        entry.hwType = fields[1];
        entry.flags = fields[2];
        entry.hwAddress = fields[3];
        entry.mask = fields[4];
        entry.device = fields[5];
        result.push_back(std::move(entry));
    }
    return result;
}

ArpTableReader::ArpTableReader(const std::filesystem::path &arpTablePath)
    : arpTablePath(arpTablePath)
{
}

std::vector<ArpEntry> ArpTableReader::ReadArpTable()
{
    std::ifstream f(arpTablePath);
    if (!f.is_open())
    {
        Dispatcher().Log().Warning(SS("Can't read " << arpTablePath.string()));
        return std::vector<ArpEntry>();
    }
    std::stringstream s;
    s << f.rdbuf();
    if (f.bad())
    {
        Dispatcher().Log().Warning(SS("Error reading " << arpTablePath.string()));
        return std::vector<ArpEntry>();
    }
    return ParseArpTable(s.str());
}

static bool IsCandidate(const ArpEntry &entry, const Ipv4Subnet &subnet, const std::string &ownAddress)
{
    return entry.ip != ownAddress && subnet.Contains(entry.ip);
}

std::optional<ArpEntry> ArpTableReader::FindByMac(
    const std::vector<ArpEntry> &entries,
    const std::string &hwAddress,
    const Ipv4Subnet &subnet,
    const std::string &ownAddress)
{
    for (const auto &entry : entries)
    {
        if (caseInsensitiveEquals(entry.hwAddress, hwAddress) && IsCandidate(entry, subnet, ownAddress))
        {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<ArpEntry> ArpTableReader::FindAnyInSubnet(
    const std::vector<ArpEntry> &entries,
    const Ipv4Subnet &subnet,
    const std::string &ownAddress)
{
    for (const auto &entry : entries)
    {
        if (IsCandidate(entry, subnet, ownAddress))
        {
            return entry;
        }
    }
    return std::nullopt;
}
