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

#include "includes/Ipv4Subnet.h"
#include "includes/P2pUtil.h"
#include <stdexcept>
#include <arpa/inet.h>
#include "ss.h"

using namespace p2plink;

std::optional<uint32_t> p2plink::ParseIpv4Address(const std::string &text)
{
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
    {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string p2plink::FormatIpv4Address(uint32_t address)
{
    struct in_addr addr;
    addr.s_addr = htonl(address);
    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr)
    {
        throw std::logic_error("inet_ntop failed.");
    }
    return buffer;
}

Ipv4Subnet::Ipv4Subnet(uint32_t baseAddress, int prefixLength)
    : prefixLength(prefixLength)
{
    if (prefixLength < 0 || prefixLength > 32)
    {
        throw std::invalid_argument(SS("Invalid prefix length: " << prefixLength));
    }
    this->baseAddress = baseAddress & Mask();
}

uint32_t Ipv4Subnet::Mask() const
{
    if (prefixLength == 0)
        return 0;
    return 0xFFFFFFFFu << (32 - prefixLength);
}

Ipv4Subnet Ipv4Subnet::Parse(const std::string &text)
{
    auto slash = text.find('/');
    if (slash == std::string::npos)
    {
        throw std::invalid_argument("Expecting n.n.n.n/nn: " + text);
    }
    auto address = ParseIpv4Address(text.substr(0, slash));
    if (!address)
    {
        throw std::invalid_argument("Invalid IPv4 address: " + text);
    }
    int prefix;
    try
    {
        prefix = toInt<int>(text.substr(slash + 1));
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("Invalid prefix length: " + text);
    }
    return Ipv4Subnet(*address, prefix);
}

bool Ipv4Subnet::Contains(uint32_t address) const
{
    return (address & Mask()) == baseAddress;
}

bool Ipv4Subnet::Contains(const std::string &address) const
{
    auto parsed = ParseIpv4Address(address);
    return parsed.has_value() && Contains(*parsed);
}

std::string Ipv4Subnet::HostAddress(uint32_t host) const
{
    if ((host & Mask()) != 0)
    {
        throw std::out_of_range(SS("Host " << host << " is outside " << ToString()));
    }
    return FormatIpv4Address(baseAddress | host);
}

std::string Ipv4Subnet::ToString() const
{
    return SS(FormatIpv4Address(baseAddress) << "/" << prefixLength);
}
