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

#include <string>
#include <cstdint>
#include <optional>
#include <iostream>

namespace p2plink
{
    /**
     * @brief Parse dotted-quad IPv4 text.
     *
     * @return The address in host byte order, or std::nullopt if the text is not a valid address.
     */
    std::optional<uint32_t> ParseIpv4Address(const std::string &text);

    std::string FormatIpv4Address(uint32_t address);

    /**
     * @brief An IPv4 subnet, e.g. 192.168.49.0/24.
     */
    class Ipv4Subnet
    {
    public:
        Ipv4Subnet() {}
        Ipv4Subnet(uint32_t baseAddress, int prefixLength);

        /**
         * @brief Parse "n.n.n.n/nn" notation.
         *
         * @throws std::invalid_argument on malformed input.
         */
        static Ipv4Subnet Parse(const std::string &text);

        bool Contains(const std::string &address) const;
        bool Contains(uint32_t address) const;

        /**
         * @brief The address of host number `host` within the subnet.
         *
         * e.g. HostAddress(12) on 192.168.49.0/24 returns "192.168.49.12".
         * @throws std::out_of_range if the host number does not fit in the subnet.
         */
        std::string HostAddress(uint32_t host) const;

        uint32_t BaseAddress() const { return baseAddress; }
        int PrefixLength() const { return prefixLength; }
        uint32_t Mask() const;

        std::string ToString() const;

        bool operator==(const Ipv4Subnet &other) const
        {
            return baseAddress == other.baseAddress && prefixLength == other.prefixLength;
        }

    private:
        uint32_t baseAddress = 0;
        int prefixLength = 32;
    };

    inline std::ostream &operator<<(std::ostream &s, const Ipv4Subnet &subnet)
    {
        s << subnet.ToString();
        return s;
    }
}
