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
#include <vector>
#include <optional>
#include <filesystem>
#include "Ipv4Subnet.h"

namespace p2plink
{
    /**
     * @brief One row of the kernel ARP cache.
     */
    struct ArpEntry
    {
        std::string ip;
        std::string hwType;
        std::string flags;
        std::string hwAddress;
        std::string mask;
        std::string device;
    };

    /**
     * @brief Parse text in /proc/net/arp format.
     *
     * The first line is a column header and is skipped. Rows with fewer than six
     * fields, or whose first field is not an IPv4 address, are skipped. Never throws on
     * malformed input.
     */
    std::vector<ArpEntry> ParseArpTable(const std::string &text);

    /**
     * @brief Reads the OS address-resolution cache.
     */
    class ArpTableReader
    {
    public:
        ArpTableReader(const std::filesystem::path &arpTablePath = "/proc/net/arp");
        virtual ~ArpTableReader() {}

        /**
         * @brief Read and parse the ARP cache.
         *
         * An unreadable file is logged and produces an empty result.
         */
        virtual std::vector<ArpEntry> ReadArpTable();

        /**
         * @brief Find the entry with the given hardware address.
         *
         * Comparison is case-insensitive. Only entries in `subnet` whose address is not
         * `ownAddress` are considered.
         */
        static std::optional<ArpEntry> FindByMac(
            const std::vector<ArpEntry> &entries,
            const std::string &hwAddress,
            const Ipv4Subnet &subnet,
            const std::string &ownAddress);

        /**
         * @brief The first entry in `subnet` whose address is not `ownAddress`.
         */
        static std::optional<ArpEntry> FindAnyInSubnet(
            const std::vector<ArpEntry> &entries,
            const Ipv4Subnet &subnet,
            const std::string &ownAddress);

    private:
        std::filesystem::path arpTablePath;
    };
}
