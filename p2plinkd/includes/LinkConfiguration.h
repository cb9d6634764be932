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
#include <chrono>
#include <string>
#include <filesystem>
#include <iostream>
#include "Ipv4Subnet.h"

namespace p2plink
{
    /**
     * @brief Link establishment and address resolution settings.
     *
     * Built once at process start (defaults, optionally overridden by a configuration file)
     * and handed to each component by value. Components never modify it.
     */
    struct LinkConfiguration
    {
        using milliseconds = std::chrono::milliseconds;

        // connect() retry policy.
        int maxConnectRetries = 5;
        milliseconds connectRetryDelay{2000}; // spacing between attempts when peer rediscovery is disabled.
        bool rediscoverPeersOnRetry = true;
        milliseconds peerRediscoveryDelay{3500};

        // Group owner intent: attempts up to goIntentSwitchAttempt use lowGoIntent; later ones use highGoIntent.
        int lowGoIntent = 0;
        int highGoIntent = 15;
        int goIntentSwitchAttempt = 2;

        // Stale group removal before connecting.
        milliseconds postRemoveGroupDelay{1000};
        milliseconds postRemoveBusyDelay{2500};

        // Group formation polling.
        milliseconds connectionRetryDelay{1000};
        int maxConnectionAttempts = 15; // clamped to [3,30].
        int maxGroupInfoAttempts = 15;

        // Client address resolution.
        milliseconds dhcpSettleDelay{4000};
        int arpRetryCount = 3;
        milliseconds arpRetryDelay{2000};
        std::string arpTablePath = "/proc/net/arp";
        Ipv4Subnet groupSubnet{0xC0A83100u, 24}; // 192.168.49.0/24
        std::string groupOwnerAddress = "192.168.49.1";

        // Subnet scan.
        int scanFirstHost = 2;
        int scanLastHost = 254;
        int scanBatchSize = 25;
        milliseconds probeTimeout{500};
        int probePort = 7;

        // wpa_supplicant.
        std::string wlanInterface = "wlan0";
        std::string p2pInterface = "p2p-dev-wlan0";
        std::string wpaSocketDirectory = "/var/run/wpa_supplicant";
        milliseconds wpaRequestTimeout{10000};

        int GoIntentForAttempt(int attempt) const
        {
            return attempt <= goIntentSwitchAttempt ? lowGoIntent : highGoIntent;
        }

        /**
         * @brief Check value ranges, clamping maxConnectionAttempts to [3,30].
         *
         * @throws std::invalid_argument if a value is out of range.
         */
        void Validate();

        /**
         * @brief Load settings from a key=value configuration file.
         *
         * Keys that don't appear in the file keep their current values.
         * @throws std::invalid_argument on unknown keys or malformed values.
         * @throws cotask::CoFileNotFoundException if the file can't be opened.
         */
        void Load(const std::filesystem::path &path);
        void Load(std::istream &s, const std::string &sourceName = "<stream>");
        void Save(std::ostream &s) const;
    };
}
