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
#include "LinkConfiguration.h"
#include "WpaCtrl.h"
#include <map>
#include <vector>
#include <mutex>

namespace p2plink
{
    /**
     * @brief IPeerConnectionApi over wpa_supplicant's control interface.
     *
     * Requests run on the dispatcher's worker pool; results are delivered on the foreground thread.
     * wpa_supplicant failures surface as P2pOperationException.
     */
    class WpaPeerConnectionApi : public IPeerConnectionApi
    {
    public:
        WpaPeerConnectionApi(const LinkConfiguration &config);

        /**
         * @brief Open the control socket of the p2p device interface.
         *
         * @throws WpaIoException if wpa_supplicant is not running.
         */
        void Open();
        void Close();

        virtual CoTask<> Connect(const std::string peerAddress, int goIntent) override;
        virtual CoTask<> DiscoverPeers() override;
        virtual CoTask<std::optional<ConnectionInfo>> RequestConnectionInfo() override;
        virtual CoTask<std::optional<GroupInfo>> RequestGroupInfo() override;
        virtual CoTask<> RemoveGroup() override;

        // Reply parsing.

        /**
         * @brief P2pErrorCode for a failure reply.
         */
        static int ErrorCodeFromReply(const std::string &reply);

        static std::vector<std::string> ReplyLines(const std::string &reply);

        /**
         * @brief Find the P2P group interface (p2p-<wlanInterface>-<n>) in an INTERFACES reply.
         */
        static std::optional<std::string> FindGroupInterface(const std::string &interfacesReply, const std::string &wlanInterface);

        static std::map<std::string, std::string> ParseKeyValues(const std::string &reply);

        /**
         * @brief Interpret a STATUS reply from a group interface.
         *
         * @param groupOwnerAddress Reported as the group owner's address when this device is a client.
         */
        static ConnectionInfo ParseStatus(const std::string &statusReply, const std::string &groupOwnerAddress);

        /**
         * @brief Interpret a STA-FIRST/STA-NEXT reply.
         *
         * The first line is the station's interface address. The P2P device address (p2p_device_addr=) is
         * preferred when present.
         * @return std::nullopt at the end of the station list.
         */
        static std::optional<ConnectedClient> ParseStation(const std::string &staReply, std::string *pStationAddress);

    private:
        CoTask<std::string> Request(const std::string interfaceName, const std::string command);
        CoTask<> RequestOk(const std::string interfaceName, const std::string command);
        CoTask<std::optional<std::string>> GetGroupInterface();

        std::string RequestBlocking(const std::string &interfaceName, const std::string &command);

        const LinkConfiguration config;
        std::mutex p2pDeviceMutex;
        WpaCtrl p2pDeviceCtrl;
    };
}
