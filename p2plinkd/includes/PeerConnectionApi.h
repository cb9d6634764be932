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
#include <string>
#include <vector>
#include <optional>

namespace p2plink
{
    using namespace cotask;

    /**
     * @brief Error codes reported by PeerConnectionAPI operations.
     */
    namespace P2pErrorCode
    {
        constexpr int ERROR = 0;
        constexpr int P2P_UNSUPPORTED = 1;
        constexpr int BUSY = 2;
    }

    /**
     * @brief Display name for a P2pErrorCode.
     *
     * ERROR, P2P_UNSUPPORTED, BUSY, or UNKNOWN_<n> for anything else.
     */
    std::string ErrorCodeName(int code);

    struct ConnectionInfo
    {
        bool groupFormed = false;
        bool isGroupOwner = false;
        std::string groupOwnerAddress;
    };

    /**
     * @brief A client of a group owned by this device.
     */
    class ConnectedClient
    {
    public:
        ConnectedClient() {}
        ConnectedClient(const std::string &deviceAddress)
            : deviceAddress(deviceAddress)
        {
        }

        const std::string &DeviceAddress() const { return deviceAddress; }

        const std::optional<std::string> &ResolvedIp() const { return resolvedIp; }

        /**
         * @brief Record the client's IP address.
         *
         * The address is write-once. Setting the same value again is a no-op.
         * @throws std::logic_error if a different address has already been set.
         */
        void SetResolvedIp(const std::string &ip);

    private:
        std::string deviceAddress;
        std::optional<std::string> resolvedIp;
    };

    struct GroupInfo
    {
        bool isGroupOwner = false;
        std::string interfaceName;
        std::vector<ConnectedClient> clients;
    };

    /**
     * @brief Platform P2P operations.
     *
     * All operations complete on the foreground dispatcher. Failed operations throw
     * P2pOperationException carrying a P2pErrorCode.
     */
    class IPeerConnectionApi
    {
    public:
        virtual ~IPeerConnectionApi() {}

        virtual CoTask<> Connect(const std::string peerAddress, int goIntent) = 0;
        virtual CoTask<> DiscoverPeers() = 0;

        /**
         * @return std::nullopt if connection info is not available yet.
         */
        virtual CoTask<std::optional<ConnectionInfo>> RequestConnectionInfo() = 0;

        /**
         * @return std::nullopt if there is no current group.
         */
        virtual CoTask<std::optional<GroupInfo>> RequestGroupInfo() = 0;

        virtual CoTask<> RemoveGroup() = 0;
    };

} // namespace
