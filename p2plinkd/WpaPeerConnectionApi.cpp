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

#include "includes/WpaPeerConnectionApi.h"
#include "includes/WpaExceptions.h"
#include "includes/LinkExceptions.h"
#include "includes/P2pUtil.h"
#include <sstream>
#include "ss.h"

using namespace p2plink;
using namespace cotask;

WpaPeerConnectionApi::WpaPeerConnectionApi(const LinkConfiguration &config)
    : config(config)
{
}

void WpaPeerConnectionApi::Open()
{
    std::lock_guard lock{p2pDeviceMutex};
    p2pDeviceCtrl.Open(std::filesystem::path(config.wpaSocketDirectory) / config.p2pInterface, config.wpaRequestTimeout);
}

void WpaPeerConnectionApi::Close()
{
    std::lock_guard lock{p2pDeviceMutex};
    p2pDeviceCtrl.Close();
}

int WpaPeerConnectionApi::ErrorCodeFromReply(const std::string &reply)
{
    std::string firstLine = trim(reply.substr(0, reply.find('\n')));
    if (firstLine == "UNKNOWN COMMAND")
    {
        return P2pErrorCode::P2P_UNSUPPORTED;
    }
    if (firstLine.find("BUSY") != std::string::npos)
    {
        return P2pErrorCode::BUSY;
    }
    return P2pErrorCode::ERROR;
}

std::vector<std::string> WpaPeerConnectionApi::ReplyLines(const std::string &reply)
{
    std::vector<std::string> result;
    std::istringstream s(reply);
    std::string line;
    while (std::getline(s, line))
    {
        if (!line.empty())
        {
            result.push_back(line);
        }
    }
    return result;
}

std::optional<std::string> WpaPeerConnectionApi::FindGroupInterface(const std::string &interfacesReply, const std::string &wlanInterface)
{
    std::string prefix = "p2p-" + wlanInterface + "-";
    for (const auto &line : ReplyLines(interfacesReply))
    {
        std::string name = trim(line);
        if (name.starts_with(prefix))
        {
            return name;
        }
    }
    return std::nullopt;
}

std::map<std::string, std::string> WpaPeerConnectionApi::ParseKeyValues(const std::string &reply)
{
    std::map<std::string, std::string> result;
    for (const auto &line : ReplyLines(reply))
    {
        auto equals = line.find('=');
        if (equals != std::string::npos)
        {
            result[line.substr(0, equals)] = line.substr(equals + 1);
        }
    }
    return result;
}

ConnectionInfo WpaPeerConnectionApi::ParseStatus(const std::string &statusReply, const std::string &groupOwnerAddress)
{
    // wpa_state=COMPLETED
    // mode=P2P GO | station
    auto values = ParseKeyValues(statusReply);
    ConnectionInfo result;
    result.groupFormed = values["wpa_state"] == "COMPLETED";
    result.isGroupOwner = values["mode"] == "P2P GO";
    if (result.groupFormed && !result.isGroupOwner)
    {
        result.groupOwnerAddress = groupOwnerAddress;
    }
    return result;
}

std::optional<ConnectedClient> WpaPeerConnectionApi::ParseStation(const std::string &staReply, std::string *pStationAddress)
{
    // a2:15:e5:0d:91:b2
    // flags=[AUTH][ASSOC][AUTHORIZED]
    // ...
    // p2p_device_addr=ca:74:fa:63:67:58
    auto lines = ReplyLines(staReply);
    if (lines.empty() || lines[0] == "FAIL" || lines[0].find('=') != std::string::npos)
    {
        return std::nullopt;
    }
    *pStationAddress = trim(lines[0]);
    auto values = ParseKeyValues(staReply);
    auto deviceAddress = values.find("p2p_device_addr");
    if (deviceAddress != values.end() && !deviceAddress->second.empty())
    {
        return ConnectedClient(deviceAddress->second);
    }
    return ConnectedClient(*pStationAddress);
}

std::string WpaPeerConnectionApi::RequestBlocking(const std::string &interfaceName, const std::string &command)
{
    if (interfaceName == config.p2pInterface)
    {
        std::lock_guard lock{p2pDeviceMutex};
        if (!p2pDeviceCtrl.IsOpen())
        {
            p2pDeviceCtrl.Open(std::filesystem::path(config.wpaSocketDirectory) / config.p2pInterface, config.wpaRequestTimeout);
        }
        try
        {
            return p2pDeviceCtrl.Request(command);
        }
        catch (const WpaTimedOutException &)
        {
            // A late reply would otherwise be read as the reply to the next request.
            p2pDeviceCtrl.Close();
            throw;
        }
    }
    WpaCtrl ctrl;
    ctrl.Open(std::filesystem::path(config.wpaSocketDirectory) / interfaceName, config.wpaRequestTimeout);
    return ctrl.Request(command);
}

CoTask<std::string> WpaPeerConnectionApi::Request(const std::string interfaceName, const std::string command)
{
    std::string reply;
    std::exception_ptr exception;

    co_await CoBackground();
    try
    {
        reply = RequestBlocking(interfaceName, command);
    }
    catch (...)
    {
        exception = std::current_exception();
    }
    co_await CoForeground();

    if (exception)
    {
        std::rethrow_exception(exception);
    }
    Dispatcher().Log().Debug(SS(interfaceName << "> " << command << " < " << trim(reply)));
    co_return reply;
}

CoTask<> WpaPeerConnectionApi::RequestOk(const std::string interfaceName, const std::string command)
{
    std::string reply;
    try
    {
        reply = co_await Request(interfaceName, command);
    }
    catch (const std::exception &e)
    {
        throw P2pOperationException(P2pErrorCode::ERROR, command, e.what());
    }
    if (trim(reply) != "OK")
    {
        throw P2pOperationException(ErrorCodeFromReply(reply), command, trim(reply));
    }
}

CoTask<> WpaPeerConnectionApi::Connect(const std::string peerAddress, int goIntent)
{
    co_await RequestOk(config.p2pInterface, SS("P2P_CONNECT " << peerAddress << " pbc go_intent=" << goIntent));
}

CoTask<> WpaPeerConnectionApi::DiscoverPeers()
{
    co_await RequestOk(config.p2pInterface, "P2P_FIND");
}

CoTask<std::optional<std::string>> WpaPeerConnectionApi::GetGroupInterface()
{
    std::string reply = co_await Request(config.p2pInterface, "INTERFACES");
    co_return FindGroupInterface(reply, config.wlanInterface);
}

CoTask<std::optional<ConnectionInfo>> WpaPeerConnectionApi::RequestConnectionInfo()
{
    std::optional<std::string> groupInterface = co_await GetGroupInterface();
    if (!groupInterface)
    {
        co_return ConnectionInfo{};
    }
    std::string status;
    bool available = true;
    try
    {
        status = co_await Request(*groupInterface, "STATUS");
    }
    catch (const WpaIoException &e)
    {
        // The group interface can vanish between INTERFACES and STATUS.
        Dispatcher().Log().Debug(SS("STATUS " << *groupInterface << " failed. " << e.what()));
        available = false;
    }
    if (!available)
    {
        co_return std::nullopt;
    }
    co_return ParseStatus(status, config.groupOwnerAddress);
}

CoTask<std::optional<GroupInfo>> WpaPeerConnectionApi::RequestGroupInfo()
{
    std::optional<std::string> groupInterface = co_await GetGroupInterface();
    if (!groupInterface)
    {
        co_return std::nullopt;
    }
    GroupInfo groupInfo;
    groupInfo.interfaceName = *groupInterface;

    std::string status = co_await Request(*groupInterface, "STATUS");
    groupInfo.isGroupOwner = ParseStatus(status, config.groupOwnerAddress).isGroupOwner;
    if (!groupInfo.isGroupOwner)
    {
        co_return groupInfo;
    }

    std::string stationAddress;
    std::string reply = co_await Request(*groupInterface, "STA-FIRST");
    while (true)
    {
        std::optional<ConnectedClient> client = ParseStation(reply, &stationAddress);
        if (!client)
        {
            break;
        }
        groupInfo.clients.push_back(std::move(*client));
        reply = co_await Request(*groupInterface, "STA-NEXT " + stationAddress);
    }
    co_return groupInfo;
}

CoTask<> WpaPeerConnectionApi::RemoveGroup()
{
    std::optional<std::string> groupInterface;
    try
    {
        groupInterface = co_await GetGroupInterface();
    }
    catch (const std::exception &e)
    {
        throw P2pOperationException(P2pErrorCode::ERROR, "INTERFACES", e.what());
    }
    if (!groupInterface)
    {
        throw P2pOperationException(P2pErrorCode::ERROR, "P2P_GROUP_REMOVE", "No P2P group");
    }
    co_await RequestOk(config.p2pInterface, "P2P_GROUP_REMOVE " + *groupInterface);
}
