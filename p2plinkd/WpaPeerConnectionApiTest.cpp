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
#include "includes/LinkExceptions.h"
#include <iostream>
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace p2plink;
using namespace cotask;
using namespace std;
using namespace std::chrono_literals;

void ErrorCodeTest()
{
    cout << "--- ErrorCodeTest" << endl;
    assert(WpaPeerConnectionApi::ErrorCodeFromReply("FAIL\n") == P2pErrorCode::ERROR);
    assert(WpaPeerConnectionApi::ErrorCodeFromReply("UNKNOWN COMMAND\n") == P2pErrorCode::P2P_UNSUPPORTED);
    assert(WpaPeerConnectionApi::ErrorCodeFromReply("FAIL-BUSY\n") == P2pErrorCode::BUSY);
    assert(WpaPeerConnectionApi::ErrorCodeFromReply("") == P2pErrorCode::ERROR);

    assert(ErrorCodeName(P2pErrorCode::ERROR) == "ERROR");
    assert(ErrorCodeName(P2pErrorCode::P2P_UNSUPPORTED) == "P2P_UNSUPPORTED");
    assert(ErrorCodeName(P2pErrorCode::BUSY) == "BUSY");
    assert(ErrorCodeName(7) == "UNKNOWN_7");

    P2pOperationException e(P2pErrorCode::BUSY, "P2P_CONNECT", "FAIL-BUSY");
    assert(std::string(e.what()) == "P2P_CONNECT failed: BUSY (FAIL-BUSY)");
    assert(e.code() == P2pErrorCode::BUSY);
    cout << "--- ErrorCodeTest Done" << endl;
}

void InterfacesTest()
{
    cout << "--- InterfacesTest" << endl;
    std::string reply = "wlan0\np2p-dev-wlan0\np2p-wlan0-3\n";
    auto groupInterface = WpaPeerConnectionApi::FindGroupInterface(reply, "wlan0");
    assert(groupInterface == "p2p-wlan0-3");
    assert(!WpaPeerConnectionApi::FindGroupInterface("wlan0\np2p-dev-wlan0\n", "wlan0"));
    assert(!WpaPeerConnectionApi::FindGroupInterface(reply, "wlan1"));
    cout << "--- InterfacesTest Done" << endl;
}

void StatusTest()
{
    cout << "--- StatusTest" << endl;
    ConnectionInfo owner = WpaPeerConnectionApi::ParseStatus(
        "bssid=de:a6:32:d4:f7:0c\nssid=DIRECT-xy\nmode=P2P GO\nwpa_state=COMPLETED\nip_address=192.168.49.1\n",
        "192.168.49.1");
    assert(owner.groupFormed);
    assert(owner.isGroupOwner);
    assert(owner.groupOwnerAddress.empty());

    ConnectionInfo client = WpaPeerConnectionApi::ParseStatus(
        "mode=station\nwpa_state=COMPLETED\n",
        "192.168.49.1");
    assert(client.groupFormed);
    assert(!client.isGroupOwner);
    assert(client.groupOwnerAddress == "192.168.49.1");

    ConnectionInfo forming = WpaPeerConnectionApi::ParseStatus("mode=station\nwpa_state=4WAY_HANDSHAKE\n", "192.168.49.1");
    assert(!forming.groupFormed);
    assert(forming.groupOwnerAddress.empty());
    cout << "--- StatusTest Done" << endl;
}

void StationTest()
{
    cout << "--- StationTest" << endl;
    std::string stationAddress;
    auto client = WpaPeerConnectionApi::ParseStation(
        "a2:15:e5:0d:91:b2\nflags=[AUTH][ASSOC][AUTHORIZED]\naid=1\np2p_device_addr=ca:74:fa:63:67:58\n",
        &stationAddress);
    assert(client.has_value());
    assert(client->DeviceAddress() == "ca:74:fa:63:67:58");
    assert(stationAddress == "a2:15:e5:0d:91:b2");

    client = WpaPeerConnectionApi::ParseStation("a2:15:e5:0d:91:b2\nflags=[AUTH]\n", &stationAddress);
    assert(client.has_value());
    assert(client->DeviceAddress() == "a2:15:e5:0d:91:b2");

    assert(!WpaPeerConnectionApi::ParseStation("", &stationAddress));
    assert(!WpaPeerConnectionApi::ParseStation("FAIL\n", &stationAddress));
    assert(!WpaPeerConnectionApi::ParseStation("flags=[AUTH]\n", &stationAddress));
    cout << "--- StationTest Done" << endl;
}

// Plays wpa_supplicant's side of a control socket.
class ControlSocketServer
{
public:
    ControlSocketServer(const std::string &path)
        : path(path)
    {
        sock = socket(PF_UNIX, SOCK_DGRAM, 0);
        assert(sock != -1);
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        assert(bind(sock, (struct sockaddr *)&addr, sizeof(addr)) == 0);
    }
    ~ControlSocketServer()
    {
        close(sock);
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    std::string Receive()
    {
        char buffer[256];
        clientLength = sizeof(client);
        ssize_t received = recvfrom(sock, buffer, sizeof(buffer), 0, (struct sockaddr *)&client, &clientLength);
        assert(received >= 0);
        return std::string(buffer, (size_t)received);
    }
    bool Reply(const std::string &reply)
    {
        return sendto(sock, reply.c_str(), reply.length(), 0, (struct sockaddr *)&client, clientLength) >= 0;
    }

private:
    std::string path;
    int sock = -1;
    struct sockaddr_un client;
    socklen_t clientLength = 0;
};

void TimedOutRequestTest()
{
    cout << "--- TimedOutRequestTest" << endl;
    {
        char dirTemplate[] = "/tmp/p2plinktestXXXXXX";
        assert(mkdtemp(dirTemplate) != nullptr);
        std::filesystem::path directory{dirTemplate};

        LinkConfiguration config;
        config.wpaSocketDirectory = directory.string();
        config.wpaRequestTimeout = 200ms;
        {
            ControlSocketServer server{(directory / config.p2pInterface).string()};
            WpaPeerConnectionApi api(config);

            bool thrown = false;
            try
            {
                api.DiscoverPeers().GetResult();
            }
            catch (const P2pOperationException &e)
            {
                thrown = true;
                assert(e.code() == P2pErrorCode::ERROR);
            }
            assert(thrown);

            // The reply arrives too late, after the requesting socket is gone.
            assert(server.Receive() == "P2P_FIND");
            assert(!server.Reply("OK\n"));

            // The next request gets its own reply.
            std::thread responder([&server]() {
                std::string request = server.Receive();
                assert(request.starts_with("P2P_CONNECT "));
                assert(server.Reply("FAIL-BUSY\n"));
            });
            thrown = false;
            try
            {
                api.Connect("aa:bb:cc:dd:ee:ff", 0).GetResult();
            }
            catch (const P2pOperationException &e)
            {
                thrown = true;
                assert(e.code() == P2pErrorCode::BUSY);
            }
            responder.join();
            assert(thrown);
            api.Close();
        }
        std::filesystem::remove_all(directory);
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- TimedOutRequestTest Done" << endl;
}

int main(int argc, char **argv)
{
    ErrorCodeTest();
    InterfacesTest();
    StatusTest();
    StationTest();
    TimedOutRequestTest();
    return 0;
}
