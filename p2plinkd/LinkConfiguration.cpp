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

#include "includes/LinkConfiguration.h"
#include "includes/ConfigSerializer.h"
#include "includes/P2pUtil.h"
#include "cotask/CoExceptions.h"
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>
#include "ss.h"

using namespace p2plink;
using namespace p2plink::config_serializer;
using namespace std;

void p2plink::config_serializer::ParseConfigValue(const std::string &text, int *pValue)
{
    *pValue = toInt<int>(text);
}

void p2plink::config_serializer::ParseConfigValue(const std::string &text, bool *pValue)
{
    if (text == "true" || text == "1")
    {
        *pValue = true;
    }
    else if (text == "false" || text == "0")
    {
        *pValue = false;
    }
    else
    {
        throw invalid_argument("Expecting true or false: " + text);
    }
}

void p2plink::config_serializer::ParseConfigValue(const std::string &text, std::string *pValue)
{
    *pValue = DecodeString(text);
}

void p2plink::config_serializer::ParseConfigValue(const std::string &text, std::chrono::milliseconds *pValue)
{
    *pValue = std::chrono::milliseconds(toInt64(text));
}

void p2plink::config_serializer::ParseConfigValue(const std::string &text, Ipv4Subnet *pValue)
{
    *pValue = Ipv4Subnet::Parse(DecodeString(text));
}

std::string p2plink::config_serializer::FormatConfigValue(int value)
{
    return SS(value);
}
std::string p2plink::config_serializer::FormatConfigValue(bool value)
{
    return value ? "true" : "false";
}
std::string p2plink::config_serializer::FormatConfigValue(const std::string &value)
{
    return EncodeString(value);
}
std::string p2plink::config_serializer::FormatConfigValue(std::chrono::milliseconds value)
{
    return SS(value.count());
}
std::string p2plink::config_serializer::FormatConfigValue(const Ipv4Subnet &value)
{
    return value.ToString();
}

#define SERIALIZER_ENTRY(MEMBER_NAME, COMMENT) \
    std::make_shared<ConfigSerializer<LinkConfiguration, decltype(LinkConfiguration::MEMBER_NAME)>>(#MEMBER_NAME, &LinkConfiguration::MEMBER_NAME, COMMENT)

static const std::vector<std::shared_ptr<ConfigSerializerBase<LinkConfiguration>>> configSerializers =
    {
        SERIALIZER_ENTRY(maxConnectRetries, "connect() attempts before giving up."),
        SERIALIZER_ENTRY(rediscoverPeersOnRetry, "Refresh peer discovery before retrying a failed connect()."),
        SERIALIZER_ENTRY(peerRediscoveryDelay, "Delay (ms) before retrying after a peer discovery refresh."),
        SERIALIZER_ENTRY(connectRetryDelay, "Delay (ms) between connect() attempts when rediscoverPeersOnRetry=false."),
        SERIALIZER_ENTRY(lowGoIntent, "Group owner intent for early attempts (0-15)."),
        SERIALIZER_ENTRY(highGoIntent, "Group owner intent for later attempts (0-15)."),
        SERIALIZER_ENTRY(goIntentSwitchAttempt, "Last attempt that uses lowGoIntent."),
        SERIALIZER_ENTRY(postRemoveGroupDelay, "Settle time (ms) after removing a stale group."),
        SERIALIZER_ENTRY(postRemoveBusyDelay, "Settle time (ms) when stale group removal reports BUSY."),
        SERIALIZER_ENTRY(connectionRetryDelay, "Group formation polling interval (ms)."),
        SERIALIZER_ENTRY(maxConnectionAttempts, "Connection info polls before giving up (3-30)."),
        SERIALIZER_ENTRY(maxGroupInfoAttempts, "Group info polls before giving up."),
        SERIALIZER_ENTRY(dhcpSettleDelay, "Wait (ms) for the client's DHCP lease before resolving its address."),
        SERIALIZER_ENTRY(arpRetryCount, "ARP table re-reads before falling back to a subnet scan."),
        SERIALIZER_ENTRY(arpRetryDelay, "Delay (ms) between ARP table re-reads."),
        SERIALIZER_ENTRY(arpTablePath, "ARP cache file."),
        SERIALIZER_ENTRY(groupSubnet, "P2P group subnet (n.n.n.n/nn)."),
        SERIALIZER_ENTRY(groupOwnerAddress, "Address of this device on the group subnet."),
        SERIALIZER_ENTRY(scanFirstHost, "First host number probed by the subnet scan."),
        SERIALIZER_ENTRY(scanLastHost, "Last host number probed by the subnet scan."),
        SERIALIZER_ENTRY(scanBatchSize, "Concurrent probes per scan batch."),
        SERIALIZER_ENTRY(probeTimeout, "Reachability probe timeout (ms)."),
        SERIALIZER_ENTRY(probePort, "TCP port used by reachability probes."),
        SERIALIZER_ENTRY(wlanInterface, "Name of the wlan device interface."),
        SERIALIZER_ENTRY(p2pInterface, "Name of the p2p device interface."),
        SERIALIZER_ENTRY(wpaSocketDirectory, "wpa_supplicant control socket directory."),
        SERIALIZER_ENTRY(wpaRequestTimeout, "wpa_supplicant request timeout (ms)."),
};

static void RequirePositive(const char *name, int64_t value)
{
    if (value <= 0)
    {
        throw invalid_argument(SS(name << " must be greater than zero."));
    }
}
static void RequireNonNegative(const char *name, int64_t value)
{
    if (value < 0)
    {
        throw invalid_argument(SS(name << " must not be negative."));
    }
}

void LinkConfiguration::Validate()
{
    if (maxConnectionAttempts < 3)
        maxConnectionAttempts = 3;
    if (maxConnectionAttempts > 30)
        maxConnectionAttempts = 30;

    RequirePositive("maxConnectRetries", maxConnectRetries);
    RequirePositive("maxGroupInfoAttempts", maxGroupInfoAttempts);
    RequirePositive("scanBatchSize", scanBatchSize);
    RequirePositive("probeTimeout", probeTimeout.count());
    RequirePositive("wpaRequestTimeout", wpaRequestTimeout.count());
    RequireNonNegative("arpRetryCount", arpRetryCount);
    RequireNonNegative("connectRetryDelay", connectRetryDelay.count());
    RequireNonNegative("peerRediscoveryDelay", peerRediscoveryDelay.count());
    RequireNonNegative("postRemoveGroupDelay", postRemoveGroupDelay.count());
    RequireNonNegative("postRemoveBusyDelay", postRemoveBusyDelay.count());
    RequireNonNegative("connectionRetryDelay", connectionRetryDelay.count());
    RequireNonNegative("dhcpSettleDelay", dhcpSettleDelay.count());
    RequireNonNegative("arpRetryDelay", arpRetryDelay.count());

    if (lowGoIntent < 0 || lowGoIntent > 15 || highGoIntent < 0 || highGoIntent > 15)
    {
        throw invalid_argument("Group owner intent must be in the range 0-15.");
    }
    if (probePort <= 0 || probePort > 65535)
    {
        throw invalid_argument("probePort must be in the range 1-65535.");
    }
    if (!groupSubnet.Contains(groupOwnerAddress))
    {
        throw invalid_argument(SS("groupOwnerAddress " << groupOwnerAddress << " is not in " << groupSubnet));
    }
    // Scans never cover more than the host range of a /8.
    uint32_t maxHost = std::min<uint32_t>(~groupSubnet.Mask(), 0x00FFFFFFu);
    if (scanFirstHost < 1 || scanLastHost < scanFirstHost || (uint32_t)scanLastHost >= maxHost)
    {
        throw invalid_argument(SS("Invalid scan range " << scanFirstHost << "-" << scanLastHost << " for " << groupSubnet));
    }
}

void LinkConfiguration::Load(const std::filesystem::path &path)
{
    std::ifstream f{path};
    if (!f.is_open())
    {
        throw cotask::CoFileNotFoundException(SS("Can't open file " << path));
    }
    Load(f, path.string());
}

// Remove a '#' comment, ignoring '#' inside quoted strings.
static std::string StripComment(const std::string &line)
{
    bool quoted = false;
    for (size_t i = 0; i < line.length(); ++i)
    {
        char c = line[i];
        if (quoted && c == '\\')
        {
            ++i;
        }
        else if (c == '"')
        {
            quoted = !quoted;
        }
        else if (c == '#' && !quoted)
        {
            return line.substr(0, i);
        }
    }
    return line;
}

void LinkConfiguration::Load(std::istream &s, const std::string &sourceName)
{
    std::string line;
    int lineNumber = 0;
    while (std::getline(s, line))
    {
        ++lineNumber;
        line = trim(StripComment(line));
        if (line.empty())
            continue;

        auto equals = line.find('=');
        if (equals == std::string::npos)
        {
            throw invalid_argument(SS(sourceName << "(" << lineNumber << "): Expecting key=value."));
        }
        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        bool found = false;
        for (const auto &serializer : configSerializers)
        {
            if (serializer->Name() == key)
            {
                try
                {
                    serializer->SetValue(*this, value);
                }
                catch (const std::exception &e)
                {
                    throw invalid_argument(SS(sourceName << "(" << lineNumber << "): " << e.what()));
                }
                found = true;
                break;
            }
        }
        if (!found)
        {
            throw invalid_argument(SS(sourceName << "(" << lineNumber << "): Unknown key '" << key << "'."));
        }
    }
    Validate();
}

void LinkConfiguration::Save(std::ostream &s) const
{
    for (const auto &serializer : configSerializers)
    {
        for (const auto &commentLine : split(serializer->Comment(), '\n'))
        {
            s << "# " << commentLine << "\n";
        }
        s << serializer->Name() << "=" << serializer->GetValue(*this) << "\n\n";
    }
}
