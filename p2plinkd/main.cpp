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

#include "cotask/CoTask.h"
#include "CommandLineParser.h"
#include "includes/LinkConfiguration.h"
#include "includes/WpaPeerConnectionApi.h"
#include "includes/ArpTableReader.h"
#include "includes/ReachabilityProbe.h"
#include "includes/SubnetScanner.h"
#include "includes/RetryScheduler.h"
#include "includes/GroupFormationWatcher.h"
#include "includes/ClientAddressResolver.h"
#include "includes/ConnectionEstablisher.h"
#include "includes/PrettyPrinter.h"
#include <exception>
#include <iostream>
#include <string>
#include <filesystem>
#include <signal.h>
#include <unistd.h>
#include "ss.h"
#if __linux__
#include <systemd/sd-daemon.h>
#endif

using namespace p2plink;
using namespace cotask;
using namespace std;

volatile sig_atomic_t shutdown_flag = 1;
volatile sig_atomic_t signal_abort = 1;

void onSigInt(int signal)
{
    if (signal_abort)
    {
        exit(EXIT_FAILURE);
    }
    shutdown_flag = 0;
}

static void printHelp()
{
    PrettyPrinter p;

    p << "p2plinkd v1.0 - Wi-Fi Direct link establishment and peer address discovery\n"
      << "\n"
      << "Usage:\n";
    p << "\tp2plinkd [options]* <peer-device-address>\n\n";
    p << "Options:\n";

    p.Indent(20);
    p.HangingIndent(" -?, --help");
    p << "Help. Print this message.\n\n";

    p.HangingIndent(" -c, --config-file=FILE");
    p << "Use this configuration file.\n\n";

#ifdef __linux__
    p.HangingIndent(" -D, --systemd");
    p << "Run under systemd. (Uses systemd logging instead of console logging.)\n\n";
#endif

    p.HangingIndent(" -i, --wlan-interface=<interface_name>");
    p << "wlan interface (default wlan0)\n\n";

    p.HangingIndent(" --log-level=debug|info|warning|error");
    p << "Set log level (default info)\n\n";

    p.HangingIndent(" --no-remove-group");
    p << "Don't remove an existing P2P group before connecting.\n\n";

    p.HangingIndent(" --disconnect");
    p << "Remove the current P2P group and exit.\n\n";

    p.HangingIndent(" --print-config");
    p << "Print the effective configuration and exit.\n\n";

    p.Indent(4);
    p.HangingIndent("Remarks:");

    p << "p2plinkd connects to a Wi-Fi Direct peer using wpa_supplicant, waits for the P2P group to form, and "
         "prints the peer's IP address on stdout. When this device becomes group owner, the client's address is "
         "found from the ARP cache, or by probing the group subnet.\n\n";

    p.Indent(4);
    p.HangingIndent("Example:");

    p << "p2plinkd -c /etc/p2plink/p2plinkd.conf -i wlan0 aa:bb:cc:dd:ee:ff\n\n";

    p.Indent(4);
    p.HangingIndent("Configuration file format:");

    p << "Key-value pairs separated by '='. String values "
         "may optionally be surrounded by double quotes. "
         "Within quoted strings, only the following escape values "
         "are supported: \\n \\r \\t \\\\ \\\". "
         "The '#' character can be used to mark comments. All content "
         "after the '#', to the following end-of-line is discarded. "
         "Use --print-config to list the available keys and their current values."
         "\n\n";
}

CoTask<int> CoMain(int argc, const char *const *argv)
{
    string interfaceOption;
    string logLevel = "info";
    std::string configFile;
    bool help = false;
    bool systemd = false;
    bool printConfig = false;
    bool noRemoveGroup = false;
    bool disconnect = false;
    std::vector<std::string> arguments;

    bool parsed = false;
    try
    {
        CommandLineParser parser;
        parser.AddOption("-?", &help);
        parser.AddOption("--help", &help);
        parser.AddOption("-i", &interfaceOption);
        parser.AddOption("--wlan-interface", &interfaceOption);
        parser.AddOption("-c", &configFile);
        parser.AddOption("--config-file", &configFile);
        parser.AddOption("--log-level", &logLevel);
        parser.AddOption("-D", &systemd);
        parser.AddOption("--systemd", &systemd);
        parser.AddOption("--print-config", &printConfig);
        parser.AddOption("--no-remove-group", &noRemoveGroup);
        parser.AddOption("--disconnect", &disconnect);

        parser.Parse(argc, argv);
        arguments = parser.Arguments();
        parsed = true;
    }
    catch (const std::exception &e)
    {
        cout << "Error: " << e.what() << endl;
    }
    if (!parsed)
    {
        co_return EXIT_FAILURE;
    }
    if (help)
    {
        printHelp();
        co_return EXIT_SUCCESS;
    }

    LinkConfiguration config;
    try
    {
        if (!configFile.empty())
        {
            config.Load(std::filesystem::path(configFile));
        }
        if (!interfaceOption.empty())
        {
            config.wlanInterface = interfaceOption;
            config.p2pInterface = "p2p-dev-" + interfaceOption;
        }
        config.Validate();
    }
    catch (const std::exception &e)
    {
        cout << "Error: Failed to load config file. " << e.what() << endl;
        co_return EXIT_FAILURE;
    }
    if (printConfig)
    {
        config.Save(cout);
        co_return EXIT_SUCCESS;
    }
    if (!disconnect && arguments.size() != 1)
    {
        cout << "Error: Expecting a single peer device address. (p2plinkd --help for usage)" << endl;
        co_return EXIT_FAILURE;
    }

    std::shared_ptr<ILog> log;
    if (systemd)
    {
        log = std::make_shared<SystemdLog>();
    }
    else
    {
        log = std::make_shared<ConsoleLog>();
    }
    try
    {
        log->SetLogLevel(ParseLogLevel(logLevel));
    }
    catch (const std::exception &e)
    {
        cout << "Error: " << e.what() << endl;
        co_return EXIT_FAILURE;
    }
    Dispatcher().SetLog(log);

    signal_abort = 0; // signals cancel instead of aborting.

    int exitCode = EXIT_FAILURE;
    try
    {
        WpaPeerConnectionApi api(config);
        api.Open();

        ArpTableReader arpTableReader(config.arpTablePath);
        TcpReachabilityProbe probe(config.probePort);
        SubnetScanner subnetScanner(probe, config.scanBatchSize, config.probeTimeout);
        RetryScheduler retryScheduler;
        GroupFormationWatcher groupFormationWatcher(api, retryScheduler, config);
        ClientAddressResolver clientAddressResolver(arpTableReader, subnetScanner, retryScheduler, config);
        ConnectionEstablisher connectionEstablisher(api, groupFormationWatcher, clientAddressResolver, retryScheduler, config);

#ifdef __linux__
        if (systemd)
        {
            sd_notifyf(0, "READY=1\n"
                          "MAINPID=%lu",
                       (unsigned long)getpid());
        }
#endif

        bool finished = false;
        if (disconnect)
        {
            connectionEstablisher.Disconnect([&finished, &exitCode]() {
                finished = true;
                exitCode = EXIT_SUCCESS;
            });
        }
        else
        {
            const std::string &peerAddress = arguments[0];
            log->Info(SS("Connecting to " << peerAddress));

            auto onConnected = [&finished, &exitCode, systemd](const std::string &ip) {
                cout << ip << endl;
#ifdef __linux__
                if (systemd)
                {
                    sd_notifyf(0, "STATUS=Connected: %s", ip.c_str());
                }
#endif
                finished = true;
                exitCode = EXIT_SUCCESS;
            };
            auto onFailure = [&finished, &exitCode, &log, systemd](const std::string &message) {
                log->Error(message);
#ifdef __linux__
                if (systemd)
                {
                    sd_notifyf(0, "STATUS=Failed: %s", message.c_str());
                }
#endif
                finished = true;
                exitCode = EXIT_FAILURE;
            };
            if (noRemoveGroup)
            {
                connectionEstablisher.InitiateConnection(peerAddress, onConnected, onFailure);
            }
            else
            {
                connectionEstablisher.Connect(peerAddress, onConnected, onFailure);
            }
        }

        while (shutdown_flag && !finished)
        {
            co_await CoDelay(300ms);
        }
        if (!finished)
        {
            log->Info("Interrupted.");
        }

#ifdef __linux__
        if (systemd)
        {
            sd_notify(0, "STOPPING=1");
        }
#endif
        api.Close();
    }
    catch (const std::exception &e)
    {
#ifdef __linux__
        if (systemd)
        {
            sd_notifyf(0, "STATUS=Unexpected error: %s", e.what());
        }
#endif
        log->Error(SS("Terminating abnormally. " << e.what()));
        exitCode = EXIT_FAILURE;
    }
    co_return exitCode;
}

int main(int argc, const char **argv)
{
    // signals have to be established before the CoDispatcher thread pool is started.
    signal(SIGTERM, onSigInt);
    signal(SIGINT, onSigInt);

    return CoMain(argc, argv).GetResult();
}
