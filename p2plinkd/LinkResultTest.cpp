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

#include "includes/LinkResult.h"
#include "cotask/CoTask.h"
#include <iostream>
#include <cassert>

using namespace p2plink;
using namespace cotask;
using namespace std;

void DeliveredFromMessageLoopTest()
{
    cout << "--- DeliveredFromMessageLoopTest" << endl;
    {
        int connected = 0;
        int failed = 0;
        std::string ip;
        LinkResult result(
            [&](const std::string &value) {
                ++connected;
                ip = value;
            },
            [&](const std::string &) { ++failed; });

        result.Connected("192.168.49.12");
        assert(result.HasFired());
        // Not called synchronously.
        assert(connected == 0);

        Dispatcher().PumpUntilIdle();
        assert(connected == 1);
        assert(failed == 0);
        assert(ip == "192.168.49.12");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- DeliveredFromMessageLoopTest Done" << endl;
}

void FiresOnceTest()
{
    cout << "--- FiresOnceTest" << endl;
    {
        int connected = 0;
        int failed = 0;
        std::string message;
        LinkResult result(
            [&](const std::string &) { ++connected; },
            [&](const std::string &value) {
                ++failed;
                message = value;
            });
        result.Failed("Could not resolve client IP");

        bool thrown = false;
        try
        {
            result.Connected("192.168.49.12");
        }
        catch (const std::logic_error &)
        {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try
        {
            result.Failed("again");
        }
        catch (const std::logic_error &)
        {
            thrown = true;
        }
        assert(thrown);

        Dispatcher().PumpUntilIdle();
        assert(connected == 0);
        assert(failed == 1);
        assert(message == "Could not resolve client IP");
    }
    {
        // Empty callbacks are allowed.
        LinkResult result(nullptr, nullptr);
        result.Connected("192.168.49.12");
        Dispatcher().PumpUntilIdle();
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- FiresOnceTest Done" << endl;
}

int main(int argc, char **argv)
{
    DeliveredFromMessageLoopTest();
    FiresOnceTest();
    return 0;
}
