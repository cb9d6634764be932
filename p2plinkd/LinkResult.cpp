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
#include <stdexcept>

using namespace p2plink;
using namespace cotask;

LinkResult::LinkResult(ConnectedCallback onConnected, FailureCallback onFailure)
    : onConnected(std::move(onConnected)),
      onFailure(std::move(onFailure))
{
}

void LinkResult::Fire(std::function<void(void)> &&delivery)
{
    if (fired.exchange(true))
    {
        throw std::logic_error("Link result has already been delivered.");
    }
    Dispatcher().PostDelayedFunction(0ms, std::move(delivery));
}

void LinkResult::Connected(const std::string &ip)
{
    Fire([onConnected = std::move(onConnected), ip]() {
        if (onConnected)
        {
            onConnected(ip);
        }
    });
}

void LinkResult::Failed(const std::string &message)
{
    Fire([onFailure = std::move(onFailure), message]() {
        if (onFailure)
        {
            onFailure(message);
        }
    });
}
