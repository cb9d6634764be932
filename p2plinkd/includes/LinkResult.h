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
#include <functional>
#include <atomic>

namespace p2plink
{
    using ConnectedCallback = std::function<void(const std::string &ip)>;
    using FailureCallback = std::function<void(const std::string &message)>;

    /**
     * @brief Delivers the outcome of a link request exactly once.
     *
     * Exactly one of onConnected and onFailure is called, once, from the foreground
     * dispatcher's message loop.
     */
    class LinkResult
    {
    public:
        LinkResult(ConnectedCallback onConnected, FailureCallback onFailure);
        LinkResult(const LinkResult &) = delete;
        LinkResult &operator=(const LinkResult &) = delete;

        /**
         * @throws std::logic_error if a result has already been delivered.
         */
        void Connected(const std::string &ip);
        /**
         * @throws std::logic_error if a result has already been delivered.
         */
        void Failed(const std::string &message);

        bool HasFired() const { return fired; }

    private:
        void Fire(std::function<void(void)> &&delivery);

        ConnectedCallback onConnected;
        FailureCallback onFailure;
        std::atomic<bool> fired{false};
    };
}
