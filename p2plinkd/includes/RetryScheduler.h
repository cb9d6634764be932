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
#include <chrono>
#include <functional>
#include <optional>

namespace p2plink
{
    using namespace cotask;

    /**
     * @brief Delayed re-invocation on the foreground dispatcher.
     *
     * Holds no per-peer state. Virtual so that tests can record delays without waiting.
     */
    class RetryScheduler
    {
    public:
        using milliseconds = std::chrono::milliseconds;

        virtual ~RetryScheduler() {}

        /**
         * @brief Suspend the calling coroutine for `delay`; resumes on the foreground thread.
         */
        virtual CoTask<> Delay(milliseconds delay);

        /**
         * @brief Run `continuation` on the foreground thread after `delay`.
         *
         * @return A handle for Cancel().
         */
        virtual uint64_t Schedule(milliseconds delay, std::function<void(void)> continuation);

        /**
         * @brief Cancel a scheduled continuation.
         *
         * @return false if the continuation has already run, or the handle is unknown.
         */
        virtual bool Cancel(uint64_t handle);

        /**
         * @brief Call attemptFn(1), attemptFn(2), ... until it produces a value.
         *
         * At most `maxAttempts` calls are made, with `delay` between them. Exceptions thrown by
         * attemptFn propagate to the caller.
         * @return The first value produced, or std::nullopt if every attempt came back empty.
         */
        template <typename T>
        CoTask<std::optional<T>> RetryUntilValue(
            int maxAttempts,
            milliseconds delay,
            std::function<CoTask<std::optional<T>>(int attempt)> attemptFn);
    };

    template <typename T>
    CoTask<std::optional<T>> RetryScheduler::RetryUntilValue(
        int maxAttempts,
        milliseconds delay,
        std::function<CoTask<std::optional<T>>(int attempt)> attemptFn)
    {
        for (int attempt = 1; attempt <= maxAttempts; ++attempt)
        {
            std::optional<T> result = co_await attemptFn(attempt);
            if (result.has_value())
            {
                co_return result;
            }
            if (attempt < maxAttempts)
            {
                co_await Delay(delay);
            }
        }
        co_return std::nullopt;
    }
}
