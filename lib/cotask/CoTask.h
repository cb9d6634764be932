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
#include <coroutine>
#include <utility>
#include <queue>
#include <vector>
#include <exception>
#include <concepts>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <list>
#include "Log.h"
#include "Fifo.h"
#include "CoExceptions.h"

#ifdef __GNUC__
// ignoring the result of a [[nodiscard]] CoTask<> is a serious error, not just a warning.
#pragma GCC diagnostic error "-Wunused-result"

#define COTASK_GCC_VERSION() (__GNUC__ * 100 + __GNUC_MINOR__)

// GCC 10.2 reports spurious "statement has no effect" on coroutines. (fixed in 10.3)
#if COTASK_GCC_VERSION() < 1003
#pragma GCC diagnostic ignored "-Wunused-value"
#endif

#endif

namespace cotask
{
    using namespace std::chrono_literals;

    template <typename... Dummy>
    struct CoTask;
    template <typename T>
    struct CoTask<T>;
    template <>
    struct CoTask<>;

    constexpr std::chrono::milliseconds NO_TIMEOUT = std::chrono::milliseconds(-1);

    template <typename T, typename RETURN_TYPE>
    concept Awaitable = requires(T a, std::coroutine_handle<> h)
    {
        {
            a.await_ready()
        }
        ->std::convertible_to<bool>;
        {a.await_suspend(h)};
        {
            a.await_resume()
        }
        ->std::convertible_to<RETURN_TYPE>;
    };

    class CoTaskSchedulerPool;
    class CoTaskSchedulerThread;

    /**
     * @brief Per-thread coroutine scheduler.
     *
     * The thread that first calls CurrentDispatcher() owns the foreground dispatcher. Coroutines
     * resumed via Post(), PostDelayed() and timers run on the foreground thread. PostBackground()
     * hands a coroutine to the worker pool; worker threads get their own dispatcher instance
     * that forwards foreground operations to the foreground dispatcher.
     */
    class CoDispatcher
    {
    public:
        using TimeMs = std::chrono::milliseconds;

    private:
        static CoDispatcher *CreateMainDispatcher();

        CoDispatcher();
        CoDispatcher(CoDispatcher *pForegroundDispatcher, CoTaskSchedulerPool *pSchedulerPool);
        ~CoDispatcher();

    public:
        static CoDispatcher &CurrentDispatcher();
        static void DestroyDispatcher();

        CoDispatcher *GetForegroundDispatcher() { return pForegroundDispatcher; }

        static TimeMs Now();

        void Post(std::coroutine_handle<> handle);
        void PostBackground(std::coroutine_handle<> handle);
        void PostDelayed(TimeMs delay, const std::coroutine_handle<> &handle);

        /**
         * @brief Run a function on the foreground thread after a delay.
         *
         * @return A handle that can be passed to CancelDelayedFunction().
         */
        uint64_t PostDelayedFunction(TimeMs delay, std::function<void(void)> fn);
        bool CancelDelayedFunction(uint64_t timerHandle);

        bool IsDone() const;

        /**
         * @brief Pump all messages that are ready to run.
         *
         * @return true if at least one message was processed.
         */
        bool PumpMessages();

        /**
         * @brief Pump messages, waiting for the next message or timer if none are ready.
         *
         * @param waitForMessages If true, blocks until a message is posted or the next timer is due.
         * @return true if at least one message was processed.
         */
        bool PumpMessages(bool waitForMessages);

        void PumpUntilIdle();

        void SetThreadPoolSize(size_t threads);
        size_t GetThreadPoolSize() const;

        bool IsForeground() const
        {
            return this == pForegroundDispatcher;
        }

        ILog &Log() const
        {
            if (!IsForeground())
                return pForegroundDispatcher->Log();
            return *(log.get());
        }

        void SetLog(const std::shared_ptr<ILog> &log)
        {
            std::lock_guard lock{gLogMutex};
            this->log = log;
        }

        /**
         * @brief Run a coroutine to completion without awaiting it.
         *
         * The dispatcher owns the task until it completes. Tasks that exit with an exception are logged.
         */
        void StartThread(CoTask<> &&task);

        // Test instrumentation
        class Instrumentation
        {
        public:
            static size_t GetThreadPoolSize();
            static size_t GetNumberOfDeadThreads();
            static size_t GetNumberOfRunningThreads();
        };

    private:
        bool PumpTimerMessages(TimeMs time);
        bool GetNextTimer(TimeMs *pResult);

        std::list<CoTask<>> coroutineThreads;
        void ScavengeTasks();

        bool messagePosted = false;
        void PumpMessageNotifyOne();
        void PumpMessageWait(TimeMs maxWait);
        uint64_t nextTimerHandle = 0;
        static std::mutex gLogMutex;
        std::shared_ptr<ILog> log = std::make_shared<ConsoleLog>();
        friend class CoTaskSchedulerPool;
        friend class CoTaskSchedulerThread;
        static void RemoveThreadDispatcher();

        std::mutex pumpMessageMutex;
        std::condition_variable pumpMessageConditionVariable;

        std::mutex schedulerMutex;

        static thread_local CoDispatcher *pInstance;
        CoDispatcher *pForegroundDispatcher;
        CoTaskSchedulerPool *pSchedulerPool;

        struct CoroutineTimerEntry
        {
            TimeMs time;
            std::coroutine_handle<> handle;
        };
        struct TimerFunctionEntry
        {
            TimeMs time;
            std::function<void(void)> fn;
            uint64_t timerHandle;
        };

        struct TimerEntryGreater
        {
            bool operator()(const CoroutineTimerEntry &x, const CoroutineTimerEntry &y) const
            {
                return x.time > y.time;
            }
        };

        std::priority_queue<CoroutineTimerEntry, std::vector<CoroutineTimerEntry>, TimerEntryGreater> coroutineTimerQueue;

        // Kept sorted by time. Linear insert, but cancellation is a simple erase.
        std::list<TimerFunctionEntry> functionTimerQueue;

        Fifo<std::coroutine_handle<>> queue;
    };

    /**
     * @brief An eagerly-started coroutine that produces a value of type T.
     *
     * co_await the task to obtain the value (or the exception thrown by the coroutine).
     * GetResult() pumps foreground messages until the task completes.
     */
    template <typename T>
    struct [[nodiscard("Are you missing a co_await?")]] CoTask<T>
    {
        struct promise_type
        {
            // The awaiting coroutine, resumed when this one completes.
            std::coroutine_handle<> precursor;

            T data;

            std::exception_ptr unhandledException;

            CoTask get_return_object() noexcept
            {
                return {std::coroutine_handle<promise_type>::from_promise(*this)};
            }

            std::suspend_never initial_suspend() const noexcept { return {}; }

            void unhandled_exception()
            {
                unhandledException = std::current_exception();
            }

            auto final_suspend() const noexcept
            {
                struct awaiter
                {
                    bool await_ready() const noexcept { return false; }

                    void await_resume() const noexcept {}

                    // symmetric transfer to the awaiting coroutine, if there is one.
                    std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> h) noexcept
                    {
                        auto precursor = h.promise().precursor;
                        if (precursor)
                        {
                            return precursor;
                        }
                        return std::noop_coroutine();
                    }
                };
                return awaiter{};
            }

            void return_value(T &&value) noexcept
            {
                data = std::move(value);
            }
            void return_value(const T &value)
            {
                data = value;
            }
        };

        bool await_ready() const noexcept
        {
            return handle.done();
        }

        T await_resume() const
        {
            auto &promise = handle.promise();
            if (promise.unhandledException)
            {
                std::rethrow_exception(promise.unhandledException);
            }
            return std::move(promise.data);
        }

        void await_suspend(std::coroutine_handle<> coroutine) const noexcept
        {
            handle.promise().precursor = coroutine;
        }

        std::coroutine_handle<promise_type> handle = nullptr;

        CoTask(std::coroutine_handle<promise_type> handle)
            : handle(handle)
        {
        }

        CoTask(CoTask<T> &&other)
            : handle(std::exchange(other.handle, nullptr))
        {
        }
        CoTask<T> &operator=(CoTask<T> &&other)
        {
            if (this != &other)
            {
                if (this->handle != nullptr)
                {
                    this->handle.destroy();
                }
                this->handle = std::exchange(other.handle, nullptr);
            }
            return *this;
        }
        ~CoTask()
        {
            if (handle != nullptr)
            {
                handle.destroy();
            }
        }

        T GetResult();
    };

    inline CoDispatcher &Dispatcher() { return CoDispatcher::CurrentDispatcher(); }

    /**
     * @brief An eagerly-started coroutine with no result.
     */
    template <>
    struct [[nodiscard("Are you missing a co_await?")]] CoTask<>
    {
        struct promise_type
        {
            std::coroutine_handle<> precursor;

            std::exception_ptr unhandledException;

            std::coroutine_handle<promise_type> get_return_object() noexcept
            {
                return std::coroutine_handle<promise_type>::from_promise(*this);
            }

            std::suspend_never initial_suspend() const noexcept { return {}; }

            void unhandled_exception()
            {
                unhandledException = std::current_exception();
            }

            auto final_suspend() const noexcept
            {
                struct awaiter
                {
                    bool await_ready() const noexcept { return false; }

                    void await_resume() const noexcept {}

                    std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> h) noexcept
                    {
                        auto precursor = h.promise().precursor;
                        if (precursor)
                        {
                            return precursor;
                        }
                        return std::noop_coroutine();
                    }
                };
                return awaiter{};
            }

            void return_void() noexcept
            {
            }
        };

        bool await_ready() const noexcept
        {
            return handle.done();
        }

        void await_resume() const
        {
            auto &promise = handle.promise();
            if (promise.unhandledException)
            {
                std::rethrow_exception(promise.unhandledException);
            }
        }

        void await_suspend(std::coroutine_handle<> coroutine) const noexcept
        {
            handle.promise().precursor = coroutine;
        }

        bool IsDone() const { return handle == nullptr || handle.done(); }

        void GetResult()
        {
            while (!handle.done())
            {
                CoDispatcher::CurrentDispatcher().PumpMessages(true);
            }
            auto h = std::exchange(handle, nullptr);
            std::exception_ptr exception = h.promise().unhandledException;
            h.destroy();
            if (exception)
            {
                std::rethrow_exception(exception);
            }
        }

        std::coroutine_handle<promise_type> handle;

        CoTask()
            : handle(nullptr)
        {
        }

        CoTask(std::coroutine_handle<promise_type> handle)
            : handle(handle)
        {
        }

        CoTask(CoTask<> &&other)
            : handle(std::exchange(other.handle, nullptr))
        {
        }
        CoTask<> &operator=(CoTask<> &&other)
        {
            if (this != &other)
            {
                if (this->handle != nullptr)
                {
                    this->handle.destroy();
                }
                this->handle = std::exchange(other.handle, nullptr);
            }
            return *this;
        }
        ~CoTask()
        {
            if (handle != nullptr)
            {
                handle.destroy();
            }
        }
    };

    //***************************************************************

    /**
     * @brief Suspend the current coroutine; resume it on the foreground thread after a delay.
     */
    inline auto CoDelay(CoDispatcher::TimeMs delayMs) noexcept
    {
        struct awaiter
        {
            CoDispatcher::TimeMs delayMs;

            bool await_ready() const noexcept { return false; }

            void await_suspend(std::coroutine_handle<> coroutine) noexcept
            {
                CoDispatcher::CurrentDispatcher().PostDelayed(delayMs, coroutine);
            }

            void await_resume() const noexcept
            {
            }
        };
        return awaiter{delayMs};
    }

    /**
     * @brief Continue the current coroutine on the foreground thread.
     */
    inline auto CoForeground() noexcept
    {
        struct awaiter
        {
            bool await_ready() const noexcept { return false; }

            void await_suspend(std::coroutine_handle<> coroutine) noexcept
            {
                CoDispatcher::CurrentDispatcher().Post(coroutine);
            }

            void await_resume() const noexcept
            {
            }
        };
        return awaiter{};
    }

    /**
     * @brief Continue the current coroutine on a worker-pool thread.
     *
     * Code that awaits a task which runs in the background must not inspect the
     * task until it has returned to the foreground with CoForeground().
     */
    inline auto CoBackground() noexcept
    {
        struct awaiter
        {
            bool await_ready() const noexcept { return false; }

            void await_suspend(std::coroutine_handle<> coroutine) noexcept
            {
                CoDispatcher::CurrentDispatcher().PostBackground(coroutine);
            }

            void await_resume() const noexcept
            {
            }
        };
        return awaiter{};
    }

    /**************************/

    inline CoDispatcher &CoDispatcher::CurrentDispatcher()
    {
        CoDispatcher *pResult = pInstance;
        if (pResult == nullptr)
            pResult = pInstance = CoDispatcher::CreateMainDispatcher();
        return *pResult;
    }

    template <typename T>
    T CoTask<T>::GetResult()
    {
        while (!handle.done())
        {
            CoDispatcher::CurrentDispatcher().PumpMessages(true);
        }
        auto h = std::exchange(handle, nullptr);
        auto &promise = h.promise();
        if (promise.unhandledException)
        {
            std::exception_ptr exception = promise.unhandledException;
            h.destroy();
            std::rethrow_exception(exception);
        }
        T value = std::move(promise.data);
        h.destroy();
        return value;
    }

} // namespace
