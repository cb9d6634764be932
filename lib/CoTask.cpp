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
#include <chrono>
#include <thread>
#include <stdexcept>
#include "ss.h"
#include "CoTaskSchedulerPool.h"

using namespace cotask;
using namespace std;

using Clock = std::chrono::steady_clock;

thread_local CoDispatcher *CoDispatcher::pInstance;
std::mutex CoDispatcher::gLogMutex;

// Upper bound on an idle wait, so that a missed notification can only delay the loop, never hang it.
static constexpr CoDispatcher::TimeMs MAX_IDLE_WAIT = 1000ms;

CoDispatcher::TimeMs CoDispatcher::Now()
{
    auto duration = Clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

void CoDispatcher::PostDelayed(TimeMs delay, const std::coroutine_handle<> &handle)
{
    if (!IsForeground())
    {
        pForegroundDispatcher->PostDelayed(delay, handle);
        return;
    }
    {
        std::lock_guard lock{this->schedulerMutex};
        coroutineTimerQueue.push(CoroutineTimerEntry{Now() + delay, handle});
    }
    PumpMessageNotifyOne();
}

uint64_t CoDispatcher::PostDelayedFunction(TimeMs delay, std::function<void(void)> callback)
{
    if (!IsForeground())
    {
        return pForegroundDispatcher->PostDelayedFunction(delay, std::move(callback));
    }
    uint64_t handle;
    {
        std::lock_guard lock{this->schedulerMutex};
        handle = ++nextTimerHandle;
        TimerFunctionEntry entry{Now() + delay, std::move(callback), handle};
        auto i = functionTimerQueue.begin();
        while (i != functionTimerQueue.end() && i->time <= entry.time)
        {
            ++i;
        }
        functionTimerQueue.insert(i, std::move(entry));
    }
    PumpMessageNotifyOne();
    return handle;
}

bool CoDispatcher::CancelDelayedFunction(uint64_t handle)
{
    if (!IsForeground())
    {
        return pForegroundDispatcher->CancelDelayedFunction(handle);
    }
    std::lock_guard lock{this->schedulerMutex};

    for (auto i = functionTimerQueue.begin(); i != functionTimerQueue.end(); ++i)
    {
        if (i->timerHandle == handle)
        {
            functionTimerQueue.erase(i);
            return true;
        }
    }
    return false;
}

void CoDispatcher::PostBackground(std::coroutine_handle<> handle)
{
    this->pSchedulerPool->Post(handle);
}

void CoDispatcher::Post(std::coroutine_handle<> handle)
{
    if (!IsForeground())
    {
        pForegroundDispatcher->Post(handle);
        return;
    }
    {
        std::unique_lock lock{schedulerMutex};
        queue.push(handle);
    }
    PumpMessageNotifyOne();
}

void CoDispatcher::PumpUntilIdle()
{
    while (!IsDone())
    {
        PumpMessages(true);
    }
}

void CoDispatcher::SetThreadPoolSize(size_t size)
{
    if (!IsForeground())
    {
        throw std::logic_error("Not allowed on a background thread.");
    }
    pSchedulerPool->Resize(size);
}

size_t CoDispatcher::GetThreadPoolSize() const
{
    return pSchedulerPool->GetSize();
}

bool CoDispatcher::PumpTimerMessages(TimeMs time)
{
    std::unique_lock<std::mutex> lock{schedulerMutex};

    bool coroutineReady = !coroutineTimerQueue.empty() && coroutineTimerQueue.top().time <= time;
    bool functionReady = !functionTimerQueue.empty() && functionTimerQueue.front().time <= time;

    if (functionReady && (!coroutineReady || functionTimerQueue.front().time <= coroutineTimerQueue.top().time))
    {
        auto fn = std::move(functionTimerQueue.front().fn);
        functionTimerQueue.pop_front();
        lock.unlock();
        fn();
        return true;
    }
    if (coroutineReady)
    {
        auto handle = coroutineTimerQueue.top().handle;
        coroutineTimerQueue.pop();
        lock.unlock();
        handle.resume();
        return true;
    }
    return false;
}

bool CoDispatcher::GetNextTimer(CoDispatcher::TimeMs *pResult)
{
    std::lock_guard lock{schedulerMutex};
    bool result = false;
    if (!coroutineTimerQueue.empty())
    {
        *pResult = coroutineTimerQueue.top().time;
        result = true;
    }
    if (!functionTimerQueue.empty())
    {
        auto t = functionTimerQueue.front().time;
        if (!result || t < *pResult)
        {
            *pResult = t;
        }
        result = true;
    }
    return result;
}

bool CoDispatcher::PumpMessages(bool waitForMessages)
{
    if (PumpMessages())
    {
        return true;
    }
    if (!waitForMessages)
    {
        return false;
    }
    TimeMs waitTime = MAX_IDLE_WAIT;
    TimeMs nextTimer;
    if (GetNextTimer(&nextTimer))
    {
        TimeMs delay = nextTimer - Now();
        if (delay < waitTime)
        {
            waitTime = delay;
        }
    }
    PumpMessageWait(waitTime);
    return PumpMessages();
}

bool CoDispatcher::PumpMessages()
{
    if (!IsForeground())
    {
        throw std::logic_error("Can't pump on a background thread.");
    }

    bool processedAny = false;

    TimeMs now = Now();

    while (true)
    {
        bool processedMessage = false;

        while (PumpTimerMessages(now))
        {
            processedAny = true;
        }

        {
            std::unique_lock<std::mutex> lock{schedulerMutex};
            while (!this->queue.empty())
            {
                processedAny = true;
                processedMessage = true;
                std::coroutine_handle<> t = queue.pop();
                lock.unlock();
                t.resume();
                lock.lock();
            }
        }
        if (!processedMessage)
        {
            pSchedulerPool->ScavengeDeadThreads();
            ScavengeTasks();

            return processedAny;
        }
    }
}

CoDispatcher::CoDispatcher()
{
    this->pForegroundDispatcher = this;
    this->pSchedulerPool = new CoTaskSchedulerPool(this);
}

CoDispatcher::CoDispatcher(CoDispatcher *pForegroundDispatcher, CoTaskSchedulerPool *pSchedulerPool)
{
    this->pForegroundDispatcher = pForegroundDispatcher;
    this->pSchedulerPool = pSchedulerPool;
}

CoDispatcher::~CoDispatcher()
{
    if (IsForeground())
    {
        coroutineThreads.clear();
        delete this->pSchedulerPool;
        this->pSchedulerPool = nullptr;
    }
}

static bool hasMainDispatcher = false;

CoDispatcher *CoDispatcher::CreateMainDispatcher()
{
    if (hasMainDispatcher)
    {
        throw std::logic_error("Operation performed on a non-dispatcher thread.");
    }
    hasMainDispatcher = true;
    return new CoDispatcher();
}

void CoDispatcher::DestroyDispatcher()
{
    if (CoDispatcher::pInstance != nullptr)
    {
        CoDispatcher *p = pInstance;
        if (!p->IsForeground())
        {
            throw std::logic_error("Can only destroy the foreground dispatcher.");
        }
        pInstance = nullptr;
        delete p;
        hasMainDispatcher = false;
    }
}

void CoDispatcher::RemoveThreadDispatcher()
{
    CoDispatcher *p = pInstance;
    pInstance = nullptr;
    if (p != nullptr && !p->IsForeground())
    {
        delete p;
    }
}

bool CoDispatcher::IsDone() const
{
    if (!IsForeground())
    {
        return pForegroundDispatcher->IsDone();
    }
    {
        std::lock_guard lock{const_cast<CoDispatcher *>(this)->schedulerMutex};
        if ((!coroutineTimerQueue.empty()) || (!queue.empty()) || (!functionTimerQueue.empty()))
        {
            return false;
        }
    }
    return pSchedulerPool->IsDone();
}

size_t CoDispatcher::Instrumentation::GetThreadPoolSize()
{
    return CurrentDispatcher().pSchedulerPool->GetSize();
}

size_t CoDispatcher::Instrumentation::GetNumberOfDeadThreads()
{
    return CurrentDispatcher().pSchedulerPool->deadThreads.size();
}

size_t CoDispatcher::Instrumentation::GetNumberOfRunningThreads()
{
    return CurrentDispatcher().coroutineThreads.size();
}

void CoDispatcher::PumpMessageNotifyOne()
{
    std::lock_guard lock{pumpMessageMutex};
    messagePosted = true;
    pumpMessageConditionVariable.notify_one();
}

void CoDispatcher::PumpMessageWait(TimeMs maxWait)
{
    if (maxWait < 1ms)
        maxWait = 1ms;
    std::unique_lock lock{pumpMessageMutex};
    pumpMessageConditionVariable.wait_for(lock, maxWait, [this]() { return messagePosted; });
    messagePosted = false;
}

void CoDispatcher::ScavengeTasks()
{
    for (auto i = coroutineThreads.begin(); i != coroutineThreads.end(); /**/)
    {
        if (i->IsDone())
        {
            try
            {
                if (i->handle != nullptr)
                {
                    i->GetResult();
                }
            }
            catch (const std::exception &e)
            {
                Log().Error(SS("Coroutine thread exited abnormally. (" << e.what() << ")"));
            }
            i = coroutineThreads.erase(i);
        }
        else
        {
            ++i;
        }
    }
}

void CoDispatcher::StartThread(CoTask<> &&task)
{
    if (!IsForeground())
    {
        throw std::logic_error("StartThread must be called on the foreground thread.");
    }
    coroutineThreads.push_front(std::move(task));
    PumpMessageNotifyOne();
}
