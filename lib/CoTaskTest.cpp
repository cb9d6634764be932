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

#include <iostream>
#include <chrono>
#include <thread>
#include <atomic>
#include <vector>
#include <exception>
#include <stdexcept>
#include <cassert>

using namespace cotask;
using namespace std;

/****** DelayTest ************************************/
CoTask<int> DelayTask2(int instance)
{
    cout << "    Enter Task2(" << instance << ")" << endl;
    co_await CoDelay(100ms);
    cout << "    Exit Task2(" << instance << ")" << endl;
    co_return 1;
}

CoTask<int> DelayTask1()
{
    auto startMs = CoDispatcher::Now();
    int checkPoints = 1;

    cout << "Enter Task1" << endl;

    co_await CoDelay(100ms);
    ++checkPoints;

    checkPoints += co_await DelayTask2(0);
    checkPoints += co_await DelayTask2(1);
    cout << "Exit Task1" << endl;

    auto elapsed = CoDispatcher::Now() - startMs;
    assert(elapsed.count() >= 300);
    assert(checkPoints == 4);
    co_return checkPoints;
}

void DelayTest()
{
    cout << "--- DelayTest" << endl;
    CoTask<int> task = DelayTask1();

    int result = task.GetResult();
    assert(result == 4);

    CoDispatcher::DestroyDispatcher();
    cout << "--- DelayTest Done" << endl;
}

void ConceptsTest()
{
    static_assert(Awaitable<CoTask<int>, int>);
    static_assert(Awaitable<CoTask<>, void>);
}

/***************************/
CoTask<> BackgroundTask1()
{
    assert(Dispatcher().IsForeground());

    co_await CoBackground();
    cout << "        IsForeground: " << Dispatcher().IsForeground() << endl;
    assert(!Dispatcher().IsForeground());

    co_await CoForeground();
    cout << "        IsForeground: " << Dispatcher().IsForeground() << endl;
    assert(Dispatcher().IsForeground());
}

void BackgroundTest()
{
    cout << "--- BackgroundTest" << endl;
    {
        CoTask<> task = BackgroundTask1();
        task.GetResult();
    }
    Dispatcher().PumpUntilIdle();
    CoDispatcher::DestroyDispatcher();
    cout << "--- BackgroundTest Done" << endl;
}

/***************************/
CoTask<int> BackgroundNested()
{
    cout << "Nest>" << endl;
    co_await BackgroundTask1();
    cout << "<Nest" << endl;
    co_return 7;
}

void BackgroundNestedTest()
{
    cout << "--- BackgroundNestedTest" << endl;
    {
        CoTask<int> task = BackgroundNested();
        assert(task.GetResult() == 7);
    }
    assert(Dispatcher().IsDone());
    CoDispatcher::DestroyDispatcher();
    cout << "--- BackgroundNestedTest Done" << endl;
}

/***************************/
CoTask<bool> SlowBackgroundWork(std::atomic<int> *pInFlight, std::atomic<int> *pMaxInFlight)
{
    co_await CoBackground();
    int current = ++(*pInFlight);
    int observed = pMaxInFlight->load();
    while (current > observed && !pMaxInFlight->compare_exchange_weak(observed, current))
    {
    }
    std::this_thread::sleep_for(50ms);
    --(*pInFlight);
    co_await CoForeground();
    co_return true;
}

CoTask<int> ParallelBackgroundWork(std::atomic<int> *pInFlight, std::atomic<int> *pMaxInFlight)
{
    std::vector<CoTask<bool>> tasks;
    for (int i = 0; i < 8; ++i)
    {
        tasks.push_back(SlowBackgroundWork(pInFlight, pMaxInFlight));
    }
    int completed = 0;
    for (auto &task : tasks)
    {
        if (co_await task)
        {
            ++completed;
        }
    }
    co_return completed;
}

void ParallelBackgroundTest()
{
    cout << "--- ParallelBackgroundTest" << endl;
    Dispatcher().SetThreadPoolSize(4);

    std::atomic<int> inFlight = 0;
    std::atomic<int> maxInFlight = 0;
    {
        CoTask<int> task = ParallelBackgroundWork(&inFlight, &maxInFlight);
        assert(task.GetResult() == 8);
    }
    cout << "    Max in flight: " << maxInFlight.load() << endl;
    assert(maxInFlight.load() <= 4);
    assert(maxInFlight.load() >= 1);
    CoDispatcher::DestroyDispatcher();
    cout << "--- ParallelBackgroundTest Done" << endl;
}

/**************************************/
void TestThreadPoolSizing()
{
    cout << "--- TestThreadPoolSizing" << endl;
    CoDispatcher &dispatcher = CoDispatcher::CurrentDispatcher();

    dispatcher.SetThreadPoolSize(5);

    size_t threadPoolSize = CoDispatcher::Instrumentation::GetThreadPoolSize();
    assert(threadPoolSize == 5);
    dispatcher.SetThreadPoolSize(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100ms));

    CoDispatcher::CurrentDispatcher().PumpMessages(); // and for the dead threads to be reclaimed.

    threadPoolSize = CoDispatcher::Instrumentation::GetThreadPoolSize();
    assert(threadPoolSize == 1);
    size_t deadThreadCount = CoDispatcher::Instrumentation::GetNumberOfDeadThreads();
    assert(deadThreadCount == 0);

    CoDispatcher::DestroyDispatcher();
    cout << "--- TestThreadPoolSizing Done" << endl;
}

/** DelayedFunctionTest *************************************/
void DelayedFunctionTest()
{
    cout << "--- DelayedFunctionTest" << endl;
    std::vector<int> order;

    Dispatcher().PostDelayedFunction(60ms, [&order]() { order.push_back(3); });
    Dispatcher().PostDelayedFunction(20ms, [&order]() { order.push_back(1); });
    uint64_t cancelled = Dispatcher().PostDelayedFunction(40ms, [&order]() { order.push_back(2); });
    Dispatcher().PostDelayedFunction(0ms, [&order]() { order.push_back(0); });

    assert(Dispatcher().CancelDelayedFunction(cancelled));
    assert(!Dispatcher().CancelDelayedFunction(cancelled));

    while (order.size() < 3)
    {
        Dispatcher().PumpMessages(true);
    }
    assert((order == std::vector<int>{0, 1, 3}));

    CoDispatcher::DestroyDispatcher();
    cout << "--- DelayedFunctionTest Done" << endl;
}

/** StartThreadTest *************************************/
CoTask<> CountingThread(int *pCount)
{
    co_await CoDelay(10ms);
    ++(*pCount);
}

CoTask<> FailingThread()
{
    co_await CoDelay(10ms);
    throw std::logic_error("Expected exception.");
}

void StartThreadTest()
{
    cout << "--- StartThreadTest" << endl;
    int count = 0;
    Dispatcher().StartThread(CountingThread(&count));
    Dispatcher().StartThread(CountingThread(&count));
    Dispatcher().StartThread(FailingThread()); // logged, not propagated.

    while (CoDispatcher::Instrumentation::GetNumberOfRunningThreads() != 0)
    {
        Dispatcher().PumpMessages(true);
    }
    assert(count == 2);

    CoDispatcher::DestroyDispatcher();
    cout << "--- StartThreadTest Done" << endl;
}

/** VoidTest *************************************/

CoTask<> VoidTask1()
{
    co_await CoDelay(100ms);
}

CoTask<> VoidTask2()
{
    throw std::logic_error("Expected exception.");
    co_return;
}

void VoidTest()
{
    cout << "--- VoidTest" << endl;
    CoTask<> task = VoidTask1();
    task.GetResult();

    bool caught = false;
    try
    {
        CoTask<> task = VoidTask2();
        task.GetResult();
    }
    catch (const std::exception &e)
    {
        caught = true;
        cout << "Expected exception: " << e.what() << endl;
    }
    assert(caught);
    CoDispatcher::DestroyDispatcher();
    cout << "--- VoidTest Done" << endl;
}
/***************************************/

CoTask<> CatchTest1()
{
    co_await CoDelay(30ms);
    cout << "          Throwing..." << endl;
    throw std::logic_error("Expected exception");
    co_return;
}

CoTask<std::string> CatchIntercept2()
{
    try
    {
        co_await CatchTest1();
    }
    catch (const std::exception &e)
    {
        co_return e.what();
    }
    co_return "No error thrown.";
}
CoTask<std::string> CatchPassThrough2()
{
    co_await CatchTest1();
    co_return "No error thrown.";
}

void CatchTest()
{
    cout << "--- CatchTest" << endl;
    // exceptions propagate through GetResult().
    bool caught = false;
    try
    {
        CoTask<std::string> task = CatchPassThrough2();
        std::string result = task.GetResult();
    }
    catch (const std::exception &e)
    {
        caught = true;
        cout << "Expected exception: " << e.what() << endl;
    }
    assert(caught);

    caught = false;
    try
    {
        CoTask<> task = CatchTest1();
        task.GetResult();
    }
    catch (const std::exception &e)
    {
        caught = true;
        cout << "Expected exception: " << e.what() << endl;
    }
    assert(caught);

    {
        CoTask<std::string> task = CatchIntercept2();
        std::string result = task.GetResult();
        cout << "exception handled in coroutine: " << result << endl;
        assert(result == "Expected exception");
    }
    CoDispatcher::DestroyDispatcher();
    cout << "--- CatchTest Done" << endl;
}
/***************************************/
int main(int argc, char **argv)
{
    ConceptsTest();
    CatchTest();
    VoidTest();
    DelayedFunctionTest();
    StartThreadTest();
    TestThreadPoolSizing();
    BackgroundTest();
    BackgroundNestedTest();
    ParallelBackgroundTest();
    DelayTest();

    CoDispatcher::DestroyDispatcher();
    return 0;
}
