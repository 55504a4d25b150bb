///////////////////////////////////////////////////////////////////////////////
// FILE:          ThreadPool.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Fixed-size pool of worker threads executing queued tasks
//
// COPYRIGHT:     SpecimenScope contributors, 2026
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "ThreadPool.h"

#include <algorithm>
#include <mutex>
#include <thread>
#include <utility>

namespace scope
{

ThreadPool::ThreadPool(size_t threadCount)
{
    const size_t count = std::max<size_t>(1, threadCount);
    for (size_t n = 0; n < count; ++n)
    {
        auto thread = std::make_unique<std::thread>(&ThreadPool::ThreadFunc, this);
        threads_.push_back(std::move(thread));
    }
}

ThreadPool::~ThreadPool()
{
    Shutdown();
}

size_t ThreadPool::GetSize() const
{
    return threads_.size();
}

size_t ThreadPool::GetQueuedCount() const
{
    std::lock_guard<std::mutex> lock(mx_);
    return queue_.size();
}

bool ThreadPool::Execute(Task task)
{
    if (!task)
        return false;
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (abortFlag_)
            return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (abortFlag_)
            return;
        abortFlag_ = true;
        queue_.clear();
    }
    cv_.notify_all();

    for (const auto& thread : threads_)
    {
        if (thread->joinable())
            thread->join();
    }
}

void ThreadPool::ThreadFunc()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mx_);
            cv_.wait(lock, [&]() { return abortFlag_ || !queue_.empty(); });
            if (abortFlag_)
                break;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace scope
