///////////////////////////////////////////////////////////////////////////////
// FILE:          ThreadPool.h
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

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace scope
{

class ThreadPool final
{
public:
    typedef std::function<void()> Task;

    explicit ThreadPool(size_t threadCount);
    ~ThreadPool();

    size_t GetSize() const;
    size_t GetQueuedCount() const;

    // Returns false if the pool is shutting down and the task was dropped.
    bool Execute(Task task);

    // Stops accepting tasks, drops the ones still queued and joins workers.
    // Tasks already running are expected to observe their own stop flags.
    void Shutdown();

private:
    void ThreadFunc();

private:
    std::vector<std::unique_ptr<std::thread>> threads_{};
    bool abortFlag_{ false };
    mutable std::mutex mx_{};
    std::condition_variable cv_{};
    std::deque<Task> queue_{};
};

} // namespace scope
