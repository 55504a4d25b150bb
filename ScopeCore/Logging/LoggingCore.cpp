// COPYRIGHT:     SpecimenScope contributors, 2026
//                All Rights reserved
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

#include "LoggingCore.h"

#include "Logger.h"

#include <algorithm>
#include <chrono>

namespace scope
{
namespace logging
{


LoggingCore::LoggingCore() :
   stopAsync_(false)
{}


LoggingCore::~LoggingCore()
{
   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      stopAsync_ = true;
   }
   asyncCondVar_.notify_all();
   if (asyncThread_.joinable())
      asyncThread_.join();
}


void
LoggingCore::SwapSinks(
      const std::vector<std::pair<std::shared_ptr<LogSink>, SinkMode>>& toRemove,
      const std::vector<std::pair<std::shared_ptr<LogSink>, SinkMode>>& toAdd)
{
   std::lock_guard<std::mutex> syncLock(syncSinksMutex_);
   std::lock_guard<std::mutex> asyncLock(asyncMutex_);

   for (const auto& sinkAndMode : toRemove)
   {
      std::vector<std::shared_ptr<LogSink>>& sinks =
         (sinkAndMode.second == SinkModeSynchronous) ? syncSinks_ : asyncSinks_;
      sinks.erase(std::remove(sinks.begin(), sinks.end(), sinkAndMode.first),
            sinks.end());
   }
   for (const auto& sinkAndMode : toAdd)
   {
      if (sinkAndMode.second == SinkModeSynchronous)
         syncSinks_.push_back(sinkAndMode.first);
      else
         asyncSinks_.push_back(sinkAndMode.first);
   }
   if (!asyncSinks_.empty() && !asyncThread_.joinable())
      asyncThread_ = std::thread(&LoggingCore::RunAsyncThread, this);
}


Logger
LoggingCore::NewLogger(const std::string& componentLabel)
{
   return Logger(shared_from_this(), componentLabel);
}


void
LoggingCore::SendEntry(const LoggerData& loggerData, LogLevel level,
      const char* entryText)
{
   Metadata metadata(loggerData, level);
   std::vector<internal::EntryLine> lines;
   internal::SplitEntryIntoLines(entryText, lines);

   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      for (const auto& sink : syncSinks_)
      {
         if (sink->Accepts(metadata))
            sink->Consume(metadata, lines);
      }
   }

   bool haveAsync = false;
   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      if (!asyncSinks_.empty())
      {
         asyncQueue_.push_back(std::make_pair(metadata, lines));
         haveAsync = true;
      }
   }
   if (haveAsync)
      asyncCondVar_.notify_one();
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      syncSinks_.push_back(sink);
      return;
   }

   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      asyncSinks_.push_back(sink);
   }
   StartAsyncThreadIfNeeded();
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      syncSinks_.erase(std::remove(syncSinks_.begin(), syncSinks_.end(), sink),
            syncSinks_.end());
      return;
   }

   std::lock_guard<std::mutex> lock(asyncMutex_);
   asyncSinks_.erase(std::remove(asyncSinks_.begin(), asyncSinks_.end(), sink),
         asyncSinks_.end());
}


void
LoggingCore::StartAsyncThreadIfNeeded()
{
   std::lock_guard<std::mutex> lock(asyncMutex_);
   if (!asyncThread_.joinable())
      asyncThread_ = std::thread(&LoggingCore::RunAsyncThread, this);
}


void
LoggingCore::RunAsyncThread()
{
   std::deque<QueuedEntry> batch;
   std::vector<std::shared_ptr<LogSink>> sinks;

   for (;;)
   {
      bool stopping;
      {
         std::unique_lock<std::mutex> lock(asyncMutex_);
         asyncCondVar_.wait_for(lock, std::chrono::milliseconds(30),
               [this] { return stopAsync_ || !asyncQueue_.empty(); });
         batch.swap(asyncQueue_);
         sinks = asyncSinks_;
         stopping = stopAsync_;
      }

      for (const auto& entry : batch)
      {
         for (const auto& sink : sinks)
         {
            if (sink->Accepts(entry.first))
               sink->Consume(entry.first, entry.second);
         }
      }
      batch.clear();

      if (stopping)
         break;
   }
}


} // namespace logging
} // namespace scope
