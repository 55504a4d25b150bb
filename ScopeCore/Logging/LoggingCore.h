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

#pragma once

#include "LineSplitter.h"
#include "LogSink.h"
#include "Metadata.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>


namespace scope
{
namespace logging
{

class Logger;


enum SinkMode
{
   SinkModeSynchronous,
   SinkModeAsynchronous,
};


/**
 * Central dispatcher of log entries. Loggers hold a shared pointer to it, so
 * it must be created with std::make_shared.
 *
 * Synchronous sinks receive each entry on the logging thread, serialized by
 * a mutex. Asynchronous sinks receive entries on a background thread; the
 * queue is drained when the core is destroyed.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   typedef std::pair<Metadata, std::vector<internal::EntryLine>> QueuedEntry;

   std::mutex syncSinksMutex_;
   std::vector<std::shared_ptr<LogSink>> syncSinks_;

   std::mutex asyncMutex_;
   std::condition_variable asyncCondVar_;
   std::vector<std::shared_ptr<LogSink>> asyncSinks_;
   std::deque<QueuedEntry> asyncQueue_;
   bool stopAsync_;
   std::thread asyncThread_;

public:
   LoggingCore();
   ~LoggingCore();

   LoggingCore(const LoggingCore&) = delete;
   LoggingCore& operator=(const LoggingCore&) = delete;

   void AddSink(std::shared_ptr<LogSink> sink, SinkMode mode);
   void RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode);

   // Replace one set of sinks with another without losing entries between
   // the two (used for log file switching).
   void SwapSinks(const std::vector<std::pair<std::shared_ptr<LogSink>, SinkMode>>& toRemove,
         const std::vector<std::pair<std::shared_ptr<LogSink>, SinkMode>>& toAdd);

   Logger NewLogger(const std::string& componentLabel);

   void SendEntry(const LoggerData& loggerData, LogLevel level,
         const char* entryText);

private:
   void StartAsyncThreadIfNeeded();
   void RunAsyncThread();
};


} // namespace logging
} // namespace scope
