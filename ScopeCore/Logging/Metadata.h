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

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#else
#include <pthread.h>
#endif

#include <chrono>
#include <string>


namespace scope
{
namespace logging
{

namespace internal
{

inline std::chrono::time_point<std::chrono::system_clock>
Now()
{ return std::chrono::system_clock::now(); }


#ifdef _WIN32
typedef DWORD ThreadIdType;

inline ThreadIdType
GetTid() { return ::GetCurrentThreadId(); }
#else
typedef pthread_t ThreadIdType;

inline ThreadIdType
GetTid() { return ::pthread_self(); }
#endif


} // namespace internal


enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


/**
 * Per-logger data: the component label, interned so that entries can carry
 * it as a plain pointer.
 */
class LoggerData
{
   const char* component_;

public:
   LoggerData(const char* componentLabel) :
      component_(InternString(componentLabel))
   {}
   LoggerData(const std::string& componentLabel) :
      component_(InternString(componentLabel))
   {}

   const char* GetComponentLabel() const { return component_; }

private:
   static const char* InternString(const std::string& s);
};


/**
 * Metadata of one log entry: who logged it, at which level, when and from
 * which thread.
 */
class Metadata
{
   LoggerData loggerData_;
   LogLevel level_;
   std::chrono::time_point<std::chrono::system_clock> time_;
   internal::ThreadIdType tid_;

public:
   Metadata(const LoggerData& loggerData, LogLevel level) :
      loggerData_(loggerData),
      level_(level),
      time_(internal::Now()),
      tid_(internal::GetTid())
   {}

   const LoggerData& GetLoggerData() const { return loggerData_; }
   LogLevel GetLevel() const { return level_; }
   std::chrono::time_point<std::chrono::system_clock> GetTimestamp() const
   { return time_; }
   internal::ThreadIdType GetThreadId() const { return tid_; }
};


} // namespace logging
} // namespace scope
