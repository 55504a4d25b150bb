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

#include "LoggingCore.h"
#include "Metadata.h"

#include <memory>
#include <sstream>
#include <string>


namespace scope
{
namespace logging
{


/**
 * Lightweight, copyable handle used by components to send entries.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   LoggerData loggerData_;

public:
   Logger(std::shared_ptr<LoggingCore> core, const std::string& label) :
      core_(core),
      loggerData_(label)
   {}

   void operator()(LogLevel level, const char* entryText) const
   { core_->SendEntry(loggerData_, level, entryText); }

   void operator()(LogLevel level, const std::string& entryText) const
   { (*this)(level, entryText.c_str()); }
};


namespace internal
{

// Collects streamed values and sends them as one entry on destruction. Used
// through the LOG_* macros only.
class LogStream
{
   const Logger& logger_;
   LogLevel level_;
   std::ostringstream stream_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger),
      level_(level)
   {}

   ~LogStream()
   { logger_(level_, stream_.str()); }

   template <typename T>
   LogStream& operator<<(const T& value)
   {
      stream_ << value;
      return *this;
   }
};

} // namespace internal


} // namespace logging
} // namespace scope


#define LOG_WITH_LEVEL(logger, level) \
   ::scope::logging::internal::LogStream((logger), (level))

#define LOG_TRACE(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelTrace)
#define LOG_DEBUG(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelDebug)
#define LOG_INFO(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelInfo)
#define LOG_WARNING(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelWarning)
#define LOG_ERROR(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelError)
#define LOG_FATAL(logger) \
   LOG_WITH_LEVEL((logger), ::scope::logging::LogLevelFatal)
