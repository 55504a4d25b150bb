///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Facade to the logging subsystem
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

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace scope
{

/**
 * Facade to the logging subsystem: an optional stderr sink and an optional
 * primary log file, both filtered at the primary log level.
 */
class LogManager
{
   std::shared_ptr<logging::LoggingCore> loggingCore_;
   logging::Logger internalLogger_;

   mutable std::mutex mutex_;

   logging::LogLevel primaryLogLevel_;

   bool usingStdErr_;
   std::shared_ptr<logging::LogSink> stdErrSink_;

   std::string primaryFilename_;
   std::shared_ptr<logging::LogSink> primaryFileSink_;

   static const logging::SinkMode PrimarySinkMode;

public:
   LogManager();

   void SetUseStdErr(bool flag);
   bool IsUsingStdErr() const;

   void SetPrimaryLogFilename(const std::string& filename, bool truncate);
   std::string GetPrimaryLogFilename() const;
   bool IsUsingPrimaryLogFile() const;

   void SetPrimaryLogLevel(logging::LogLevel level);
   logging::LogLevel GetPrimaryLogLevel() const;

   logging::Logger NewLogger(const std::string& label);
};

} // namespace scope
