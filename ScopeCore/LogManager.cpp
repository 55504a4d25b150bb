///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.cpp
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

#include "LogManager.h"

#include "CoreUtils.h"
#include "Error.h"

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace scope
{

namespace
{

const char* StringForLogLevel(logging::LogLevel level)
{
   switch (level)
   {
      case logging::LogLevelTrace: return "trace";
      case logging::LogLevelDebug: return "debug";
      case logging::LogLevelInfo: return "info";
      case logging::LogLevelWarning: return "warning";
      case logging::LogLevelError: return "error";
      case logging::LogLevelFatal: return "fatal";
      default: return "(unknown)";
   }
}

} // anonymous namespace

const logging::SinkMode LogManager::PrimarySinkMode = logging::SinkModeAsynchronous;

LogManager::LogManager() :
   loggingCore_(std::make_shared<logging::LoggingCore>()),
   internalLogger_(loggingCore_->NewLogger("LogManager")),
   primaryLogLevel_(logging::LogLevelInfo),
   usingStdErr_(false)
{}


void
LogManager::SetUseStdErr(bool flag)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (flag == usingStdErr_)
      return;

   usingStdErr_ = flag;
   if (flag)
   {
      if (!stdErrSink_)
      {
         stdErrSink_ = std::make_shared<logging::StdErrLogSink>();
         stdErrSink_->SetFilter(
               std::make_shared<logging::LevelFilter>(primaryLogLevel_));
      }
      loggingCore_->AddSink(stdErrSink_, PrimarySinkMode);

      LOG_INFO(internalLogger_) << "Enabled logging to stderr";
   }
   else
   {
      LOG_INFO(internalLogger_) << "Disabling logging to stderr";

      loggingCore_->RemoveSink(stdErrSink_, PrimarySinkMode);
   }
}


bool
LogManager::IsUsingStdErr() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return usingStdErr_;
}


void
LogManager::SetPrimaryLogFilename(const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (filename == primaryFilename_)
      return;

   primaryFilename_ = filename;

   if (primaryFilename_.empty())
   {
      if (primaryFileSink_)
      {
         LOG_INFO(internalLogger_) << "Disabling primary log file";
         loggingCore_->RemoveSink(primaryFileSink_, PrimarySinkMode);
         primaryFileSink_.reset();
      }
      return;
   }

   std::shared_ptr<logging::LogSink> newSink;
   try
   {
      newSink = std::make_shared<logging::FileLogSink>(primaryFilename_, !truncate);
   }
   catch (const logging::CannotOpenFileException&)
   {
      LOG_ERROR(internalLogger_) << "Failed to open file " <<
         filename << " as primary log file";
      if (primaryFileSink_)
      {
         LOG_INFO(internalLogger_) << "Disabling primary log file";
         loggingCore_->RemoveSink(primaryFileSink_, PrimarySinkMode);
      }
      primaryFileSink_.reset();
      primaryFilename_.clear();
      throw CScopeError("Cannot open file " + ToQuotedString(filename),
            SCOPEERR_FileOpenFailed);
   }

   newSink->SetFilter(std::make_shared<logging::LevelFilter>(primaryLogLevel_));

   if (!primaryFileSink_)
   {
      loggingCore_->AddSink(newSink, PrimarySinkMode);
      primaryFileSink_ = newSink;
      LOG_INFO(internalLogger_) << "Enabled primary log file " <<
         primaryFilename_;
   }
   else
   {
      // Swap atomically so that no entries are lost between the two files.
      LOG_INFO(internalLogger_) << "Switching primary log file";
      std::vector<std::pair<std::shared_ptr<logging::LogSink>, logging::SinkMode>> toRemove;
      std::vector<std::pair<std::shared_ptr<logging::LogSink>, logging::SinkMode>> toAdd;
      toRemove.push_back(std::make_pair(primaryFileSink_, PrimarySinkMode));
      toAdd.push_back(std::make_pair(newSink, PrimarySinkMode));

      loggingCore_->SwapSinks(toRemove, toAdd);
      primaryFileSink_ = newSink;
      LOG_INFO(internalLogger_) << "Switched primary log file to " <<
         primaryFilename_;
   }
}


std::string
LogManager::GetPrimaryLogFilename() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryFilename_;
}


bool
LogManager::IsUsingPrimaryLogFile() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return !primaryFilename_.empty();
}


void
LogManager::SetPrimaryLogLevel(logging::LogLevel level)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (level == primaryLogLevel_)
      return;

   logging::LogLevel oldLevel = primaryLogLevel_;
   primaryLogLevel_ = level;

   std::shared_ptr<logging::EntryFilter> filter =
      std::make_shared<logging::LevelFilter>(level);
   if (stdErrSink_)
      stdErrSink_->SetFilter(filter);
   if (primaryFileSink_)
      primaryFileSink_->SetFilter(filter);

   LOG_INFO(internalLogger_) << "Switched primary log level from " <<
      StringForLogLevel(oldLevel) << " to " << StringForLogLevel(level);
}


logging::LogLevel
LogManager::GetPrimaryLogLevel() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryLogLevel_;
}


logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return loggingCore_->NewLogger(label);
}

} // namespace scope
