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
#include "Metadata.h"
#include "MetadataFormatter.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>


namespace scope
{
namespace logging
{


class CannotOpenFileException : public std::runtime_error
{
public:
   explicit CannotOpenFileException(const std::string& filename) :
      std::runtime_error("Cannot open log file " + filename)
   {}
};


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Metadata& metadata) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   explicit LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   virtual bool Filter(const Metadata& metadata) const
   { return metadata.GetLevel() >= minLevel_; }
};


/**
 * Destination of log entries. Consume() is only ever called by one thread at
 * a time (the logging core serializes delivery per sink mode).
 */
class LogSink
{
   mutable std::mutex filterMutex_;
   std::shared_ptr<EntryFilter> filter_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter);
   bool Accepts(const Metadata& metadata) const;

   virtual void Consume(const Metadata& metadata,
         const std::vector<internal::EntryLine>& lines) = 0;
};


class StdErrLogSink : public LogSink
{
   internal::MetadataFormatter formatter_;

public:
   virtual void Consume(const Metadata& metadata,
         const std::vector<internal::EntryLine>& lines);
};


class FileLogSink : public LogSink
{
   std::string filename_;
   std::ofstream fileStream_;
   internal::MetadataFormatter formatter_;

public:
   // Throws CannotOpenFileException
   FileLogSink(const std::string& filename, bool append);

   const std::string& GetFilename() const { return filename_; }

   virtual void Consume(const Metadata& metadata,
         const std::vector<internal::EntryLine>& lines);
};


namespace internal
{

void WriteEntryLines(std::ostream& stream, MetadataFormatter& formatter,
      const Metadata& metadata, const std::vector<EntryLine>& lines);

} // namespace internal


} // namespace logging
} // namespace scope
