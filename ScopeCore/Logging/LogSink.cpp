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

#include "LogSink.h"

#include <iostream>

namespace scope
{
namespace logging
{


void
LogSink::SetFilter(std::shared_ptr<EntryFilter> filter)
{
   std::lock_guard<std::mutex> lock(filterMutex_);
   filter_ = filter;
}


bool
LogSink::Accepts(const Metadata& metadata) const
{
   std::shared_ptr<EntryFilter> filter;
   {
      std::lock_guard<std::mutex> lock(filterMutex_);
      filter = filter_;
   }
   return !filter || filter->Filter(metadata);
}


void
internal::WriteEntryLines(std::ostream& stream, MetadataFormatter& formatter,
      const Metadata& metadata, const std::vector<EntryLine>& lines)
{
   for (std::vector<EntryLine>::const_iterator it = lines.begin(),
         end = lines.end(); it != end; ++it)
   {
      if (it->state == LineStateEntryFirstLine)
         formatter.FormatLinePrefix(stream, metadata);
      else
         formatter.FormatContinuationPrefix(stream);

      if (it->state == LineStateLineContinuation)
         stream << " ...";
      stream << ' ' << it->text << '\n';
   }
}


void
StdErrLogSink::Consume(const Metadata& metadata,
      const std::vector<internal::EntryLine>& lines)
{
   internal::WriteEntryLines(std::clog, formatter_, metadata, lines);
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException(filename_);
}


void
FileLogSink::Consume(const Metadata& metadata,
      const std::vector<internal::EntryLine>& lines)
{
   internal::WriteEntryLines(fileStream_, formatter_, metadata, lines);
   fileStream_.flush();
}


} // namespace logging
} // namespace scope
