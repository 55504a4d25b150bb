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

#include "Metadata.h"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <ostream>
#include <sstream>
#include <string>


namespace scope
{
namespace logging
{
namespace internal
{


inline const char*
LevelString(LogLevel logLevel)
{
   switch (logLevel)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
      default: return "???";
   }
}


// Formats the metadata prefix of the first line of an entry and the blank
// prefix of its continuation lines. Single-threaded use only; each sink owns
// its own formatter.
class MetadataFormatter
{
   std::string buf_;
   std::ostringstream sstrm_;
   size_t openBracketCol_;
   size_t closeBracketCol_;

public:
   MetadataFormatter() : openBracketCol_(0), closeBracketCol_(0) {}

   void FormatLinePrefix(std::ostream& stream, const Metadata& metadata);
   void FormatContinuationPrefix(std::ostream& stream);
};


inline std::string
FormatLocalTime(std::chrono::time_point<std::chrono::system_clock> tp)
{
   using namespace std::chrono;
   auto us = duration_cast<microseconds>(tp.time_since_epoch());
   auto secs = duration_cast<seconds>(us);
   auto whole = duration_cast<microseconds>(secs);
   auto frac = static_cast<int>((us - whole).count());

   std::time_t t(secs.count());
   std::tm *ptm;
#ifdef _WIN32
   ptm = std::localtime(&t);
#else
   std::tm tmstruct;
   ptm = localtime_r(&t, &tmstruct);
#endif

   // "yyyy-mm-ddThh:mm:ss.uuuuuu"
   const char *timeFmt = "%Y-%m-%dT%H:%M:%S";
   char buf[32];
   std::size_t len = std::strftime(buf, sizeof(buf), timeFmt, ptm);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06d", frac);
   return buf;
}


inline void
MetadataFormatter::FormatLinePrefix(std::ostream& stream,
      const Metadata& metadata)
{
   buf_ = FormatLocalTime(metadata.GetTimestamp());
   buf_ += " tid";
   sstrm_.str(std::string());
   sstrm_ << metadata.GetThreadId();
   buf_ += sstrm_.str();
   buf_ += ' ';

   openBracketCol_ = buf_.size();
   buf_ += '[';

   buf_ += LevelString(metadata.GetLevel());
   buf_ += ',';
   buf_ += metadata.GetLoggerData().GetComponentLabel();

   closeBracketCol_ = buf_.size();
   buf_ += ']';

   stream << buf_;
}


inline void
MetadataFormatter::FormatContinuationPrefix(std::ostream& stream)
{
   buf_.assign(closeBracketCol_ + 1, ' ');
   buf_[openBracketCol_] = '[';
   buf_[closeBracketCol_] = ']';
   stream << buf_;
}


} // namespace internal
} // namespace logging
} // namespace scope
