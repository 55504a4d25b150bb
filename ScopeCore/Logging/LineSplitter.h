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

#include <cstddef>
#include <string>
#include <vector>


namespace scope
{
namespace logging
{
namespace internal
{


// Lines longer than this are soft-split into continuation lines.
const std::size_t MaxLogLineLen = 127;


enum LineState
{
   LineStateEntryFirstLine,
   LineStateNewLine,
   LineStateLineContinuation,
};


struct EntryLine
{
   LineState state;
   std::string text;

   EntryLine(LineState s, const std::string& t) : state(s), text(t) {}
};


// Split the text of an entry at CR, LF or CRLF. Trailing line breaks are
// dropped, but an empty entry still produces one (empty) line.
inline void
SplitEntryIntoLines(const char* entryText, std::vector<EntryLine>& lines)
{
   lines.clear();
   LineState state = LineStateEntryFirstLine;
   std::string current;

   const char* p = entryText ? entryText : "";
   for (;;)
   {
      const char ch = *p;
      if (ch == '\0' || ch == '\r' || ch == '\n')
      {
         lines.push_back(EntryLine(state, current));
         current.clear();
         state = LineStateNewLine;

         if (ch == '\0')
            break;
         if (ch == '\r' && *(p + 1) == '\n')
            ++p;
         ++p;
         continue;
      }

      if (current.size() == MaxLogLineLen)
      {
         lines.push_back(EntryLine(state, current));
         current.clear();
         state = LineStateLineContinuation;
      }
      current += ch;
      ++p;
   }

   // Drop the empty lines produced by trailing line breaks
   while (lines.size() > 1 && lines.back().text.empty() &&
         lines.back().state == LineStateNewLine)
      lines.pop_back();
}


} // namespace internal
} // namespace logging
} // namespace scope
