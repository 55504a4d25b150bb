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

#include "Metadata.h"

#include <mutex>
#include <set>
#include <string>

namespace scope
{
namespace logging
{

const char*
LoggerData::InternString(const std::string& s)
{
   // Labels are few and live for the whole process; never erase.
   static std::mutex mutex;
   static std::set<std::string> strings;

   std::lock_guard<std::mutex> lock(mutex);
   std::set<std::string>::const_iterator found = strings.insert(s).first;
   return found->c_str();
}

} // namespace logging
} // namespace scope
