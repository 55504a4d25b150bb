///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeDevice - Hardware device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Class with utility methods for building pin port adapters
//
// COPYRIGHT:     SpecimenScope contributors, 2026
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//

#include "DeviceUtils.h"

#include <chrono>
#include <cstddef>
#include <cstring>
#include <thread>

/**
 * Copies strings with predefined size limit.
 * Returns false if the source had to be truncated.
 */
bool CDeviceUtils::CopyLimitedString(char* target, const char* source)
{
   std::strncpy(target, source, SC::MaxStrLength - 1);
   target[SC::MaxStrLength - 1] = 0;
   return std::strlen(source) <= static_cast<std::size_t>(SC::MaxStrLength - 1);
}

unsigned CDeviceUtils::GetMaxStringLength()
{
   return SC::MaxStrLength;
}

void CDeviceUtils::SleepMs(long ms)
{
   if (ms <= 0)
      return;
   std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

/**
 * Sleeps for the given number of microseconds. Step pulses are timed with
 * this call, so a zero or negative value returns immediately instead of
 * yielding.
 */
void CDeviceUtils::SleepUs(long us)
{
   if (us <= 0)
      return;
   std::this_thread::sleep_for(std::chrono::microseconds(us));
}
