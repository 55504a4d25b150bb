///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.h
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

#pragma once

#include "ScopeDeviceConstants.h"

class CDeviceUtils
{
public:
   static bool CopyLimitedString(char* pszTarget, const char* pszSource);
   static unsigned GetMaxStringLength();
   static void SleepMs(long ms);
   static void SleepUs(long us);
};
