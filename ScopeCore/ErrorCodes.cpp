///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
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

#include "ErrorCodes.h"

namespace scope {

const char*
GetErrorText(int code)
{
   switch (code)
   {
      case SCOPEERR_OK: return "No error";
      case SCOPEERR_GENERIC: return "Unspecified error";
      case SCOPEERR_PinWriteFailed: return "Pin write failed; motors disabled";
      case SCOPEERR_LockBusy: return "Axis is in use by another controller";
      case SCOPEERR_SafetyLimitExceeded: return "Axis safety limit exceeded; motors disabled";
      case SCOPEERR_HomingFailed: return "Limit switch not found while homing";
      case SCOPEERR_TabSeekTimeout: return "No tray tab found within the search distance";
      case SCOPEERR_MotionAborted: return "Motion aborted";
      case SCOPEERR_SessionHalted: return "Motion refused: system is in the error state";
      case SCOPEERR_MotionTimeout: return "Motion timed out";
      case SCOPEERR_InvalidAxis: return "Invalid axis";
      case SCOPEERR_InvalidConfiguration: return "Invalid stage configuration";
      case SCOPEERR_NotRunning: return "Motion core is not running";
      case SCOPEERR_AlreadyRunning: return "Motion core is already running";
      case SCOPEERR_PortInitializationFailed: return "Pin port initialization failed";
      case SCOPEERR_FileOpenFailed: return "Cannot open file";
      default: return "Unknown error";
   }
}

} // namespace scope
