///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   List of error IDs returned by the motion core
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

#define SCOPEERR_OK                          0
#define SCOPEERR_GENERIC                     1
#define SCOPEERR_PinWriteFailed              2
#define SCOPEERR_LockBusy                    3
#define SCOPEERR_SafetyLimitExceeded         4
#define SCOPEERR_HomingFailed                5
#define SCOPEERR_TabSeekTimeout              6
#define SCOPEERR_MotionAborted               7
#define SCOPEERR_SessionHalted               8
#define SCOPEERR_MotionTimeout               9
#define SCOPEERR_InvalidAxis                 10
#define SCOPEERR_InvalidConfiguration        11
#define SCOPEERR_NotRunning                  12
#define SCOPEERR_AlreadyRunning              13
#define SCOPEERR_PortInitializationFailed    14
#define SCOPEERR_FileOpenFailed              15

namespace scope {

const char* GetErrorText(int code);

} // namespace scope
