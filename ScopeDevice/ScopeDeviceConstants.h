///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopeDeviceConstants.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeDevice - Hardware device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global constants shared by the pin port interface and the
//                device adapters implementing it.
//
// COPYRIGHT:     SpecimenScope contributors, 2026
//
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

#pragma once

///////////////////////////////////////////////////////////////////////////////
// Global error codes
//
#define DEVICE_OK                      0
#define DEVICE_ERR                     1  // generic, undefined error
#define DEVICE_INVALID_PIN             2
#define DEVICE_PIN_WRITE_FAILED        3
#define DEVICE_NOT_INITIALIZED         4
#define DEVICE_IO_ERROR                5
#define DEVICE_NOT_SUPPORTED           6

namespace SC {

   const int MaxStrLength = 1024;

   enum PinLevel {
      PinLow = 0,
      PinHigh = 1
   };

   enum PinPull {
      PullNone,
      PullUp,
      PullDown
   };

} // namespace SC
