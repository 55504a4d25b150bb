///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopeDevice.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeDevice - Hardware device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   The interface to the digital I/O hardware that carries the
//                stepper, button, limit-switch and optical-sensor lines.
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

// N.B.
//
// Implementations are called concurrently from the sensor monitor, the button
// watchers and whichever task currently owns an axis. ReadPin() and WritePin()
// must be safe to call from several threads at once.

#include "ScopeDeviceConstants.h"
#include "DeviceUtils.h"

namespace SC {

   /**
    * Digital pin port. Pins are identified by the number the board uses for
    * them (BCM numbering on the exhibit's controller).
    */
   class PinPort
   {
   public:
      PinPort() {}
      virtual ~PinPort() {}

      virtual int Initialize() = 0;
      virtual int Shutdown() = 0;

      virtual void GetName(char* name) const = 0;

      /**
       * Configures the pin as an output driven to the given level.
       */
      virtual int SetupOutput(int pin, PinLevel initial) = 0;

      /**
       * Configures the pin as an input with the requested bias.
       */
      virtual int SetupInput(int pin, PinPull pull) = 0;

      /**
       * Samples an input. Must not throw; returns PinLow when the read
       * fails, so that a broken line reads as inactive.
       */
      virtual PinLevel ReadPin(int pin) = 0;

      /**
       * Drives an output. Returns DEVICE_OK or an error code; a failed write
       * is fatal for the motion session.
       */
      virtual int WritePin(int pin, PinLevel level) = 0;
   };

} // namespace SC
