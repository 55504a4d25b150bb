///////////////////////////////////////////////////////////////////////////////
// FILE:          PinIO.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Core-side access to the pin port
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

#include "Logging/Logger.h"
#include "../ScopeDevice/ScopeDevice.h"

#include <string>

namespace scope
{

class MotionState;
class Notifier;

extern const char* const ErrorStateBanner;

/**
 * Wraps the pin port with the core's failure policy: a failed write puts the
 * whole session into the error state.
 */
class PinIO
{
   SC::PinPort& port_;
   MotionState& state_;
   const Notifier& notifier_;
   logging::Logger logger_;

public:
   PinIO(SC::PinPort& port, MotionState& state, const Notifier& notifier,
         logging::Logger logger);

   bool Write(int pin, SC::PinLevel level);
   bool IsHigh(int pin);

   // Sets the error state; the first caller also raises the banner.
   void EnterErrorState(const std::string& reason);
};

} // namespace scope
