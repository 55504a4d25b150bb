///////////////////////////////////////////////////////////////////////////////
// FILE:          PinIO.cpp
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

#include "PinIO.h"

#include "MotionState.h"
#include "Notifier.h"

namespace scope
{

const char* const ErrorStateBanner =
   "Motor limit exceeded or GPIO error. Motors disabled.";

PinIO::PinIO(SC::PinPort& port, MotionState& state, const Notifier& notifier,
      logging::Logger logger) :
   port_(port),
   state_(state),
   notifier_(notifier),
   logger_(logger)
{}


bool
PinIO::Write(int pin, SC::PinLevel level)
{
   int ret = port_.WritePin(pin, level);
   if (ret == DEVICE_OK)
      return true;

   EnterErrorState("Write to pin " + std::to_string(pin) +
         " failed (device error " + std::to_string(ret) + ")");
   return false;
}


bool
PinIO::IsHigh(int pin)
{
   return port_.ReadPin(pin) == SC::PinHigh;
}


void
PinIO::EnterErrorState(const std::string& reason)
{
   LOG_ERROR(logger_) << reason;
   if (state_.RaiseErrorState())
   {
      LOG_ERROR(logger_) << "Entering error state; all motion is disabled";
      notifier_.ErrorState(ErrorStateBanner);
   }
}

} // namespace scope
