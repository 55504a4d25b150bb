///////////////////////////////////////////////////////////////////////////////
// FILE:          ManualOverride.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Button watchers that hand an axis to the visitor while a button is held
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

#include "ManualOverride.h"

#include "ErrorCodes.h"
#include "MotionState.h"
#include "PinIO.h"
#include "StepperDriver.h"

#include "../ScopeDevice/DeviceUtils.h"

#include <mutex>

namespace scope
{

ManualOverride::ManualOverride(const StageConfig& config, MotionState& state,
      PinIO& pins, StepperDriver& driver, logging::Logger logger) :
   config_(config),
   state_(state),
   pins_(pins),
   driver_(driver),
   logger_(logger),
   stop_(true),
   pool_(std::make_unique<ThreadPool>(NumAxes * 2))
{
   const AxisId axes[] = { AxisTray, AxisZoom, AxisFocus };
   for (AxisId axis : axes)
   {
      const AxisPins& pins = config_.PinsFor(axis);
      buttons_.push_back(ButtonBinding{ axis, DirectionForward, pins.cwButtonPin });
      buttons_.push_back(ButtonBinding{ axis, DirectionReverse, pins.ccwButtonPin });
   }
   lastPressed_.assign(buttons_.size(), 0);
}


ManualOverride::~ManualOverride()
{
   Stop();
}


void
ManualOverride::Start()
{
   if (!watchers_.empty())
      return;
   stop_ = false;
   if (!pool_)
      pool_ = std::make_unique<ThreadPool>(NumAxes * 2);
   for (size_t i = 0; i < buttons_.size(); ++i)
      watchers_.emplace_back(&ManualOverride::WatchButton, this, i);
}


void
ManualOverride::Stop()
{
   stop_ = true;
   for (std::thread& t : watchers_)
   {
      if (t.joinable())
         t.join();
   }
   watchers_.clear();
   // Joins the press tasks; each one sees running == false or a released
   // button and returns promptly.
   pool_.reset();
}


bool
ManualOverride::IsPressed(size_t button)
{
   // Buttons are pulled up; pressed reads low
   return !pins_.IsHigh(buttons_[button].pin);
}


void
ManualOverride::WatchButton(size_t button)
{
   const ButtonBinding& b = buttons_[button];
   LOG_DEBUG(logger_) << "Watching " << AxisName(b.axis) << " " <<
      (b.direction == DirectionForward ? "CW" : "CCW") << " button on pin " << b.pin;

   lastPressed_[button] = IsPressed(button) ? 1 : 0;
   while (!stop_ && state_.IsRunning())
   {
      PollButton(button);
      CDeviceUtils::SleepMs(config_.buttonPollMs);
   }
}


void
ManualOverride::PollButtonsOnce()
{
   for (size_t i = 0; i < buttons_.size(); ++i)
      PollButton(i);
}


void
ManualOverride::PollButton(size_t button)
{
   const int pressed = IsPressed(button) ? 1 : 0;
   if (pressed && !lastPressed_[button])
   {
      const ButtonBinding& b = buttons_[button];
      if (state_.IsInitializing())
      {
         LOG_INFO(logger_) << "Ignoring press on pin " << b.pin <<
            " during initialization";
      }
      else
      {
         LOG_INFO(logger_) << "Press detected: " << AxisName(b.axis) <<
            " pin " << b.pin;
         if (!pool_ || !pool_->Execute([this, button]() { HandlePress(button); }))
            LOG_WARNING(logger_) << "Press on pin " << b.pin <<
               " dropped: shutting down";
      }
   }
   lastPressed_[button] = pressed;
}


bool
ManualOverride::ConfirmPress(size_t button)
{
   CDeviceUtils::SleepMs(config_.pressConfirmMs);
   return state_.IsRunning() && IsPressed(button);
}


void
ManualOverride::HandlePress(size_t button)
{
   if (!ConfirmPress(button))
      return;

   state_.MarkUserActivity();
   LOG_INFO(logger_) << "User interaction: autonomous motion suspended";

   int ret = SpinWhileHeld(button);
   if (ret != SCOPEERR_OK && ret != SCOPEERR_LockBusy)
      LOG_WARNING(logger_) << "Manual " << AxisName(buttons_[button].axis) <<
         " motion ended: " << GetErrorText(ret);
}


int
ManualOverride::SpinWhileHeld(size_t button)
{
   const ButtonBinding& b = buttons_[button];
   const char* name = AxisName(b.axis);

   std::unique_lock<std::timed_mutex> lock(state_.AxisMutex(b.axis), std::try_to_lock);
   if (!lock.owns_lock())
   {
      LOG_INFO(logger_) << "Could not acquire lock for " << name <<
         ", skipping spin (another controller active)";
      return SCOPEERR_LockBusy;
   }

   LOG_INFO(logger_) << name << " manual control taken";

   PulseRequest spin(b.axis, b.direction, -1, config_.stepDelayFastUs);
   spin.applyLimitBackoff = true;
   if (b.axis == AxisTray)
   {
      // Finer pitch while a tab is in the beam
      spin.stepDelayFunc = [this]() -> long
      {
         return state_.IsOptical2Asserted() ?
            config_.stepDelaySlowUs : config_.stepDelayFastUs;
      };
   }
   spin.abortCheck = [this]() -> int
   {
      if (!state_.IsRunning())
         return SCOPEERR_MotionAborted;
      if (state_.IsErrorState())
         return SCOPEERR_SessionHalted;
      return SCOPEERR_OK;
   };
   spin.afterStep = [this, button](long) { return IsPressed(button); };

   long taken = 0;
   int ret = driver_.RunPulses(spin, taken);
   LOG_INFO(logger_) << name << " manual control released after " << taken <<
      " steps";
   return ret;
}

} // namespace scope
