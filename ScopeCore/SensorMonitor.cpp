///////////////////////////////////////////////////////////////////////////////
// FILE:          SensorMonitor.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Polling loop for limit switches and optical tab sensors
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

#include "SensorMonitor.h"

#include "MotionState.h"
#include "Notifier.h"
#include "PinIO.h"
#include "SpecimenMapper.h"

#include "../ScopeDevice/DeviceUtils.h"

namespace scope
{

SensorMonitor::SensorMonitor(const StageConfig& config, MotionState& state,
      PinIO& pins, const SpecimenMapper& mapper, const Notifier& notifier,
      logging::Logger logger) :
   config_(config),
   state_(state),
   pins_(pins),
   mapper_(mapper),
   notifier_(notifier),
   logger_(logger),
   stop_(true),
   prevOptical1_(false),
   prevOptical2_(false),
   optical1Logged_(false),
   zoomLimitLatched_(false),
   focusLimitLatched_(false),
   riseSeen_(false),
   wideTabSeen_(false)
{}


SensorMonitor::~SensorMonitor()
{
   Stop();
}


void
SensorMonitor::Start()
{
   if (thread_.joinable())
      return;
   stop_ = false;
   thread_ = std::thread(&SensorMonitor::Svc, this);
}


void
SensorMonitor::Stop()
{
   stop_ = true;
   if (thread_.joinable())
      thread_.join();
}


void
SensorMonitor::Svc()
{
   LOG_INFO(logger_) << "Sensor monitor started";
   Prime();
   while (!stop_ && state_.IsRunning())
   {
      PollOnce();
      CDeviceUtils::SleepMs(config_.sensorPollMs);
   }
   LOG_INFO(logger_) << "Sensor monitor stopped";
}


void
SensorMonitor::Prime()
{
   prevOptical1_ = pins_.IsHigh(config_.optical1Pin);
   prevOptical2_ = pins_.IsHigh(config_.optical2Pin);
   state_.SetOpticalState(prevOptical1_, prevOptical2_);
}


void
SensorMonitor::PollOnce()
{
   PollOnce(Clock::now());
}


void
SensorMonitor::PollOnce(Clock::time_point now)
{
   CheckLimitSwitches();

   const bool s1 = pins_.IsHigh(config_.optical1Pin);
   const bool s2 = pins_.IsHigh(config_.optical2Pin);

   // The panel follows the sensor level, before debounce or mapping
   if (prevOptical2_ && !s2)
   {
      notifier_.PanelShouldOpen(false);
      HandleOptical2Fall();
   }
   if (!prevOptical2_ && s2)
   {
      notifier_.PanelShouldOpen(true);
      HandleOptical2Rise(now);
   }

   if (s1 && !prevOptical1_ && !optical1Logged_)
   {
      LOG_DEBUG(logger_) << "Optical 1 rising";
      optical1Logged_ = true;
   }
   if (!s1)
      optical1Logged_ = false;

   if (s1 && s2)
      HandleWideTab(now);

   prevOptical1_ = s1;
   prevOptical2_ = s2;
   state_.SetOpticalState(s1, s2);
}


void
SensorMonitor::CheckLimitSwitches()
{
   struct LimitSwitch
   {
      AxisId axis;
      int pin;
      bool* latched;
   };
   const LimitSwitch switches[] = {
      { AxisZoom, config_.limitZoomPin, &zoomLimitLatched_ },
      { AxisFocus, config_.limitFocusPin, &focusLimitLatched_ },
   };

   for (const LimitSwitch& sw : switches)
   {
      const bool reached = pins_.IsHigh(sw.pin);
      if (reached && !*sw.latched)
      {
         LOG_WARNING(logger_) << AxisName(sw.axis) << " limit reached (pin " <<
            sw.pin << ")";
         *sw.latched = true;
         notifier_.LimitReached(AxisName(sw.axis));
      }
      else if (!reached && *sw.latched)
      {
         *sw.latched = false;
      }
   }
}


bool
SensorMonitor::Debounced(Clock::time_point now, Clock::time_point& last,
      bool& seen) const
{
   if (seen && now - last <= std::chrono::milliseconds(config_.sensorDebounceMs))
      return false;
   seen = true;
   last = now;
   return true;
}


void
SensorMonitor::Announce(int specimen)
{
   notifier_.SpecimenChanged(specimen);
}


void
SensorMonitor::HandleOptical2Fall()
{
   const long steps = state_.GetSteps(AxisTray);
   state_.RecordFall(steps);
   LOG_DEBUG(logger_) << "Optical 2 fall at tray steps " << steps;
}


void
SensorMonitor::HandleOptical2Rise(Clock::time_point now)
{
   if (!Debounced(now, lastRise_, riseSeen_))
      return;

   const long cur = state_.GetSteps(AxisTray);
   int specimen = 0;
   long fallAnchor = 0;

   if (mapper_.MapStepsToSpecimen(cur, config_.tabSeekToleranceFraction, specimen))
   {
      const int tab = mapper_.TabForSpecimen(specimen);
      state_.SetDisplay(tab, specimen);
      state_.SetLastRiseAnchor(cur);
      Announce(specimen);
      LOG_INFO(logger_) << "Optical 2 rise matched specimen " << specimen <<
         " (tab " << tab << ") at tray steps " << cur;
   }
   else if (state_.GetPendingFall(fallAnchor))
   {
      const long delta = cur - fallAnchor;
      FallResolution r = mapper_.ResolveAfterFall(state_.GetCurrentTab(),
            state_.GetCurrentSpecimen(), delta, config_.opt2StepThreshold);
      state_.SetDisplay(r.tab, r.specimen);
      state_.SetLastRiseAnchor(cur);
      Announce(r.specimen);
      LOG_INFO(logger_) << "Optical 2 rise resolved by travel: delta=" << delta <<
         " dir=" << r.direction << " tab=" << r.tab << " specimen=" <<
         r.specimen << " tray steps " << cur;
   }
   else if (mapper_.MapStepsToSpecimen(cur, config_.rangeToleranceFraction, specimen))
   {
      // Best effort with the looser tolerance used for reconciliation
      state_.SetCurrentSpecimen(specimen);
      state_.SetLastRiseAnchor(cur);
      Announce(specimen);
      LOG_INFO(logger_) << "Optical 2 rise (no prior fall) -> specimen " <<
         specimen << " at tray steps " << cur;
   }
   else
   {
      LOG_WARNING(logger_) << "Optical 2 rise could not be mapped to a specimen "
         "(tray steps " << cur << ")";
   }

   state_.ClearPendingFall();
}


void
SensorMonitor::HandleWideTab(Clock::time_point now)
{
   if (!Debounced(now, lastWideTab_, wideTabSeen_))
      return;

   if (state_.IsInitializing())
   {
      LOG_DEBUG(logger_) << "Wide tab seen during initialization; counters left alone";
      return;
   }

   state_.ResetTrayOrigin();
   const int specimen = mapper_.SpecimenForTab(1);
   state_.SetDisplay(1, specimen);
   Announce(specimen);
   LOG_INFO(logger_) << "Wide tab: tray origin reset to " <<
      state_.GetTrayBaseline() << ", tab 1 -> specimen " << specimen;
}

} // namespace scope
