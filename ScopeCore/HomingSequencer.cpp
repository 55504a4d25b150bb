///////////////////////////////////////////////////////////////////////////////
// FILE:          HomingSequencer.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Axis homing, tray calibration and the tab-seek primitive
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

#include "HomingSequencer.h"

#include "ErrorCodes.h"
#include "MotionState.h"
#include "Notifier.h"
#include "PinIO.h"
#include "SpecimenMapper.h"
#include "SpecimenStore.h"
#include "StepperDriver.h"

#include <chrono>
#include <cstdlib>
#include <mutex>

namespace scope
{

namespace
{

const char* DirectionName(Direction direction)
{
   return direction == DirectionForward ? "forward" : "reverse";
}

} // anonymous namespace

HomingSequencer::HomingSequencer(const StageConfig& config, MotionState& state,
      PinIO& pins, StepperDriver& driver, const SpecimenMapper& mapper,
      SpecimenStore& store, const Notifier& notifier, logging::Logger logger) :
   config_(config),
   state_(state),
   pins_(pins),
   driver_(driver),
   mapper_(mapper),
   store_(store),
   notifier_(notifier),
   logger_(logger)
{}


bool
HomingSequencer::IsOptical2Asserted()
{
   return pins_.IsHigh(config_.optical2Pin);
}


int
HomingSequencer::AbortCheck() const
{
   if (!state_.IsRunning())
      return SCOPEERR_MotionAborted;
   if (state_.IsErrorState())
      return SCOPEERR_SessionHalted;
   if (state_.IsAbortAutonomous() && !state_.IsInitializing())
      return SCOPEERR_MotionAborted;
   return SCOPEERR_OK;
}


int
HomingSequencer::HomeLimitAxis(AxisId axis)
{
   const int limitPin = config_.LimitPinFor(axis);
   if (limitPin < 0)
      return SCOPEERR_InvalidAxis;

   const char* name = AxisName(axis);
   LOG_INFO(logger_) << "Homing " << name << " axis";

   std::unique_lock<std::timed_mutex> lock(state_.AxisMutex(axis), std::defer_lock);
   if (!lock.try_lock_for(std::chrono::milliseconds(config_.axisLockTimeoutMs)))
   {
      LOG_ERROR(logger_) << "Could not acquire lock for " << name;
      return SCOPEERR_LockBusy;
   }

   bool found = false;
   Direction foundDirection = DirectionForward;
   const Direction searchOrder[] = { DirectionForward, DirectionReverse };
   for (Direction direction : searchOrder)
   {
      PulseRequest search(axis, direction, config_.maxInitSteps,
            config_.stepDelayFastUs);
      search.countSteps = false;
      search.abortCheck = [this]() { return AbortCheck(); };
      search.afterStep = [&, direction](long taken) -> bool
      {
         if (pins_.IsHigh(limitPin))
         {
            found = true;
            return false;
         }
         if (taken % 1500 == 0)
            LOG_DEBUG(logger_) << name << " search " << DirectionName(direction) <<
               " steps=" << taken;
         return true;
      };

      long taken = 0;
      int ret = driver_.RunPulses(search, taken);
      if (ret != SCOPEERR_OK)
         return ret;
      if (found)
      {
         foundDirection = direction;
         LOG_INFO(logger_) << name << " limit detected after " << taken <<
            " steps (" << DirectionName(direction) << ")";
         break;
      }
   }

   if (!found)
   {
      LOG_WARNING(logger_) << name << " limit not found during homing";
      return SCOPEERR_HomingFailed;
   }

   PulseRequest backoff(axis,
         foundDirection == DirectionForward ? DirectionReverse : DirectionForward,
         config_.backoffSteps, config_.stepDelayFastUs);
   backoff.countSteps = false;
   backoff.abortCheck = [this]() { return AbortCheck(); };

   long taken = 0;
   int ret = driver_.RunPulses(backoff, taken);
   if (ret != SCOPEERR_OK)
      return ret;

   state_.ZeroAxis(axis);
   LOG_INFO(logger_) << name << " homed and zeroed";
   return SCOPEERR_OK;
}


int
HomingSequencer::HomeTray()
{
   LOG_INFO(logger_) << "Homing TRAY: searching for the wide tab";

   std::unique_lock<std::timed_mutex> lock(state_.AxisMutex(AxisTray), std::defer_lock);
   if (!lock.try_lock_for(std::chrono::milliseconds(config_.tabSeekLockTimeoutMs)))
   {
      LOG_ERROR(logger_) << "Could not acquire lock for TRAY";
      return SCOPEERR_LockBusy;
   }

   int consecutive = 0;
   bool found = false;
   auto sample = [&]() -> bool
   {
      if (pins_.IsHigh(config_.optical1Pin) && pins_.IsHigh(config_.optical2Pin))
      {
         if (++consecutive >= config_.debounceCountInit)
            found = true;
      }
      else
      {
         consecutive = 0;
      }
      return found;
   };

   if (!sample())
   {
      PulseRequest scan(AxisTray, DirectionForward, config_.maxInitSteps,
            config_.stepDelaySlowUs);
      scan.abortCheck = [this]() { return AbortCheck(); };
      scan.afterStep = [&](long taken) -> bool
      {
         if (taken % 500 == 0)
            LOG_DEBUG(logger_) << "TRAY scan steps=" << taken;
         return !sample();
      };

      long taken = 0;
      int ret = driver_.RunPulses(scan, taken);
      if (ret != SCOPEERR_OK)
         return ret;
   }

   if (!found)
   {
      LOG_WARNING(logger_) << "TRAY homing timed out searching for the wide tab";
      return SCOPEERR_HomingFailed;
   }

   state_.ResetTrayOrigin();
   state_.SetDisplay(1, mapper_.SpecimenForTab(1));
   LOG_INFO(logger_) << "Wide tab detected (tab 1); tray origin reset to " <<
      state_.GetTrayBaseline();
   return SCOPEERR_OK;
}


int
HomingSequencer::AdvanceToNextTab(long dro)
{
   std::unique_lock<std::timed_mutex> lock(state_.AxisMutex(AxisTray), std::defer_lock);
   if (!lock.try_lock_for(std::chrono::milliseconds(config_.tabSeekLockTimeoutMs)))
   {
      LOG_WARNING(logger_) << "Could not acquire TRAY lock for next-tab movement";
      return SCOPEERR_LockBusy;
   }

   bool sawLow = false;
   int consecutiveHigh = 0;
   bool found = false;

   PulseRequest seek(AxisTray, DirectionForward, config_.maxInitSteps,
         config_.stepDelayFastUs);
   seek.abortCheck = [this]() { return AbortCheck(); };
   seek.afterStep = [&](long taken) -> bool
   {
      const bool high = pins_.IsHigh(config_.optical2Pin);
      if (!sawLow)
      {
         if (!high)
            sawLow = true;
      }
      else if (high)
      {
         if (++consecutiveHigh >= 2)
         {
            found = true;
            return false;
         }
      }
      else
      {
         consecutiveHigh = 0;
      }
      if (taken % 500 == 0)
         LOG_DEBUG(logger_) << "Tab seek steps=" << taken << " optical2=" << high;
      return true;
   };

   long taken = 0;
   int ret = driver_.RunPulses(seek, taken);
   if (ret != SCOPEERR_OK)
      return ret;
   if (!found)
   {
      LOG_WARNING(logger_) << "Timed out searching for the next tab";
      return SCOPEERR_TabSeekTimeout;
   }
   LOG_INFO(logger_) << "Optical 2 rise detected after " << taken << " steps";

   if (dro == 0)
      return SCOPEERR_OK;

   PulseRequest offset(AxisTray, dro > 0 ? DirectionForward : DirectionReverse,
         std::labs(dro), config_.stepDelayFastUs);
   offset.abortCheck = [this]() { return AbortCheck(); };
   ret = driver_.RunPulses(offset, taken);
   if (ret != SCOPEERR_OK)
      return ret;

   LOG_INFO(logger_) << "Applied dro=" << dro << "; tray steps now " <<
      state_.GetSteps(AxisTray);
   return SCOPEERR_OK;
}


int
HomingSequencer::RunInitializationStages()
{
   int ret = HomeLimitAxis(AxisZoom);
   LOG_INFO(logger_) << "Zoom homing result: " << GetErrorText(ret);
   if (ret != SCOPEERR_OK)
      return ret;

   ret = HomeLimitAxis(AxisFocus);
   LOG_INFO(logger_) << "Focus homing result: " << GetErrorText(ret);
   if (ret != SCOPEERR_OK)
      return ret;

   ret = HomeTray();
   LOG_INFO(logger_) << "Tray homing result: " << GetErrorText(ret);
   if (ret != SCOPEERR_OK)
      return ret;

   const int nextTab = 2;
   const int specimen = mapper_.SpecimenForTab(nextTab);
   const SpecimenRecord record = store_.LoadSpecimen(specimen);

   LOG_INFO(logger_) << "Advancing to tab " << nextTab << " (specimen " <<
      specimen << ", dro=" << record.defaultRotationOffset << ")";
   ret = AdvanceToNextTab(record.defaultRotationOffset);
   if (ret != SCOPEERR_OK)
      return ret;

   ret = driver_.MoveToAbsolute(AxisZoom, record.defaultZoom, config_.stepDelayFastUs);
   if (ret != SCOPEERR_OK)
      return ret;
   ret = driver_.MoveToAbsolute(AxisFocus, record.defaultFocus, config_.stepDelayFastUs);
   if (ret != SCOPEERR_OK)
      return ret;

   state_.SetDisplay(nextTab, specimen);
   notifier_.SpecimenChanged(specimen);
   notifier_.PanelShouldOpen(IsOptical2Asserted());
   return SCOPEERR_OK;
}


int
HomingSequencer::RunInitialization()
{
   state_.SetInitializing(true);
   LOG_INFO(logger_) << "Starting initialization (zoom, focus, tray)";

   int ret = RunInitializationStages();
   if (ret == SCOPEERR_OK)
   {
      state_.SetInitialized(true);
      state_.StampAutoAdvance();
      LOG_INFO(logger_) << "Initialization succeeded; holding first specimen";
   }
   else
   {
      LOG_ERROR(logger_) << "Initialization failed: " << GetErrorText(ret);
   }

   state_.SetInitializing(false);
   notifier_.InitializationFinished(ret == SCOPEERR_OK);
   return ret;
}

} // namespace scope
