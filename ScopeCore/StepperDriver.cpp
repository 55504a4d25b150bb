///////////////////////////////////////////////////////////////////////////////
// FILE:          StepperDriver.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Step/direction pulse generation with safety bounds and limit backoff
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

#include "StepperDriver.h"

#include "CoreUtils.h"
#include "ErrorCodes.h"
#include "MotionState.h"
#include "PinIO.h"

#include "../ScopeDevice/DeviceUtils.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <mutex>

namespace scope
{

namespace
{

SC::PinLevel LevelFor(Direction direction)
{
   return direction == DirectionForward ? SC::PinHigh : SC::PinLow;
}

Direction Reversed(Direction direction)
{
   return direction == DirectionForward ? DirectionReverse : DirectionForward;
}

} // anonymous namespace

StepperDriver::StepperDriver(const StageConfig& config, MotionState& state,
      PinIO& pins, logging::Logger logger) :
   config_(config),
   state_(state),
   pins_(pins),
   logger_(logger)
{}


int
StepperDriver::Pulse(int stepPin, long delayUs)
{
   if (!pins_.Write(stepPin, SC::PinHigh))
      return SCOPEERR_PinWriteFailed;
   CDeviceUtils::SleepUs(delayUs);
   if (!pins_.Write(stepPin, SC::PinLow))
      return SCOPEERR_PinWriteFailed;
   CDeviceUtils::SleepUs(delayUs);
   return SCOPEERR_OK;
}


int
StepperDriver::SafetyBoundExceeded(AxisId axis, long value)
{
   pins_.EnterErrorState(std::string(AxisName(axis)) + " safety bound exceeded (" +
         ToString(value) + " beyond +/-" + ToString(config_.MaxStepsFor(axis)) + ")");
   return SCOPEERR_SafetyLimitExceeded;
}


// Checked before the pulse so the motor never leaves the counted range
int
StepperDriver::CheckTravelBound(AxisId axis, int delta)
{
   if (axis == AxisTray)
      return SCOPEERR_OK;

   const long next = state_.GetSteps(axis) + delta;
   if (std::labs(next) <= config_.MaxStepsFor(axis))
      return SCOPEERR_OK;
   return SafetyBoundExceeded(axis, next);
}


int
StepperDriver::CommitStep(AxisId axis, int delta)
{
   if (axis == AxisTray)
   {
      state_.CommitTraySteps(delta);
      return SCOPEERR_OK;
   }

   long newValue = 0;
   if (state_.CommitLimitedSteps(axis, delta, config_.MaxStepsFor(axis), newValue))
      return SCOPEERR_OK;
   return SafetyBoundExceeded(axis, newValue);
}


int
StepperDriver::BackOffLimit(const PulseRequest& request, long delayUs)
{
   const AxisPins& pins = config_.PinsFor(request.axis);
   const Direction back = Reversed(request.direction);

   LOG_WARNING(logger_) << AxisName(request.axis) <<
      " limit hit during move, backing off " << config_.backoffSteps << " steps";

   if (!pins_.Write(pins.dirPin, LevelFor(back)))
      return SCOPEERR_PinWriteFailed;
   for (long i = 0; i < config_.backoffSteps; ++i)
   {
      if (!state_.IsRunning())
         return SCOPEERR_MotionAborted;
      int ret = SCOPEERR_OK;
      if (request.countSteps)
      {
         ret = CheckTravelBound(request.axis, back);
         if (ret != SCOPEERR_OK)
            return ret;
      }
      ret = Pulse(pins.stepPin, delayUs);
      if (ret != SCOPEERR_OK)
         return ret;
      if (request.countSteps)
      {
         ret = CommitStep(request.axis, back);
         if (ret != SCOPEERR_OK)
            return ret;
      }
   }
   if (!pins_.Write(pins.dirPin, LevelFor(request.direction)))
      return SCOPEERR_PinWriteFailed;
   return SCOPEERR_OK;
}


int
StepperDriver::RunPulses(const PulseRequest& request, long& stepsTaken)
{
   stepsTaken = 0;
   if (!IsValidAxis(request.axis))
      return SCOPEERR_InvalidAxis;

   const AxisPins& pins = config_.PinsFor(request.axis);
   const int limitPin = config_.LimitPinFor(request.axis);

   if (!pins_.Write(pins.dirPin, LevelFor(request.direction)))
      return SCOPEERR_PinWriteFailed;

   while (request.maxSteps < 0 || stepsTaken < request.maxSteps)
   {
      if (request.abortCheck)
      {
         int ret = request.abortCheck();
         if (ret != SCOPEERR_OK)
            return ret;
      }

      const long delayUs = request.stepDelayFunc ?
         request.stepDelayFunc() : request.stepDelayUs;

      int ret = SCOPEERR_OK;
      if (request.countSteps)
      {
         ret = CheckTravelBound(request.axis, request.direction);
         if (ret != SCOPEERR_OK)
            return ret;
      }
      ret = Pulse(pins.stepPin, delayUs);
      if (ret != SCOPEERR_OK)
         return ret;
      ++stepsTaken;

      if (request.countSteps)
      {
         ret = CommitStep(request.axis, request.direction);
         if (ret != SCOPEERR_OK)
            return ret;
      }

      if (request.applyLimitBackoff && limitPin >= 0 && pins_.IsHigh(limitPin))
         return BackOffLimit(request, delayUs);

      if (request.afterStep && !request.afterStep(stepsTaken))
         break;
   }
   return SCOPEERR_OK;
}


int
StepperDriver::MoveRelative(AxisId axis, long steps, long stepDelayUs, long timeoutMs)
{
   if (!IsValidAxis(axis))
      return SCOPEERR_InvalidAxis;

   const char* name = AxisName(axis);
   if (state_.IsErrorState())
   {
      LOG_WARNING(logger_) << "Not moving " << name << " (error state)";
      return SCOPEERR_SessionHalted;
   }

   std::unique_lock<std::timed_mutex> lock(state_.AxisMutex(axis), std::defer_lock);
   if (!lock.try_lock_for(std::chrono::milliseconds(config_.axisLockTimeoutMs)))
   {
      LOG_WARNING(logger_) << "Could not acquire lock for " << name;
      return SCOPEERR_LockBusy;
   }
   LOG_DEBUG(logger_) << "Acquired motor lock for " << name;

   if (steps == 0)
      return SCOPEERR_OK;

   const auto start = std::chrono::steady_clock::now();
   PulseRequest request(axis, steps > 0 ? DirectionForward : DirectionReverse,
         std::labs(steps), stepDelayUs);
   request.applyLimitBackoff = true;
   request.abortCheck = [this, start, timeoutMs, name]() -> int
   {
      if (!state_.IsRunning())
      {
         LOG_INFO(logger_) << "Aborting " << name << " move: shutting down";
         return SCOPEERR_MotionAborted;
      }
      if (state_.IsErrorState())
      {
         LOG_WARNING(logger_) << "Aborting " << name << " move: error state";
         return SCOPEERR_SessionHalted;
      }
      if (state_.IsAbortAutonomous() && !state_.IsInitializing())
      {
         LOG_INFO(logger_) << "Aborting " << name << " move: manual override";
         return SCOPEERR_MotionAborted;
      }
      if (timeoutMs > 0)
      {
         const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start).count();
         if (elapsed > timeoutMs)
         {
            LOG_WARNING(logger_) << "Timeout moving " << name << " after " <<
               elapsed << " ms";
            return SCOPEERR_MotionTimeout;
         }
      }
      return SCOPEERR_OK;
   };

   long taken = 0;
   int ret = RunPulses(request, taken);
   LOG_DEBUG(logger_) << "Released motor lock for " << name << " after " <<
      taken << " of " << std::labs(steps) << " steps (result " << ret << ")";
   return ret;
}


int
StepperDriver::MoveToAbsolute(AxisId axis, long target, long stepDelayUs)
{
   if (!IsValidAxis(axis))
      return SCOPEERR_InvalidAxis;

   const long current = state_.GetSteps(axis);
   const long delta = target - current;
   const long timeoutMs = ComputeAbsoluteTimeoutMs(stepDelayUs, delta);

   LOG_INFO(logger_) << "Absolute move " << AxisName(axis) << " current=" <<
      current << " target=" << target << " delta=" << delta <<
      " timeout=" << timeoutMs << " ms";

   int ret = MoveRelative(axis, delta, stepDelayUs, timeoutMs);
   LOG_INFO(logger_) << "Absolute move " << AxisName(axis) << " finished (" <<
      GetErrorText(ret) << ")";
   return ret;
}


long
StepperDriver::ComputeAbsoluteTimeoutMs(long stepDelayUs, long delta)
{
   // Each step takes two half-pulse delays
   const double estimatedMs =
      static_cast<double>(std::labs(delta)) * 2.0 * stepDelayUs / 1000.0;
   return std::max(15000L, static_cast<long>(estimatedMs * 2.0 + 5000.0));
}

} // namespace scope
