///////////////////////////////////////////////////////////////////////////////
// FILE:          StepperDriver.h
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

#pragma once

#include "Axis.h"
#include "Logging/Logger.h"
#include "StageConfig.h"

#include <functional>

namespace scope
{

class MotionState;
class PinIO;

/**
 * Parameters of one run of the pulse loop.
 *
 * Before each pulse abortCheck (if set) is consulted; a non-zero code stops
 * the run and is returned. After each pulse the counter is committed (when
 * countSteps is set), the limit switch is checked (when applyLimitBackoff is
 * set), then afterStep (if set) is called with the number of pulses so far;
 * returning false ends the run successfully.
 */
struct PulseRequest
{
   AxisId axis;
   Direction direction;
   long maxSteps;                 // negative means no bound
   long stepDelayUs;              // per half-pulse
   std::function<long()> stepDelayFunc; // overrides stepDelayUs when set
   std::function<int()> abortCheck;
   std::function<bool(long)> afterStep;
   bool applyLimitBackoff;
   bool countSteps;

   PulseRequest(AxisId a, Direction d, long steps, long delayUs) :
      axis(a),
      direction(d),
      maxSteps(steps),
      stepDelayUs(delayUs),
      applyLimitBackoff(false),
      countSteps(true)
   {}
};

class StepperDriver
{
   const StageConfig& config_;
   MotionState& state_;
   PinIO& pins_;
   logging::Logger logger_;

public:
   StepperDriver(const StageConfig& config, MotionState& state, PinIO& pins,
         logging::Logger logger);

   /**
    * The shared pulse loop. The caller must hold the axis mutex.
    */
   int RunPulses(const PulseRequest& request, long& stepsTaken);

   /**
    * Moves an axis by a signed number of steps. timeoutMs <= 0 disables the
    * elapsed-time check.
    */
   int MoveRelative(AxisId axis, long steps, long stepDelayUs, long timeoutMs = 0);

   int MoveToAbsolute(AxisId axis, long target, long stepDelayUs);

   static long ComputeAbsoluteTimeoutMs(long stepDelayUs, long delta);

private:
   int Pulse(int stepPin, long delayUs);
   int CheckTravelBound(AxisId axis, int delta);
   int CommitStep(AxisId axis, int delta);
   int SafetyBoundExceeded(AxisId axis, long value);
   int BackOffLimit(const PulseRequest& request, long delayUs);
};

} // namespace scope
