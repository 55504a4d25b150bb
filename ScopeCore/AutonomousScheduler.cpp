///////////////////////////////////////////////////////////////////////////////
// FILE:          AutonomousScheduler.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Timed round-robin advance through the specimens
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

#include "AutonomousScheduler.h"

#include "ErrorCodes.h"
#include "HomingSequencer.h"
#include "MotionState.h"
#include "Notifier.h"
#include "SpecimenMapper.h"
#include "SpecimenStore.h"
#include "StepperDriver.h"

#include "../ScopeDevice/DeviceUtils.h"

#include <chrono>

namespace scope
{

const char*
SchedulerStateName(SchedulerState state)
{
   switch (state)
   {
      case SchedulerIdle: return "Idle";
      case SchedulerSuspended: return "Suspended";
      case SchedulerPendingFallReconcile: return "PendingFallReconcile";
      case SchedulerHolding: return "Holding";
      case SchedulerAdvancing: return "Advancing";
   }
   return "(unknown)";
}


AutonomousScheduler::AutonomousScheduler(const StageConfig& config,
      MotionState& state, StepperDriver& driver, HomingSequencer& homing,
      const SpecimenMapper& mapper, SpecimenStore& store,
      const Notifier& notifier, logging::Logger logger) :
   config_(config),
   state_(state),
   driver_(driver),
   homing_(homing),
   mapper_(mapper),
   store_(store),
   notifier_(notifier),
   logger_(logger),
   stop_(true),
   schedulerState_(SchedulerIdle)
{}


AutonomousScheduler::~AutonomousScheduler()
{
   Stop();
}


void
AutonomousScheduler::Start()
{
   if (thread_.joinable())
      return;
   stop_ = false;
   state_.SetAutonomousMode(true);
   state_.SetAbortAutonomous(false);
   thread_ = std::thread(&AutonomousScheduler::Svc, this);
}


void
AutonomousScheduler::Stop()
{
   stop_ = true;
   if (thread_.joinable())
      thread_.join();
}


void
AutonomousScheduler::Svc()
{
   LOG_INFO(logger_) << "Autonomous scheduler started";
   while (!stop_ && state_.IsRunning())
   {
      const long sleepMs = RunCycle();
      CDeviceUtils::SleepMs(sleepMs);
   }
   LOG_INFO(logger_) << "Autonomous scheduler stopped";
}


long
AutonomousScheduler::RunCycle()
{
   typedef MotionState::Clock Clock;
   const std::chrono::milliseconds idle(config_.autonomyIdleMs);

   if (state_.IsErrorState())
   {
      schedulerState_ = SchedulerIdle;
      return config_.errorPollMs;
   }

   if (state_.IsInitializing() || !state_.IsInitialized())
   {
      schedulerState_ = SchedulerIdle;
      return config_.frozenPollMs;
   }

   if (Clock::now() - state_.GetLastUserAction() < idle)
   {
      if (state_.IsAutonomousMode())
         LOG_INFO(logger_) << "User activity detected; suppressing autonomous motion";
      state_.SetAutonomousMode(false);
      state_.SetAbortAutonomous(true);
      schedulerState_ = SchedulerSuspended;
      return config_.suspendedPollMs;
   }

   if (!state_.IsAutonomousMode())
      LOG_INFO(logger_) << "Idle timeout reached; resuming autonomous motion";
   state_.SetAutonomousMode(true);
   state_.SetAbortAutonomous(false);

   long fallAnchor = 0;
   if (state_.GetPendingFall(fallAnchor))
   {
      schedulerState_ = SchedulerPendingFallReconcile;
      ReconcilePendingFall(fallAnchor);
      state_.ClearPendingFall();
   }

   if (Clock::now() - state_.GetLastAutoAdvance() < idle)
   {
      schedulerState_ = SchedulerHolding;
      return config_.dwellPollMs;
   }

   schedulerState_ = SchedulerAdvancing;
   return Advance();
}


void
AutonomousScheduler::ReconcilePendingFall(long fallAnchor)
{
   const long cur = state_.GetSteps(AxisTray);
   int specimen = 0;
   if (mapper_.MapStepsToSpecimen(cur, config_.rangeToleranceFraction, specimen))
   {
      const int tab = mapper_.TabForSpecimen(specimen);
      state_.SetDisplay(tab, specimen);
      notifier_.SpecimenChanged(specimen);
      notifier_.PanelShouldOpen(homing_.IsOptical2Asserted());
      LOG_INFO(logger_) << "Reconciled pending fall: tray steps " << cur <<
         " map to specimen " << specimen;
      return;
   }

   const long delta = cur - fallAnchor;
   FallResolution r = mapper_.ResolveAfterFall(state_.GetCurrentTab(),
         state_.GetCurrentSpecimen(), delta, config_.opt2StepThreshold);
   state_.SetDisplay(r.tab, r.specimen);
   notifier_.SpecimenChanged(r.specimen);
   notifier_.PanelShouldOpen(homing_.IsOptical2Asserted());
   LOG_INFO(logger_) << "Reconciled pending fall: delta=" << delta <<
      " dir=" << r.direction << " -> specimen " << r.specimen;
}


long
AutonomousScheduler::Advance()
{
   const int n = mapper_.NumSpecimens();
   int current = state_.GetCurrentSpecimen();
   if (current < 1 || current > n)
   {
      if (!mapper_.MapStepsToSpecimen(state_.GetSteps(AxisTray),
               config_.rangeToleranceFraction, current))
         current = 1;
      LOG_INFO(logger_) << "Current specimen unknown; assuming " << current;
   }

   const int next = (current % n) + 1;
   const SpecimenRecord record = store_.LoadSpecimen(next);
   LOG_INFO(logger_) << "Advancing to specimen " << next << " (dro=" <<
      record.defaultRotationOffset << ")";

   int ret = homing_.AdvanceToNextTab(record.defaultRotationOffset);
   if (ret != SCOPEERR_OK)
   {
      LOG_INFO(logger_) << "Advance aborted: " << GetErrorText(ret);
      schedulerState_ = SchedulerIdle;
      return config_.retryPollMs;
   }
   state_.SetDisplay(mapper_.TabForSpecimen(next), next);

   const AxisId lensAxes[] = { AxisZoom, AxisFocus };
   for (AxisId axis : lensAxes)
   {
      const long target = (axis == AxisZoom) ? record.defaultZoom : record.defaultFocus;
      ret = driver_.MoveToAbsolute(axis, target, config_.stepDelayFastUs);
      if (ret != SCOPEERR_OK)
      {
         LOG_INFO(logger_) << AxisName(axis) << " move aborted: " << GetErrorText(ret);
         schedulerState_ = SchedulerIdle;
         return config_.retryPollMs;
      }
   }

   notifier_.SpecimenChanged(next);
   notifier_.PanelShouldOpen(homing_.IsOptical2Asserted());

   int mapped = 0;
   const long traySteps = state_.GetSteps(AxisTray);
   if (mapper_.MapStepsToSpecimen(traySteps, config_.rangeToleranceFraction, mapped))
      LOG_INFO(logger_) << "Move complete; tray steps " << traySteps <<
         " map to specimen " << mapped;
   else
      LOG_INFO(logger_) << "Move complete; tray steps " << traySteps <<
         " do not map to a specimen";

   state_.StampAutoAdvance();
   schedulerState_ = SchedulerHolding;
   LOG_INFO(logger_) << "Displaying specimen " << next << " for " <<
      config_.autonomyIdleMs << " ms";
   return config_.dwellPollMs;
}

} // namespace scope
