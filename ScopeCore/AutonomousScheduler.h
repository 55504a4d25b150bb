///////////////////////////////////////////////////////////////////////////////
// FILE:          AutonomousScheduler.h
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

#pragma once

#include "Logging/Logger.h"
#include "StageConfig.h"

#include <atomic>
#include <thread>

namespace scope
{

class HomingSequencer;
class MotionState;
class Notifier;
class SpecimenMapper;
class SpecimenStore;
class StepperDriver;

enum SchedulerState
{
   SchedulerIdle,
   SchedulerSuspended,
   SchedulerPendingFallReconcile,
   SchedulerHolding,
   SchedulerAdvancing,
};

const char* SchedulerStateName(SchedulerState state);

class AutonomousScheduler
{
public:
   AutonomousScheduler(const StageConfig& config, MotionState& state,
         StepperDriver& driver, HomingSequencer& homing,
         const SpecimenMapper& mapper, SpecimenStore& store,
         const Notifier& notifier, logging::Logger logger);
   ~AutonomousScheduler();

   void Start();
   void Stop();

   /**
    * Runs one pass of the state machine and returns how long to sleep
    * before the next pass, in milliseconds.
    */
   long RunCycle();

   SchedulerState GetState() const { return schedulerState_.load(); }

private:
   void Svc();
   void ReconcilePendingFall(long fallAnchor);
   long Advance();

   const StageConfig& config_;
   MotionState& state_;
   StepperDriver& driver_;
   HomingSequencer& homing_;
   const SpecimenMapper& mapper_;
   SpecimenStore& store_;
   const Notifier& notifier_;
   logging::Logger logger_;

   std::thread thread_;
   std::atomic<bool> stop_;
   std::atomic<SchedulerState> schedulerState_;
};

} // namespace scope
