///////////////////////////////////////////////////////////////////////////////
// FILE:          HomingSequencer.h
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

#pragma once

#include "Axis.h"
#include "Logging/Logger.h"
#include "StageConfig.h"

namespace scope
{

class MotionState;
class Notifier;
class PinIO;
class SpecimenMapper;
class SpecimenStore;
class StepperDriver;

class HomingSequencer
{
   const StageConfig& config_;
   MotionState& state_;
   PinIO& pins_;
   StepperDriver& driver_;
   const SpecimenMapper& mapper_;
   SpecimenStore& store_;
   const Notifier& notifier_;
   logging::Logger logger_;

public:
   HomingSequencer(const StageConfig& config, MotionState& state, PinIO& pins,
         StepperDriver& driver, const SpecimenMapper& mapper,
         SpecimenStore& store, const Notifier& notifier,
         logging::Logger logger);

   /**
    * Drives a zoom/focus axis onto its limit switch (trying the forward
    * direction first, then reverse), backs off and zeros the counter.
    */
   int HomeLimitAxis(AxisId axis);

   /**
    * Scans the tray slowly until both optical sensors have been asserted for
    * debounceCountInit consecutive samples, then resets the tray origin.
    */
   int HomeTray();

   /**
    * Drives the tray forward to the next optical-2 rise (a low sample
    * followed by two high samples), then applies the relative offset dro.
    */
   int AdvanceToNextTab(long dro);

   /**
    * Zoom, focus, tray, then the advance to tab 2 with that specimen's
    * stored positions. Stops at the first failing stage.
    */
   int RunInitialization();

   /// Reads optical sensor 2 directly; true while a tab is under it.
   bool IsOptical2Asserted();

private:
   int AbortCheck() const;
   int RunInitializationStages();
};

} // namespace scope
