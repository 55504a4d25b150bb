///////////////////////////////////////////////////////////////////////////////
// FILE:          ManualOverride.h
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

#pragma once

#include "Axis.h"
#include "Logging/Logger.h"
#include "StageConfig.h"
#include "ThreadPool.h"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace scope
{

class MotionState;
class PinIO;
class StepperDriver;

struct ButtonBinding
{
   AxisId axis;
   Direction direction;
   int pin;
};

/**
 * One watcher thread per button. A confirmed press marks user activity and
 * then tries to seize the axis without waiting; a press on a busy axis is
 * dropped, never queued.
 */
class ManualOverride
{
public:
   ManualOverride(const StageConfig& config, MotionState& state, PinIO& pins,
         StepperDriver& driver, logging::Logger logger);
   ~ManualOverride();

   void Start();
   void Stop();

   const std::vector<ButtonBinding>& GetButtons() const { return buttons_; }

   /// Polls every button once, dispatching presses to the task pool.
   void PollButtonsOnce();

   /// Waits out switch bounce; true if the button is still held afterwards.
   bool ConfirmPress(size_t button);

   /// Spins the axis until the button is released. Returns SCOPEERR_LockBusy
   /// without touching any pin if the axis is already held.
   int SpinWhileHeld(size_t button);

   bool IsPressed(size_t button);

private:
   void WatchButton(size_t button);
   void PollButton(size_t button);
   void HandlePress(size_t button);

   const StageConfig& config_;
   MotionState& state_;
   PinIO& pins_;
   StepperDriver& driver_;
   logging::Logger logger_;

   std::vector<ButtonBinding> buttons_;
   std::vector<int> lastPressed_;
   std::vector<std::thread> watchers_;
   std::atomic<bool> stop_;
   std::unique_ptr<ThreadPool> pool_;
};

} // namespace scope
