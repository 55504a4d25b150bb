///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionState.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Shared state of the motion subsystem: counters, locks and flags
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

#include <atomic>
#include <chrono>
#include <mutex>

namespace scope
{

/**
 * State shared by every control loop. One instance is owned by the core and
 * handed by reference to each component when it is constructed.
 *
 * Locking: the per-axis mutex serializes pulse emission on that axis, and is
 * the only license to change the axis counter. The counter itself is
 * additionally guarded by a counter mutex so that readers never see a torn
 * tray/rotation-offset pair. Flags are plain atomics.
 */
class MotionState
{
public:
   typedef std::chrono::steady_clock Clock;

   MotionState(long trayBaseline, long autonomyIdleMs, int initialSpecimen);

   MotionState(const MotionState&) = delete;
   MotionState& operator=(const MotionState&) = delete;

   std::timed_mutex& AxisMutex(AxisId axis) { return axisMutex_[axis]; }

   // Counters
   long GetSteps(AxisId axis) const;
   long GetRotationOffset() const;
   void CommitTraySteps(long delta);
   // Applies delta unless the result would exceed |bound|; returns false
   // (leaving the counter untouched) in that case. newValue receives the
   // resulting (or refused) value.
   bool CommitLimitedSteps(AxisId axis, long delta, long bound, long& newValue);
   void ResetTrayOrigin();
   void ZeroAxis(AxisId axis);
   long GetTrayBaseline() const { return trayBaseline_; }

   // Flags
   bool IsRunning() const { return running_.load(); }
   void SetRunning(bool flag) { running_.store(flag); }
   bool IsErrorState() const { return errorState_.load(); }
   // Returns true only for the call that entered the error state.
   bool RaiseErrorState() { return !errorState_.exchange(true); }
   bool IsInitializing() const { return initializing_.load(); }
   void SetInitializing(bool flag) { initializing_.store(flag); }
   bool IsInitialized() const { return initialized_.load(); }
   void SetInitialized(bool flag) { initialized_.store(flag); }
   bool IsAutonomousMode() const { return autonomousMode_.load(); }
   void SetAutonomousMode(bool flag) { autonomousMode_.store(flag); }
   bool IsAbortAutonomous() const { return abortAutonomous_.load(); }
   void SetAbortAutonomous(bool flag) { abortAutonomous_.store(flag); }

   // Pending-fall marker
   void RecordFall(long traySteps);
   bool GetPendingFall(long& anchor) const;
   void ClearPendingFall();

   // User activity and autonomous advance timestamps
   void MarkUserActivity();
   Clock::time_point GetLastUserAction() const;
   void StampAutoAdvance();
   Clock::time_point GetLastAutoAdvance() const;

   // Display state. A tab of 0 means "not known yet".
   void SetDisplay(int tab, int specimen);
   void SetCurrentSpecimen(int specimen);
   int GetCurrentTab() const;
   int GetCurrentSpecimen() const;
   void SetLastRiseAnchor(long traySteps);
   long GetLastRiseAnchor() const;

   // Latest optical sample, published by the sensor monitor.
   void SetOpticalState(bool optical1, bool optical2);
   bool IsOptical1Asserted() const { return optical1_.load(); }
   bool IsOptical2Asserted() const { return optical2_.load(); }

private:
   const long trayBaseline_;

   std::timed_mutex axisMutex_[NumAxes];

   mutable std::mutex trayCounterMutex_;
   long traySteps_;
   long rotationOffset_;

   mutable std::mutex zoomCounterMutex_;
   long zoomSteps_;

   mutable std::mutex focusCounterMutex_;
   long focusSteps_;

   std::atomic<bool> running_;
   std::atomic<bool> errorState_;
   std::atomic<bool> initializing_;
   std::atomic<bool> initialized_;
   std::atomic<bool> autonomousMode_;
   std::atomic<bool> abortAutonomous_;

   std::atomic<bool> optical1_;
   std::atomic<bool> optical2_;

   mutable std::mutex displayMutex_;
   bool fallSeen_;
   long fallAnchor_;
   Clock::time_point lastUserAction_;
   Clock::time_point lastAutoAdvance_;
   int currentTab_;
   int currentSpecimen_;
   long lastRiseAnchor_;
};

} // namespace scope
