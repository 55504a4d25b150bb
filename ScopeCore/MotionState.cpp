///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionState.cpp
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

#include "MotionState.h"

#include <cstdlib>

namespace scope
{

MotionState::MotionState(long trayBaseline, long autonomyIdleMs, int initialSpecimen) :
   trayBaseline_(trayBaseline),
   traySteps_(trayBaseline),
   rotationOffset_(0),
   zoomSteps_(0),
   focusSteps_(0),
   running_(false),
   errorState_(false),
   initializing_(false),
   initialized_(false),
   autonomousMode_(true),
   abortAutonomous_(false),
   optical1_(false),
   optical2_(false),
   fallSeen_(false),
   fallAnchor_(0),
   currentTab_(0),
   currentSpecimen_(initialSpecimen),
   lastRiseAnchor_(0)
{
   // Start out as if the exhibit has been idle for longer than the threshold
   const Clock::time_point longAgo = Clock::now() -
      std::chrono::milliseconds(autonomyIdleMs) - std::chrono::seconds(1);
   lastUserAction_ = longAgo;
   lastAutoAdvance_ = longAgo;
}


long
MotionState::GetSteps(AxisId axis) const
{
   switch (axis)
   {
      case AxisTray:
      {
         std::lock_guard<std::mutex> lock(trayCounterMutex_);
         return traySteps_;
      }
      case AxisZoom:
      {
         std::lock_guard<std::mutex> lock(zoomCounterMutex_);
         return zoomSteps_;
      }
      case AxisFocus:
      {
         std::lock_guard<std::mutex> lock(focusCounterMutex_);
         return focusSteps_;
      }
   }
   return 0;
}


long
MotionState::GetRotationOffset() const
{
   std::lock_guard<std::mutex> lock(trayCounterMutex_);
   return rotationOffset_;
}


void
MotionState::CommitTraySteps(long delta)
{
   std::lock_guard<std::mutex> lock(trayCounterMutex_);
   traySteps_ += delta;
   rotationOffset_ += delta;
}


bool
MotionState::CommitLimitedSteps(AxisId axis, long delta, long bound, long& newValue)
{
   if (axis == AxisTray)
   {
      std::lock_guard<std::mutex> lock(trayCounterMutex_);
      traySteps_ += delta;
      rotationOffset_ += delta;
      newValue = traySteps_;
      return true;
   }

   std::mutex& m = (axis == AxisZoom) ? zoomCounterMutex_ : focusCounterMutex_;
   long& counter = (axis == AxisZoom) ? zoomSteps_ : focusSteps_;

   std::lock_guard<std::mutex> lock(m);
   newValue = counter + delta;
   if (std::labs(newValue) > bound)
      return false;
   counter = newValue;
   return true;
}


void
MotionState::ResetTrayOrigin()
{
   std::lock_guard<std::mutex> lock(trayCounterMutex_);
   traySteps_ = trayBaseline_;
   rotationOffset_ = 0;
}


void
MotionState::ZeroAxis(AxisId axis)
{
   switch (axis)
   {
      case AxisTray:
         ResetTrayOrigin();
         break;
      case AxisZoom:
      {
         std::lock_guard<std::mutex> lock(zoomCounterMutex_);
         zoomSteps_ = 0;
         break;
      }
      case AxisFocus:
      {
         std::lock_guard<std::mutex> lock(focusCounterMutex_);
         focusSteps_ = 0;
         break;
      }
   }
}


void
MotionState::RecordFall(long traySteps)
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   fallSeen_ = true;
   fallAnchor_ = traySteps;
}


bool
MotionState::GetPendingFall(long& anchor) const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   if (!fallSeen_)
      return false;
   anchor = fallAnchor_;
   return true;
}


void
MotionState::ClearPendingFall()
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   fallSeen_ = false;
}


void
MotionState::MarkUserActivity()
{
   {
      std::lock_guard<std::mutex> lock(displayMutex_);
      lastUserAction_ = Clock::now();
   }
   autonomousMode_.store(false);
   abortAutonomous_.store(true);
}


MotionState::Clock::time_point
MotionState::GetLastUserAction() const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   return lastUserAction_;
}


void
MotionState::StampAutoAdvance()
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   lastAutoAdvance_ = Clock::now();
}


MotionState::Clock::time_point
MotionState::GetLastAutoAdvance() const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   return lastAutoAdvance_;
}


void
MotionState::SetDisplay(int tab, int specimen)
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   currentTab_ = tab;
   currentSpecimen_ = specimen;
}


void
MotionState::SetCurrentSpecimen(int specimen)
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   currentSpecimen_ = specimen;
}


int
MotionState::GetCurrentTab() const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   return currentTab_;
}


int
MotionState::GetCurrentSpecimen() const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   return currentSpecimen_;
}


void
MotionState::SetLastRiseAnchor(long traySteps)
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   lastRiseAnchor_ = traySteps;
}


long
MotionState::GetLastRiseAnchor() const
{
   std::lock_guard<std::mutex> lock(displayMutex_);
   return lastRiseAnchor_;
}


void
MotionState::SetOpticalState(bool optical1, bool optical2)
{
   optical1_.store(optical1);
   optical2_.store(optical2);
}

} // namespace scope
