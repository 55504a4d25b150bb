///////////////////////////////////////////////////////////////////////////////
// FILE:          SensorMonitor.h
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

#pragma once

#include "Logging/Logger.h"
#include "StageConfig.h"

#include <atomic>
#include <chrono>
#include <thread>

namespace scope
{

class MotionState;
class Notifier;
class PinIO;
class SpecimenMapper;

/**
 * Samples the limit switches and both optical sensors at a fixed interval,
 * detects edges and keeps the tray position and displayed specimen in
 * step with what passes through the beam.
 */
class SensorMonitor
{
public:
   typedef std::chrono::steady_clock Clock;

   SensorMonitor(const StageConfig& config, MotionState& state, PinIO& pins,
         const SpecimenMapper& mapper, const Notifier& notifier,
         logging::Logger logger);
   ~SensorMonitor();

   void Start();
   void Stop();
   bool IsActive() const { return thread_.joinable(); }

   /// Takes the initial optical samples that later edges are measured from.
   void Prime();

   /// One iteration of the polling loop.
   void PollOnce();
   void PollOnce(Clock::time_point now);

private:
   void Svc();
   void CheckLimitSwitches();
   void HandleOptical2Fall();
   void HandleOptical2Rise(Clock::time_point now);
   void HandleWideTab(Clock::time_point now);
   void Announce(int specimen);
   bool Debounced(Clock::time_point now, Clock::time_point& last, bool& seen) const;

   const StageConfig& config_;
   MotionState& state_;
   PinIO& pins_;
   const SpecimenMapper& mapper_;
   const Notifier& notifier_;
   logging::Logger logger_;

   std::thread thread_;
   std::atomic<bool> stop_;

   bool prevOptical1_;
   bool prevOptical2_;
   bool optical1Logged_;
   bool zoomLimitLatched_;
   bool focusLimitLatched_;
   bool riseSeen_;
   Clock::time_point lastRise_;
   bool wideTabSeen_;
   Clock::time_point lastWideTab_;
};

} // namespace scope
