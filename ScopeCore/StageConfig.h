///////////////////////////////////////////////////////////////////////////////
// FILE:          StageConfig.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Stage geometry, pin assignments and timing constants
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

#include <string>
#include <vector>

namespace scope
{

struct AxisPins
{
   int stepPin;
   int dirPin;
   int cwButtonPin;
   int ccwButtonPin;
};

/// Inclusive range of absolute tray steps.
struct StepRange
{
   long start;
   long end;

   long Width() const { return end - start + 1; }
   long Center() const { return (start + end) / 2; }
   bool Contains(long steps) const { return steps >= start && steps <= end; }
};

/// The two tray positions (front and back of the carousel) of one specimen.
struct SpecimenRanges
{
   int specimen;
   StepRange first;
   StepRange second;
};

struct StageConfig
{
   AxisPins trayPins;
   AxisPins zoomPins;
   AxisPins focusPins;

   int limitZoomPin;
   int limitFocusPin;
   int optical1Pin;
   int optical2Pin;

   long stepDelayFastUs;
   long stepDelaySlowUs;

   long backoffSteps;
   long maxInitSteps;
   int debounceCountInit;
   long sensorDebounceMs;
   long opt2StepThreshold;

   long maxZoomSteps;
   long maxFocusSteps;
   long trayBaseline;

   double tabSeekToleranceFraction;
   double rangeToleranceFraction;
   long minimumTolerance;

   long autonomyIdleMs;

   long sensorPollMs;
   long buttonPollMs;
   long pressConfirmMs;
   long dwellPollMs;
   long suspendedPollMs;
   long frozenPollMs;
   long errorPollMs;
   long retryPollMs;
   long shutdownGraceMs;

   long axisLockTimeoutMs;
   long tabSeekLockTimeoutMs;

   int initialSpecimen;

   std::vector<SpecimenRanges> specimenRanges;

   StageConfig();

   const AxisPins& PinsFor(AxisId axis) const;

   /// Limit switch input of a zoom/focus axis; -1 for the tray.
   int LimitPinFor(AxisId axis) const;

   /// Safety bound on |counter| of a zoom/focus axis; 0 for the tray.
   long MaxStepsFor(AxisId axis) const;

   int NumSpecimens() const { return static_cast<int>(specimenRanges.size()); }

   long StepsPerRevolution() const;
};

/**
 * Reads a JSON configuration file; keys present override the defaults.
 * Throws CScopeError (SCOPEERR_InvalidConfiguration) if the file cannot be
 * read or parsed, or if the result does not validate.
 */
StageConfig LoadStageConfig(const std::string& path);

/// Same as LoadStageConfig(), from an in-memory document.
StageConfig ParseStageConfig(const std::string& jsonText);

/// Throws CScopeError (SCOPEERR_InvalidConfiguration) describing the first
/// problem found.
void ValidateStageConfig(const StageConfig& config);

} // namespace scope
