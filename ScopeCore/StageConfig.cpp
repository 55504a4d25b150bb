///////////////////////////////////////////////////////////////////////////////
// FILE:          StageConfig.cpp
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

#include "StageConfig.h"

#include "CoreUtils.h"
#include "Error.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace scope
{

namespace
{

const SpecimenRanges DefaultRanges[] = {
   { 1, { 13809, 14168 }, { 5575, 5940 } },
   { 2, { 14630, 14987 }, { 6399, 6765 } },
   { 3, { 15454, 15819 }, { 7223, 7585 } },
   { 4, { 16284, 16641 }, { 8060, 8400 } },
   { 5, { 17103, 17462 }, { 8900, 9219 } },
   { 6, { 9600, 10100 }, { 9600, 10100 } },
   { 7, { 10495, 10856 }, { 2292, 2651 } },
   { 8, { 11314, 11678 }, { 3133, 3466 } },
   { 9, { 12150, 12506 }, { 3937, 4297 } },
   { 10, { 12977, 13348 }, { 4758, 5114 } },
};

template <typename T>
void Override(const nlohmann::json& obj, const char* key, T& field)
{
   auto it = obj.find(key);
   if (it != obj.end() && !it->is_null())
      field = it->get<T>();
}

void OverrideAxisPins(const nlohmann::json& pins, const char* key, AxisPins& axis)
{
   auto it = pins.find(key);
   if (it == pins.end())
      return;
   Override(*it, "step", axis.stepPin);
   Override(*it, "dir", axis.dirPin);
   Override(*it, "cw", axis.cwButtonPin);
   Override(*it, "ccw", axis.ccwButtonPin);
}

StepRange ParseRange(const nlohmann::json& j)
{
   if (!j.is_array() || j.size() != 2)
      throw CScopeError("A step range must be a two-element array",
            SCOPEERR_InvalidConfiguration);
   StepRange r;
   r.start = j.at(0).get<long>();
   r.end = j.at(1).get<long>();
   return r;
}

std::vector<SpecimenRanges> ParseRanges(const nlohmann::json& j)
{
   if (!j.is_array())
      throw CScopeError("\"specimenRanges\" must be an array",
            SCOPEERR_InvalidConfiguration);

   std::vector<SpecimenRanges> result;
   for (const auto& entry : j)
   {
      const nlohmann::json& ranges = entry.at("ranges");
      if (!ranges.is_array() || ranges.size() != 2)
         throw CScopeError("Each specimen needs exactly two step ranges",
               SCOPEERR_InvalidConfiguration);
      SpecimenRanges s;
      s.specimen = entry.at("specimen").get<int>();
      s.first = ParseRange(ranges.at(0));
      s.second = ParseRange(ranges.at(1));
      result.push_back(s);
   }
   return result;
}

void CheckPositive(long value, const char* name)
{
   if (value <= 0)
      throw CScopeError(std::string(name) + " must be positive (got " +
            ToString(value) + ")", SCOPEERR_InvalidConfiguration);
}

void CheckNonNegative(long value, const char* name)
{
   if (value < 0)
      throw CScopeError(std::string(name) + " must not be negative (got " +
            ToString(value) + ")", SCOPEERR_InvalidConfiguration);
}

void CheckFraction(double value, const char* name)
{
   if (!(value >= 0.0 && value <= 1.0))
      throw CScopeError(std::string(name) + " must be within [0, 1] (got " +
            ToString(value) + ")", SCOPEERR_InvalidConfiguration);
}

} // anonymous namespace


StageConfig::StageConfig() :
   trayPins{ 22, 27, 12, 25 },
   zoomPins{ 13, 6, 23, 24 },
   focusPins{ 21, 20, 18, 4 },
   limitZoomPin(17),
   limitFocusPin(5),
   optical1Pin(26),
   optical2Pin(19),
   stepDelayFastUs(3500),
   stepDelaySlowUs(10000),
   backoffSteps(100),
   maxInitSteps(12000),
   debounceCountInit(6),
   sensorDebounceMs(80),
   opt2StepThreshold(50),
   maxZoomSteps(10000),
   maxFocusSteps(10000),
   trayBaseline(10000),
   tabSeekToleranceFraction(0.05),
   rangeToleranceFraction(0.10),
   minimumTolerance(50),
   autonomyIdleMs(20000),
   sensorPollMs(20),
   buttonPollMs(10),
   pressConfirmMs(20),
   dwellPollMs(200),
   suspendedPollMs(500),
   frozenPollMs(200),
   errorPollMs(500),
   retryPollMs(100),
   shutdownGraceMs(50),
   axisLockTimeoutMs(2000),
   tabSeekLockTimeoutMs(5000),
   initialSpecimen(6),
   specimenRanges(std::begin(DefaultRanges), std::end(DefaultRanges))
{}


const AxisPins&
StageConfig::PinsFor(AxisId axis) const
{
   switch (axis)
   {
      case AxisZoom: return zoomPins;
      case AxisFocus: return focusPins;
      case AxisTray:
      default:
         return trayPins;
   }
}


int
StageConfig::LimitPinFor(AxisId axis) const
{
   switch (axis)
   {
      case AxisZoom: return limitZoomPin;
      case AxisFocus: return limitFocusPin;
      default: return -1;
   }
}


long
StageConfig::MaxStepsFor(AxisId axis) const
{
   switch (axis)
   {
      case AxisZoom: return maxZoomSteps;
      case AxisFocus: return maxFocusSteps;
      default: return 0;
   }
}


long
StageConfig::StepsPerRevolution() const
{
   long maxEnd = 0;
   for (const auto& s : specimenRanges)
      maxEnd = std::max(maxEnd, std::max(s.first.end, s.second.end));
   return maxEnd + 500;
}


StageConfig
ParseStageConfig(const std::string& jsonText)
{
   StageConfig config;
   try
   {
      nlohmann::json doc = nlohmann::json::parse(jsonText);
      if (!doc.is_object())
         throw CScopeError("Configuration document must be a JSON object",
               SCOPEERR_InvalidConfiguration);

      auto pins = doc.find("pins");
      if (pins != doc.end())
      {
         OverrideAxisPins(*pins, "tray", config.trayPins);
         OverrideAxisPins(*pins, "zoom", config.zoomPins);
         OverrideAxisPins(*pins, "focus", config.focusPins);
         Override(*pins, "limitZoom", config.limitZoomPin);
         Override(*pins, "limitFocus", config.limitFocusPin);
         Override(*pins, "optical1", config.optical1Pin);
         Override(*pins, "optical2", config.optical2Pin);
      }

      auto timing = doc.find("timing");
      if (timing != doc.end())
      {
         Override(*timing, "stepDelayFastUs", config.stepDelayFastUs);
         Override(*timing, "stepDelaySlowUs", config.stepDelaySlowUs);
         Override(*timing, "sensorDebounceMs", config.sensorDebounceMs);
         Override(*timing, "sensorPollMs", config.sensorPollMs);
         Override(*timing, "buttonPollMs", config.buttonPollMs);
         Override(*timing, "pressConfirmMs", config.pressConfirmMs);
         Override(*timing, "dwellPollMs", config.dwellPollMs);
         Override(*timing, "suspendedPollMs", config.suspendedPollMs);
         Override(*timing, "frozenPollMs", config.frozenPollMs);
         Override(*timing, "errorPollMs", config.errorPollMs);
         Override(*timing, "retryPollMs", config.retryPollMs);
         Override(*timing, "shutdownGraceMs", config.shutdownGraceMs);
         Override(*timing, "axisLockTimeoutMs", config.axisLockTimeoutMs);
         Override(*timing, "tabSeekLockTimeoutMs", config.tabSeekLockTimeoutMs);
      }

      auto limits = doc.find("limits");
      if (limits != doc.end())
      {
         Override(*limits, "backoffSteps", config.backoffSteps);
         Override(*limits, "maxInitSteps", config.maxInitSteps);
         Override(*limits, "debounceCountInit", config.debounceCountInit);
         Override(*limits, "opt2StepThreshold", config.opt2StepThreshold);
         Override(*limits, "maxZoomSteps", config.maxZoomSteps);
         Override(*limits, "maxFocusSteps", config.maxFocusSteps);
         Override(*limits, "trayBaseline", config.trayBaseline);
      }

      auto tolerances = doc.find("tolerances");
      if (tolerances != doc.end())
      {
         Override(*tolerances, "tabSeekFraction", config.tabSeekToleranceFraction);
         Override(*tolerances, "rangeFraction", config.rangeToleranceFraction);
         Override(*tolerances, "minimum", config.minimumTolerance);
      }

      auto autonomy = doc.find("autonomy");
      if (autonomy != doc.end())
      {
         Override(*autonomy, "idleMs", config.autonomyIdleMs);
         Override(*autonomy, "initialSpecimen", config.initialSpecimen);
      }

      auto ranges = doc.find("specimenRanges");
      if (ranges != doc.end())
         config.specimenRanges = ParseRanges(*ranges);
   }
   catch (const nlohmann::json::exception& e)
   {
      throw CScopeError("Cannot parse stage configuration",
            SCOPEERR_InvalidConfiguration,
            CScopeError(e.what(), SCOPEERR_InvalidConfiguration));
   }

   ValidateStageConfig(config);
   return config;
}


StageConfig
LoadStageConfig(const std::string& path)
{
   std::ifstream in(path);
   if (!in)
      throw CScopeError("Cannot open stage configuration file " +
            ToQuotedString(path), SCOPEERR_InvalidConfiguration);

   std::ostringstream text;
   text << in.rdbuf();
   try
   {
      return ParseStageConfig(text.str());
   }
   catch (const CScopeError& e)
   {
      throw CScopeError("Invalid stage configuration file " +
            ToQuotedString(path), SCOPEERR_InvalidConfiguration, e);
   }
}


void
ValidateStageConfig(const StageConfig& config)
{
   if (config.specimenRanges.empty())
      throw CScopeError("The specimen range table is empty",
            SCOPEERR_InvalidConfiguration);

   const int n = config.NumSpecimens();
   std::set<int> ids;
   for (const auto& s : config.specimenRanges)
   {
      if (s.specimen < 1 || s.specimen > n)
         throw CScopeError("Specimen id " + ToString(s.specimen) +
               " is outside 1.." + ToString(n), SCOPEERR_InvalidConfiguration);
      if (!ids.insert(s.specimen).second)
         throw CScopeError("Specimen id " + ToString(s.specimen) +
               " appears twice in the range table", SCOPEERR_InvalidConfiguration);
      if (s.first.end < s.first.start || s.second.end < s.second.start)
         throw CScopeError("Specimen " + ToString(s.specimen) +
               " has a range whose end precedes its start",
               SCOPEERR_InvalidConfiguration);
   }

   if (config.initialSpecimen < 1 || config.initialSpecimen > n)
      throw CScopeError("initialSpecimen must be within 1.." + ToString(n),
            SCOPEERR_InvalidConfiguration);

   CheckPositive(config.maxZoomSteps, "maxZoomSteps");
   CheckPositive(config.maxFocusSteps, "maxFocusSteps");
   CheckPositive(config.maxInitSteps, "maxInitSteps");
   if (config.debounceCountInit < 1)
      throw CScopeError("debounceCountInit must be at least 1",
            SCOPEERR_InvalidConfiguration);

   CheckNonNegative(config.stepDelayFastUs, "stepDelayFastUs");
   CheckNonNegative(config.stepDelaySlowUs, "stepDelaySlowUs");
   CheckNonNegative(config.backoffSteps, "backoffSteps");
   CheckNonNegative(config.sensorDebounceMs, "sensorDebounceMs");
   CheckNonNegative(config.opt2StepThreshold, "opt2StepThreshold");
   CheckNonNegative(config.minimumTolerance, "minimumTolerance");
   CheckNonNegative(config.autonomyIdleMs, "autonomyIdleMs");
   CheckNonNegative(config.pressConfirmMs, "pressConfirmMs");
   CheckNonNegative(config.shutdownGraceMs, "shutdownGraceMs");
   CheckNonNegative(config.axisLockTimeoutMs, "axisLockTimeoutMs");
   CheckNonNegative(config.tabSeekLockTimeoutMs, "tabSeekLockTimeoutMs");
   CheckPositive(config.sensorPollMs, "sensorPollMs");
   CheckPositive(config.buttonPollMs, "buttonPollMs");
   CheckPositive(config.dwellPollMs, "dwellPollMs");
   CheckPositive(config.suspendedPollMs, "suspendedPollMs");
   CheckPositive(config.frozenPollMs, "frozenPollMs");
   CheckPositive(config.errorPollMs, "errorPollMs");
   CheckPositive(config.retryPollMs, "retryPollMs");

   CheckFraction(config.tabSeekToleranceFraction, "tabSeekToleranceFraction");
   CheckFraction(config.rangeToleranceFraction, "rangeToleranceFraction");

   // Every pin has exactly one role.
   const int pins[] = {
      config.trayPins.stepPin, config.trayPins.dirPin,
      config.trayPins.cwButtonPin, config.trayPins.ccwButtonPin,
      config.zoomPins.stepPin, config.zoomPins.dirPin,
      config.zoomPins.cwButtonPin, config.zoomPins.ccwButtonPin,
      config.focusPins.stepPin, config.focusPins.dirPin,
      config.focusPins.cwButtonPin, config.focusPins.ccwButtonPin,
      config.limitZoomPin, config.limitFocusPin,
      config.optical1Pin, config.optical2Pin,
   };
   std::set<int> seen;
   for (int pin : pins)
   {
      if (pin < 0)
         throw CScopeError("Pin numbers must not be negative (got " +
               ToString(pin) + ")", SCOPEERR_InvalidConfiguration);
      if (!seen.insert(pin).second)
         throw CScopeError("Pin " + ToString(pin) + " is assigned twice",
               SCOPEERR_InvalidConfiguration);
   }
}

} // namespace scope
