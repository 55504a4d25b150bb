///////////////////////////////////////////////////////////////////////////////
// FILE:          SpecimenMapper.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Mapping between tray positions, tabs and specimens
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

#include "StageConfig.h"

#include <vector>

namespace scope
{

struct FallResolution
{
   int tab;
   int specimen;
   int direction; // -1, 0 or +1
};

/**
 * Pure queries over the specimen range table. Specimens and tabs are both
 * numbered 1..N; tab 1 is the wide tab.
 */
class SpecimenMapper
{
   std::vector<SpecimenRanges> ranges_;
   long minimumTolerance_;

public:
   SpecimenMapper(const std::vector<SpecimenRanges>& ranges, long minimumTolerance);

   int NumSpecimens() const { return static_cast<int>(ranges_.size()); }

   long ToleranceFor(const StepRange& range, double toleranceFraction) const;

   /**
    * Scans the table in order; for each range, containment or a distance
    * to the range center within tolerance is a match, and the first match
    * wins. Returns false if no range qualifies.
    */
   bool MapStepsToSpecimen(long steps, double toleranceFraction, int& specimen) const;

   /// The specimen shown across from a tab.
   int SpecimenForTab(int tab) const;

   /// Inverse of SpecimenForTab(); 0 if the specimen is out of range.
   int TabForSpecimen(int specimen) const;

   /**
    * Infers the new tab from the tray travel between an optical-2 fall and
    * now. Travel beyond +/-threshold moves one tab in that direction. An
    * unknown tab (0) is derived from the current specimen, or taken as 1.
    */
   FallResolution ResolveAfterFall(int currentTab, int currentSpecimen,
         long delta, long threshold) const;
};

} // namespace scope
