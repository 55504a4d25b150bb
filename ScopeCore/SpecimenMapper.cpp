///////////////////////////////////////////////////////////////////////////////
// FILE:          SpecimenMapper.cpp
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

#include "SpecimenMapper.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace scope
{

SpecimenMapper::SpecimenMapper(const std::vector<SpecimenRanges>& ranges,
      long minimumTolerance) :
   ranges_(ranges),
   minimumTolerance_(minimumTolerance)
{}


long
SpecimenMapper::ToleranceFor(const StepRange& range, double toleranceFraction) const
{
   const long width = std::max(1L, range.Width());
   return std::max(minimumTolerance_,
         std::lround(static_cast<double>(width) * toleranceFraction));
}


bool
SpecimenMapper::MapStepsToSpecimen(long steps, double toleranceFraction,
      int& specimen) const
{
   // No nearest-center fallback: outside every tolerance maps to nothing
   for (const auto& entry : ranges_)
   {
      const StepRange* pair[] = { &entry.first, &entry.second };
      for (const StepRange* range : pair)
      {
         if (range->Contains(steps))
         {
            specimen = entry.specimen;
            return true;
         }

         const long distance = std::labs(steps - range->Center());
         if (distance <= ToleranceFor(*range, toleranceFraction))
         {
            specimen = entry.specimen;
            return true;
         }
      }
   }
   return false;
}


int
SpecimenMapper::SpecimenForTab(int tab) const
{
   const int n = NumSpecimens();
   int index = (tab + n / 2 - 1) % n;
   if (index < 0)
      index += n;
   return index + 1;
}


int
SpecimenMapper::TabForSpecimen(int specimen) const
{
   for (int tab = 1; tab <= NumSpecimens(); ++tab)
   {
      if (SpecimenForTab(tab) == specimen)
         return tab;
   }
   return 0;
}


FallResolution
SpecimenMapper::ResolveAfterFall(int currentTab, int currentSpecimen,
      long delta, long threshold) const
{
   const int n = NumSpecimens();

   int tab = currentTab;
   if (tab < 1 || tab > n)
   {
      tab = TabForSpecimen(currentSpecimen);
      if (tab == 0)
         tab = 1;
   }

   int direction = 0;
   if (delta > threshold)
      direction = +1;
   else if (delta < -threshold)
      direction = -1;

   FallResolution result;
   result.direction = direction;
   result.tab = ((tab - 1 + direction) % n + n) % n + 1;
   result.specimen = SpecimenForTab(result.tab);
   return result;
}

} // namespace scope
