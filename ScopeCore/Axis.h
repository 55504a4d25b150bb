///////////////////////////////////////////////////////////////////////////////
// FILE:          Axis.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Identity of the three motorized axes
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

namespace scope {

enum AxisId
{
   AxisTray,
   AxisZoom,
   AxisFocus,
};

const int NumAxes = 3;

inline const char*
AxisName(AxisId axis)
{
   switch (axis)
   {
      case AxisTray: return "TRAY";
      case AxisZoom: return "ZOOM";
      case AxisFocus: return "FOCUS";
   }
   return "(invalid axis)";
}

inline bool
IsValidAxis(int axis)
{
   return axis >= AxisTray && axis <= AxisFocus;
}

// Travel direction; positive drives the direction pin high.
enum Direction
{
   DirectionReverse = -1,
   DirectionForward = +1,
};

} // namespace scope
