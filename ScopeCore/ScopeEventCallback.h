///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopeEventCallback.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Callback interface for the display, panel and alert layers
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
#include <iostream>

class ScopeEventCallback
{
public:
   ScopeEventCallback() {}
   virtual ~ScopeEventCallback() {}

   virtual void onSpecimenChanged(int specimen)
   {
      std::cout << "onSpecimenChanged() " << specimen << '\n';
   }

   /**
    * \brief Called on optical sensor 2 edges.
    *
    * The info panel slides in when the tab enters the beam (open == true)
    * and out when it leaves.
    */
   virtual void onPanelShouldOpen(bool open)
   {
      std::cout << "onPanelShouldOpen() " << open << '\n';
   }

   virtual void onLimitReached(const char* axisName)
   {
      std::cout << "onLimitReached() " << axisName << '\n';
   }

   /**
    * \brief Called once when the session enters the error state.
    *
    * The message is meant for a persistent banner; motion stays disabled
    * until the process is restarted.
    */
   virtual void onErrorState(const char* message)
   {
      std::cout << "onErrorState() " << message << '\n';
   }

   virtual void onInitializationFinished(bool succeeded)
   {
      std::cout << "onInitializationFinished() " << succeeded << '\n';
   }
};
