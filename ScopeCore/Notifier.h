///////////////////////////////////////////////////////////////////////////////
// FILE:          Notifier.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Thread-safe forwarding of core events to the registered callback
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

#include <mutex>
#include <string>

class ScopeEventCallback;

namespace scope
{

class Notifier
{
   mutable std::mutex mutex_;
   ScopeEventCallback* callback_;

public:
   Notifier() : callback_(nullptr) {}

   Notifier(const Notifier&) = delete;
   Notifier& operator=(const Notifier&) = delete;

   // Not owned. Pass null to unregister.
   void SetCallback(ScopeEventCallback* callback);

   void SpecimenChanged(int specimen) const;
   void PanelShouldOpen(bool open) const;
   void LimitReached(const std::string& axisName) const;
   void ErrorState(const std::string& message) const;
   void InitializationFinished(bool succeeded) const;
};

} // namespace scope
