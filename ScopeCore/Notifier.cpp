///////////////////////////////////////////////////////////////////////////////
// FILE:          Notifier.cpp
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

#include "Notifier.h"

#include "ScopeEventCallback.h"

namespace scope
{

void
Notifier::SetCallback(ScopeEventCallback* callback)
{
   std::lock_guard<std::mutex> lock(mutex_);
   callback_ = callback;
}


void
Notifier::SpecimenChanged(int specimen) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (callback_)
      callback_->onSpecimenChanged(specimen);
}


void
Notifier::PanelShouldOpen(bool open) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (callback_)
      callback_->onPanelShouldOpen(open);
}


void
Notifier::LimitReached(const std::string& axisName) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (callback_)
      callback_->onLimitReached(axisName.c_str());
}


void
Notifier::ErrorState(const std::string& message) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (callback_)
      callback_->onErrorState(message.c_str());
}


void
Notifier::InitializationFinished(bool succeeded) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (callback_)
      callback_->onInitializationFinished(succeeded);
}

} // namespace scope
