///////////////////////////////////////////////////////////////////////////////
// FILE:          SysfsGPIO.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Pin port on the Linux sysfs GPIO interface (/sys/class/gpio)
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

#include "../../ScopeDevice/ScopeDevice.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

extern const char* g_SysfsGPIOPortName;

/**
 * Pins are exported on setup and unexported on shutdown (only those this
 * port exported itself). Sysfs has no control over pull resistors; the
 * requested bias is recorded and must be provided by the board's device
 * tree overlay.
 */
class SysfsGPIOPort : public SC::PinPort
{
public:
   explicit SysfsGPIOPort(const std::string& root = "/sys/class/gpio");
   ~SysfsGPIOPort();

   int Initialize();
   int Shutdown();
   void GetName(char* name) const;

   int SetupOutput(int pin, SC::PinLevel initial);
   int SetupInput(int pin, SC::PinPull pull);
   SC::PinLevel ReadPin(int pin);
   int WritePin(int pin, SC::PinLevel level);

   bool GetRequestedPull(int pin, SC::PinPull& pull) const;

private:
   struct PinHandle
   {
      int fd;
      bool output;
      SC::PinPull pull;
   };

   std::string PinDirectory(int pin) const;
   int Export(int pin);
   int SetDirection(int pin, const char* direction);
   int OpenValue(int pin, bool output, SC::PinPull pull);
   void ClosePin(int pin);

   std::string root_;
   bool initialized_;
   mutable std::mutex mutex_;
   std::map<int, PinHandle> pins_;
   std::vector<int> exported_;
};
