///////////////////////////////////////////////////////////////////////////////
// FILE:          SysfsGPIO.cpp
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

#include "SysfsGPIO.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

const char* g_SysfsGPIOPortName = "SysfsGPIO";

namespace
{

const int DirectionRetries = 20;
const long DirectionRetryMs = 10;

int WriteFile(const std::string& path, const std::string& text)
{
   int fd = ::open(path.c_str(), O_WRONLY);
   if (fd < 0)
      return DEVICE_IO_ERROR;
   ssize_t n = ::write(fd, text.c_str(), text.size());
   ::close(fd);
   return n == static_cast<ssize_t>(text.size()) ? DEVICE_OK : DEVICE_IO_ERROR;
}

bool IsDirectory(const std::string& path)
{
   struct stat st;
   return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

} // anonymous namespace


SysfsGPIOPort::SysfsGPIOPort(const std::string& root) :
   root_(root),
   initialized_(false)
{}


SysfsGPIOPort::~SysfsGPIOPort()
{
   Shutdown();
}


void
SysfsGPIOPort::GetName(char* name) const
{
   CDeviceUtils::CopyLimitedString(name, g_SysfsGPIOPortName);
}


int
SysfsGPIOPort::Initialize()
{
   if (initialized_)
      return DEVICE_OK;
   if (!IsDirectory(root_))
      return DEVICE_IO_ERROR;
   initialized_ = true;
   return DEVICE_OK;
}


int
SysfsGPIOPort::Shutdown()
{
   std::lock_guard<std::mutex> lock(mutex_);
   for (auto& entry : pins_)
      ::close(entry.second.fd);
   pins_.clear();

   int ret = DEVICE_OK;
   for (int pin : exported_)
   {
      if (WriteFile(root_ + "/unexport", std::to_string(pin)) != DEVICE_OK)
         ret = DEVICE_IO_ERROR;
   }
   exported_.clear();
   initialized_ = false;
   return ret;
}


std::string
SysfsGPIOPort::PinDirectory(int pin) const
{
   return root_ + "/gpio" + std::to_string(pin);
}


int
SysfsGPIOPort::Export(int pin)
{
   if (IsDirectory(PinDirectory(pin)))
      return DEVICE_OK;

   int ret = WriteFile(root_ + "/export", std::to_string(pin));
   if (ret != DEVICE_OK)
      return ret;
   exported_.push_back(pin);
   return DEVICE_OK;
}


int
SysfsGPIOPort::SetDirection(int pin, const char* direction)
{
   // The attribute files of a freshly exported pin may not be writable until
   // udev has adjusted their permissions.
   const std::string path = PinDirectory(pin) + "/direction";
   int ret = DEVICE_IO_ERROR;
   for (int attempt = 0; attempt < DirectionRetries; ++attempt)
   {
      ret = WriteFile(path, direction);
      if (ret == DEVICE_OK)
         break;
      CDeviceUtils::SleepMs(DirectionRetryMs);
   }
   return ret;
}


int
SysfsGPIOPort::OpenValue(int pin, bool output, SC::PinPull pull)
{
   const std::string path = PinDirectory(pin) + "/value";
   int fd = ::open(path.c_str(), output ? O_RDWR : O_RDONLY);
   if (fd < 0)
      return DEVICE_IO_ERROR;

   ClosePin(pin);
   PinHandle handle;
   handle.fd = fd;
   handle.output = output;
   handle.pull = pull;
   pins_[pin] = handle;
   return DEVICE_OK;
}


void
SysfsGPIOPort::ClosePin(int pin)
{
   auto it = pins_.find(pin);
   if (it == pins_.end())
      return;
   ::close(it->second.fd);
   pins_.erase(it);
}


int
SysfsGPIOPort::SetupOutput(int pin, SC::PinLevel initial)
{
   if (!initialized_)
      return DEVICE_NOT_INITIALIZED;
   if (pin < 0)
      return DEVICE_INVALID_PIN;

   std::lock_guard<std::mutex> lock(mutex_);
   int ret = Export(pin);
   if (ret != DEVICE_OK)
      return ret;
   // "high"/"low" set the direction and the initial level glitch-free
   ret = SetDirection(pin, initial == SC::PinHigh ? "high" : "low");
   if (ret != DEVICE_OK)
      return ret;
   return OpenValue(pin, true, SC::PullNone);
}


int
SysfsGPIOPort::SetupInput(int pin, SC::PinPull pull)
{
   if (!initialized_)
      return DEVICE_NOT_INITIALIZED;
   if (pin < 0)
      return DEVICE_INVALID_PIN;

   std::lock_guard<std::mutex> lock(mutex_);
   int ret = Export(pin);
   if (ret != DEVICE_OK)
      return ret;
   ret = SetDirection(pin, "in");
   if (ret != DEVICE_OK)
      return ret;
   return OpenValue(pin, false, pull);
}


bool
SysfsGPIOPort::GetRequestedPull(int pin, SC::PinPull& pull) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   auto it = pins_.find(pin);
   if (it == pins_.end() || it->second.output)
      return false;
   pull = it->second.pull;
   return true;
}


SC::PinLevel
SysfsGPIOPort::ReadPin(int pin)
{
   int fd = -1;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pins_.find(pin);
      if (it == pins_.end())
         return SC::PinLow;
      fd = it->second.fd;
   }

   char c = '0';
   if (::pread(fd, &c, 1, 0) != 1)
      return SC::PinLow;
   return c == '1' ? SC::PinHigh : SC::PinLow;
}


int
SysfsGPIOPort::WritePin(int pin, SC::PinLevel level)
{
   int fd = -1;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pins_.find(pin);
      if (it == pins_.end())
         return DEVICE_INVALID_PIN;
      if (!it->second.output)
         return DEVICE_NOT_SUPPORTED;
      fd = it->second.fd;
   }

   const char c = (level == SC::PinHigh) ? '1' : '0';
   if (::pwrite(fd, &c, 1, 0) != 1)
      return DEVICE_PIN_WRITE_FAILED;
   return DEVICE_OK;
}
