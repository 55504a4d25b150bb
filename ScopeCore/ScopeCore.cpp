///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopeCore.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   The SpecimenScope motion core: top-level interface
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

#include "ScopeCore.h"

#include "CoreUtils.h"
#include "HomingSequencer.h"
#include "LogManager.h"
#include "ManualOverride.h"
#include "MotionState.h"
#include "Notifier.h"
#include "PinIO.h"
#include "SensorMonitor.h"
#include "SpecimenMapper.h"
#include "SpecimenStore.h"
#include "StepperDriver.h"

#include "../ScopeDevice/ScopeDevice.h"

#include <chrono>
#include <sstream>

namespace
{

const int SCOPECORE_VERSION_MAJOR = 1;
const int SCOPECORE_VERSION_MINOR = 0;
const int SCOPECORE_VERSION_PATCH = 0;

} // anonymous namespace


CScopeCore::CScopeCore(SC::PinPort* port, const scope::StageConfig& config,
      std::shared_ptr<scope::SpecimenStore> store) :
   logManager_(std::make_shared<scope::LogManager>()),
   appLogger_(logManager_->NewLogger("App")),
   coreLogger_(logManager_->NewLogger("Core")),
   port_(port),
   config_(config),
   store_(store),
   initFinished_(false),
   debugReadout_(false),
   portInitialized_(false)
{
   if (!store_)
      throw CScopeError("Null specimen store", SCOPEERR_InvalidConfiguration);
   CreateComponents();
}


CScopeCore::CScopeCore(SC::PinPort* port, const scope::StageConfig& config,
      const std::string& specimenDirectory) :
   logManager_(std::make_shared<scope::LogManager>()),
   appLogger_(logManager_->NewLogger("App")),
   coreLogger_(logManager_->NewLogger("Core")),
   port_(port),
   config_(config),
   store_(std::make_shared<scope::JsonSpecimenStore>(specimenDirectory,
            logManager_->NewLogger("SpecimenStore"))),
   initFinished_(false),
   debugReadout_(false),
   portInitialized_(false)
{
   CreateComponents();
}


void
CScopeCore::CreateComponents()
{
   if (!port_)
      throw CScopeError("Null pin port", SCOPEERR_PortInitializationFailed);
   scope::ValidateStageConfig(config_);

   state_ = std::make_unique<scope::MotionState>(config_.trayBaseline,
         config_.autonomyIdleMs, config_.initialSpecimen);
   notifier_ = std::make_unique<scope::Notifier>();
   pins_ = std::make_unique<scope::PinIO>(*port_, *state_, *notifier_,
         logManager_->NewLogger("PinIO"));
   mapper_ = std::make_unique<scope::SpecimenMapper>(config_.specimenRanges,
         config_.minimumTolerance);
   driver_ = std::make_unique<scope::StepperDriver>(config_, *state_, *pins_,
         logManager_->NewLogger("StepperDriver"));
   homing_ = std::make_unique<scope::HomingSequencer>(config_, *state_, *pins_,
         *driver_, *mapper_, *store_, *notifier_,
         logManager_->NewLogger("Homing"));
   monitor_ = std::make_unique<scope::SensorMonitor>(config_, *state_, *pins_,
         *mapper_, *notifier_, logManager_->NewLogger("SensorMonitor"));
   override_ = std::make_unique<scope::ManualOverride>(config_, *state_, *pins_,
         *driver_, logManager_->NewLogger("ManualOverride"));
   scheduler_ = std::make_unique<scope::AutonomousScheduler>(config_, *state_,
         *driver_, *homing_, *mapper_, *store_, *notifier_,
         logManager_->NewLogger("Autonomous"));

   LOG_INFO(coreLogger_) << "Core created; " << config_.NumSpecimens() <<
      " specimens, " << config_.StepsPerRevolution() << " steps per revolution";
}


CScopeCore::~CScopeCore()
{
   try
   {
      shutdown();
   }
   catch (const CScopeError& e)
   {
      LOG_ERROR(coreLogger_) << "Error during shutdown: " << e.getFullMsg();
   }
   LOG_INFO(coreLogger_) << "Core session ended";
}


std::string
CScopeCore::getVersionInfo() const
{
   std::ostringstream txt;
   txt << "SpecimenScope core version " << SCOPECORE_VERSION_MAJOR << "." <<
      SCOPECORE_VERSION_MINOR << "." << SCOPECORE_VERSION_PATCH;
   return txt.str();
}


void
CScopeCore::ConfigurePins()
{
   const scope::AxisId axes[] = { scope::AxisTray, scope::AxisZoom, scope::AxisFocus };
   for (scope::AxisId axis : axes)
   {
      const scope::AxisPins& p = config_.PinsFor(axis);
      const int outputs[] = { p.stepPin, p.dirPin };
      for (int pin : outputs)
      {
         int ret = port_->SetupOutput(pin, SC::PinLow);
         if (ret != DEVICE_OK)
            throw CScopeError("Cannot configure output pin " + ToString(pin) +
                  " (device error " + ToString(ret) + ")",
                  SCOPEERR_PortInitializationFailed);
      }

      const int buttons[] = { p.cwButtonPin, p.ccwButtonPin };
      for (int pin : buttons)
      {
         int ret = port_->SetupInput(pin, SC::PullUp);
         if (ret != DEVICE_OK)
            throw CScopeError("Cannot configure button pin " + ToString(pin) +
                  " (device error " + ToString(ret) + ")",
                  SCOPEERR_PortInitializationFailed);
      }
   }

   const struct { int pin; SC::PinPull pull; } inputs[] = {
      { config_.limitZoomPin, SC::PullUp },
      { config_.limitFocusPin, SC::PullUp },
      { config_.optical1Pin, SC::PullDown },
      { config_.optical2Pin, SC::PullDown },
   };
   for (const auto& in : inputs)
   {
      int ret = port_->SetupInput(in.pin, in.pull);
      if (ret != DEVICE_OK)
         throw CScopeError("Cannot configure sensor pin " + ToString(in.pin) +
               " (device error " + ToString(ret) + ")",
               SCOPEERR_PortInitializationFailed);
   }
}


void
CScopeCore::startup()
{
   if (state_->IsRunning() || initThread_.joinable())
      throw CScopeError("The core is already running", SCOPEERR_AlreadyRunning);

   char name[SC::MaxStrLength];
   port_->GetName(name);
   LOG_INFO(coreLogger_) << "Starting up on pin port " << name;

   int ret = port_->Initialize();
   if (ret != DEVICE_OK)
      throw CScopeError("Pin port " + ToQuotedString(name) +
            " failed to initialize (device error " + ToString(ret) + ")",
            SCOPEERR_PortInitializationFailed);
   portInitialized_ = true;

   try
   {
      ConfigurePins();
   }
   catch (const CScopeError& e)
   {
      LOG_ERROR(coreLogger_) << e.getMsg();
      portInitialized_ = false;
      ret = port_->Shutdown();
      if (ret != DEVICE_OK)
         LOG_ERROR(coreLogger_) << "Pin port shutdown failed (device error " <<
            ret << ")";
      throw;
   }

   initFinished_ = false;
   state_->SetRunning(true);
   monitor_->Start();
   override_->Start();
   scheduler_->Start();
   initThread_ = std::thread(&CScopeCore::RunInitializationTask, this);

   LOG_INFO(coreLogger_) << "Control loops started";
}


void
CScopeCore::RunInitializationTask()
{
   int ret = homing_->RunInitialization();
   LOG_INFO(coreLogger_) << "Initialization finished: initialized=" <<
      ToString(state_->IsInitialized()) << " (" << scope::GetErrorText(ret) << ")";
   initFinished_ = true;
}


void
CScopeCore::shutdown()
{
   if (!state_->IsRunning() && !initThread_.joinable() && !portInitialized_)
      return;

   LOG_INFO(coreLogger_) << "Shutting down";
   state_->SetRunning(false);
   CDeviceUtils::SleepMs(config_.shutdownGraceMs);

   if (initThread_.joinable())
      initThread_.join();
   override_->Stop();
   scheduler_->Stop();
   monitor_->Stop();

   if (portInitialized_)
   {
      portInitialized_ = false;
      int ret = port_->Shutdown();
      if (ret != DEVICE_OK)
         LOG_ERROR(coreLogger_) << "Pin port shutdown failed (device error " <<
            ret << ")";
   }
   LOG_INFO(coreLogger_) << "Shutdown complete";
}


bool
CScopeCore::waitForInitialization(long timeoutMs)
{
   const auto deadline = std::chrono::steady_clock::now() +
      std::chrono::milliseconds(timeoutMs);
   while (!initFinished_)
   {
      if (std::chrono::steady_clock::now() >= deadline)
         return false;
      CDeviceUtils::SleepMs(5);
   }
   return state_->IsInitialized();
}


void
CScopeCore::registerCallback(ScopeEventCallback* cb)
{
   notifier_->SetCallback(cb);
}


long CScopeCore::getTrayStepCount() const { return state_->GetSteps(scope::AxisTray); }
long CScopeCore::getRotationOffset() const { return state_->GetRotationOffset(); }
long CScopeCore::getZoomStepCount() const { return state_->GetSteps(scope::AxisZoom); }
long CScopeCore::getFocusStepCount() const { return state_->GetSteps(scope::AxisFocus); }
int CScopeCore::getCurrentSpecimen() const { return state_->GetCurrentSpecimen(); }
int CScopeCore::getCurrentTab() const { return state_->GetCurrentTab(); }
bool CScopeCore::isRunning() const { return state_->IsRunning(); }
bool CScopeCore::isInitialized() const { return state_->IsInitialized(); }
bool CScopeCore::isInitializing() const { return state_->IsInitializing(); }
bool CScopeCore::isErrorState() const { return state_->IsErrorState(); }
bool CScopeCore::isAutonomousMode() const { return state_->IsAutonomousMode(); }
long CScopeCore::getStepsPerRevolution() const { return config_.StepsPerRevolution(); }


scope::SchedulerState
CScopeCore::getSchedulerState() const
{
   return scheduler_->GetState();
}


void
CScopeCore::enableDebugReadout(bool enable)
{
   debugReadout_ = enable;
   LOG_DEBUG(coreLogger_) << "Debug readout " << (enable ? "enabled" : "disabled");
}


bool
CScopeCore::isDebugReadoutEnabled() const
{
   return debugReadout_;
}


std::string
CScopeCore::getDebugReadout() const
{
   if (!debugReadout_)
      return std::string();

   const long anchor = state_->GetLastRiseAnchor();
   std::ostringstream txt;
   txt << "Zoom Step: " << state_->GetSteps(scope::AxisZoom) << '\n';
   txt << "Focus Step: " << state_->GetSteps(scope::AxisFocus) << '\n';
   txt << "Rotation (rel): " << state_->GetSteps(scope::AxisTray) - anchor << '\n';
   txt << "Last Rise Anchor: " << anchor << '\n';
   return txt.str();
}


void
CScopeCore::enableStderrLog(bool enable)
{
   logManager_->SetUseStdErr(enable);
}


bool
CScopeCore::stderrLogEnabled() const
{
   return logManager_->IsUsingStdErr();
}


void
CScopeCore::setPrimaryLogFile(const char* filename, bool truncate)
{
   std::string filenameStr;
   if (filename)
      filenameStr = filename;
   logManager_->SetPrimaryLogFilename(filenameStr, truncate);
}


std::string
CScopeCore::getPrimaryLogFile() const
{
   return logManager_->GetPrimaryLogFilename();
}


void
CScopeCore::setLogLevel(scope::logging::LogLevel level)
{
   logManager_->SetPrimaryLogLevel(level);
}


void
CScopeCore::logMessage(const char* msg)
{
   appLogger_(scope::logging::LogLevelInfo, msg ? msg : "(null)");
}
