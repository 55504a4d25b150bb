///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopeCore.h
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

#pragma once

#include "AutonomousScheduler.h"
#include "Error.h"
#include "Logging/Logger.h"
#include "StageConfig.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

class ScopeEventCallback;

namespace SC {
   class PinPort;
} // namespace SC

namespace scope {
   class HomingSequencer;
   class LogManager;
   class ManualOverride;
   class MotionState;
   class Notifier;
   class PinIO;
   class SensorMonitor;
   class SpecimenMapper;
   class SpecimenStore;
   class StepperDriver;
} // namespace scope


/// The SpecimenScope motion core.
/**
 * Owns the control loops of the exhibit stage: the sensor monitor, the
 * button watchers, the autonomous scheduler and the one-shot initialization
 * task. The pin port is not owned and must outlive the core.
 */
class CScopeCore
{
public:
   CScopeCore(SC::PinPort* port, const scope::StageConfig& config,
         std::shared_ptr<scope::SpecimenStore> store);
   /// Reads specimen records from specimen_<n>.json files in a directory.
   CScopeCore(SC::PinPort* port, const scope::StageConfig& config,
         const std::string& specimenDirectory);
   ~CScopeCore();

   std::string getVersionInfo() const;

   /** \name Session control. */
   ///@{
   void startup();
   void shutdown();
   bool waitForInitialization(long timeoutMs);
   void registerCallback(ScopeEventCallback* cb);
   ///@}

   /** \name State queries. */
   ///@{
   long getTrayStepCount() const;
   long getRotationOffset() const;
   long getZoomStepCount() const;
   long getFocusStepCount() const;
   int getCurrentSpecimen() const;
   int getCurrentTab() const;
   bool isRunning() const;
   bool isInitialized() const;
   bool isInitializing() const;
   bool isErrorState() const;
   bool isAutonomousMode() const;
   scope::SchedulerState getSchedulerState() const;
   long getStepsPerRevolution() const;
   const scope::StageConfig& getStageConfig() const { return config_; }
   ///@}

   /** \name Debug readout. */
   ///@{
   void enableDebugReadout(bool enable);
   bool isDebugReadoutEnabled() const;
   std::string getDebugReadout() const;
   ///@}

   /** \name Logging and log management. */
   ///@{
   void enableStderrLog(bool enable);
   bool stderrLogEnabled() const;
   void setPrimaryLogFile(const char* filename, bool truncate = false);
   std::string getPrimaryLogFile() const;
   void setLogLevel(scope::logging::LogLevel level);
   void logMessage(const char* msg);
   ///@}

private:
   // make object non-copyable
   CScopeCore(const CScopeCore&);
   CScopeCore& operator=(const CScopeCore&);

   void CreateComponents();
   void ConfigurePins();
   void RunInitializationTask();

private:
   // LogManager should be the first data member, so that it is available for
   // as long as possible during construction and (especially) destruction.
   std::shared_ptr<scope::LogManager> logManager_;
   scope::logging::Logger appLogger_;
   scope::logging::Logger coreLogger_;

   SC::PinPort* port_;
   const scope::StageConfig config_;
   std::shared_ptr<scope::SpecimenStore> store_;

   std::unique_ptr<scope::MotionState> state_;
   std::unique_ptr<scope::Notifier> notifier_;
   std::unique_ptr<scope::PinIO> pins_;
   std::unique_ptr<scope::SpecimenMapper> mapper_;
   std::unique_ptr<scope::StepperDriver> driver_;
   std::unique_ptr<scope::HomingSequencer> homing_;
   std::unique_ptr<scope::SensorMonitor> monitor_;
   std::unique_ptr<scope::ManualOverride> override_;
   std::unique_ptr<scope::AutonomousScheduler> scheduler_;

   std::thread initThread_;
   std::atomic<bool> initFinished_;
   std::atomic<bool> debugReadout_;
   bool portInitialized_;
};
