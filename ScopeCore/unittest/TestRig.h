// Wiring of the core components around a SimulatedStage, with timing
// constants shrunk so that tests run in milliseconds.

#pragma once

#include "SimulatedStage.h"

#include "AutonomousScheduler.h"
#include "HomingSequencer.h"
#include "Logging/Logging.h"
#include "ManualOverride.h"
#include "MotionState.h"
#include "Notifier.h"
#include "PinIO.h"
#include "ScopeEventCallback.h"
#include "SensorMonitor.h"
#include "SpecimenMapper.h"
#include "SpecimenStore.h"
#include "StageConfig.h"
#include "StepperDriver.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

inline scope::StageConfig FastTestConfig() {
   scope::StageConfig c;
   c.stepDelayFastUs = 20;
   c.stepDelaySlowUs = 40;
   c.maxInitSteps = 3000;
   c.sensorPollMs = 1;
   c.buttonPollMs = 1;
   c.pressConfirmMs = 2;
   c.dwellPollMs = 5;
   c.suspendedPollMs = 5;
   c.frozenPollMs = 5;
   c.errorPollMs = 5;
   c.retryPollMs = 5;
   c.shutdownGraceMs = 1;
   c.axisLockTimeoutMs = 200;
   c.tabSeekLockTimeoutMs = 200;
   c.autonomyIdleMs = 300;
   return c;
}

inline scope::logging::Logger TestLogger(const std::string& label) {
   static std::shared_ptr<scope::logging::LoggingCore> core =
      std::make_shared<scope::logging::LoggingCore>();
   return core->NewLogger(label);
}

// Waits until pred() holds or the timeout expires; returns the final value.
inline bool WaitFor(std::function<bool()> pred, long timeoutMs = 2000) {
   const auto deadline = std::chrono::steady_clock::now() +
      std::chrono::milliseconds(timeoutMs);
   while (!pred()) {
      if (std::chrono::steady_clock::now() >= deadline)
         return pred();
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
   }
   return true;
}

// A fresh directory under the system temp directory, removed on destruction.
class ScratchDirectory {
   std::filesystem::path path_;

public:
   ScratchDirectory() {
      static std::atomic<int> counter(0);
      const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
      path_ = std::filesystem::temp_directory_path() /
         ("scopecore-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
      std::filesystem::create_directories(path_);
   }

   ~ScratchDirectory() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
   }

   ScratchDirectory(const ScratchDirectory&) = delete;
   ScratchDirectory& operator=(const ScratchDirectory&) = delete;

   std::string Path() const { return path_.string(); }
   std::string PathOf(const std::string& name) const { return (path_ / name).string(); }

   void Write(const std::string& name, const std::string& contents) const {
      std::ofstream out(PathOf(name));
      out << contents;
   }

   std::string Read(const std::string& name) const {
      std::ifstream in(PathOf(name));
      return std::string(std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>());
   }
};

struct MemorySpecimenStore : scope::SpecimenStore {
   std::map<int, scope::SpecimenRecord> records;
   std::vector<int> requests;
   std::mutex mutex;

   scope::SpecimenRecord LoadSpecimen(int specimen) override {
      std::lock_guard<std::mutex> lock(mutex);
      requests.push_back(specimen);
      auto it = records.find(specimen);
      if (it != records.end())
         return it->second;
      return scope::SpecimenRecord::Defaults(specimen);
   }

   void Set(int specimen, long zoom, long focus, long dro) {
      scope::SpecimenRecord r = scope::SpecimenRecord::Defaults(specimen);
      r.defaultZoom = zoom;
      r.defaultFocus = focus;
      r.defaultRotationOffset = dro;
      std::lock_guard<std::mutex> lock(mutex);
      records[specimen] = r;
   }
};

struct RecordingCallback : ScopeEventCallback {
   std::mutex mutex;
   std::vector<int> specimens;
   std::vector<bool> panels;
   std::vector<std::string> limits;
   std::vector<std::string> errors;
   std::vector<bool> initResults;

   void onSpecimenChanged(int specimen) override {
      std::lock_guard<std::mutex> lock(mutex);
      specimens.push_back(specimen);
   }
   void onPanelShouldOpen(bool open) override {
      std::lock_guard<std::mutex> lock(mutex);
      panels.push_back(open);
   }
   void onLimitReached(const char* axisName) override {
      std::lock_guard<std::mutex> lock(mutex);
      limits.push_back(axisName);
   }
   void onErrorState(const char* message) override {
      std::lock_guard<std::mutex> lock(mutex);
      errors.push_back(message);
   }
   void onInitializationFinished(bool succeeded) override {
      std::lock_guard<std::mutex> lock(mutex);
      initResults.push_back(succeeded);
   }

   size_t ErrorCount() {
      std::lock_guard<std::mutex> lock(mutex);
      return errors.size();
   }
   int LastSpecimen() {
      std::lock_guard<std::mutex> lock(mutex);
      return specimens.empty() ? 0 : specimens.back();
   }
};

// Every component of the core, constructed the way CScopeCore does it.
struct StageRig {
   scope::StageConfig config;
   SimulatedStage stage;
   MemorySpecimenStore store;
   RecordingCallback events;
   scope::MotionState state;
   scope::Notifier notifier;
   scope::PinIO pins;
   scope::SpecimenMapper mapper;
   scope::StepperDriver driver;
   scope::HomingSequencer homing;
   scope::SensorMonitor monitor;
   scope::ManualOverride manual;
   scope::AutonomousScheduler scheduler;

   explicit StageRig(const scope::StageConfig& c = FastTestConfig()) :
      config(c),
      stage(config),
      state(config.trayBaseline, config.autonomyIdleMs, config.initialSpecimen),
      pins(stage, state, notifier, TestLogger("PinIO")),
      mapper(config.specimenRanges, config.minimumTolerance),
      driver(config, state, pins, TestLogger("StepperDriver")),
      homing(config, state, pins, driver, mapper, store, notifier, TestLogger("Homing")),
      monitor(config, state, pins, mapper, notifier, TestLogger("SensorMonitor")),
      manual(config, state, pins, driver, TestLogger("ManualOverride")),
      scheduler(config, state, driver, homing, mapper, store, notifier, TestLogger("Autonomous"))
   {
      notifier.SetCallback(&events);
      state.SetRunning(true);
   }

   ~StageRig() {
      state.SetRunning(false);
      manual.Stop();
      scheduler.Stop();
      monitor.Stop();
   }

   // Tray pattern with a tab (optical 2 only) every `spacing` physical steps,
   // `width` steps wide, starting at `firstTab`.
   void UseRegularTabs(long firstTab, long spacing, long width) {
      stage.optical2At = [=](long pos) {
         if (pos < firstTab)
            return false;
         return (pos - firstTab) % spacing < width;
      };
   }
};
