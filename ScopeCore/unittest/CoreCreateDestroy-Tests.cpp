#include <catch2/catch_all.hpp>

#include "ScopeCore.h"
#include "TestRig.h"

#include <memory>

namespace {

scope::StageConfig CoreTestConfig()
{
   scope::StageConfig c = FastTestConfig();
   c.maxInitSteps = 600;
   return c;
}

// Limit switches and tabs placed so that initialization succeeds quickly
void MakeInitializable(SimulatedStage& stage)
{
   stage.zoomLimitAt = [](long pos) { return pos >= 150; };
   stage.focusLimitAt = [](long pos) { return pos >= 150; };
   stage.optical1At = [](long pos) { return pos >= 100 && pos <= 110; };
   stage.optical2At = [](long pos) {
      return (pos >= 100 && pos <= 110) || (pos >= 300 && pos <= 315);
   };
}

} // namespace

TEST_CASE("CScopeCore create and destroy twice", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   {
      CScopeCore c1(&stage, config, std::make_shared<MemorySpecimenStore>());
   }
   {
      CScopeCore c2(&stage, config, std::make_shared<MemorySpecimenStore>());
   }
   CHECK(stage.ShutdownCount() == 0);
}

TEST_CASE("CScopeCore rejects bad construction arguments", "[CoreCreateDestroy]")
{
   scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   auto store = std::make_shared<MemorySpecimenStore>();

   CHECK_THROWS_AS(CScopeCore(nullptr, config, store), CScopeError);
   CHECK_THROWS_AS(CScopeCore(&stage, config,
            std::shared_ptr<scope::SpecimenStore>()), CScopeError);

   config.optical1Pin = config.optical2Pin;
   try
   {
      CScopeCore c(&stage, config, store);
      FAIL("expected an exception");
   }
   catch (const CScopeError& e)
   {
      CHECK(e.getCode() == SCOPEERR_InvalidConfiguration);
   }
}

TEST_CASE("CScopeCore startup configures every pin", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());
   c.startup();
   CHECK(c.isRunning());

   const scope::AxisId axes[] = { scope::AxisTray, scope::AxisZoom, scope::AxisFocus };
   for (scope::AxisId axis : axes)
   {
      const scope::AxisPins& p = config.PinsFor(axis);
      CHECK(stage.IsConfiguredOutput(p.stepPin));
      CHECK(stage.IsConfiguredOutput(p.dirPin));
      SC::PinPull pull = SC::PullNone;
      REQUIRE(stage.GetPull(p.cwButtonPin, pull));
      CHECK(pull == SC::PullUp);
      REQUIRE(stage.GetPull(p.ccwButtonPin, pull));
      CHECK(pull == SC::PullUp);
   }

   SC::PinPull pull = SC::PullNone;
   REQUIRE(stage.GetPull(config.limitZoomPin, pull));
   CHECK(pull == SC::PullUp);
   REQUIRE(stage.GetPull(config.limitFocusPin, pull));
   CHECK(pull == SC::PullUp);
   REQUIRE(stage.GetPull(config.optical1Pin, pull));
   CHECK(pull == SC::PullDown);
   REQUIRE(stage.GetPull(config.optical2Pin, pull));
   CHECK(pull == SC::PullDown);

   CHECK_THROWS_AS(c.startup(), CScopeError);

   c.shutdown();
   CHECK_FALSE(c.isRunning());
   CHECK(stage.ShutdownCount() == 1);
   c.shutdown();
   CHECK(stage.ShutdownCount() == 1);
}

TEST_CASE("CScopeCore startup fails when the port does not initialize", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   stage.initializeResult = DEVICE_ERR;
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());

   try
   {
      c.startup();
      FAIL("expected an exception");
   }
   catch (const CScopeError& e)
   {
      CHECK(e.getCode() == SCOPEERR_PortInitializationFailed);
   }
   CHECK_FALSE(c.isRunning());
}

TEST_CASE("CScopeCore initializes and reports the first specimen", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   MakeInitializable(stage);
   auto store = std::make_shared<MemorySpecimenStore>();
   store->Set(7, 30, 20, 0);
   RecordingCallback events;

   CScopeCore c(&stage, config, store);
   c.registerCallback(&events);
   c.startup();

   REQUIRE(c.waitForInitialization(10000));
   CHECK(c.isInitialized());
   CHECK_FALSE(c.isInitializing());
   CHECK(c.getCurrentTab() == 2);
   CHECK(c.getCurrentSpecimen() == 7);
   CHECK(c.getZoomStepCount() == 30);
   CHECK(c.getFocusStepCount() == 20);
   CHECK_FALSE(c.isErrorState());
   {
      std::lock_guard<std::mutex> lock(events.mutex);
      CHECK(events.initResults == std::vector<bool>{ true });
   }

   c.shutdown();
   c.registerCallback(nullptr);
}

TEST_CASE("CScopeCore reads specimen defaults from a directory", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   MakeInitializable(stage);
   ScratchDirectory dir;
   dir.Write("specimen_7.json", R"({ "name": "Azurite",
      "default_zoom": 25, "default_focus": 10 })");

   CScopeCore c(&stage, config, dir.Path());
   c.startup();
   REQUIRE(c.waitForInitialization(10000));
   CHECK(c.getCurrentSpecimen() == 7);
   CHECK(c.getZoomStepCount() == 25);
   CHECK(c.getFocusStepCount() == 10);
   c.shutdown();
}

TEST_CASE("CScopeCore failed write halts the session", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   MakeInitializable(stage);
   stage.FailWritesTo(config.zoomPins.stepPin);
   RecordingCallback events;

   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());
   c.registerCallback(&events);
   c.startup();

   CHECK_FALSE(c.waitForInitialization(10000));
   CHECK(c.isErrorState());
   CHECK_FALSE(c.isInitialized());
   CHECK(events.ErrorCount() == 1);
   CHECK(c.getSchedulerState() == scope::SchedulerIdle);

   c.shutdown();
   c.registerCallback(nullptr);
}

TEST_CASE("CScopeCore can be restarted", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());

   c.startup();
   c.shutdown();
   c.startup();
   CHECK(c.isRunning());
   c.shutdown();
   CHECK(stage.ShutdownCount() == 2);
}

TEST_CASE("CScopeCore debug readout", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());

   CHECK_FALSE(c.isDebugReadoutEnabled());
   CHECK(c.getDebugReadout().empty());

   c.enableDebugReadout(true);
   CHECK(c.getDebugReadout() ==
         "Zoom Step: 0\nFocus Step: 0\nRotation (rel): 10000\nLast Rise Anchor: 0\n");
}

TEST_CASE("CScopeCore queries before startup", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());

   CHECK(c.getVersionInfo().find("SpecimenScope core version") == 0);
   CHECK(c.getTrayStepCount() == config.trayBaseline);
   CHECK(c.getRotationOffset() == 0);
   CHECK(c.getCurrentSpecimen() == config.initialSpecimen);
   CHECK(c.getCurrentTab() == 0);
   CHECK(c.getStepsPerRevolution() == 17962);
   CHECK_FALSE(c.isRunning());
   CHECK_FALSE(c.waitForInitialization(10));
}

TEST_CASE("CScopeCore primary log file", "[CoreCreateDestroy]")
{
   const scope::StageConfig config = CoreTestConfig();
   SimulatedStage stage(config);
   ScratchDirectory dir;
   CScopeCore c(&stage, config, std::make_shared<MemorySpecimenStore>());

   c.setPrimaryLogFile(dir.PathOf("core.log").c_str(), true);
   CHECK(c.getPrimaryLogFile() == dir.PathOf("core.log"));
   c.logMessage("visitor panel opened");
   CHECK(WaitFor([&] {
      return dir.Read("core.log").find("visitor panel opened") != std::string::npos;
   }));

   try
   {
      c.setPrimaryLogFile(dir.PathOf("missing/dir/core.log").c_str());
      FAIL("expected an exception");
   }
   catch (const CScopeError& e)
   {
      CHECK(e.getCode() == SCOPEERR_FileOpenFailed);
   }
   CHECK(c.getPrimaryLogFile().empty());

   c.enableStderrLog(false);
   CHECK_FALSE(c.stderrLogEnabled());
}
