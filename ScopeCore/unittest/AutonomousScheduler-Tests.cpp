#include <catch2/catch_all.hpp>

#include "TestRig.h"

#include <chrono>
#include <thread>

namespace scope {

namespace {

StageConfig SchedulerTestConfig() {
   StageConfig c = FastTestConfig();
   c.maxInitSteps = 400;
   c.autonomyIdleMs = 40;
   return c;
}

void SleepPastIdle(const StageRig& rig) {
   std::this_thread::sleep_for(std::chrono::milliseconds(rig.config.autonomyIdleMs + 10));
}

} // namespace

TEST_CASE("scheduler stays frozen until initialized", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());

   CHECK(rig.scheduler.RunCycle() == rig.config.frozenPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerIdle);

   rig.state.SetInitialized(true);
   rig.state.SetInitializing(true);
   CHECK(rig.scheduler.RunCycle() == rig.config.frozenPollMs);
   CHECK(rig.stage.StepEdges(AxisTray) == 0);
}

TEST_CASE("scheduler does nothing in the error state", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.state.SetInitialized(true);
   rig.pins.EnterErrorState("test");

   CHECK(rig.scheduler.RunCycle() == rig.config.errorPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerIdle);
   CHECK(rig.stage.StepEdges(AxisTray) == 0);
}

TEST_CASE("user activity suspends autonomous motion until idle", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.state.SetInitialized(true);
   rig.state.StampAutoAdvance();
   rig.state.MarkUserActivity();

   CHECK(rig.scheduler.RunCycle() == rig.config.suspendedPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerSuspended);
   CHECK_FALSE(rig.state.IsAutonomousMode());
   CHECK(rig.state.IsAbortAutonomous());

   SleepPastIdle(rig);
   rig.state.StampAutoAdvance();
   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerHolding);
   CHECK(rig.state.IsAutonomousMode());
   CHECK_FALSE(rig.state.IsAbortAutonomous());
}

TEST_CASE("pending fall is reconciled before holding", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(2, 7);
   rig.state.StampAutoAdvance();

   SECTION("by travel when no range matches") {
      rig.state.CommitTraySteps(50);
      rig.state.RecordFall(rig.state.GetSteps(AxisTray));
      rig.state.CommitTraySteps(100);

      CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
      CHECK(rig.state.GetCurrentTab() == 3);
      CHECK(rig.state.GetCurrentSpecimen() == 8);
      CHECK(rig.events.specimens == std::vector<int>{ 8 });
      CHECK(rig.events.panels == std::vector<bool>{ false });
   }

   SECTION("by range when the tray sits in one") {
      rig.state.RecordFall(rig.state.GetSteps(AxisTray));
      rig.state.CommitTraySteps(1500);

      CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
      CHECK(rig.state.GetCurrentSpecimen() == 8);
      CHECK(rig.state.GetCurrentTab() == 3);
      CHECK(rig.events.panels == std::vector<bool>{ false });
   }

   SECTION("panel reports the sensor level") {
      rig.stage.optical2At = [](long) { return true; };
      rig.state.RecordFall(rig.state.GetSteps(AxisTray));
      rig.state.CommitTraySteps(1500);

      CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
      CHECK(rig.events.panels == std::vector<bool>{ true });
   }

   long anchor = 0;
   CHECK_FALSE(rig.state.GetPendingFall(anchor));
   CHECK(rig.scheduler.GetState() == SchedulerHolding);
   CHECK(rig.stage.StepEdges(AxisTray) == 0);
}

TEST_CASE("scheduler advances to the next specimen once idle", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.UseRegularTabs(50, 200, 20);
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(2, 7);
   rig.store.Set(8, 25, -15, 5);

   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerHolding);

   CHECK(rig.stage.Position(AxisTray) == 51 + 5);
   CHECK(rig.state.GetSteps(AxisZoom) == 25);
   CHECK(rig.state.GetSteps(AxisFocus) == -15);
   CHECK(rig.state.GetCurrentTab() == 3);
   CHECK(rig.state.GetCurrentSpecimen() == 8);
   CHECK(rig.events.specimens == std::vector<int>{ 8 });
   CHECK(rig.events.panels == std::vector<bool>{ true });

   // Holds the new specimen for the idle period
   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.stage.Position(AxisTray) == 56);

   SleepPastIdle(rig);
   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.stage.Position(AxisTray) == 251);
   CHECK(rig.state.GetCurrentSpecimen() == 9);
   CHECK(rig.store.requests == std::vector<int>{ 8, 9 });
}

TEST_CASE("advance wraps from the last specimen to the first", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.UseRegularTabs(50, 200, 20);
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(5, 10);

   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.state.GetCurrentSpecimen() == 1);
   CHECK(rig.state.GetCurrentTab() == 6);
}

TEST_CASE("unknown current specimen is taken from the tray position", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.UseRegularTabs(50, 200, 20);
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(0, 0);

   // The tray counter starts at the baseline, inside specimen 6's range
   CHECK(rig.scheduler.RunCycle() == rig.config.dwellPollMs);
   CHECK(rig.state.GetCurrentSpecimen() == 7);
}

TEST_CASE("failed advance is retried later", "[AutonomousScheduler]")
{
   StageRig rig(SchedulerTestConfig());
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(2, 7);

   CHECK(rig.scheduler.RunCycle() == rig.config.retryPollMs);
   CHECK(rig.scheduler.GetState() == SchedulerIdle);
   CHECK(rig.state.GetCurrentSpecimen() == 7);
   CHECK(rig.events.specimens.empty());
   CHECK(rig.stage.Position(AxisTray) == rig.config.maxInitSteps);
}

TEST_CASE("user press interrupts an advance in progress", "[AutonomousScheduler]")
{
   StageConfig c = SchedulerTestConfig();
   c.maxInitSteps = 100000;
   StageRig rig(c);
   rig.state.SetInitialized(true);
   rig.state.SetDisplay(2, 7);

   rig.scheduler.Start();
   CHECK(rig.state.IsAutonomousMode());
   REQUIRE(WaitFor([&] { return rig.stage.StepEdges(AxisTray) > 20; }));

   rig.state.MarkUserActivity();
   CHECK(WaitFor([&] { return rig.scheduler.GetState() == SchedulerSuspended; }));
   const long stopped = rig.stage.StepEdges(AxisTray);
   std::this_thread::sleep_for(std::chrono::milliseconds(20));
   CHECK(rig.stage.StepEdges(AxisTray) == stopped);
   CHECK(rig.events.specimens.empty());

   rig.scheduler.Stop();
}

TEST_CASE("scheduler state names", "[AutonomousScheduler]")
{
   CHECK(std::string(SchedulerStateName(SchedulerIdle)) == "Idle");
   CHECK(std::string(SchedulerStateName(SchedulerPendingFallReconcile)) ==
         "PendingFallReconcile");
   CHECK(std::string(SchedulerStateName(SchedulerAdvancing)) == "Advancing");
}

} // namespace scope
