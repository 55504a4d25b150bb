#include <catch2/catch_all.hpp>

#include "TestRig.h"

#include <chrono>

namespace scope {

namespace {

using std::chrono::milliseconds;

struct MonitorFixture {
   StageRig rig;
   SensorMonitor::Clock::time_point t0 = SensorMonitor::Clock::now();

   explicit MonitorFixture(const StageConfig& c = FastTestConfig()) : rig(c) {
      SetOptical(false, false);
      rig.monitor.Prime();
   }

   void SetOptical(bool optical1, bool optical2) {
      rig.stage.ForceInput(rig.config.optical1Pin, optical1 ? SC::PinHigh : SC::PinLow);
      rig.stage.ForceInput(rig.config.optical2Pin, optical2 ? SC::PinHigh : SC::PinLow);
   }

   void MoveTrayCounterTo(long steps) {
      rig.state.CommitTraySteps(steps - rig.state.GetSteps(AxisTray));
   }

   void PollAt(long ms) {
      rig.monitor.PollOnce(t0 + milliseconds(ms));
   }

   // A tab leaving the beam at `from` and the next arriving at `to`
   void FallThenRise(long from, long to, long atMs) {
      SetOptical(false, true);
      rig.monitor.Prime();
      MoveTrayCounterTo(from);
      SetOptical(false, false);
      PollAt(atMs);
      MoveTrayCounterTo(to);
      SetOptical(false, true);
      PollAt(atMs + 1);
   }
};

} // namespace

TEST_CASE("rise inside a configured range names the specimen", "[SensorMonitor]")
{
   MonitorFixture f;
   f.MoveTrayCounterTo(10850);
   f.SetOptical(false, true);
   f.PollAt(0);

   CHECK(f.rig.state.GetCurrentSpecimen() == 7);
   CHECK(f.rig.state.GetCurrentTab() == 2);
   CHECK(f.rig.state.GetLastRiseAnchor() == 10850);
   CHECK(f.rig.state.IsOptical2Asserted());
   CHECK(f.rig.events.specimens == std::vector<int>{ 7 });
   CHECK(f.rig.events.panels == std::vector<bool>{ true });
}

TEST_CASE("rise after a fall is resolved by the tray travel", "[SensorMonitor]")
{
   MonitorFixture f;
   f.rig.state.SetDisplay(2, 7);

   SECTION("forward travel moves to the next tab") {
      f.FallThenRise(10050, 10150, 0);
      CHECK(f.rig.state.GetCurrentTab() == 3);
      CHECK(f.rig.state.GetCurrentSpecimen() == 8);
      CHECK(f.rig.events.specimens == std::vector<int>{ 8 });
   }

   SECTION("reverse travel moves to the previous tab") {
      f.FallThenRise(7100, 7000, 0);
      CHECK(f.rig.state.GetCurrentTab() == 1);
      CHECK(f.rig.state.GetCurrentSpecimen() == 6);
   }

   SECTION("travel within the threshold keeps the tab") {
      f.FallThenRise(7000, 7030, 0);
      CHECK(f.rig.state.GetCurrentTab() == 2);
      CHECK(f.rig.state.GetCurrentSpecimen() == 7);
   }

   // Panel closes on the fall and reopens on the rise
   CHECK(f.rig.events.panels == std::vector<bool>{ false, true });
   long anchor = 0;
   CHECK_FALSE(f.rig.state.GetPendingFall(anchor));
}

TEST_CASE("fall records the tray position", "[SensorMonitor]")
{
   MonitorFixture f;
   f.SetOptical(false, true);
   f.rig.monitor.Prime();
   f.MoveTrayCounterTo(12345);
   f.SetOptical(false, false);
   f.PollAt(0);

   long anchor = 0;
   REQUIRE(f.rig.state.GetPendingFall(anchor));
   CHECK(anchor == 12345);
   CHECK(f.rig.events.panels == std::vector<bool>{ false });
   CHECK(f.rig.events.specimens.empty());
}

TEST_CASE("rise without a prior fall falls back to the looser tolerance", "[SensorMonitor]")
{
   StageConfig c = FastTestConfig();
   c.minimumTolerance = 0;
   c.tabSeekToleranceFraction = 0.0;
   c.rangeToleranceFraction = 1.0;
   c.initialSpecimen = 1;
   c.specimenRanges = {
      { 1, { 11000, 11099 }, { 20000, 20099 } },
      { 2, { 30000, 30099 }, { 40000, 40099 } },
   };
   MonitorFixture f(c);

   SECTION("near enough to a range center") {
      f.MoveTrayCounterTo(11120);
      f.SetOptical(false, true);
      f.PollAt(0);
      CHECK(f.rig.state.GetCurrentSpecimen() == 1);
      CHECK(f.rig.state.GetCurrentTab() == 0);
      CHECK(f.rig.state.GetLastRiseAnchor() == 11120);
      CHECK(f.rig.events.specimens == std::vector<int>{ 1 });
   }

   SECTION("too far from every range") {
      f.MoveTrayCounterTo(25000);
      f.SetOptical(false, true);
      f.PollAt(0);
      CHECK(f.rig.events.specimens.empty());
      CHECK(f.rig.state.GetCurrentSpecimen() == 1);
   }
}

TEST_CASE("unmapped rise leaves the display alone", "[SensorMonitor]")
{
   MonitorFixture f;
   f.MoveTrayCounterTo(7000);
   f.SetOptical(false, true);
   f.PollAt(0);

   CHECK(f.rig.events.specimens.empty());
   CHECK(f.rig.state.GetCurrentSpecimen() == f.rig.config.initialSpecimen);
   CHECK(f.rig.events.panels == std::vector<bool>{ true });
}

TEST_CASE("rises inside the debounce window are ignored", "[SensorMonitor]")
{
   MonitorFixture f;
   f.MoveTrayCounterTo(10850);
   f.SetOptical(false, true);
   f.PollAt(0);
   f.SetOptical(false, false);
   f.PollAt(10);
   f.SetOptical(false, true);
   f.PollAt(20);
   CHECK(f.rig.events.specimens == std::vector<int>{ 7 });
   CHECK(f.rig.events.panels == std::vector<bool>{ true, false, true });

   f.SetOptical(false, false);
   f.PollAt(100);
   f.MoveTrayCounterTo(11500);
   f.SetOptical(false, true);
   f.PollAt(200);
   CHECK(f.rig.events.specimens == std::vector<int>{ 7, 8 });
}

TEST_CASE("panel follows optical 2 outside every range", "[SensorMonitor]")
{
   MonitorFixture f;
   f.MoveTrayCounterTo(30000);
   f.SetOptical(false, true);
   f.PollAt(0);
   REQUIRE(f.rig.events.panels == std::vector<bool>{ true });

   // Chatter inside the debounce window still reopens the panel
   f.SetOptical(false, false);
   f.PollAt(10);
   f.SetOptical(false, true);
   f.PollAt(20);

   CHECK(f.rig.state.IsOptical2Asserted());
   CHECK(f.rig.events.panels == std::vector<bool>{ true, false, true });
   CHECK(f.rig.events.specimens.empty());
}

TEST_CASE("wide tab resets the tray origin", "[SensorMonitor]")
{
   MonitorFixture f;
   f.SetOptical(false, true);
   f.rig.monitor.Prime();
   f.rig.state.SetDisplay(4, 9);
   f.MoveTrayCounterTo(13500);

   SECTION("when running") {
      f.SetOptical(true, true);
      f.PollAt(0);
      CHECK(f.rig.state.GetSteps(AxisTray) == f.rig.config.trayBaseline);
      CHECK(f.rig.state.GetRotationOffset() == 0);
      CHECK(f.rig.state.GetCurrentTab() == 1);
      CHECK(f.rig.state.GetCurrentSpecimen() == 6);
      CHECK(f.rig.events.specimens == std::vector<int>{ 6 });

      // Still in the beam a moment later: no second reset
      f.MoveTrayCounterTo(10010);
      f.PollAt(5);
      CHECK(f.rig.state.GetSteps(AxisTray) == 10010);
      CHECK(f.rig.events.specimens.size() == 1);
   }

   SECTION("not while initializing") {
      f.rig.state.SetInitializing(true);
      f.SetOptical(true, true);
      f.PollAt(0);
      CHECK(f.rig.state.GetSteps(AxisTray) == 13500);
      CHECK(f.rig.state.GetCurrentTab() == 4);
      CHECK(f.rig.events.specimens.empty());
   }
}

TEST_CASE("limit switch alerts are latched", "[SensorMonitor]")
{
   MonitorFixture f;
   f.rig.stage.ForceInput(f.rig.config.limitZoomPin, SC::PinHigh);
   f.PollAt(0);
   f.PollAt(1);
   CHECK(f.rig.events.limits == std::vector<std::string>{ "ZOOM" });

   f.rig.stage.ForceInput(f.rig.config.limitZoomPin, SC::PinLow);
   f.PollAt(2);
   f.rig.stage.ForceInput(f.rig.config.limitZoomPin, SC::PinHigh);
   f.rig.stage.ForceInput(f.rig.config.limitFocusPin, SC::PinHigh);
   f.PollAt(3);
   CHECK(f.rig.events.limits == std::vector<std::string>{ "ZOOM", "ZOOM", "FOCUS" });
}

TEST_CASE("monitor thread starts and stops", "[SensorMonitor]")
{
   MonitorFixture f;
   CHECK_FALSE(f.rig.monitor.IsActive());
   f.rig.monitor.Start();
   CHECK(f.rig.monitor.IsActive());

   f.rig.stage.ForceInput(f.rig.config.limitFocusPin, SC::PinHigh);
   CHECK(WaitFor([&] {
      std::lock_guard<std::mutex> lock(f.rig.events.mutex);
      return !f.rig.events.limits.empty();
   }));

   f.rig.monitor.Stop();
   CHECK_FALSE(f.rig.monitor.IsActive());
}

} // namespace scope
