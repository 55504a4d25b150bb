#include <catch2/catch_all.hpp>

#include "StageConfig.h"
#include "Error.h"
#include "TestRig.h"

namespace scope {

TEST_CASE("default configuration describes the exhibit", "[StageConfig]")
{
   StageConfig c;
   CHECK_NOTHROW(ValidateStageConfig(c));

   CHECK(c.NumSpecimens() == 10);
   CHECK(c.StepsPerRevolution() == 17962);
   CHECK(c.trayBaseline == 10000);
   CHECK(c.initialSpecimen == 6);

   CHECK(c.PinsFor(AxisTray).stepPin == 22);
   CHECK(c.PinsFor(AxisZoom).dirPin == 6);
   CHECK(c.PinsFor(AxisFocus).ccwButtonPin == 4);
   CHECK(c.LimitPinFor(AxisZoom) == 17);
   CHECK(c.LimitPinFor(AxisFocus) == 5);
   CHECK(c.LimitPinFor(AxisTray) == -1);
   CHECK(c.MaxStepsFor(AxisZoom) == 10000);
   CHECK(c.MaxStepsFor(AxisTray) == 0);
}

TEST_CASE("JSON keys override the defaults", "[StageConfig]")
{
   const StageConfig c = ParseStageConfig(R"({
      "pins": { "tray": { "step": 2, "dir": 3 }, "optical2": 16 },
      "timing": { "stepDelayFastUs": 1000, "shutdownGraceMs": 10 },
      "limits": { "maxZoomSteps": 500, "opt2StepThreshold": 80 },
      "tolerances": { "rangeFraction": 0.2, "minimum": 30 },
      "autonomy": { "idleMs": 60000, "initialSpecimen": 2 }
   })");

   CHECK(c.trayPins.stepPin == 2);
   CHECK(c.trayPins.dirPin == 3);
   CHECK(c.trayPins.cwButtonPin == 12);
   CHECK(c.optical2Pin == 16);
   CHECK(c.stepDelayFastUs == 1000);
   CHECK(c.stepDelaySlowUs == 10000);
   CHECK(c.shutdownGraceMs == 10);
   CHECK(c.maxZoomSteps == 500);
   CHECK(c.opt2StepThreshold == 80);
   CHECK(c.rangeToleranceFraction == Catch::Approx(0.2));
   CHECK(c.tabSeekToleranceFraction == Catch::Approx(0.05));
   CHECK(c.minimumTolerance == 30);
   CHECK(c.autonomyIdleMs == 60000);
   CHECK(c.initialSpecimen == 2);
}

TEST_CASE("specimen range table can be replaced", "[StageConfig]")
{
   const StageConfig c = ParseStageConfig(R"({
      "autonomy": { "initialSpecimen": 1 },
      "specimenRanges": [
         { "specimen": 1, "ranges": [[100, 199], [1100, 1199]] },
         { "specimen": 2, "ranges": [[300, 399], [1300, 1399]] }
      ]
   })");

   REQUIRE(c.NumSpecimens() == 2);
   CHECK(c.specimenRanges[1].first.start == 300);
   CHECK(c.specimenRanges[1].second.end == 1399);
   CHECK(c.StepsPerRevolution() == 1899);
}

TEST_CASE("empty document keeps every default", "[StageConfig]")
{
   const StageConfig c = ParseStageConfig("{}");
   CHECK(c.NumSpecimens() == 10);
   CHECK(c.sensorPollMs == 20);
}

namespace {

int ErrorCodeOf(const std::string& json) {
   try {
      ParseStageConfig(json);
   }
   catch (const CScopeError& e) {
      return e.getCode();
   }
   return SCOPEERR_OK;
}

} // namespace

TEST_CASE("invalid configurations are rejected", "[StageConfig]")
{
   const char* json = GENERATE(
      "not json",
      "[1, 2]",
      R"({ "timing": { "sensorPollMs": "fast" } })",
      R"({ "timing": { "sensorPollMs": 0 } })",
      R"({ "limits": { "maxFocusSteps": -5 } })",
      R"({ "tolerances": { "rangeFraction": 1.5 } })",
      R"({ "pins": { "optical1": 19 } })",
      R"({ "pins": { "limitZoom": -1 } })",
      R"({ "autonomy": { "initialSpecimen": 11 } })",
      R"({ "specimenRanges": [] })",
      R"({ "specimenRanges": [ { "specimen": 1, "ranges": [[10, 5], [20, 30]] } ] })",
      R"({ "specimenRanges": [ { "specimen": 1, "ranges": [[1, 5]] } ] })",
      R"({ "autonomy": { "initialSpecimen": 1 }, "specimenRanges": [
            { "specimen": 1, "ranges": [[1, 5], [6, 9]] },
            { "specimen": 1, "ranges": [[11, 15], [16, 19]] } ] })",
      R"({ "autonomy": { "initialSpecimen": 1 }, "specimenRanges": [
            { "specimen": 3, "ranges": [[1, 5], [6, 9]] } ] })");

   CAPTURE(json);
   CHECK(ErrorCodeOf(json) == SCOPEERR_InvalidConfiguration);
}

TEST_CASE("parse errors carry the underlying JSON error", "[StageConfig]")
{
   try {
      ParseStageConfig("{ \"timing\": ");
      FAIL("expected an exception");
   }
   catch (const CScopeError& e) {
      REQUIRE(e.getUnderlyingError() != nullptr);
      CHECK(e.getFullMsg().find("Cannot parse stage configuration") != std::string::npos);
   }
}

TEST_CASE("configuration is loaded from a file", "[StageConfig]")
{
   ScratchDirectory dir;

   SECTION("valid file") {
      dir.Write("stage.json", R"({ "limits": { "backoffSteps": 42 } })");
      const StageConfig c = LoadStageConfig(dir.PathOf("stage.json"));
      CHECK(c.backoffSteps == 42);
   }

   SECTION("missing file") {
      CHECK_THROWS_AS(LoadStageConfig(dir.PathOf("absent.json")), CScopeError);
   }

   SECTION("invalid file names the file") {
      dir.Write("bad.json", R"({ "timing": { "retryPollMs": 0 } })");
      try {
         LoadStageConfig(dir.PathOf("bad.json"));
         FAIL("expected an exception");
      }
      catch (const CScopeError& e) {
         CHECK(e.getCode() == SCOPEERR_InvalidConfiguration);
         CHECK(e.getMsg().find("bad.json") != std::string::npos);
         CHECK(e.getUnderlyingError() != nullptr);
      }
   }
}

} // namespace scope
