#include <catch2/catch_all.hpp>

#include "SpecimenMapper.h"
#include "StageConfig.h"

#include <cmath>

namespace scope {

namespace {

SpecimenMapper DefaultMapper() {
   StageConfig c;
   return SpecimenMapper(c.specimenRanges, c.minimumTolerance);
}

} // namespace

TEST_CASE("specimen across from each tab", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();
   REQUIRE(m.NumSpecimens() == 10);

   CHECK(m.SpecimenForTab(1) == 6);
   CHECK(m.SpecimenForTab(2) == 7);
   CHECK(m.SpecimenForTab(5) == 10);
   CHECK(m.SpecimenForTab(6) == 1);
   CHECK(m.SpecimenForTab(10) == 5);

   for (int tab = 1; tab <= 10; ++tab)
      CHECK(m.TabForSpecimen(m.SpecimenForTab(tab)) == tab);

   CHECK(m.TabForSpecimen(0) == 0);
   CHECK(m.TabForSpecimen(11) == 0);
}

TEST_CASE("positions inside a range map to its specimen", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();
   StageConfig c;

   for (const auto& s : c.specimenRanges) {
      const StepRange* ranges[] = { &s.first, &s.second };
      for (const StepRange* r : ranges) {
         const long probes[] = { r->start, r->Center(), r->end };
         for (long steps : probes) {
            int specimen = 0;
            REQUIRE(m.MapStepsToSpecimen(steps, 0.05, specimen));
            CHECK(specimen == s.specimen);
         }
      }
   }
}

TEST_CASE("tolerance around a range center", "[SpecimenMapper]")
{
   // Widen nothing but the tolerance: a narrow range whose tolerance
   // reaches past its ends.
   std::vector<SpecimenRanges> table = {
      { 1, { 1000, 1009 }, { 5000, 5009 } },
      { 2, { 3000, 3009 }, { 7000, 7009 } },
   };
   SpecimenMapper m(table, 50);

   const StepRange& r = table[0].first;
   const long tol = m.ToleranceFor(r, 0.05);
   REQUIRE(tol == 50);

   int specimen = 0;
   CHECK(m.MapStepsToSpecimen(r.Center() + tol, 0.05, specimen));
   CHECK(specimen == 1);
   specimen = 0;
   CHECK(m.MapStepsToSpecimen(r.Center() - tol, 0.05, specimen));
   CHECK(specimen == 1);

   CHECK_FALSE(m.MapStepsToSpecimen(r.Center() + tol + 1, 0.05, specimen));
   CHECK_FALSE(m.MapStepsToSpecimen(r.Center() - tol - 1, 0.05, specimen));
}

TEST_CASE("tolerance scales with range width", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();

   StepRange narrow{ 0, 99 };
   CHECK(m.ToleranceFor(narrow, 0.10) == 50);

   StepRange wide{ 0, 1999 };
   CHECK(m.ToleranceFor(wide, 0.05) == 100);
   CHECK(m.ToleranceFor(wide, 0.10) == 200);

   // The fraction is rounded, not truncated
   StepRange odd{ 0, 1014 }; // width 1015
   CHECK(m.ToleranceFor(odd, 0.10) == 102);
}

TEST_CASE("first qualifying range wins", "[SpecimenMapper]")
{
   std::vector<SpecimenRanges> table = {
      { 1, { 0, 20 }, { 5000, 5100 } },
      { 2, { 15, 200 }, { 6000, 6100 } },
   };
   SpecimenMapper m(table, 50);

   int specimen = 0;
   REQUIRE(m.MapStepsToSpecimen(18, 0.05, specimen));
   CHECK(specimen == 1);

   // Within tolerance of specimen 1's center and inside specimen 2's range:
   // the table is scanned in order, so the tolerance match comes first.
   specimen = 0;
   REQUIRE(m.MapStepsToSpecimen(50, 0.05, specimen));
   CHECK(specimen == 1);

   specimen = 0;
   REQUIRE(m.MapStepsToSpecimen(150, 0.05, specimen));
   CHECK(specimen == 2);
}

TEST_CASE("gap between ranges does not fall back to the nearest center", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();

   // Between specimen 2's back range (6399..6765) and specimen 3's
   // (7223..7585), farther than tolerance from both centers.
   int specimen = -1;
   CHECK_FALSE(m.MapStepsToSpecimen(6990, 0.05, specimen));
   CHECK(specimen == -1);
}

TEST_CASE("duplicated range of specimen 6", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();
   int specimen = 0;
   REQUIRE(m.MapStepsToSpecimen(10000, 0.05, specimen));
   CHECK(specimen == 6);
   REQUIRE(m.MapStepsToSpecimen(9600, 0.05, specimen));
   CHECK(specimen == 6);
}

TEST_CASE("resolve tab after a fall", "[SpecimenMapper]")
{
   SpecimenMapper m = DefaultMapper();

   SECTION("forward travel advances one tab") {
      FallResolution r = m.ResolveAfterFall(2, 7, 100, 50);
      CHECK(r.direction == 1);
      CHECK(r.tab == 3);
      CHECK(r.specimen == 8);
   }

   SECTION("reverse travel retreats one tab") {
      FallResolution r = m.ResolveAfterFall(2, 7, -100, 50);
      CHECK(r.direction == -1);
      CHECK(r.tab == 1);
      CHECK(r.specimen == 6);
   }

   SECTION("travel within threshold stays put") {
      int delta = GENERATE(-50, 0, 50);
      FallResolution r = m.ResolveAfterFall(4, 9, delta, 50);
      CHECK(r.direction == 0);
      CHECK(r.tab == 4);
      CHECK(r.specimen == 9);
   }

   SECTION("wraps around the carousel") {
      CHECK(m.ResolveAfterFall(10, 5, 80, 50).tab == 1);
      CHECK(m.ResolveAfterFall(1, 6, -80, 50).tab == 10);
   }

   SECTION("unknown tab is derived from the current specimen") {
      FallResolution r = m.ResolveAfterFall(0, 7, 100, 50);
      CHECK(r.tab == 3);
      CHECK(r.specimen == 8);
   }

   SECTION("unknown tab and specimen start from tab 1") {
      FallResolution r = m.ResolveAfterFall(0, 0, 100, 50);
      CHECK(r.tab == 2);
      CHECK(r.specimen == 7);
   }
}

} // namespace scope
