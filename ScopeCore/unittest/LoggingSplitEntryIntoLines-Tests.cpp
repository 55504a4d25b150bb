#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <string>
#include <vector>

namespace scope {
namespace logging {

using internal::EntryLine;
using internal::SplitEntryIntoLines;

TEST_CASE("split entry into lines", "[Logging]")
{
   std::vector<EntryLine> result;

   SECTION("empty result")
   {
      const char *testStr = GENERATE(
         "", "\r", "\n", "\r\r", "\r\n", "\n\n",
         "\r\r\r", "\r\r\n", "\r\n\r", "\r\n\n",
         "\n\r\r", "\n\r\n", "\n\n\r", "\n\n\n");
      SplitEntryIntoLines(testStr, result);
      REQUIRE(result.size() == 1);
      CHECK(result[0].text == "");
      CHECK(result[0].state == internal::LineStateEntryFirstLine);
   }

   SECTION("single-char result")
   {
      const char *testStr = GENERATE(
         "X", "X\r", "X\n", "X\r\r", "X\r\n", "X\n\n",
         "X\r\r\r", "X\r\r\n", "X\r\n\r", "X\r\n\n",
         "X\n\r\r", "X\n\r\n", "X\n\n\r", "X\n\n\n");
      SplitEntryIntoLines(testStr, result);
      REQUIRE(result.size() == 1);
      CHECK(result[0].text == "X");
   }

   SECTION("two-line result")
   {
      const char *testStr = GENERATE(
         "X\rY", "X\nY", "X\r\nY",
         "X\nY\r", "X\nY\n", "X\nY\r\r", "X\nY\r\n", "X\nY\n\n",
         "X\nY\r\r\r", "X\nY\r\r\n", "X\nY\r\n\r", "X\nY\r\n\n",
         "X\nY\n\r\r", "X\nY\n\r\n", "X\nY\n\n\r", "X\nY\n\n\n");
      SplitEntryIntoLines(testStr, result);
      REQUIRE(result.size() == 2);
      CHECK(result[0].text == "X");
      CHECK(result[1].text == "Y");
      CHECK(result[1].state == internal::LineStateNewLine);
   }

   SECTION("blank line in the middle is kept")
   {
      const char *testStr = GENERATE("X\n\nY", "X\r\rY", "X\r\n\r\nY");
      SplitEntryIntoLines(testStr, result);
      REQUIRE(result.size() == 3);
      CHECK(result[1].text == "");
      CHECK(result[2].text == "Y");
   }

   SECTION("null text")
   {
      SplitEntryIntoLines(nullptr, result);
      REQUIRE(result.size() == 1);
      CHECK(result[0].text == "");
   }
}

TEST_CASE("long lines are soft-split", "[Logging]")
{
   std::vector<EntryLine> result;
   const std::string text(2 * internal::MaxLogLineLen + 46, 'a');
   SplitEntryIntoLines(text.c_str(), result);

   REQUIRE(result.size() == 3);
   CHECK(result[0].state == internal::LineStateEntryFirstLine);
   CHECK(result[0].text.size() == internal::MaxLogLineLen);
   CHECK(result[1].state == internal::LineStateLineContinuation);
   CHECK(result[1].text.size() == internal::MaxLogLineLen);
   CHECK(result[2].state == internal::LineStateLineContinuation);
   CHECK(result[2].text.size() == 46);
}

TEST_CASE("line of exactly the maximum length is not split", "[Logging]")
{
   std::vector<EntryLine> result;
   const std::string text(internal::MaxLogLineLen, 'b');
   SplitEntryIntoLines((text + "\n").c_str(), result);
   REQUIRE(result.size() == 1);
   CHECK(result[0].text == text);
}

} // namespace logging
} // namespace scope
