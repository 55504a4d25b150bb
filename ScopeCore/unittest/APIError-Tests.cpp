#include <catch2/catch_all.hpp>

#include "Error.h"
#include "ErrorCodes.h"

#include <string>

TEST_CASE("error code of zero becomes generic", "[APIError]")
{
   CScopeError e("Something went wrong", SCOPEERR_OK);
   CHECK(e.getCode() == SCOPEERR_GENERIC);
   CHECK(e.getMsg() == "Something went wrong");
}

TEST_CASE("null message does not crash", "[APIError]")
{
   const char* msg = nullptr;
   CScopeError e(msg, SCOPEERR_LockBusy);
   CHECK(e.getCode() == SCOPEERR_LockBusy);
   CHECK_FALSE(e.getMsg().empty());
}

TEST_CASE("empty message falls back to the code text", "[APIError]")
{
   CScopeError e(std::string(), SCOPEERR_TabSeekTimeout);
   CHECK(e.getMsg() == scope::GetErrorText(SCOPEERR_TabSeekTimeout));
}

TEST_CASE("chained errors are reported in full", "[APIError]")
{
   CScopeError inner("Unexpected token", SCOPEERR_InvalidConfiguration);
   CScopeError middle("Cannot parse stage configuration",
         SCOPEERR_InvalidConfiguration, inner);
   CScopeError outer("Invalid stage configuration file \"stage.json\"",
         SCOPEERR_InvalidConfiguration, middle);

   CHECK(outer.getFullMsg() ==
         "Invalid stage configuration file \"stage.json\" "
         "[ Cannot parse stage configuration ] [ Unexpected token ]");
   CHECK(std::string(outer.what()) == outer.getFullMsg());
   REQUIRE(outer.getUnderlyingError() != nullptr);
   REQUIRE(outer.getUnderlyingError()->getUnderlyingError() != nullptr);
   CHECK(outer.getUnderlyingError()->getUnderlyingError()->getMsg() == "Unexpected token");
}

TEST_CASE("copies own their chained errors", "[APIError]")
{
   CScopeError copy("placeholder");
   {
      CScopeError inner("inner", SCOPEERR_PinWriteFailed);
      CScopeError outer("outer", SCOPEERR_SessionHalted, inner);
      copy = outer;
   }
   CHECK(copy.getCode() == SCOPEERR_SessionHalted);
   REQUIRE(copy.getUnderlyingError() != nullptr);
   CHECK(copy.getUnderlyingError()->getCode() == SCOPEERR_PinWriteFailed);
   CHECK(copy.getFullMsg() == "outer [ inner ]");
}

TEST_CASE("every error code has text", "[APIError]")
{
   const int code = GENERATE(range(SCOPEERR_OK, SCOPEERR_FileOpenFailed + 1));
   CAPTURE(code);
   CHECK(std::string(scope::GetErrorText(code)) != "Unknown error");
   CHECK(std::string(scope::GetErrorText(-1)) == "Unknown error");
}
