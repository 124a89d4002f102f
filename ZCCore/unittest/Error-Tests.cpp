#include <catch2/catch_all.hpp>

#include "Error.h"

#include <string>

TEST_CASE("CZCError carries message and code", "[Error]")
{
   CZCError e("Device rejected the command", ZCERR_CommandRejected);
   CHECK(e.getMsg() == "Device rejected the command");
   CHECK(std::string(e.what()) == "Device rejected the command");
   CHECK(e.getCode() == ZCERR_CommandRejected);
   CHECK(e.getUnderlyingError() == nullptr);
}

TEST_CASE("CZCError default code is generic", "[Error]")
{
   CZCError e("oops");
   CHECK(e.getCode() == ZCERR_GENERIC);
   CZCError n(static_cast<const char*>(nullptr));
   CHECK(n.getMsg() == "(null message)");
}

TEST_CASE("CZCError empty message falls back to code", "[Error]")
{
   CZCError e("", ZCERR_BadReply);
   CHECK(e.getMsg() == "Error (code 6)");
}

TEST_CASE("CZCError chains underlying errors", "[Error]")
{
   CZCError inner("Not a valid reply", ZCERR_MalformedFrame);
   CZCError outer("Homing failed", ZCERR_GENERIC, inner);
   REQUIRE(outer.getUnderlyingError() != nullptr);
   CHECK(outer.getUnderlyingError()->getCode() == ZCERR_MalformedFrame);
   CHECK(outer.getFullMsg() == "Homing failed [ Not a valid reply ]");

   CZCError copy(outer);
   CHECK(copy.getFullMsg() == outer.getFullMsg());

   CZCError assigned("x");
   assigned = outer;
   CHECK(assigned.getUnderlyingError()->getMsg() == "Not a valid reply");
}
