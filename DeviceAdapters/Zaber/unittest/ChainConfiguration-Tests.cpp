#include <catch2/catch_all.hpp>

#include "../ChainConfiguration.h"

#include "../../../ZCCore/Error.h"
#include "../../../ZCDevice/ZCDeviceConstants.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {

ChainConfiguration ParseText(const std::string& text)
{
   std::istringstream in(text);
   return ChainConfiguration::Parse(in);
}

int ParseErrorCode(const std::string& text)
{
   try
   {
      ParseText(text);
   }
   catch (const CZCError& e)
   {
      return e.getCode();
   }
   return ZCERR_OK;
}

}

TEST_CASE("Configuration reads port, serial settings and devices", "[ChainConfiguration]")
{
   ChainConfiguration config = ParseText(
      "# Two devices\n"
      "Port,/dev/ttyUSB0\n"
      "\n"
      "BaudRate,9600\n"
      "AnswerTimeoutMs, 250\n"
      "Device,1,Stage\n"
      "Device,3,FilterWheel\r\n");

   CHECK(config.GetPort() == "/dev/ttyUSB0");
   CHECK(config.GetBaudRate() == 9600);
   CHECK(config.GetAnswerTimeoutMs() == 250);
   REQUIRE(config.GetDevices().size() == 2);
   CHECK(config.GetDevices().at(1) == "Stage");
   CHECK(config.GetDevices().at(3) == "FilterWheel");
}

TEST_CASE("Configuration serial settings have defaults", "[ChainConfiguration]")
{
   ChainConfiguration config = ParseText("Port,COM3\n");
   CHECK(config.GetBaudRate() == ZC::DefaultBaudRate);
   CHECK(config.GetAnswerTimeoutMs() == ZC::DefaultAnswerTimeoutMs);
   CHECK(config.GetDevices().empty());
}

TEST_CASE("Configuration errors name the line", "[ChainConfiguration]")
{
   try
   {
      ParseText("Port,COM3\nDevice,1,Stage\nDevice,x,Stage\n");
      FAIL("bad address accepted");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_InvalidConfiguration);
      CHECK_THAT(e.getMsg(), Catch::Matchers::StartsWith("Line 3"));
      REQUIRE(e.getUnderlyingError() != nullptr);
      CHECK_THAT(e.getFullMsg(), Catch::Matchers::ContainsSubstring("Device address"));
   }
}

TEST_CASE("Malformed configuration lines are rejected", "[ChainConfiguration]")
{
   CHECK(ParseErrorCode("Port,COM3\nSpeed,9\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\nBaudRate\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\nBaudRate,fast\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\nAnswerTimeoutMs,0\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\nDevice,1\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\nDevice,1,Stage,extra\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("Port,COM3\n,,,\n") == ZCERR_InvalidConfiguration);
}

TEST_CASE("Duplicate device addresses are rejected", "[ChainConfiguration]")
{
   CHECK(ParseErrorCode("Port,COM3\nDevice,2,Stage\nDevice,2,FilterWheel\n") ==
      ZCERR_InvalidConfiguration);
}

TEST_CASE("A configuration must name the port", "[ChainConfiguration]")
{
   CHECK(ParseErrorCode("Device,2,Stage\n") == ZCERR_InvalidConfiguration);
   CHECK(ParseErrorCode("") == ZCERR_InvalidConfiguration);
}

TEST_CASE("Kinds and address ranges are left to the registry", "[ChainConfiguration]")
{
   ChainConfiguration config = ParseText("Port,COM3\nDevice,150,Camera\n");
   CHECK(config.GetDevices().at(150) == "Camera");
}

TEST_CASE("Configuration loads from a file", "[ChainConfiguration]")
{
   const std::string filename = "ChainConfiguration-Tests.cfg";
   {
      std::ofstream out(filename.c_str());
      out << "Port,/dev/ttyS1\nDevice,7,Stage\n";
   }
   ChainConfiguration config = ChainConfiguration::LoadFromFile(filename);
   std::remove(filename.c_str());

   CHECK(config.GetPort() == "/dev/ttyS1");
   CHECK(config.GetDevices().at(7) == "Stage");
}

TEST_CASE("Missing configuration file is reported", "[ChainConfiguration]")
{
   try
   {
      ChainConfiguration::LoadFromFile("no/such/dir/chain.cfg");
      FAIL("missing file accepted");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_FileOpenFailed);
   }
}
