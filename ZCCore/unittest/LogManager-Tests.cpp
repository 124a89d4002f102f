#include <catch2/catch_all.hpp>

#include "CapturingLogSink.h"
#include "Error.h"
#include "LogManager.h"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

namespace zc {

namespace {

std::string ReadFile(const std::string& path)
{
   std::ifstream in(path.c_str());
   return std::string(std::istreambuf_iterator<char>(in),
         std::istreambuf_iterator<char>());
}

}

TEST_CASE("LogManager defaults", "[LogManager]")
{
   LogManager mgr;
   CHECK_FALSE(mgr.IsUsingStdErr());
   CHECK_FALSE(mgr.IsUsingPrimaryLogFile());
   CHECK(mgr.GetPrimaryLogLevel() == logging::LogLevelInfo);
}

TEST_CASE("LogManager stderr toggle", "[LogManager]")
{
   LogManager mgr;
   mgr.SetUseStdErr(true);
   CHECK(mgr.IsUsingStdErr());
   LOG_INFO(mgr.NewLogger("test")) << "to stderr";
   mgr.SetUseStdErr(false);
   CHECK_FALSE(mgr.IsUsingStdErr());
}

TEST_CASE("LogManager primary file honors level", "[LogManager]")
{
   const std::string filename = "LogManager-Tests-primary.log";
   {
      LogManager mgr;
      mgr.SetPrimaryLogFilename(filename, true);
      CHECK(mgr.IsUsingPrimaryLogFile());
      CHECK(mgr.GetPrimaryLogFilename() == filename);

      logging::Logger lgr = mgr.NewLogger("Bus");
      LOG_DEBUG(lgr) << "hidden at info level";
      mgr.SetPrimaryLogLevel(logging::LogLevelDebug);
      LOG_DEBUG(lgr) << "visible at debug level";

      mgr.SetPrimaryLogFilename("", false);
      CHECK_FALSE(mgr.IsUsingPrimaryLogFile());
      LOG_ERROR(lgr) << "after close";
   }

   const std::string contents = ReadFile(filename);
   CHECK_THAT(contents, !Catch::Matchers::ContainsSubstring("hidden at info level"));
   CHECK_THAT(contents, Catch::Matchers::ContainsSubstring("[dbg,Bus] visible at debug level"));
   CHECK_THAT(contents, !Catch::Matchers::ContainsSubstring("after close"));
   std::remove(filename.c_str());
}

TEST_CASE("LogManager unopenable file throws", "[LogManager]")
{
   LogManager mgr;
   try
   {
      mgr.SetPrimaryLogFilename("no-such-directory/x/y.log", true);
      FAIL("expected CZCError");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_FileOpenFailed);
   }
   CHECK_FALSE(mgr.IsUsingPrimaryLogFile());
}

TEST_CASE("LogManager extra sinks", "[LogManager]")
{
   LogManager mgr;
   auto sink = std::make_shared<CapturingLogSink>();
   mgr.AddSink(sink);
   LOG_TRACE(mgr.NewLogger("extra")) << "unfiltered";
   mgr.RemoveSink(sink);
   LOG_TRACE(mgr.NewLogger("extra")) << "dropped";
   CHECK_THAT(sink->Contents(), Catch::Matchers::ContainsSubstring("unfiltered"));
   CHECK_THAT(sink->Contents(), !Catch::Matchers::ContainsSubstring("dropped"));
}

} // namespace zc
