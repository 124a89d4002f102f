#include <catch2/catch_all.hpp>

#include "RegisteredDeviceCollection.h"

namespace ZC {
namespace internal {

TEST_CASE("RegisteredDeviceCollection empty") {
   RegisteredDeviceCollection c;
   CHECK(c.GetNumberOfDevices() == 0);
   std::string buf = "untouched";
   CHECK_FALSE(c.GetDeviceName(0, buf));
   CHECK_FALSE(c.GetDeviceDescription("nonexistent", buf));
   CHECK(buf == "untouched");
   CHECK(c.GetDeviceKind("nonexistent") == ZC::UnknownKind);
}

TEST_CASE("RegisteredDeviceCollection rejects duplicate and empty names") {
   RegisteredDeviceCollection c;
   CHECK(c.RegisterDevice("Stage", ZC::StageKind, "first"));
   CHECK_FALSE(c.RegisterDevice("Stage", ZC::FilterWheelKind, "second"));
   CHECK_FALSE(c.RegisterDevice("", ZC::FilterWheelKind, "nameless"));
   CHECK(c.GetNumberOfDevices() == 1);

   std::string desc;
   CHECK(c.GetDeviceDescription("Stage", desc));
   CHECK(desc == "first");
   CHECK(c.GetDeviceKind("Stage") == ZC::StageKind);
}

TEST_CASE("RegisteredDeviceCollection multiple devices return correct info") {
   RegisteredDeviceCollection c;
   c.RegisterDevice("Stage", ZC::StageKind, "Linear stage");
   c.RegisterDevice("FilterWheel", ZC::FilterWheelKind, "Filter wheel");
   CHECK(c.GetNumberOfDevices() == 2);

   std::string buf;
   CHECK(c.GetDeviceName(0, buf));
   CHECK(buf == "Stage");
   CHECK(c.GetDeviceName(1, buf));
   CHECK(buf == "FilterWheel");
   CHECK_FALSE(c.GetDeviceName(2, buf));

   CHECK(c.GetDeviceKind("FilterWheel") == ZC::FilterWheelKind);
   CHECK(c.GetDeviceKind("filterwheel") == ZC::UnknownKind);
   CHECK(c.GetDeviceDescription("FilterWheel", buf));
   CHECK(buf == "Filter wheel");
}

} // namespace internal
} // namespace ZC
