#include <catch2/catch_all.hpp>

#include "SimulatedChain.h"

#include "../Stage.h"

#include "../../../ZCCore/Error.h"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

std::size_t CountWrites(const ScriptedSerial& serial, const std::string& cmd)
{
   std::vector<std::string> writes = serial.Writes();
   return static_cast<std::size_t>(std::count(writes.begin(), writes.end(), cmd));
}

}

TEST_CASE("Stage names its axes after their numbers", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 3);
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());

   CHECK(stage.GetKind() == ZC::StageKind);
   CHECK(stage.GetAddress() == 1);
   CHECK(stage.GetNumberOfAxes() == 3);
   std::map<std::string, ZC::StageAxis*> axes = stage.GetAxes();
   REQUIRE(axes.size() == 3);
   CHECK(axes.count("1") == 1);
   CHECK(axes.count("2") == 1);
   CHECK(axes.count("3") == 1);
}

TEST_CASE("Construction does not home the stage", "[Stage]")
{
   SimulatedChain sim;
   SimDevice& dev = sim.AddStage(1, 2);
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());

   CHECK(dev.homeCount == 0);
   CHECK_FALSE(stage.IsEnabled());
}

TEST_CASE("Enabling an unhomed stage sends exactly one home", "[Stage]")
{
   SimulatedChain sim;
   SimDevice& dev = sim.AddStage(1, 2);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);
   Stage stage(*bus, 1, zc::logging::Logger());

   stage.Enable();
   CHECK(stage.IsEnabled());
   CHECK(dev.homeCount == 1);
   CHECK(CountWrites(*serial, "/01 0 home\n") == 1);

   std::vector<std::string> writes = serial->Writes();
   REQUIRE(writes.size() >= 2);
   CHECK(writes[writes.size() - 2] == "/01 0 get limit.home.triggered\n");
   CHECK(writes.back() == "/01 0 home\n");
}

TEST_CASE("Enabling a homed stage sends no home", "[Stage]")
{
   SimulatedChain sim;
   SimDevice& dev = sim.AddStage(1, 1);
   dev.homed = true;
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);
   Stage stage(*bus, 1, zc::logging::Logger());

   stage.Enable();
   CHECK(stage.IsEnabled());
   CHECK(dev.homeCount == 0);
   CHECK(CountWrites(*serial, "/01 0 home\n") == 0);

   stage.Disable();
   CHECK_FALSE(stage.IsEnabled());
   stage.Enable();
   CHECK(dev.homeCount == 0);
}

TEST_CASE("Moves truncate to whole microsteps", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 2);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);
   Stage stage(*bus, 1, zc::logging::Logger());
   stage.Enable();

   std::map<std::string, ZC::StageAxis*> axes = stage.GetAxes();
   axes["1"]->MoveTo(1000.9);
   CHECK(serial->Writes().back() == "/01 1 move abs 1000\n");
   axes["2"]->MoveTo(500.0);
   axes["2"]->MoveBy(-10.7);
   CHECK(serial->Writes().back() == "/01 2 move rel -10\n");

   CHECK(axes["1"]->GetPosition() == 1000.0);
   CHECK(axes["2"]->GetPosition() == 490.0);
}

TEST_CASE("Multi-axis moves and positions", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 2);
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());
   stage.Enable();

   stage.MoveTo({ { "1", 100.0 }, { "2", 200.0 } });
   stage.MoveBy({ { "2", 5.0 } });

   std::map<std::string, double> pos = stage.GetPosition();
   CHECK(pos["1"] == 100.0);
   CHECK(pos["2"] == 205.0);
}

TEST_CASE("Limits are read from the device", "[Stage]")
{
   SimulatedChain sim;
   SimDevice& dev = sim.AddStage(1, 2);
   dev.limitMin = -500;
   dev.limitMax = 60000;
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());

   std::map<std::string, ZC::AxisLimits> limits = stage.GetLimits();
   REQUIRE(limits.size() == 2);
   CHECK(limits["1"] == ZC::AxisLimits(-500, 60000));
   CHECK(limits["2"].lower == -500);
   CHECK(limits["2"].upper == 60000);
}

TEST_CASE("Unknown axis names are rejected before any traffic", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 2);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);
   Stage stage(*bus, 1, zc::logging::Logger());
   stage.Enable();
   std::size_t before = serial->Writes().size();

   try
   {
      stage.MoveTo({ { "1", 10.0 }, { "3", 10.0 } });
      FAIL("unknown axis accepted");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_NoSuchAxis);
   }
   CHECK(serial->Writes().size() == before);
}

TEST_CASE("A stage without a reference position rejects moves", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 1);
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());

   try
   {
      stage.MoveBy({ { "1", 10.0 } });
      FAIL("move accepted without a reference position");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_CommandRejected);
   }
}

TEST_CASE("Out-of-travel moves are rejected by the device", "[Stage]")
{
   SimulatedChain sim;
   SimDevice& dev = sim.AddStage(1, 1);
   dev.limitMax = 1000;
   std::unique_ptr<SerialBus> bus = sim.OpenBus();
   Stage stage(*bus, 1, zc::logging::Logger());
   stage.Enable();

   CHECK_THROWS_AS(stage.MoveTo({ { "1", 1001.0 } }), CZCError);
   CHECK(dev.positions[0] == 0);
}

TEST_CASE("Lifecycle hooks send nothing", "[Stage]")
{
   SimulatedChain sim;
   sim.AddStage(1, 1);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);
   Stage stage(*bus, 1, zc::logging::Logger());
   std::size_t before = serial->Writes().size();

   stage.Initialize();
   stage.Shutdown();
   CHECK(serial->Writes().size() == before);
}
