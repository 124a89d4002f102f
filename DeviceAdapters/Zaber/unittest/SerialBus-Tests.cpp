#include <catch2/catch_all.hpp>

#include "SimulatedChain.h"

#include "../SerialBus.h"

#include "../../../ZCCore/Error.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::unique_ptr<ZC::Serial> ReplyToPing(const std::vector<std::string>& lines,
   ScriptedSerial** raw = nullptr)
{
   ScriptedSerial* serial = new ScriptedSerial(
      [lines](const std::string& cmd) {
         return cmd == "/\n" ? lines : std::vector<std::string>();
      });
   if (raw)
      *raw = serial;
   return std::unique_ptr<ZC::Serial>(serial);
}

// Answers every read with the same line, as a chatty non-Zaber device
// would. Gives up after a large number of reads so a runaway reader ends.
class FloodingSerial : public ZC::Serial {
   std::string line_;
   long reads_ = 0;

public:
   explicit FloodingSerial(const std::string& line) : line_(line) {}

   void Write(const std::string&) override {}

   std::string ReadLine() override {
      if (reads_ >= 100000)
         return std::string();
      ++reads_;
      return line_;
   }

   long Reads() const { return reads_; }
};

int FloodErrorCode(const std::string& line, long* reads)
{
   FloodingSerial* serial = new FloodingSerial(line);
   std::unique_ptr<ZC::Serial> port(serial);
   int code = ZCERR_OK;
   try
   {
      SerialBus bus(std::move(port), "flood", zc::logging::Logger());
   }
   catch (const CZCError& e)
   {
      code = e.getCode();
   }
   *reads = serial->Reads();
   return code;
}

int ProbeErrorCode(const std::vector<std::string>& lines)
{
   try
   {
      SerialBus bus(ReplyToPing(lines), "test", zc::logging::Logger());
   }
   catch (const CZCError& e)
   {
      return e.getCode();
   }
   return ZCERR_OK;
}

}

TEST_CASE("Probe sends the ping and accepts a reply", "[SerialBus]")
{
   ScriptedSerial* serial;
   SerialBus bus(ReplyToPing({ "@01 0 OK  -- IDLE\r\n" }, &serial), "test",
      zc::logging::Logger());
   REQUIRE(serial->Writes().size() == 1);
   CHECK(serial->Writes()[0] == "/\n");
   CHECK(bus.GetPortName() == "test");
}

TEST_CASE("Probe accepts several devices", "[SerialBus]")
{
   CHECK(ProbeErrorCode({ "@01 0 OK IDLE -- 0\r\n", "@02 0 OK IDLE -- 0\r\n",
      "@03 0 OK IDLE -- 0\r\n" }) == ZCERR_OK);
}

TEST_CASE("Probe rejects a port that does not talk the protocol", "[SerialBus]")
{
   CHECK(ProbeErrorCode({ "garbage\r\n" }) == ZCERR_NotADevice);
   CHECK(ProbeErrorCode({ "@01 0 OK IDLE -- 0\r\n", "garbage\r\n" }) == ZCERR_NotADevice);
}

TEST_CASE("Ping check stops at the first foreign line", "[SerialBus]")
{
   long reads = 0;
   CHECK(FloodErrorCode("garbage\n", &reads) == ZCERR_NotADevice);
   CHECK(reads == 1);
}

TEST_CASE("Ping check gives up on an endless stream of replies", "[SerialBus]")
{
   long reads = 0;
   CHECK(FloodErrorCode("@01 0 OK IDLE -- 0\r\n", &reads) == ZCERR_NotADevice);
   CHECK(reads > ZC::MaxDeviceAddress);
   CHECK(reads <= 2 * ZC::MaxDeviceAddress + 1);
}

TEST_CASE("Probe rejects a silent port", "[SerialBus]")
{
   CHECK(ProbeErrorCode({}) == ZCERR_NotADevice);
}

TEST_CASE("Probe rejects a partial line", "[SerialBus]")
{
   CHECK(ProbeErrorCode({ "garb" }) == ZCERR_NotADevice);
}

TEST_CASE("Open rejects baud rates below the protocol minimum", "[SerialBus]")
{
   try
   {
      SerialBus::Open("/dev/does-not-exist", 4800, 100, zc::logging::Logger());
      FAIL("Open did not throw");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_InvalidBaudRate);
   }
}

TEST_CASE("Open reports a port that cannot be opened", "[SerialBus]")
{
   try
   {
      SerialBus::Open("/dev/does-not-exist", 115200, 100, zc::logging::Logger());
      FAIL("Open did not throw");
   }
   catch (const CZCError& e)
   {
      CHECK(e.getCode() == ZCERR_SerialPortError);
   }
}

TEST_CASE("Transact returns the raw reply line", "[SerialBus]")
{
   SimulatedChain sim;
   sim.AddStage(1, 2);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);

   CHECK(bus->Transact("/01 0 get system.axiscount\n") == "@01 0 OK IDLE -- 2\r\n");
   CHECK(serial->Writes().back() == "/01 0 get system.axiscount\n");
}

TEST_CASE("Transact returns an empty line on timeout", "[SerialBus]")
{
   SimulatedChain sim;
   sim.AddStage(1, 1);
   std::unique_ptr<SerialBus> bus = sim.OpenBus();

   CHECK(bus->Transact("/07 0\n").empty());
}

TEST_CASE("Concurrent transactions never interleave", "[SerialBus]")
{
   SimulatedChain sim;
   sim.AddStage(1, 1);
   sim.AddStage(2, 1);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);

   const int perThread = 200;
   std::vector<std::string> replies1, replies2;
   std::thread t1([&] {
      for (int i = 0; i < perThread; ++i)
         replies1.push_back(bus->Transact("/01 0\n"));
   });
   std::thread t2([&] {
      for (int i = 0; i < perThread; ++i)
         replies2.push_back(bus->Transact("/02 0\n"));
   });
   t1.join();
   t2.join();

   CHECK_FALSE(serial->Interleaved());
   CHECK(serial->Writes().size() == static_cast<std::size_t>(1 + 2 * perThread));
   for (const auto& r : replies1)
      CHECK(r.compare(0, 3, "@01") == 0);
   for (const auto& r : replies2)
      CHECK(r.compare(0, 3, "@02") == 0);
}

TEST_CASE("Lock keeps other callers out between transactions", "[SerialBus]")
{
   SimulatedChain sim;
   sim.AddStage(1, 1);
   sim.AddStage(2, 1);
   ScriptedSerial* serial;
   std::unique_ptr<SerialBus> bus = sim.OpenBus(&serial);

   std::thread other;
   {
      SerialBus::ScopedLock lock = bus->Lock();
      other = std::thread([&] { bus->Transact("/02 0\n"); });
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      bus->Transact("/01 0 get limit.home.triggered\n");
      bus->Transact("/01 0 home\n");
   }
   other.join();

   std::vector<std::string> writes = serial->Writes();
   REQUIRE(writes.size() == 4);
   CHECK(writes[1] == "/01 0 get limit.home.triggered\n");
   CHECK(writes[2] == "/01 0 home\n");
   CHECK(writes[3] == "/02 0\n");
}
