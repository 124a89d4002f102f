#pragma once

#include "../SerialBus.h"

#include "../../../ZCDevice/ZCDevice.h"

#include <chrono>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// Serial port double. Each written command is handed to the responder,
// whose reply lines are then returned one per ReadLine(). When the queue is
// empty ReadLine() returns "" as a real port does on timeout.
//
// A Write() that arrives while the reply to the previous command has not
// been read yet means two round trips overlapped on the wire.
class ScriptedSerial : public ZC::Serial {
public:
   typedef std::function<std::vector<std::string>(const std::string&)> Responder;

private:
   Responder responder_;
   mutable std::mutex mutex_;
   std::deque<std::string> pending_;
   std::vector<std::string> writes_;
   bool awaitingRead_ = false;
   bool interleaved_ = false;

public:
   explicit ScriptedSerial(Responder responder) : responder_(responder) {}

   void Write(const std::string& data) override {
      {
         std::lock_guard<std::mutex> lock(mutex_);
         if (awaitingRead_)
            interleaved_ = true;
         awaitingRead_ = true;
         writes_.push_back(data);
         for (const auto& line : responder_(data))
            pending_.push_back(line);
      }
      // Give a competing writer a chance to get in between
      std::this_thread::sleep_for(std::chrono::microseconds(50));
   }

   std::string ReadLine() override {
      std::lock_guard<std::mutex> lock(mutex_);
      awaitingRead_ = false;
      if (pending_.empty())
         return std::string();
      std::string line = pending_.front();
      pending_.pop_front();
      return line;
   }

   std::vector<std::string> Writes() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return writes_;
   }

   bool Interleaved() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return interleaved_;
   }
};


// State of one simulated device
struct SimDevice {
   long axes = 1;
   bool homed = false;
   bool busy = false;
   bool rejectRotarySettings = false;
   long cycleDist = 0;
   long indexDist = 0;
   long index = 1;
   long limitMin = 0;
   long limitMax = 305381;
   std::vector<long> positions;
   int homeCount = 0;
};


// Answers the ASCII protocol for a set of devices, one per address
class SimulatedChain {
public:
   std::map<long, SimDevice> devices;
   // When set, every reply claims to come from this address
   long replyAddressOverride = 0;

   SimDevice& AddStage(long address, long axes) {
      SimDevice& dev = devices[address];
      dev.axes = axes;
      dev.rejectRotarySettings = true;
      dev.positions.assign(axes, 0);
      return dev;
   }

   SimDevice& AddFilterWheel(long address, long numPositions) {
      SimDevice& dev = devices[address];
      dev.axes = 1;
      dev.indexDist = 25600;
      dev.cycleDist = numPositions * dev.indexDist;
      dev.positions.assign(1, 0);
      return dev;
   }

   // The serial keeps a pointer to this chain, which must outlive it
   std::unique_ptr<ZC::Serial> MakeSerial(ScriptedSerial** raw = nullptr) {
      ScriptedSerial* serial = new ScriptedSerial(
         [this](const std::string& cmd) { return Respond(cmd); });
      if (raw)
         *raw = serial;
      return std::unique_ptr<ZC::Serial>(serial);
   }

   std::unique_ptr<SerialBus> OpenBus(ScriptedSerial** raw = nullptr) {
      return std::unique_ptr<SerialBus>(
         new SerialBus(MakeSerial(raw), "sim", zc::logging::Logger()));
   }

   std::vector<std::string> Respond(const std::string& cmd) {
      std::vector<std::string> lines;
      if (cmd == "/\n") {
         for (const auto& entry : devices)
            lines.push_back(Line(entry.first, 0, "OK", entry.second, "0"));
         return lines;
      }

      // "/AA X payload\n"
      if (cmd.size() < 6 || cmd[0] != '/' || cmd[cmd.size() - 1] != '\n')
         return lines;
      long address = std::stol(cmd.substr(1, 2));
      long axis = cmd[4] - '0';
      std::string payload = cmd.size() > 7 ? cmd.substr(6, cmd.size() - 7) : "";

      auto it = devices.find(address);
      if (it == devices.end())
         return lines;
      SimDevice& dev = it->second;

      if (axis > dev.axes) {
         lines.push_back(Line(address, axis, "RJ", dev, "BADAXIS"));
         return lines;
      }

      std::string flag = "OK";
      std::string data = Execute(dev, axis, payload, flag);
      lines.push_back(Line(address, axis, flag, dev, data));
      return lines;
   }

private:
   std::string Line(long address, long axis, const std::string& flag,
         const SimDevice& dev, const std::string& data) const {
      char header[32];
      std::snprintf(header, sizeof(header), "@%02ld %ld %s %s -- ",
         replyAddressOverride ? replyAddressOverride : address, axis,
         flag.c_str(), dev.busy ? "BUSY" : "IDLE");
      return header + data + "\r\n";
   }

   static std::string PerAxis(const SimDevice& dev, long axis, std::function<long(long)> value) {
      std::ostringstream out;
      if (axis != 0)
         return std::to_string(value(axis));
      for (long i = 1; i <= dev.axes; ++i) {
         if (i > 1)
            out << ' ';
         out << value(i);
      }
      return out.str();
   }

   std::string Execute(SimDevice& dev, long axis, const std::string& payload, std::string& flag) {
      const std::string moveAbs = "move abs ";
      const std::string moveRel = "move rel ";
      const std::string moveIndex = "move index ";

      if (payload.empty())
         return "0";
      if (payload == "get system.axiscount")
         return std::to_string(dev.axes);
      if (payload == "get limit.home.triggered")
         return PerAxis(dev, axis, [&dev](long) { return dev.homed ? 1L : 0L; });
      if (payload == "home") {
         dev.homed = true;
         ++dev.homeCount;
         return "0";
      }
      if (payload == "stop")
         return "0";
      if (payload == "get version")
         return "7.38";
      if (payload == "get pos")
         return PerAxis(dev, axis, [&dev](long i) { return dev.positions[i - 1]; });
      if (payload == "get limit.min")
         return PerAxis(dev, axis, [&dev](long) { return dev.limitMin; });
      if (payload == "get limit.max")
         return PerAxis(dev, axis, [&dev](long) { return dev.limitMax; });

      if (payload == "get limit.cycle.dist" || payload == "get motion.index.dist" ||
            payload == "get motion.index.num") {
         if (dev.rejectRotarySettings) {
            flag = "RJ";
            return "BADCOMMAND";
         }
         if (payload == "get limit.cycle.dist")
            return std::to_string(dev.cycleDist);
         if (payload == "get motion.index.dist")
            return std::to_string(dev.indexDist);
         return std::to_string(dev.index);
      }

      if (payload.compare(0, moveIndex.size(), moveIndex) == 0) {
         long n = std::stol(payload.substr(moveIndex.size()));
         if (dev.indexDist <= 0 || n < 1 || n > dev.cycleDist / dev.indexDist) {
            flag = "RJ";
            return "BADDATA";
         }
         dev.index = n;
         return "0";
      }

      bool absolute = payload.compare(0, moveAbs.size(), moveAbs) == 0;
      bool relative = payload.compare(0, moveRel.size(), moveRel) == 0;
      if (absolute || relative) {
         if (!dev.homed) {
            flag = "RJ";
            return "NOREFERENCE";
         }
         long value = std::stol(payload.substr(moveAbs.size()));
         for (long i = 1; i <= dev.axes; ++i) {
            if (axis != 0 && axis != i)
               continue;
            long target = absolute ? value : dev.positions[i - 1] + value;
            if (target < dev.limitMin || target > dev.limitMax) {
               flag = "RJ";
               return "BADDATA";
            }
            dev.positions[i - 1] = target;
         }
         return "0";
      }

      flag = "RJ";
      return "BADCOMMAND";
   }
};
