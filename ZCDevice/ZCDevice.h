///////////////////////////////////////////////////////////////////////////////
// FILE:          ZCDevice.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCDevice - Device contracts
//-----------------------------------------------------------------------------
// DESCRIPTION:   The interface to the logical devices of a daisy chain.
//                Defines the contract exposed to collaborators (stages,
//                filter wheels) and the serial transport used underneath.
//
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

// N.B.
//
// Methods of the classes in this file report failure by throwing CZCError
// (see ZCCore/Error.h). None of them retries a command on failure: a motion
// command that is retried blind may be executed twice.

#include "ZCDeviceConstants.h"

#include <map>
#include <string>

namespace ZC {

   /**
    * Inclusive travel interval of an axis, in microsteps.
    */
   struct AxisLimits
   {
      long lower;
      long upper;

      AxisLimits() : lower(0), upper(0) {}
      AxisLimits(long lo, long hi) : lower(lo), upper(hi) {}

      bool operator==(const AxisLimits& other) const
      { return lower == other.lower && upper == other.upper; }
   };

   /**
    * Generic logical device on a chain.
    */
   class Device
   {
   public:
      Device() {}
      virtual ~Device() {}

      virtual DeviceKind GetKind() const = 0;
      virtual long GetAddress() const = 0;

      // Lifecycle hooks. Resource ownership belongs to the bus, so these
      // do not open or close anything.
      virtual void Initialize() = 0;
      virtual void Shutdown() = 0;

      /**
       * Prepares the device for motion. Devices that need a reference
       * position establish it here.
       */
      virtual void Enable() = 0;
      virtual void Disable() = 0;
      virtual bool IsEnabled() const = 0;
   };

   /**
    * One physical motion axis.
    */
   class StageAxis
   {
   public:
      StageAxis() {}
      virtual ~StageAxis() {}

      virtual double GetPosition() = 0;
      virtual AxisLimits GetLimits() = 0;
      virtual void MoveBy(double delta) = 0;
      virtual void MoveTo(double pos) = 0;
   };

   /**
    * Stage API. Axes are identified by name ("1", "2", ...).
    */
   class Stage : public Device
   {
   public:
      Stage() {}
      virtual ~Stage() {}

      virtual DeviceKind GetKind() const { return StageKind; }

      virtual std::map<std::string, StageAxis*> GetAxes() = 0;
      virtual std::map<std::string, double> GetPosition() = 0;
      virtual std::map<std::string, AxisLimits> GetLimits() = 0;
      virtual void MoveBy(const std::map<std::string, double>& delta) = 0;
      virtual void MoveTo(const std::map<std::string, double>& position) = 0;
   };

   /**
    * Filter wheel API. Positions are numbered from 1.
    */
   class FilterWheel : public Device
   {
   public:
      FilterWheel() {}
      virtual ~FilterWheel() {}

      virtual DeviceKind GetKind() const { return FilterWheelKind; }

      virtual long GetPosition() = 0;
      virtual void SetPosition(long pos) = 0;
      virtual long GetNumberOfPositions() const = 0;
   };

   /**
    * Serial line transport.
    */
   class Serial
   {
   public:
      Serial() {}
      virtual ~Serial() {}

      virtual void Write(const std::string& data) = 0;

      /**
       * Returns the next line, terminator included. If the answer timeout
       * expires first, returns what was received so far (possibly nothing).
       */
      virtual std::string ReadLine() = 0;
   };

} // namespace ZC
