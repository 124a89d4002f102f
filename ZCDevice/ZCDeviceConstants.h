///////////////////////////////////////////////////////////////////////////////
// FILE:          ZCDeviceConstants.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCDevice - Device contracts
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global constants and enumerations shared by the chain core
//                and the logical devices.
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

namespace ZC {

   // Device addresses on a daisy chain. Address 0 is the broadcast address
   // and is never bound to a logical device.
   const long MinDeviceAddress = 1;
   const long MaxDeviceAddress = 99;

   // Axis number 0 addresses every axis of a device
   const long AllAxes = 0;

   // Serial settings
   const long MinBaudRate = 9600;
   const long DefaultBaudRate = 115200;
   const long DefaultAnswerTimeoutMs = 500;

   // Device kinds that can be attached to a chain address
   enum DeviceKind {
      UnknownKind = 0,
      StageKind,
      FilterWheelKind
   };

   // Keywords
   extern const char* const g_Keyword_Stage;
   extern const char* const g_Keyword_FilterWheel;

} // namespace ZC
