///////////////////////////////////////////////////////////////////////////////
// FILE:          RegisteredDeviceCollection.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCDevice - Device contracts
//-----------------------------------------------------------------------------
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

// Names, kinds and descriptions of the logical devices a driver can attach
// to chain addresses. Lookup is by the name used in configuration files.

#pragma once

#include "ZCDeviceConstants.h"

#include <algorithm>
#include <string>
#include <vector>

namespace ZC {
namespace internal {

class RegisteredDeviceCollection
{
   struct DeviceInfo
   {
      std::string name;
      ZC::DeviceKind kind = ZC::UnknownKind;
      std::string description;
   };

   std::vector<DeviceInfo> devices_;

public:
   // Returns false if the name is empty or already registered
   bool RegisterDevice(const std::string& deviceName, ZC::DeviceKind deviceKind, const std::string& deviceDescription)
   {
      if (deviceName.empty())
         return false;

      auto it = std::find_if(devices_.begin(), devices_.end(),
         [&](const DeviceInfo& dev) { return dev.name == deviceName; });
      if (it != devices_.end())
         return false;

      devices_.push_back(DeviceInfo{ deviceName, deviceKind, deviceDescription });
      return true;
   }

   unsigned GetNumberOfDevices() const
   {
      return static_cast<unsigned>(devices_.size());
   }

   bool GetDeviceName(unsigned deviceIndex, std::string& name) const
   {
      if (deviceIndex >= devices_.size())
         return false;

      name = devices_[deviceIndex].name;
      return true;
   }

   // UnknownKind if the name is not registered
   ZC::DeviceKind GetDeviceKind(const std::string& deviceName) const
   {
      auto it = std::find_if(devices_.begin(), devices_.end(),
         [&](const DeviceInfo& dev) { return dev.name == deviceName; });
      if (it == devices_.end())
         return ZC::UnknownKind;

      return it->kind;
   }

   bool GetDeviceDescription(const std::string& deviceName, std::string& description) const
   {
      auto it = std::find_if(devices_.begin(), devices_.end(),
         [&](const DeviceInfo& dev) { return dev.name == deviceName; });
      if (it == devices_.end())
         return false;

      description = it->description;
      return true;
   }
};

} // namespace internal
} // namespace ZC
