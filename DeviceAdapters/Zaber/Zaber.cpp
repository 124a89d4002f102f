///////////////////////////////////////////////////////////////////////////////
// FILE:          Zaber.cpp
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Zaber daisy-chain driver
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
//

#include "Zaber.h"
#include "Stage.h"
#include "FilterWheel.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"

using namespace std;


//////////////////////////////////////////////////////////////////////////////////
// Device factory
//////////////////////////////////////////////////////////////////////////////////

namespace {

ZC::internal::RegisteredDeviceCollection InitializeModuleData()
{
	ZC::internal::RegisteredDeviceCollection devices;
	devices.RegisterDevice(ZC::g_Keyword_Stage, ZC::StageKind, g_StageDescription);
	devices.RegisterDevice(ZC::g_Keyword_FilterWheel, ZC::FilterWheelKind, g_FilterWheelDescription);
	return devices;
}

} // anonymous namespace


const ZC::internal::RegisteredDeviceCollection& GetRegisteredDevices()
{
	static const ZC::internal::RegisteredDeviceCollection devices = InitializeModuleData();
	return devices;
}


unique_ptr<ZC::Device> CreateDevice(ZC::DeviceKind kind, SerialBus& bus,
	long deviceAddress, zc::logging::Logger logger)
{
	switch (kind)
	{
	case ZC::StageKind:
		return unique_ptr<ZC::Device>(new Stage(bus, deviceAddress, logger));
	case ZC::FilterWheelKind:
		return unique_ptr<ZC::Device>(new FilterWheel(bus, deviceAddress, logger));
	default:
		throw CZCError("Devices of kind " + ToQuotedString(ToString(kind)) + " are not supported",
			ZCERR_UnsupportedDeviceKind);
	}
}


///////////////////////////////////////////////////////////////////////////////
// ZaberBase (convenience parent class)
///////////////////////////////////////////////////////////////////////////////

ZaberBase::ZaberBase(SerialBus& bus, long deviceAddress, zc::logging::Logger logger) :
	channel_(bus, deviceAddress, logger),
	logger_(logger)
{
}


ZaberBase::~ZaberBase()
{
}


bool ZaberBase::HomeIfNeeded()
{
	// Another caller must not move the device between the check and the
	// home command.
	SerialBus::ScopedLock lock = channel_.GetBus().Lock();

	// Before a device can be moved, it first needs to establish a
	// reference to the home position.
	if (channel_.IsHomed())
	{
		LOG_DEBUG(logger_) << "Device " << channel_.GetAddress() << " already homed";
		return false;
	}

	channel_.Home();
	return true;
}
