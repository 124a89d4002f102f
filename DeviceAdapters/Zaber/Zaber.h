///////////////////////////////////////////////////////////////////////////////
// FILE:          Zaber.h
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

#ifndef _ZABER_H_
#define _ZABER_H_

#include "DeviceChannel.h"
#include "SerialBus.h"

#include "../../ZCCore/Logging/Logging.h"
#include "../../ZCDevice/RegisteredDeviceCollection.h"
#include "../../ZCDevice/ZCDevice.h"

#include <memory>
#include <string>

//////////////////////////////////////////////////////////////////////////////
// Device factory
//////////////////////////////////////////////////////////////////////////////

// Names, kinds and descriptions of the devices this driver can create
const ZC::internal::RegisteredDeviceCollection& GetRegisteredDevices();

// Creates the logical device of the given kind at a chain address. The
// device talks to the hardware during construction. Throws CZCError
// (ZCERR_UnsupportedDeviceKind for kinds the driver cannot create).
std::unique_ptr<ZC::Device> CreateDevice(ZC::DeviceKind kind, SerialBus& bus,
	long deviceAddress, zc::logging::Logger logger);


// Convenience parent class of the logical devices
class ZaberBase
{
public:
	ZaberBase(SerialBus& bus, long deviceAddress, zc::logging::Logger logger);
	virtual ~ZaberBase();

protected:
	// Homes all axes of the device unless they already have a reference
	// position. Returns true if a home command was sent.
	bool HomeIfNeeded();

	DeviceChannel channel_;
	zc::logging::Logger logger_;

private:
	ZaberBase(const ZaberBase&);
	ZaberBase& operator=(const ZaberBase&);
};

#endif //_ZABER_H_
