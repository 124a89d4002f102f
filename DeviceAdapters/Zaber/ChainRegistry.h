///////////////////////////////////////////////////////////////////////////////
// FILE:          ChainRegistry.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Logical devices attached to the addresses of one chain
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

#ifndef _CHAINREGISTRY_H_
#define _CHAINREGISTRY_H_

#include "ChainConfiguration.h"
#include "SerialBus.h"

#include "../../ZCCore/LogManager.h"
#include "../../ZCDevice/ZCDevice.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Owns the bus of a daisy chain and every logical device on it. All devices
// share the one bus.
class ChainRegistry
{
public:
	// Validates every entry (ZCERR_InvalidAddress, ZCERR_UnsupportedDeviceKind)
	// before talking to any device, then creates the devices in address
	// order. Device construction talks to the hardware and may throw.
	ChainRegistry(std::unique_ptr<SerialBus> bus,
		const std::map<long, ZC::DeviceKind>& devices, zc::LogManager& logManager);
	~ChainRegistry();

	// Validates the table, opens the port and creates the devices
	static std::unique_ptr<ChainRegistry> Build(const std::string& port,
		const std::map<long, ZC::DeviceKind>& devices, zc::LogManager& logManager,
		long baudRate = ZC::DefaultBaudRate, long answerTimeoutMs = ZC::DefaultAnswerTimeoutMs);
	static std::unique_ptr<ChainRegistry> Build(const ChainConfiguration& config,
		zc::LogManager& logManager);

	// Maps a kind name ("Stage", "FilterWheel") to its kind. Throws
	// CZCError (ZCERR_UnsupportedDeviceKind) for anything else.
	static ZC::DeviceKind ParseDeviceKind(const std::string& name);
	static void ValidateEntries(const std::map<long, ZC::DeviceKind>& devices);

	// Lookups throw CZCError (ZCERR_NoSuchDevice) if there is no device of
	// the requested kind at the address.
	ZC::Device& GetDevice(long address) const;
	ZC::Stage& GetStage(long address) const;
	ZC::FilterWheel& GetFilterWheel(long address) const;
	ZC::DeviceKind GetDeviceKind(long address) const;
	std::vector<long> GetAddresses() const;

	SerialBus& GetBus() const { return *bus_; }

private:
	ChainRegistry(const ChainRegistry&);
	ChainRegistry& operator=(const ChainRegistry&);

	// Devices hold references to the bus; destroy them first
	std::unique_ptr<SerialBus> bus_;
	std::map<long, std::unique_ptr<ZC::Device>> devices_;
};

#endif //_CHAINREGISTRY_H_
