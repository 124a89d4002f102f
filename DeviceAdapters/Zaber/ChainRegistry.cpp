///////////////////////////////////////////////////////////////////////////////
// FILE:          ChainRegistry.cpp
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

#include "ChainRegistry.h"
#include "Zaber.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"

using namespace std;


ChainRegistry::ChainRegistry(unique_ptr<SerialBus> bus,
		const map<long, ZC::DeviceKind>& devices, zc::LogManager& logManager) :
	bus_(std::move(bus))
{
	ValidateEntries(devices);

	zc::logging::Logger logger = logManager.NewLogger("ChainRegistry");
	for (map<long, ZC::DeviceKind>::const_iterator it = devices.begin(); it != devices.end(); ++it)
	{
		LOG_INFO(logger) << "Creating " << ToString(it->second) << " at address " << it->first <<
			" on " << bus_->GetPortName();
		devices_[it->first] = CreateDevice(it->second, *bus_, it->first,
			logManager.NewLogger("dev:" + ToString(it->second) + ":" + ToString(it->first)));
	}
}


ChainRegistry::~ChainRegistry()
{
	devices_.clear();
}


unique_ptr<ChainRegistry> ChainRegistry::Build(const string& port,
	const map<long, ZC::DeviceKind>& devices, zc::LogManager& logManager,
	long baudRate, long answerTimeoutMs)
{
	// Reject a bad table before touching the port
	ValidateEntries(devices);

	unique_ptr<SerialBus> bus = SerialBus::Open(port, baudRate, answerTimeoutMs,
		logManager.NewLogger("bus:" + port));
	return unique_ptr<ChainRegistry>(new ChainRegistry(std::move(bus), devices, logManager));
}


unique_ptr<ChainRegistry> ChainRegistry::Build(const ChainConfiguration& config,
	zc::LogManager& logManager)
{
	map<long, ZC::DeviceKind> devices;
	const map<long, string>& names = config.GetDevices();
	for (map<long, string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		devices[it->first] = ParseDeviceKind(it->second);
	}
	return Build(config.GetPort(), devices, logManager,
		config.GetBaudRate(), config.GetAnswerTimeoutMs());
}


ZC::DeviceKind ChainRegistry::ParseDeviceKind(const string& name)
{
	ZC::DeviceKind kind = GetRegisteredDevices().GetDeviceKind(name);
	if (kind == ZC::UnknownKind)
	{
		throw CZCError("Devices of kind " + ToQuotedString(name) + " are not supported",
			ZCERR_UnsupportedDeviceKind);
	}
	return kind;
}


void ChainRegistry::ValidateEntries(const map<long, ZC::DeviceKind>& devices)
{
	for (map<long, ZC::DeviceKind>::const_iterator it = devices.begin(); it != devices.end(); ++it)
	{
		if (it->first < ZC::MinDeviceAddress || it->first > ZC::MaxDeviceAddress)
		{
			throw CZCError("Device address must be an integer between " +
				ToString(ZC::MinDeviceAddress) + "-" + ToString(ZC::MaxDeviceAddress) +
				" (got " + ToString(it->first) + ")", ZCERR_InvalidAddress);
		}
		if (it->second != ZC::StageKind && it->second != ZC::FilterWheelKind)
		{
			throw CZCError("Devices of kind " + ToQuotedString(ToString(it->second)) +
				" are not supported", ZCERR_UnsupportedDeviceKind);
		}
	}
}


ZC::Device& ChainRegistry::GetDevice(long address) const
{
	map<long, unique_ptr<ZC::Device>>::const_iterator it = devices_.find(address);
	if (it == devices_.end())
	{
		throw CZCError("No device at address " + ToString(address), ZCERR_NoSuchDevice);
	}
	return *it->second;
}


ZC::Stage& ChainRegistry::GetStage(long address) const
{
	ZC::Stage* stage = dynamic_cast<ZC::Stage*>(&GetDevice(address));
	if (!stage)
	{
		throw CZCError("Device at address " + ToString(address) + " is not a stage",
			ZCERR_NoSuchDevice);
	}
	return *stage;
}


ZC::FilterWheel& ChainRegistry::GetFilterWheel(long address) const
{
	ZC::FilterWheel* wheel = dynamic_cast<ZC::FilterWheel*>(&GetDevice(address));
	if (!wheel)
	{
		throw CZCError("Device at address " + ToString(address) + " is not a filter wheel",
			ZCERR_NoSuchDevice);
	}
	return *wheel;
}


ZC::DeviceKind ChainRegistry::GetDeviceKind(long address) const
{
	return GetDevice(address).GetKind();
}


vector<long> ChainRegistry::GetAddresses() const
{
	vector<long> addresses;
	for (map<long, unique_ptr<ZC::Device>>::const_iterator it = devices_.begin(); it != devices_.end(); ++it)
	{
		addresses.push_back(it->first);
	}
	return addresses;
}
