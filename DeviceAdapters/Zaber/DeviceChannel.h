///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceChannel.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Commands to one device address on a shared chain
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

#ifndef _DEVICECHANNEL_H_
#define _DEVICECHANNEL_H_

#include "ReplyFrame.h"
#include "SerialBus.h"

#include "../../ZCCore/Logging/Logging.h"
#include "../../ZCDevice/ZCDeviceConstants.h"

#include <string>
#include <vector>

class DeviceChannel
{
public:
	DeviceChannel(SerialBus& bus, long deviceAddress, zc::logging::Logger logger);

	long GetAddress() const { return deviceAddress_; }
	SerialBus& GetBus() const { return bus_; }

	// Sends "/<address> <axis> <command>" and returns the validated reply.
	// Axis 0 sends the command to all axes of the device. Throws CZCError:
	// ZCERR_MalformedFrame, ZCERR_AddressMismatch, ZCERR_CommandRejected.
	ReplyFrame Command(long axis, const std::string& command);

	long GetNumberOfAxes();
	// True if all axes, or the selected axis, have been homed
	bool IsHomed(long axis = ZC::AllAxes);
	void Home(long axis = ZC::AllAxes);
	bool IsBusy();
	void Stop(long axis = ZC::AllAxes);
	std::string GetFirmwareVersion();

	// Number of microsteps in one full rotation. Only valid on rotary
	// devices, including filter wheels and filter cube turrets.
	long GetRotationLength(long axis);
	long GetIndexDistance(long axis);
	long GetCurrentIndex(long axis);
	void MoveToIndex(long axis, long index);

	void MoveAbsolute(long axis, long position);
	void MoveRelative(long axis, long delta);
	long GetAbsolutePosition(long axis);
	long GetLimitMin(long axis);
	long GetLimitMax(long axis);

private:
	long GetSetting(long axis, const std::string& setting);
	std::vector<long> GetSettings(long axis, const std::string& setting);
	void ValidateReply(const ReplyFrame& reply) const;

	SerialBus& bus_;
	long deviceAddress_;
	std::string addressText_;
	zc::logging::Logger logger_;
};

#endif //_DEVICECHANNEL_H_
