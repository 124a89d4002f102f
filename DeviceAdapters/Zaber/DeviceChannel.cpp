///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceChannel.cpp
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

#include "DeviceChannel.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"
#include "../../ZCDevice/DeviceUtils.h"

#include <cstdio>
#include <sstream>

using namespace std;


DeviceChannel::DeviceChannel(SerialBus& bus, long deviceAddress, zc::logging::Logger logger) :
	bus_(bus),
	deviceAddress_(deviceAddress),
	logger_(logger)
{
	if (deviceAddress_ < ZC::MinDeviceAddress || deviceAddress_ > ZC::MaxDeviceAddress)
	{
		throw CZCError("Device address must be an integer between " +
			ToString(ZC::MinDeviceAddress) + "-" + ToString(ZC::MaxDeviceAddress) +
			" (got " + ToString(deviceAddress_) + ")", ZCERR_InvalidAddress);
	}

	char buf[8];
	snprintf(buf, sizeof(buf), "%02ld", deviceAddress_);
	addressText_ = buf;
}


ReplyFrame DeviceChannel::Command(long axis, const string& command)
{
	// The device rejects axis numbers it does not have (BADAXIS), but the
	// wire format only has room for one digit.
	if (axis < 0 || axis > 9)
	{
		throw CZCError("Axis number " + ToString(axis) + " cannot be addressed", ZCERR_NoSuchAxis);
	}

	ostringstream cmd;
	cmd << '/' << addressText_ << ' ' << axis;
	if (!command.empty())
	{
		cmd << ' ' << command;
	}
	cmd << '\n';

	string data = bus_.Transact(cmd.str());
	ReplyFrame reply = ReplyFrame::Parse(data);
	ValidateReply(reply);
	return reply;
}


void DeviceChannel::ValidateReply(const ReplyFrame& reply) const
{
	if (reply.GetAddress() != addressText_)
	{
		LOG_ERROR(logger_) << "Reply from address " << reply.GetAddress() <<
			" while talking to " << addressText_;
		throw CZCError("Received reply from a device with different address (" +
			reply.GetAddress() + " instead of " + addressText_ + ")", ZCERR_AddressMismatch);
	}
	if (!reply.IsAccepted())
	{
		LOG_ERROR(logger_) << "Command rejected: " << reply.GetResponse();
		throw CZCError("Command rejected because '" + reply.GetResponse() + "'",
			ZCERR_CommandRejected);
	}
	if (reply.HasWarning())
	{
		LOG_DEBUG(logger_) << "Device " << addressText_ << " reports warning " << reply.GetWarning();
	}
}


vector<long> DeviceChannel::GetSettings(long axis, const string& setting)
{
	ReplyFrame reply = Command(axis, "get " + setting);

	vector<string> tokens;
	CDeviceUtils::Tokenize(reply.GetResponse(), tokens, " ");
	vector<long> values;
	for (vector<string>::const_iterator it = tokens.begin(); it != tokens.end(); ++it)
	{
		long value;
		if (!CDeviceUtils::ParseLong(*it, value))
		{
			throw CZCError("Cannot decode " + setting + " from reply '" + reply.GetResponse() + "'",
				ZCERR_BadReply);
		}
		values.push_back(value);
	}
	if (values.empty())
	{
		throw CZCError("Empty reply to get " + setting, ZCERR_BadReply);
	}
	return values;
}


long DeviceChannel::GetSetting(long axis, const string& setting)
{
	vector<long> values = GetSettings(axis, setting);
	if (values.size() != 1)
	{
		throw CZCError("Expected a single value for " + setting + ", got " +
			ToString(static_cast<unsigned long>(values.size())), ZCERR_BadReply);
	}
	return values[0];
}


long DeviceChannel::GetNumberOfAxes()
{
	return GetSetting(ZC::AllAxes, "system.axiscount");
}


bool DeviceChannel::IsHomed(long axis)
{
	// One value per axis when sent to all axes
	vector<long> triggered = GetSettings(axis, "limit.home.triggered");
	for (vector<long>::const_iterator it = triggered.begin(); it != triggered.end(); ++it)
	{
		if (*it == 0)
		{
			return false;
		}
	}
	return true;
}


void DeviceChannel::Home(long axis)
{
	LOG_INFO(logger_) << "Homing device " << addressText_ << " axis " << axis;
	Command(axis, "home");
}


bool DeviceChannel::IsBusy()
{
	return !Command(ZC::AllAxes, "").IsIdle();
}


void DeviceChannel::Stop(long axis)
{
	Command(axis, "stop");
}


string DeviceChannel::GetFirmwareVersion()
{
	return Command(ZC::AllAxes, "get version").GetResponse();
}


long DeviceChannel::GetRotationLength(long axis)
{
	return GetSetting(axis, "limit.cycle.dist");
}


long DeviceChannel::GetIndexDistance(long axis)
{
	return GetSetting(axis, "motion.index.dist");
}


long DeviceChannel::GetCurrentIndex(long axis)
{
	return GetSetting(axis, "motion.index.num");
}


void DeviceChannel::MoveToIndex(long axis, long index)
{
	Command(axis, "move index " + ToString(index));
}


void DeviceChannel::MoveAbsolute(long axis, long position)
{
	Command(axis, "move abs " + ToString(position));
}


void DeviceChannel::MoveRelative(long axis, long delta)
{
	Command(axis, "move rel " + ToString(delta));
}


// In microsteps
long DeviceChannel::GetAbsolutePosition(long axis)
{
	return GetSetting(axis, "pos");
}


long DeviceChannel::GetLimitMin(long axis)
{
	return GetSetting(axis, "limit.min");
}


long DeviceChannel::GetLimitMax(long axis)
{
	return GetSetting(axis, "limit.max");
}
