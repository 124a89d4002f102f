///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialBus.cpp
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Serial connection shared by all devices of a daisy chain
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

#include "SerialBus.h"
#include "SerialPort.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"

using namespace std;

namespace {

// The empty command does nothing except make every device on the chain
// reply with its status.
const char* g_PingCommand = "/\n";

// One reply per device, with room for a device answering twice
const long g_MaxPingReplies = 2 * ZC::MaxDeviceAddress;

bool IsCompleteLine(const string& line)
{
	return !line.empty() && line[line.size() - 1] == '\n';
}

} // anonymous namespace


SerialBus::SerialBus(unique_ptr<ZC::Serial> port, const string& portName,
		zc::logging::Logger logger) :
	port_(std::move(port)),
	portName_(portName),
	logger_(logger)
{
	Probe();
}


unique_ptr<SerialBus> SerialBus::Open(const string& portName, long baudRate,
	long answerTimeoutMs, zc::logging::Logger logger)
{
	if (baudRate < ZC::MinBaudRate)
	{
		throw CZCError("Baud rate " + ToString(baudRate) + " is below the protocol minimum of " +
			ToString(ZC::MinBaudRate), ZCERR_InvalidBaudRate);
	}

	LOG_INFO(logger) << "Opening " << portName << " at " << baudRate << " baud";
	unique_ptr<ZC::Serial> port(new SerialPort(portName, baudRate, answerTimeoutMs));
	return unique_ptr<SerialBus>(new SerialBus(std::move(port), portName, logger));
}


void SerialBus::Probe()
{
	long count = 0;
	{
		ScopedLock lock(lock_);
		port_->Write(g_PingCommand);
		// Read until the chain goes quiet
		for (;;)
		{
			string line = port_->ReadLine();
			if (line.empty())
			{
				break;
			}
			if (line[0] != '@')
			{
				LOG_ERROR(logger_) << "Unexpected reply to ping on " << portName_ << ": " <<
					CDeviceUtils::EscapeControlChars(line);
				throw NotADeviceError();
			}
			if (++count > g_MaxPingReplies)
			{
				LOG_ERROR(logger_) << "More than " << g_MaxPingReplies <<
					" replies to ping on " << portName_;
				throw NotADeviceError();
			}
			if (!IsCompleteLine(line))
			{
				break;
			}
		}
	}

	if (count == 0)
	{
		LOG_ERROR(logger_) << "No reply to ping on " << portName_;
		throw NotADeviceError();
	}

	LOG_INFO(logger_) << "Found " << count << " device(s) on " << portName_;
}


CZCError SerialBus::NotADeviceError() const
{
	return CZCError(ToQuotedString(portName_) + " does not respond like a Zaber device",
		ZCERR_NotADevice);
}


string SerialBus::Transact(const string& command)
{
	ScopedLock lock(lock_);

	LOG_DEBUG(logger_) << "Send: " << CDeviceUtils::EscapeControlChars(command);
	port_->Write(command);
	string reply = port_->ReadLine();
	if (reply.empty())
	{
		LOG_WARNING(logger_) << "No reply to " << CDeviceUtils::EscapeControlChars(command);
	}
	else
	{
		LOG_DEBUG(logger_) << "Recv: " << CDeviceUtils::EscapeControlChars(reply);
	}
	return reply;
}


SerialBus::ScopedLock SerialBus::Lock()
{
	return ScopedLock(lock_);
}
