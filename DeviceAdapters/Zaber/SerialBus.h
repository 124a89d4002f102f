///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialBus.h
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

#ifndef _SERIALBUS_H_
#define _SERIALBUS_H_

#include "../../ZCCore/Logging/Logging.h"
#include "../../ZCDevice/ZCDevice.h"

#include <memory>
#include <mutex>
#include <string>

class CZCError;

// Every device on a chain replies on the same wire, so a command and its
// reply must not be split by another command. Transact() holds the bus
// lock for one write-then-read round trip. The lock is recursive: a caller
// that needs several round trips in a row (check then act) takes Lock()
// around them and the Transact() calls inside nest.
//
// There is no cancellation once a command is written; abandoning the reply
// would leave it on the wire to be read as the answer to the next command.
class SerialBus
{
public:
	typedef std::unique_lock<std::recursive_mutex> ScopedLock;

	// Takes ownership of an open port and probes it. Throws CZCError
	// (ZCERR_NotADevice) if the port does not answer like a Zaber chain.
	SerialBus(std::unique_ptr<ZC::Serial> port, const std::string& portName,
		zc::logging::Logger logger);

	// Opens a serial port at 8N1 and probes it.
	static std::unique_ptr<SerialBus> Open(const std::string& portName,
		long baudRate, long answerTimeoutMs, zc::logging::Logger logger);

	// Returns the raw reply line, or an empty string on read timeout
	std::string Transact(const std::string& command);

	ScopedLock Lock();

	const std::string& GetPortName() const { return portName_; }

private:
	SerialBus(const SerialBus&);
	SerialBus& operator=(const SerialBus&);

	void Probe();
	CZCError NotADeviceError() const;

	std::recursive_mutex lock_;
	std::unique_ptr<ZC::Serial> port_;
	std::string portName_;
	zc::logging::Logger logger_;
};

#endif //_SERIALBUS_H_
