///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialPort.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Serial port line transport built on Boost.Asio
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

#ifndef _SERIALPORT_H_
#define _SERIALPORT_H_

#include "../../ZCDevice/ZCDevice.h"

#include <boost/asio.hpp>

#include <chrono>
#include <string>

// 8 data bits, no parity, one stop bit, no flow control. Not thread-safe;
// SerialBus serializes access.
class SerialPort : public ZC::Serial
{
public:
	SerialPort(const std::string& portName, long baudRate, long answerTimeoutMs);
	~SerialPort();

	void Write(const std::string& data) override;
	std::string ReadLine() override;

	const std::string& GetPortName() const { return portName_; }

private:
	SerialPort(const SerialPort&);
	SerialPort& operator=(const SerialPort&);

	std::string portName_;
	std::chrono::milliseconds answerTimeout_;
	boost::asio::io_context io_;
	boost::asio::serial_port port_;
	boost::asio::streambuf buffer_;
};

#endif //_SERIALPORT_H_
