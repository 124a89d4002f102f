///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialPort.cpp
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

#include "SerialPort.h"

#include "../../ZCCore/Error.h"

using namespace std;

namespace asio = boost::asio;


SerialPort::SerialPort(const string& portName, long baudRate, long answerTimeoutMs) :
	portName_(portName),
	answerTimeout_(answerTimeoutMs),
	port_(io_)
{
	boost::system::error_code ec;
	port_.open(portName_, ec);
	if (ec)
	{
		throw CZCError("Cannot open serial port \"" + portName_ + "\": " + ec.message(),
			ZCERR_SerialPortError);
	}

	try
	{
		port_.set_option(asio::serial_port_base::baud_rate(static_cast<unsigned int>(baudRate)));
		port_.set_option(asio::serial_port_base::character_size(8));
		port_.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none));
		port_.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one));
		port_.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none));
	}
	catch (const boost::system::system_error& e)
	{
		throw CZCError("Cannot configure serial port \"" + portName_ + "\": " + e.what(),
			ZCERR_SerialPortError);
	}
}


SerialPort::~SerialPort()
{
	// close() failing here has nobody to report to
	boost::system::error_code ec;
	port_.close(ec);
}


void SerialPort::Write(const string& data)
{
	boost::system::error_code ec;
	asio::write(port_, asio::buffer(data), ec);
	if (ec)
	{
		throw CZCError("Write to serial port \"" + portName_ + "\" failed: " + ec.message(),
			ZCERR_SerialPortError);
	}
}


string SerialPort::ReadLine()
{
	boost::system::error_code readError = asio::error::would_block;
	asio::async_read_until(port_, buffer_, '\n',
		[&readError](const boost::system::error_code& ec, size_t) { readError = ec; });

	io_.restart();
	io_.run_for(answerTimeout_);
	if (readError == asio::error::would_block)
	{
		// Timed out. Cancel the read and let its handler complete.
		boost::system::error_code ec;
		port_.cancel(ec);
		if (ec)
		{
			throw CZCError("Cannot cancel read on serial port \"" + portName_ + "\": " + ec.message(),
				ZCERR_SerialPortError);
		}
		io_.restart();
		io_.run();
	}

	if (readError && readError != asio::error::operation_aborted)
	{
		throw CZCError("Read from serial port \"" + portName_ + "\" failed: " + readError.message(),
			ZCERR_SerialPortError);
	}

	// The buffer may hold more than one line; hand out the first one and
	// keep the rest. After a timeout it holds only a partial line, if any.
	string pending(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
	string::size_type eol = pending.find('\n');
	string line = (eol == string::npos) ? pending : pending.substr(0, eol + 1);
	buffer_.consume(line.size());
	return line;
}
