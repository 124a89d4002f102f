///////////////////////////////////////////////////////////////////////////////
// FILE:          ChainConfiguration.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Serial settings and device table of a daisy chain
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

#ifndef _CHAINCONFIGURATION_H_
#define _CHAINCONFIGURATION_H_

#include <istream>
#include <map>
#include <string>

// Configuration files are line based, one comma-separated command per line:
//
//    # comment
//    Port,/dev/ttyUSB0
//    BaudRate,115200
//    AnswerTimeoutMs,500
//    Device,1,Stage
//    Device,3,FilterWheel
//
// Device addresses and kind names are only checked for syntax here. The
// registry validates them when the chain is built.
class ChainConfiguration
{
public:
	ChainConfiguration();

	// Throws CZCError: ZCERR_FileOpenFailed, ZCERR_InvalidConfiguration
	static ChainConfiguration LoadFromFile(const std::string& filename);
	// Throws CZCError (ZCERR_InvalidConfiguration naming the line)
	static ChainConfiguration Parse(std::istream& in);

	const std::string& GetPort() const { return port_; }
	void SetPort(const std::string& port) { port_ = port; }

	long GetBaudRate() const { return baudRate_; }
	void SetBaudRate(long baudRate) { baudRate_ = baudRate; }

	long GetAnswerTimeoutMs() const { return answerTimeoutMs_; }
	void SetAnswerTimeoutMs(long timeoutMs) { answerTimeoutMs_ = timeoutMs; }

	// Address to device kind name
	const std::map<long, std::string>& GetDevices() const { return devices_; }
	// Throws CZCError (ZCERR_InvalidConfiguration) if the address is taken
	void AddDevice(long address, const std::string& kindName);

private:
	void ParseLine(const std::string& line);

	std::string port_;
	long baudRate_;
	long answerTimeoutMs_;
	std::map<long, std::string> devices_;
};

#endif //_CHAINCONFIGURATION_H_
