///////////////////////////////////////////////////////////////////////////////
// FILE:          ChainConfiguration.cpp
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

#include "ChainConfiguration.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"
#include "../../ZCDevice/DeviceUtils.h"
#include "../../ZCDevice/ZCDeviceConstants.h"

#include <fstream>
#include <vector>

using namespace std;

namespace {

const char* const g_CfgCommand_Port = "Port";
const char* const g_CfgCommand_BaudRate = "BaudRate";
const char* const g_CfgCommand_AnswerTimeout = "AnswerTimeoutMs";
const char* const g_CfgCommand_Device = "Device";

const char g_CfgCommentChar = '#';
const char* const g_CfgFieldSeparator = ",";

long ParseNumber(const string& field, const string& what)
{
	long value;
	if (!CDeviceUtils::ParseLong(field, value))
	{
		throw CZCError(what + " must be an integer (got " + ToQuotedString(field) + ")",
			ZCERR_InvalidConfiguration);
	}
	return value;
}

void CheckFieldCount(const vector<string>& tokens, size_t expected)
{
	if (tokens.size() != expected)
	{
		throw CZCError(ToQuotedString(tokens[0]) + " expects " + ToString(static_cast<unsigned long>(expected - 1)) +
			" field(s), got " + ToString(static_cast<unsigned long>(tokens.size() - 1)),
			ZCERR_InvalidConfiguration);
	}
}

} // anonymous namespace


ChainConfiguration::ChainConfiguration() :
	baudRate_(ZC::DefaultBaudRate),
	answerTimeoutMs_(ZC::DefaultAnswerTimeoutMs)
{
}


ChainConfiguration ChainConfiguration::LoadFromFile(const string& filename)
{
	ifstream in(filename.c_str());
	if (!in.is_open())
	{
		throw CZCError("Cannot open configuration file " + ToQuotedString(filename),
			ZCERR_FileOpenFailed);
	}

	try
	{
		return Parse(in);
	}
	catch (const CZCError& e)
	{
		throw CZCError("Error in configuration file " + ToQuotedString(filename),
			e.getCode(), e);
	}
}


ChainConfiguration ChainConfiguration::Parse(istream& in)
{
	ChainConfiguration config;

	string line;
	long lineNr = 0;
	while (getline(in, line))
	{
		++lineNr;
		try
		{
			config.ParseLine(line);
		}
		catch (const CZCError& e)
		{
			throw CZCError("Line " + ToString(lineNr) + ": " + ToQuotedString(CDeviceUtils::Trim(line)),
				ZCERR_InvalidConfiguration, e);
		}
	}

	if (config.port_.empty())
	{
		throw CZCError("Configuration does not name a serial port", ZCERR_InvalidConfiguration);
	}
	return config;
}


void ChainConfiguration::ParseLine(const string& line)
{
	string trimmed = CDeviceUtils::Trim(line);
	if (trimmed.empty() || trimmed[0] == g_CfgCommentChar)
		return;

	vector<string> tokens;
	CDeviceUtils::Tokenize(trimmed, tokens, g_CfgFieldSeparator);
	for (vector<string>::iterator it = tokens.begin(); it != tokens.end(); ++it)
	{
		*it = CDeviceUtils::Trim(*it);
	}
	if (tokens.empty())
	{
		throw CZCError("Line has no configuration command", ZCERR_InvalidConfiguration);
	}

	const string& command = tokens[0];
	if (command == g_CfgCommand_Port)
	{
		CheckFieldCount(tokens, 2);
		port_ = tokens[1];
	}
	else if (command == g_CfgCommand_BaudRate)
	{
		CheckFieldCount(tokens, 2);
		baudRate_ = ParseNumber(tokens[1], "Baud rate");
	}
	else if (command == g_CfgCommand_AnswerTimeout)
	{
		CheckFieldCount(tokens, 2);
		answerTimeoutMs_ = ParseNumber(tokens[1], "Answer timeout");
		if (answerTimeoutMs_ <= 0)
		{
			throw CZCError("Answer timeout must be positive", ZCERR_InvalidConfiguration);
		}
	}
	else if (command == g_CfgCommand_Device)
	{
		CheckFieldCount(tokens, 3);
		AddDevice(ParseNumber(tokens[1], "Device address"), tokens[2]);
	}
	else
	{
		throw CZCError("Unknown configuration command " + ToQuotedString(command),
			ZCERR_InvalidConfiguration);
	}
}


void ChainConfiguration::AddDevice(long address, const string& kindName)
{
	if (devices_.count(address) > 0)
	{
		throw CZCError("Device address " + ToString(address) + " is configured twice",
			ZCERR_InvalidConfiguration);
	}
	devices_[address] = kindName;
}
