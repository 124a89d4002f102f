///////////////////////////////////////////////////////////////////////////////
// FILE:          ReplyFrame.cpp
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   One reply line of the Zaber ASCII protocol
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

#include "ReplyFrame.h"

#include "../../ZCCore/Error.h"
#include "../../ZCDevice/DeviceUtils.h"

#include <cctype>

using namespace std;

namespace {

const char g_FrameStart = '@';
const char g_Delimiter = ' ';
const size_t g_DelimiterOffsets[] = { 3, 5, 8, 13, 16 };
const size_t g_ResponseOffset = 17;

const char* g_FlagAccepted = "OK";
const char* g_FlagRejected = "RJ";

bool IsDigit(char c)
{
	return isdigit(static_cast<unsigned char>(c)) != 0;
}

void ThrowMalformed(const string& line, const char* reason)
{
	throw CZCError("Not a valid reply from a Zaber device (" + string(reason) +
		"): \"" + CDeviceUtils::EscapeControlChars(line) + "\"",
		ZCERR_MalformedFrame);
}

} // anonymous namespace


ReplyFrame::ReplyFrame(const string& address, char axis, Flag flag,
		const string& status, const string& warning, const string& response) :
	address_(address),
	axis_(axis),
	flag_(flag),
	status_(status),
	warning_(warning),
	response_(response)
{
	if (address_.size() != 2 || !IsDigit(address_[0]) || !IsDigit(address_[1]) ||
		!IsDigit(axis_) || status_.size() != 4 || warning_.size() != 2)
	{
		throw CZCError("Reply fields do not fit the frame layout", ZCERR_MalformedFrame);
	}
}


ReplyFrame ReplyFrame::Parse(const string& line)
{
	string data = line;
	while (!data.empty() && (data[data.size() - 1] == '\n' || data[data.size() - 1] == '\r'))
	{
		data.erase(data.size() - 1);
	}

	// Layout first; no field is looked at before the frame is known to be
	// well formed.
	if (data.size() < g_ResponseOffset)
	{
		ThrowMalformed(line, "too short");
	}
	if (data[0] != g_FrameStart)
	{
		ThrowMalformed(line, "bad start");
	}
	for (size_t i = 0; i < sizeof(g_DelimiterOffsets) / sizeof(g_DelimiterOffsets[0]); ++i)
	{
		if (data[g_DelimiterOffsets[i]] != g_Delimiter)
		{
			ThrowMalformed(line, "bad delimiter");
		}
	}
	if (!IsDigit(data[1]) || !IsDigit(data[2]) || !IsDigit(data[4]))
	{
		ThrowMalformed(line, "bad address");
	}

	string flagText = data.substr(6, 2);
	Flag flag;
	if (flagText == g_FlagAccepted)
	{
		flag = Accepted;
	}
	else if (flagText == g_FlagRejected)
	{
		flag = Rejected;
	}
	else
	{
		ThrowMalformed(line, "bad flag");
		flag = Rejected; // not reached
	}

	return ReplyFrame(data.substr(1, 2), data[4], flag, data.substr(9, 4),
		data.substr(14, 2), data.substr(g_ResponseOffset));
}


string ReplyFrame::Format() const
{
	string result;
	result += g_FrameStart;
	result += address_;
	result += g_Delimiter;
	result += axis_;
	result += g_Delimiter;
	result += (flag_ == Accepted) ? g_FlagAccepted : g_FlagRejected;
	result += g_Delimiter;
	result += status_;
	result += g_Delimiter;
	result += warning_;
	result += g_Delimiter;
	result += response_;
	result += "\r\n";
	return result;
}


long ReplyFrame::GetAddressNumber() const
{
	return (address_[0] - '0') * 10 + (address_[1] - '0');
}


bool ReplyFrame::operator==(const ReplyFrame& other) const
{
	return address_ == other.address_ &&
		axis_ == other.axis_ &&
		flag_ == other.flag_ &&
		status_ == other.status_ &&
		warning_ == other.warning_ &&
		response_ == other.response_;
}
