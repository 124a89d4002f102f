///////////////////////////////////////////////////////////////////////////////
// FILE:          ReplyFrame.h
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

#ifndef _REPLYFRAME_H_
#define _REPLYFRAME_H_

#include <string>

// A reply looks like
//
//    @01 1 OK IDLE -- 12345\r\n
//    0123456789012345678
//
// i.e. address, axis, flag, status, warning and response, separated by
// single spaces at fixed offsets. Fields are extracted by offset, so a
// response that itself contains spaces is kept whole.
class ReplyFrame
{
public:
	enum Flag
	{
		Accepted,
		Rejected
	};

	ReplyFrame(const std::string& address, char axis, Flag flag,
		const std::string& status, const std::string& warning,
		const std::string& response);

	// Throws CZCError (ZCERR_MalformedFrame) if the line does not have the
	// reply layout. Trailing line terminators are ignored.
	static ReplyFrame Parse(const std::string& line);

	std::string Format() const;

	const std::string& GetAddress() const { return address_; }
	long GetAddressNumber() const;
	long GetAxis() const { return axis_ - '0'; }
	Flag GetFlag() const { return flag_; }
	bool IsAccepted() const { return flag_ == Accepted; }
	const std::string& GetStatus() const { return status_; }
	bool IsIdle() const { return status_ == "IDLE"; }
	const std::string& GetWarning() const { return warning_; }
	bool HasWarning() const { return warning_ != "--"; }
	const std::string& GetResponse() const { return response_; }

	bool operator==(const ReplyFrame& other) const;
	bool operator!=(const ReplyFrame& other) const { return !(*this == other); }

private:
	std::string address_;
	char axis_;
	Flag flag_;
	std::string status_;
	std::string warning_;
	std::string response_;
};

#endif //_REPLYFRAME_H_
