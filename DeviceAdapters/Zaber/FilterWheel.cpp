///////////////////////////////////////////////////////////////////////////////
// FILE:          FilterWheel.cpp
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Zaber filter wheels and filter cube turrets
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

#include "FilterWheel.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"

using namespace std;

const char* g_FilterWheelDescription = "Zaber Filter Wheel";


FilterWheel::FilterWheel(SerialBus& bus, long deviceAddress, zc::logging::Logger logger) :
	ZaberBase(bus, deviceAddress, logger),
	numPositions_(0)
{
	const string notAFilterWheel = "Device with address " + ToString(deviceAddress) +
		" is not a filter wheel";

	SerialBus::ScopedLock lock = channel_.GetBus().Lock();

	long numAxes = channel_.GetNumberOfAxes();
	if (numAxes != 1)
	{
		LOG_ERROR(logger_) << notAFilterWheel << ": it has " << numAxes << " axes";
		throw CZCError(notAFilterWheel, ZCERR_NotAFilterWheel);
	}

	// Linear devices reject the rotary settings
	long cycleSize = 0;
	long indexSize = 0;
	try
	{
		cycleSize = channel_.GetRotationLength(axis_);
		indexSize = channel_.GetIndexDistance(axis_);
	}
	catch (const CZCError& e)
	{
		if (e.getCode() != ZCERR_CommandRejected)
			throw;
		LOG_ERROR(logger_) << notAFilterWheel << ": " << e.getMsg();
		throw CZCError(notAFilterWheel, ZCERR_NotAFilterWheel, e);
	}

	if (cycleSize <= 0 || indexSize <= 0 || indexSize > cycleSize)
	{
		LOG_ERROR(logger_) << notAFilterWheel << ": cycle distance " << cycleSize <<
			", index distance " << indexSize;
		throw CZCError(notAFilterWheel, ZCERR_NotAFilterWheel);
	}

	numPositions_ = cycleSize / indexSize;
	LOG_INFO(logger_) << "Filter wheel at address " << deviceAddress << " with " <<
		numPositions_ << " positions";

	// Unlike stage movement, filter wheel homing is not hazardous, so it
	// happens here rather than in Enable().
	HomeIfNeeded();
}


FilterWheel::~FilterWheel()
{
}


void FilterWheel::Initialize()
{
}


void FilterWheel::Shutdown()
{
}


void FilterWheel::Enable()
{
}


void FilterWheel::Disable()
{
}


// Zaber positions start at one.
// TODO: confirm against hardware whether index 1 is the first filter slot.
long FilterWheel::GetPosition()
{
	return channel_.GetCurrentIndex(axis_);
}


void FilterWheel::SetPosition(long pos)
{
	if (pos < 1 || pos > numPositions_)
	{
		throw CZCError("Position must be an integer between 1 and " + ToString(numPositions_) +
			" (got " + ToString(pos) + ")", ZCERR_OutOfRange);
	}

	channel_.MoveToIndex(axis_, pos);
}
