///////////////////////////////////////////////////////////////////////////////
// FILE:          FilterWheel.h
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

#ifndef _FILTERWHEEL_H_
#define _FILTERWHEEL_H_

#include "Zaber.h"

extern const char* g_FilterWheelDescription;

// Validates the device and homes it if needed during construction. Throws
// CZCError (ZCERR_NotAFilterWheel) if the device at the address is not a
// single-axis rotary indexed device.
class FilterWheel : public ZC::FilterWheel, public ZaberBase
{
public:
	FilterWheel(SerialBus& bus, long deviceAddress, zc::logging::Logger logger);
	~FilterWheel();

	// Device API
	// ----------
	long GetAddress() const override { return channel_.GetAddress(); }
	void Initialize() override;
	void Shutdown() override;
	void Enable() override;
	void Disable() override;
	bool IsEnabled() const override { return true; }

	// FilterWheel API
	// ---------------
	long GetPosition() override;
	void SetPosition(long pos) override;
	long GetNumberOfPositions() const override { return numPositions_; }

private:
	static const long axis_ = 1;

	long numPositions_;
};

#endif //_FILTERWHEEL_H_
