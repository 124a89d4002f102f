///////////////////////////////////////////////////////////////////////////////
// FILE:          Stage.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Stage
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

#ifndef _STAGE_H_
#define _STAGE_H_

#include "Zaber.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

extern const char* g_StageDescription;

class StageAxis : public ZC::StageAxis
{
public:
	StageAxis(DeviceChannel& channel, long axisNumber);

	// StageAxis API
	// -------------
	// Positions are in microsteps. Fractional targets are truncated.
	double GetPosition() override;
	ZC::AxisLimits GetLimits() override;
	void MoveBy(double delta) override;
	void MoveTo(double pos) override;

private:
	DeviceChannel& channel_;
	long axisNumber_;
};


// Multi-axis stage. Axes are named "1" to "N" after their axis numbers.
//
// The device must have a reference position before it can move. Homing
// moves the stage, so it happens in Enable() and not at construction.
// Moves do not re-check the homed state; a device without a reference
// position rejects them.
class Stage : public ZC::Stage, public ZaberBase
{
public:
	Stage(SerialBus& bus, long deviceAddress, zc::logging::Logger logger);
	~Stage();

	// Device API
	// ----------
	long GetAddress() const override { return channel_.GetAddress(); }
	void Initialize() override;
	void Shutdown() override;
	void Enable() override;
	void Disable() override;
	bool IsEnabled() const override { return enabled_; }

	// Stage API
	// ---------
	std::map<std::string, ZC::StageAxis*> GetAxes() override;
	std::map<std::string, double> GetPosition() override;
	std::map<std::string, ZC::AxisLimits> GetLimits() override;
	void MoveBy(const std::map<std::string, double>& delta) override;
	void MoveTo(const std::map<std::string, double>& position) override;

	unsigned GetNumberOfAxes() const { return static_cast<unsigned>(axes_.size()); }

private:
	StageAxis& FindAxis(const std::string& name) const;
	void CheckMoveTargets(const std::map<std::string, double>& values) const;

	std::vector<std::unique_ptr<StageAxis>> axes_;
	std::map<std::string, StageAxis*> axesByName_;
	std::atomic<bool> enabled_;
};

#endif //_STAGE_H_
