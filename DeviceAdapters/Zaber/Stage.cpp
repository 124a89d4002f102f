///////////////////////////////////////////////////////////////////////////////
// FILE:          Stage.cpp
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

#include "Stage.h"

#include "../../ZCCore/CoreUtils.h"
#include "../../ZCCore/Error.h"

#include <cmath>
#include <limits>

using namespace std;

const char* g_StageDescription = "Zaber Stage";

namespace {

long ToMicrosteps(double value)
{
	if (!std::isfinite(value) ||
		value >= static_cast<double>(numeric_limits<long>::max()) ||
		value <= static_cast<double>(numeric_limits<long>::min()))
	{
		throw CZCError("Cannot convert " + ToString(value) + " to microsteps", ZCERR_OutOfRange);
	}
	return static_cast<long>(value);
}

} // anonymous namespace


///////////////////////////////////////////////////////////////////////////////
// StageAxis
///////////////////////////////////////////////////////////////////////////////

StageAxis::StageAxis(DeviceChannel& channel, long axisNumber) :
	channel_(channel),
	axisNumber_(axisNumber)
{
}


double StageAxis::GetPosition()
{
	return static_cast<double>(channel_.GetAbsolutePosition(axisNumber_));
}


ZC::AxisLimits StageAxis::GetLimits()
{
	long lower = channel_.GetLimitMin(axisNumber_);
	long upper = channel_.GetLimitMax(axisNumber_);
	return ZC::AxisLimits(lower, upper);
}


void StageAxis::MoveBy(double delta)
{
	channel_.MoveRelative(axisNumber_, ToMicrosteps(delta));
}


void StageAxis::MoveTo(double pos)
{
	channel_.MoveAbsolute(axisNumber_, ToMicrosteps(pos));
}


///////////////////////////////////////////////////////////////////////////////
// Stage
///////////////////////////////////////////////////////////////////////////////

Stage::Stage(SerialBus& bus, long deviceAddress, zc::logging::Logger logger) :
	ZaberBase(bus, deviceAddress, logger),
	enabled_(false)
{
	long numAxes = channel_.GetNumberOfAxes();
	if (numAxes < 1)
	{
		throw CZCError("Device " + ToString(deviceAddress) + " reports " + ToString(numAxes) + " axes",
			ZCERR_BadReply);
	}

	for (long i = 1; i <= numAxes; ++i)
	{
		axes_.push_back(unique_ptr<StageAxis>(new StageAxis(channel_, i)));
		axesByName_[ToString(i)] = axes_.back().get();
	}

	LOG_INFO(logger_) << "Stage at address " << deviceAddress << " with " << numAxes << " axes";
}


Stage::~Stage()
{
}


void Stage::Initialize()
{
}


void Stage::Shutdown()
{
}


void Stage::Enable()
{
	HomeIfNeeded();
	enabled_ = true;
}


void Stage::Disable()
{
	enabled_ = false;
}


StageAxis& Stage::FindAxis(const string& name) const
{
	map<string, StageAxis*>::const_iterator it = axesByName_.find(name);
	if (it == axesByName_.end())
	{
		throw CZCError("Stage at address " + ToString(GetAddress()) + " has no axis " +
			ToQuotedString(name), ZCERR_NoSuchAxis);
	}
	return *it->second;
}


void Stage::CheckMoveTargets(const map<string, double>& values) const
{
	for (map<string, double>::const_iterator it = values.begin(); it != values.end(); ++it)
	{
		FindAxis(it->first);
		ToMicrosteps(it->second);
	}
}


map<string, ZC::StageAxis*> Stage::GetAxes()
{
	map<string, ZC::StageAxis*> axes;
	for (map<string, StageAxis*>::const_iterator it = axesByName_.begin(); it != axesByName_.end(); ++it)
	{
		axes[it->first] = it->second;
	}
	return axes;
}


map<string, double> Stage::GetPosition()
{
	map<string, double> position;
	for (map<string, StageAxis*>::const_iterator it = axesByName_.begin(); it != axesByName_.end(); ++it)
	{
		position[it->first] = it->second->GetPosition();
	}
	return position;
}


map<string, ZC::AxisLimits> Stage::GetLimits()
{
	map<string, ZC::AxisLimits> limits;
	for (map<string, StageAxis*>::const_iterator it = axesByName_.begin(); it != axesByName_.end(); ++it)
	{
		limits[it->first] = it->second->GetLimits();
	}
	return limits;
}


void Stage::MoveBy(const map<string, double>& delta)
{
	CheckMoveTargets(delta);

	SerialBus::ScopedLock lock = channel_.GetBus().Lock();
	for (map<string, double>::const_iterator it = delta.begin(); it != delta.end(); ++it)
	{
		FindAxis(it->first).MoveBy(it->second);
	}
}


void Stage::MoveTo(const map<string, double>& position)
{
	CheckMoveTargets(position);

	SerialBus::ScopedLock lock = channel_.GetBus().Lock();
	for (map<string, double>::const_iterator it = position.begin(); it != position.end(); ++it)
	{
		FindAxis(it->first).MoveTo(it->second);
	}
}
