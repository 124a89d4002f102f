///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCDevice - Device contracts
//-----------------------------------------------------------------------------
// DESCRIPTION:   Class with utility methods for building logical devices
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

#pragma once

#include "ZCDeviceConstants.h"
#include <vector>
#include <string>

class CDeviceUtils
{
public:
   static void Tokenize(const std::string& str, std::vector<std::string>& tokens, const std::string& delimiters = ",");
   static std::string Trim(const std::string& str);
   static bool ParseLong(const std::string& str, long& value);
   static std::string EscapeControlChars(const std::string& str);
   static const char* KindName(ZC::DeviceKind kind);
};
