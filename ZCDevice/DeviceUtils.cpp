///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.cpp
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

#include "DeviceUtils.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace ZC {
   const char* const g_Keyword_Stage = "Stage";
   const char* const g_Keyword_FilterWheel = "FilterWheel";
}

/**
 * Splits a string into tokens. Consecutive delimiters do not produce empty
 * tokens.
 */
void CDeviceUtils::Tokenize(const std::string& str, std::vector<std::string>& tokens, const std::string& delimiters)
{
   // Skip delimiters at beginning.
   std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
   // Find first "non-delimiter".
   std::string::size_type pos = str.find_first_of(delimiters, lastPos);

   while (std::string::npos != pos || std::string::npos != lastPos)
   {
      tokens.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = str.find_first_not_of(delimiters, pos);
      pos = str.find_first_of(delimiters, lastPos);
   }
}

std::string CDeviceUtils::Trim(const std::string& str)
{
   const char* ws = " \t\r\n";
   std::string::size_type first = str.find_first_not_of(ws);
   if (first == std::string::npos)
      return std::string();
   std::string::size_type last = str.find_last_not_of(ws);
   return str.substr(first, last - first + 1);
}

/**
 * Parses a complete decimal integer: an optional '-' followed by digits.
 * Whitespace, a '+' sign, trailing characters, an empty string, or a value
 * that does not fit in a long are all rejected.
 */
bool CDeviceUtils::ParseLong(const std::string& str, long& value)
{
   std::string::size_type firstDigit = (!str.empty() && str[0] == '-') ? 1 : 0;
   if (firstDigit >= str.size() ||
         !std::isdigit(static_cast<unsigned char>(str[firstDigit])))
      return false;

   const char* begin = str.c_str();
   char* end = 0;
   errno = 0;
   long result = std::strtol(begin, &end, 10);
   if (end == begin || *end != '\0' || errno == ERANGE)
      return false;

   value = result;
   return true;
}

// For logging wire traffic
std::string CDeviceUtils::EscapeControlChars(const std::string& str)
{
   std::string result;
   result.reserve(str.size());
   for (std::string::const_iterator it = str.begin(); it != str.end(); ++it)
   {
      switch (*it)
      {
         case '\r': result += "\\r"; break;
         case '\n': result += "\\n"; break;
         case '\t': result += "\\t"; break;
         default:
            if (static_cast<unsigned char>(*it) < 0x20)
            {
               char buf[8];
               std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(*it));
               result += buf;
            }
            else
            {
               result += *it;
            }
      }
   }
   return result;
}

const char* CDeviceUtils::KindName(ZC::DeviceKind kind)
{
   switch (kind)
   {
      case ZC::StageKind: return ZC::g_Keyword_Stage;
      case ZC::FilterWheelKind: return ZC::g_Keyword_FilterWheel;
      case ZC::UnknownKind: return "Unknown";
   }
   return "Invalid";
}
