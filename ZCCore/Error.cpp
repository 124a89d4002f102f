///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception class for chain errors
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "Error.h"


CZCError::CZCError(const std::string& msg, Code code) :
   message_(msg),
   code_(code)
{}


CZCError::CZCError(const char* msg, Code code) :
   message_(msg ? msg : "(null message)"),
   code_(code)
{}


CZCError::CZCError(const std::string& msg, Code code, const CZCError& underlyingError) :
   message_(msg),
   code_(code),
   underlying_(new CZCError(underlyingError))
{}


CZCError::CZCError(const CZCError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ? new CZCError(*other.underlying_) : 0)
{}


CZCError&
CZCError::operator=(const CZCError& rhs)
{
   if (this == &rhs)
      return *this;
   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ? new CZCError(*rhs.underlying_) : 0);
   return *this;
}


std::string
CZCError::getMsg() const
{
   if (!message_.empty())
      return message_;

   if (code_ == ZCERR_OK)
      return "No error";
   return "Error (code " + std::to_string(code_) + ")";
}


std::string
CZCError::getFullMsg() const
{
   if (underlying_)
      return getMsg() + " [ " + underlying_->getFullMsg() + " ]";
   return getMsg();
}
