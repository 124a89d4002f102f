///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
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

#pragma once

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>


/// Core error class. Exceptions thrown by the chain are of this type.
/**
 * Error instances have a message and a code (defined in ErrorCodes.h). An
 * error may also wrap an underlying error that caused it, forming a chain
 * that getFullMsg() renders in full.
 */
class CZCError : public std::exception
{
public:
   typedef int Code;

   /// Construct with a message and optional code.
   CZCError(const std::string& msg, Code code = ZCERR_GENERIC);

   /// Construct with a message and optional code.
   CZCError(const char* msg, Code code = ZCERR_GENERIC);

   /// Construct with a message, code and underlying (chained) error.
   CZCError(const std::string& msg, Code code, const CZCError& underlyingError);

   CZCError(const CZCError& other);
   CZCError& operator=(const CZCError& rhs);

   virtual ~CZCError() {}

   virtual const char* what() const noexcept { return message_.c_str(); }

   /// Get the error message for this error (not including any underlying error).
   virtual std::string getMsg() const;

   /// Get the messages of this error and all underlying errors.
   virtual std::string getFullMsg() const;

   /// Get the error code for this error.
   virtual Code getCode() const { return code_; }

   /// Get the underlying error, or null if there is none.
   virtual const CZCError* getUnderlyingError() const { return underlying_.get(); }

private:
   std::string message_;
   Code code_;
   std::unique_ptr<CZCError> underlying_;
};
