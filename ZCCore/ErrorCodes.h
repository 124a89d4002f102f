///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Error codes carried by CZCError
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

#define ZCERR_OK                       0
#define ZCERR_GENERIC                  1

// Wire protocol
#define ZCERR_MalformedFrame           2
#define ZCERR_NotADevice               3
#define ZCERR_AddressMismatch          4
#define ZCERR_CommandRejected          5
#define ZCERR_BadReply                 6

// Caller input, checked before any wire traffic
#define ZCERR_OutOfRange               7
#define ZCERR_InvalidAddress           8
#define ZCERR_UnsupportedDeviceKind    9
#define ZCERR_NotAFilterWheel          10
#define ZCERR_NoSuchDevice             11
#define ZCERR_NoSuchAxis               12

// Environment
#define ZCERR_SerialPortError          13
#define ZCERR_InvalidBaudRate          14
#define ZCERR_InvalidConfiguration     15
#define ZCERR_FileOpenFailed           16
