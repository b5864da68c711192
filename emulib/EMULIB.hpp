//++
// EMULIB.hpp -> Global declarations for the emulator library
//
//   COPYRIGHT (C) 2015-2020 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the emulator library project.  EMULIB is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    EMULIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with EMULIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   This file contains global constants and universal macros for the emulator
// library.  It's used by all programs.
//
//   Note that IBM numbers the bits in a word from left to right, so that bit
// 0 is the MOST significant bit of a 16 bit word and bit 15 is the least.
// The IBMBITn macros below follow that convention, and the 1130 code uses
// them whenever it's quoting the IBM documentation.
//
// Bob Armstrong <bob@jfcl.com>   [20-MAY-2015]
//
// REVISION HISTORY:
// 20-MAY-15  RLA   New file.
// 15-JAN-20  RLA   Add inline SplitPath(string sPath, ...
//  3-MAR-25  RLA   Add IBM style bit numbers and sign extension macros.
//--
#pragma once
#include <stdint.h>           // uint8_t, int32_t, and much more ...
#include <string>             // C++ std::string class, et al ...
using std::string;            // this is used EVERYWHERE!


// Constants and parameters ...
#define EMUVER       153      // library version number ...

//  These macros are used with fuctions that are outside of a class definition.
// "PRIVATE" methods are local to the source file where they live, and "PUBLIC"
// are global...
#define PRIVATE static
#define PUBLIC

// Bit equates (for convenience) ...
#define BIT0    0x0001
#define BIT1    0x0002
#define BIT2    0x0004
#define BIT3    0x0008
#define BIT4    0x0010
#define BIT5    0x0020
#define BIT6    0x0040
#define BIT7    0x0080
#define BIT8    0x0100
#define BIT9    0x0200
#define BIT10   0x0400
#define BIT11   0x0800
#define BIT12   0x1000
#define BIT13   0x2000
#define BIT14   0x4000
#define BIT15   0x8000

// The same bits, numbered the IBM way (bit 0 is the MSB!) ...
#define IBMBIT(n)   ((uint16_t) (0x8000 >> (n)))

// Extract bytes and words from larger quantities ...
#define LOBYTE(x) 	((uint8_t)  ((x) & 0xFF))
#define HIBYTE(x) 	((uint8_t)  (((x) >> 8) & 0xFF))
#define LOWORD(x) 	((uint16_t) ((x) & 0xFFFF))
#define HIWORD(x)	((uint16_t) (((x) >> 16) & 0xFFFF))

// Assemble and disassemble nibbles, bytes, words and longwords...
#define MASK1(x)        ((x) & 0x01)
#define MASK2(x)        ((x) & 0x03)
#define MASK3(x)        ((x) & 0x07)
#define MASK5(x)        ((x) & 0x1F)
#define MASK6(x)        ((x) & 0x3F)
#define MASK8(x)        ((x) & 0xFF)
#define MASK15(x)       ((x) & 0x7FFF)
#define MASK16(x)       ((x) & 0xFFFF)
#define MASK32(x)       ((x) & 0xFFFFFFFFUL)
#define MKWORD(h,l)	((uint16_t) ((((h) & 0xFF) << 8) | ((l) & 0xFF)))
#define MKLONG(h,l)	((uint32_t) (( (uint32_t) ((h) & 0xFFFF) << 16) | (uint32_t) ((l) & 0xFFFF)))

//   Sign extend an 8 bit or 16 bit quantity.  The results are signed and
// the caller is expected to MASK16() them after doing any arithmetic ...
#define SIGNEX8(x)      ((int16_t) (int8_t) ((x) & 0xFF))
#define SIGNEX16(x)     ((int32_t) (int16_t) ((x) & 0xFFFF))

// Bit set, clear and test macros ...
#define SETBIT(x,b)	x |=  (b)
#define CLRBIT(x,b)	x &= ~(b)
#define CPLBIT(x,b)     x ^=  (b)
#define ISSET(x,b)	(((x) & (b)) != 0)

// Useful arithmetic macros ...
#define MAX(a,b)  ((a) > (b) ? (a) : (b))
#define MIN(a,b)  ((a) < (b) ? (a) : (b))
#define ISODD(a)  (((a) & 1) != 0)
#define ISEVEN(a) (((a) & 1) == 0)

// Useful shorthand for string comparisons ...
#define STREQL(a,b)     (strcmp(a,b) == 0)
#define STRNEQL(a,b,n)  (strncmp(a,b,n) == 0)

//   Define the C++ new operator to use the debug version. This enables tracing
// of memory leaks via _CrtDumpMemoryLeaks(), et al.  It'd be really nice if
// Visual Studio was smart enough to just do this for us, but it isn't ...
#if defined(_DEBUG) && defined(_MSC_VER)
#define DBGNEW new( _CLIENT_BLOCK, __FILE__, __LINE__)
#else
#define DBGNEW new
#endif

// FormatString() ...
extern string FormatString (const char *pszFormat, ...);
extern void FormatString (string &sResult, const char *pszFormat, ...);
