//++
// MemoryTypes.h -> Emulation dependent data types
//
//   COPYRIGHT (C) 2015-2024 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
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
//   This header defines data types for a memory address and for an
// addressible memory location.  The IBM 1130 is a word addressed machine
// with 16 bit words and (at most) a 16 bit address, so both types here are
// 16 bits wide.
//
// REVISION HISTORY:
// 19-JUN-22  RLA   New file.
// 26-AUG-22  RLA   Change register_t to cpureg_t (because stupid gcc has a
//                    built in definition for register_t!)
//  3-MAR-25  RLA   Default to 16 bit words for the 1130.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...


//++
//   This type holds a memory address.  It's purposely limited to exactly 16
// bits to ensure that address calculation overflows wrap around as expected!
// Effective address arithmetic on the 1130 is always modulo 2^16.
//--
#ifndef ADDRESS_SIZE
#define ADDRESS_SIZE  16
#endif
#define ADDRESS_MASK  ((1UL<<ADDRESS_SIZE)-1)
#define ADDRESS_MAX   ((address_t) ADDRESS_MASK)
#define ADDRESS(x)    ((address_t) ((x) & ADDRESS_MASK))
typedef uint16_t address_t;

//++
//   And this type holds a single addressable memory location.  Most micros
// are byte addressable, but the 1130 (like the PDP-8) is undeniably a word
// addressable machine and every location holds a full 16 bit word.
//--
#ifndef WORD_SIZE
#define WORD_SIZE    16
#endif
#define WORD_MASK   ((1UL<<WORD_SIZE)-1)
#define WORD_MAX    ((word_t) WORD_MASK)
#define WORD(x)     ((word_t) ((x) & WORD_MASK))
#if (WORD_SIZE == 8)
typedef uint8_t word_t;
#else
typedef uint16_t word_t;
#endif

//++
//   The default radix for all messages is hexadecimal.  All the IBM
// documentation uses hex, and so do we.
//--
#ifndef RADIX
#define RADIX     16
#endif

//++
//   This type holds the index of a CPU internal register.  The only real use
// for this type is as an argument for the GetRegister()/SetRegister() et al
// functions.
//--
typedef uint16_t cpureg_t;

//++
//   The uint1_t type is used for all single bit values and uint2_t for the
// two bit tag field.  Both are expected to behave exactly the same as an 8
// bit value and the emulation code is responsible for any masking required.
//--
typedef uint8_t uint1_t;
typedef uint8_t uint2_t;
typedef uint8_t uint3_t;
typedef uint8_t uint5_t;
