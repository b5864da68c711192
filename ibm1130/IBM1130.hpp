//++
// IBM1130.hpp -> Global declarations for the IBM 1130 emulator project
//
//   COPYRIGHT (C) 2025 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the IBM1130 emulator project. IBM1130 is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    IBM1130 is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with IBM1130.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   This file contains global constants, universal macros, and a very few
// global objects ...
//
// REVISION HISTORY:
//  3-MAR-25  RLA   Adapted from SBC6120.
//--
#pragma once
#include <stdint.h>               // uint8_t, int32_t, and much more ...

// Program name and version ...
#define PROGRAM      "IBM1130"    // used in prompts and error messages 
#define IBMVER               1    // version number of this release

// IBM 1130 peripherals ...
#define KEYBOARD_DEVICE_CODE  1   // 1131 console keyboard
#define PRINTER_DEVICE_CODE   2   // 1131 console printer
#define READER_DEVICE_CODE    9   // 2501 card reader
#define CONSOLE_LEVEL         4   // console keyboard and printer interrupt level
#define READER_LEVEL          4   // 2501 card reader interrupt level

//   These pointers reference the major parts of the IBM 1130 system being
// emulated - CPU, memory, interrupts and peripherals.  They're all declared
// in the IBM1130 cpp file and are used by the host program.
extern class CGenericMemory     *g_pMemory;     // 1130 core memory
extern class CPriorityInterrupt *g_pInterrupt;  // six level interrupt system
extern class C1130              *g_pCPU;        // 1130 CPU
extern class CKeyboard          *g_pKeyboard;   // console keyboard
extern class CPrinter           *g_pPrinter;    // console printer
extern class CCardReader        *g_pReader;     // 2501 card reader
