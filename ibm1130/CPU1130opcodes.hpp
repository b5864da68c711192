//++
// CPU1130opcodes.hpp -> IBM 1130 opcodes, decoder and disassembler
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
//    This file contains the IBM 1130 opcodes and instruction fields, and the
// function prototypes for the instruction decoder and disassembler ...
//
// REVISION HISTORY:
//  3-MAR-25  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include "MemoryTypes.h"        // address_t and word_t data types
using std::string;              // ...

//++
//   Instruction fields.  The 1130 numbers bits from the left, so the opcode
// is bits 0-4, F (long format) is bit 5, T (the index register tag) is bits
// 6-7 and the displacement is bits 8-15.  In long format instructions bit 8
// is IA (indirect address) instead ...
//--
#define IR_OPCODE     0xF800    // opcode field
#define IR_FORMAT     0x0400    // long (two word) format
#define IR_TAG        0x0300    // index register tag
#define IR_INDIRECT   0x0080    // indirect addressing (long format only)
#define IR_DISP       0x00FF    // displacement or modifier bits
#define IR_SHIFT      0x00C0    // shift type bits (shift instructions)
#define IR_COUNT      0x003F    // shift count (shift instructions)

// Load and store ...
#define OP_LD       0xC000      // ACC <= MEM(EA)
#define OP_LDD      0xC800      // ACC,EXT <= MEM(EA),MEM(EA+1)
#define OP_STO      0xD000      // MEM(EA) <= ACC
#define OP_STD      0xD800      // MEM(EA),MEM(EA+1) <= ACC,EXT
#define OP_LDX      0x6000      // XR <= DISP (short) or MEM(EA) (long)
#define OP_STX      0x6800      // MEM(EA) <= XR
#define OP_LDS      0x2000      // C,V <= DISP bits 14-15
#define OP_STS      0x2800      // MEM(EA) bits 14-15 <= C,V
// Arithmetic ...
#define OP_A        0x8000      // ACC <= ACC + MEM(EA)
#define OP_AD       0x8800      // ACC,EXT <= ACC,EXT + MEM(EA),MEM(EA+1)
#define OP_S        0x9000      // ACC <= ACC - MEM(EA)
#define OP_SD       0x9800      // ACC,EXT <= ACC,EXT - MEM(EA),MEM(EA+1)
#define OP_M        0xA000      // ACC,EXT <= ACC * MEM(EA)
#define OP_D        0xA800      // ACC <= ACC,EXT / MEM(EA), EXT <= remainder
// Logical ...
#define OP_AND      0xE000      // ACC <= ACC & MEM(EA)
#define OP_OR       0xE800      // ACC <= ACC | MEM(EA)
#define OP_EOR      0xF000      // ACC <= ACC ^ MEM(EA)
// Shifts (the shift type is in bits 8-9 of the instruction) ...
#define OP_SL       0x1000      // all shift left instructions
#define OP_SR       0x1800      // all shift right instructions
#define OP_SLA      0x1000      // shift ACC left
#define OP_SLCA     0x1040      // shift ACC left and count
#define OP_SLT      0x1080      // shift ACC,EXT left
#define OP_SLC      0x10C0      // shift ACC,EXT left and count
#define OP_SRA      0x1800      // shift ACC right (arithmetic)
#define OP_SRT      0x1880      // shift ACC,EXT right
#define OP_RTE      0x18C0      // rotate ACC,EXT right
// Branches and skips ...
#define OP_BSI      0x4000      // branch and store IAR
#define OP_BSC      0x4800      // branch or skip on condition
#define OP_MDX      0x7000      // modify index and skip
// Everything else ...
#define OP_XIO      0x0800      // execute I/O
#define OP_WAIT     0x3000      // wait (halt)

// Condition bits for BSC and BSI ...
#define COND_ZERO       0x20    // ACC is zero
#define COND_MINUS      0x10    // ACC is negative
#define COND_PLUS       0x08    // ACC is positive (and not zero)
#define COND_EVEN       0x04    // ACC bit 15 is zero
#define COND_CARRY_OFF  0x02    // carry is reset
#define COND_OVFL_OFF   0x01    // overflow is reset (and reset it!)
#define COND_BOSC       0x40    // branch out of interrupt level (long BSC)

// Opcode argument types ...
enum _OP_ARG_TYPES {
  OP_NONE,          // no operand (WAIT)
  OP_MRI,           // memory reference - short or long, tag, displacement
  OP_SHIFT,         // shift - count or index register
  OP_STATUS,        // LDS - carry and overflow bits
  OP_COND,          // BSC, BSI - address and condition bits
  OP_INDEX,         // LDX, STX, MDX - tag selects the register
};
typedef enum _OP_ARG_TYPES OP_ARG_TYPE;

// Opcode definitions for the decoder and disassembler ...
struct _OPCODE {
  const char   *pszName;        // the mnemonic for the opcode
  word_t        wOpcode;        // the actual opcode
  word_t        wMask;          // mask of significant bits
  OP_ARG_TYPE   nType;          // argument/operand for this opcode
  bool          fLong;          // TRUE if a long format exists
};
typedef struct _OPCODE OPCODE;

//++
//   This is the result of decoding one instruction.  Everything here comes
// straight from the bit fields of the instruction word(s) - no memory is
// referenced and no registers are used.
//--
struct _DECODED {
  const OPCODE *pOpcode;        // opcode table entry
  word_t        wOpcode;        // opcode (i.e. OP_xyz)
  bool          fLong;          // TRUE for a two word instruction
  uint8_t       nTag;           // index register tag (0..3)
  uint8_t       bModifiers;     // bits 8-15 of the first word
  word_t        wDisplacement;  // second word (long) or bits 8-15 (short)
  bool          fIndirect;      // indirect addressing (long format only)
};
typedef struct _DECODED DECODED;

// Look up the opcode table entry for an instruction word ...
extern const OPCODE *LookupOpcode (word_t wInstruction);
// Return TRUE if this instruction word needs a second word ...
extern bool IsLongInstruction (word_t wInstruction);
// Decode one instruction (wWord1 is ignored for short instructions) ...
extern bool DecodeInstruction (word_t wWord0, word_t wWord1, DECODED &decoded);
// Disassemble one instruction ...
extern string Disassemble (const DECODED &decoded);
extern string Disassemble (word_t wWord0, word_t wWord1=0);
