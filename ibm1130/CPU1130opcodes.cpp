//++
// CPU1130opcodes.cpp -> IBM 1130 instruction decoder and disassembler
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
//   This file contains a table of ASCII mnemonics for the IBM 1130 opcodes,
// the instruction decoder used by the CPU, and a one line disassembler.
//
//   Decoding is entirely table driven.  Every instruction word is matched
// against the table in order and the first entry where
//
//      (wInstruction & wMask) == wOpcode
//
// is the one.  Most entries care only about the five opcode bits, but the
// shifts also look at bits 8-9 to tell SLA from SLT, etc.  Anything that
// doesn't match is an invalid opcode.  Note that SRA with shift type 01 is
// deliberately missing from the table!
//
//   The disassembler output looks more or less like 1130 assembler source -
//
//      LD   L  /0105         long format, no indexing
//      A    1  /10           short format, XR1
//      BSC  L  /0200,Z-      branch unless zero or minus
//      SLA     4             shift count
//
// REVISION HISTORY:
//  3-MAR-25  RLA  New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "CPU1130opcodes.hpp"   // declarations for this module

// IBM 1130 opcode definitions ...
PRIVATE const OPCODE g_aOpcodes[] = {
  // Load and store ...
  {"LD",    OP_LD,    IR_OPCODE,          OP_MRI,    true },
  {"LDD",   OP_LDD,   IR_OPCODE,          OP_MRI,    true },
  {"STO",   OP_STO,   IR_OPCODE,          OP_MRI,    true },
  {"STD",   OP_STD,   IR_OPCODE,          OP_MRI,    true },
  {"LDX",   OP_LDX,   IR_OPCODE,          OP_INDEX,  true },
  {"STX",   OP_STX,   IR_OPCODE,          OP_INDEX,  true },
  {"LDS",   OP_LDS,   IR_OPCODE,          OP_STATUS, false},
  {"STS",   OP_STS,   IR_OPCODE,          OP_MRI,    true },
  // Arithmetic ...
  {"A",     OP_A,     IR_OPCODE,          OP_MRI,    true },
  {"AD",    OP_AD,    IR_OPCODE,          OP_MRI,    true },
  {"S",     OP_S,     IR_OPCODE,          OP_MRI,    true },
  {"SD",    OP_SD,    IR_OPCODE,          OP_MRI,    true },
  {"M",     OP_M,     IR_OPCODE,          OP_MRI,    true },
  {"D",     OP_D,     IR_OPCODE,          OP_MRI,    true },
  // Logical ...
  {"AND",   OP_AND,   IR_OPCODE,          OP_MRI,    true },
  {"OR",    OP_OR,    IR_OPCODE,          OP_MRI,    true },
  {"EOR",   OP_EOR,   IR_OPCODE,          OP_MRI,    true },
  // Shifts ...
  {"SLA",   OP_SLA,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"SLCA",  OP_SLCA,  IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"SLT",   OP_SLT,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"SLC",   OP_SLC,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"SRA",   OP_SRA,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"SRT",   OP_SRT,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  {"RTE",   OP_RTE,   IR_OPCODE|IR_SHIFT, OP_SHIFT,  false},
  // Branches and skips ...
  {"BSI",   OP_BSI,   IR_OPCODE,          OP_COND,   true },
  {"BSC",   OP_BSC,   IR_OPCODE,          OP_COND,   true },
  {"MDX",   OP_MDX,   IR_OPCODE,          OP_INDEX,  true },
  // Miscellaneous ...
  {"XIO",   OP_XIO,   IR_OPCODE,          OP_MRI,    true },
  {"WAIT",  OP_WAIT,  IR_OPCODE,          OP_NONE,   false},
};
#define OPCOUNT (sizeof(g_aOpcodes)/sizeof(OPCODE))


PUBLIC const OPCODE *LookupOpcode (word_t wInstruction)
{
  //++
  //   Search the opcode table for the entry that matches this instruction
  // word and return a pointer to it, or NULL if the opcode is invalid ...
  //--
  for (size_t i = 0;  i < OPCOUNT;  ++i) {
    if ((wInstruction & g_aOpcodes[i].wMask) == g_aOpcodes[i].wOpcode)
      return &g_aOpcodes[i];
  }
  return NULL;
}

PUBLIC bool IsLongInstruction (word_t wInstruction)
{
  //++
  //   Return TRUE if this instruction occupies two words.  That's only when
  // the F bit is set AND the opcode has a long format.  The F bit is simply
  // ignored for opcodes that don't (e.g. shifts, LDS and WAIT).
  //--
  if (!ISSET(wInstruction, IR_FORMAT)) return false;
  const OPCODE *pOpcode = LookupOpcode(wInstruction);
  return (pOpcode != NULL) && pOpcode->fLong;
}

PUBLIC bool DecodeInstruction (word_t wWord0, word_t wWord1, DECODED &decoded)
{
  //++
  //   Decode the bit fields of an instruction.  The second word is used only
  // if this turns out to be a long format instruction.  Returns FALSE (and
  // decoded is undefined) if the opcode is invalid ...
  //--
  const OPCODE *pOpcode = LookupOpcode(wWord0);
  if (pOpcode == NULL) return false;
  decoded.pOpcode = pOpcode;
  decoded.wOpcode = pOpcode->wOpcode;
  decoded.fLong = pOpcode->fLong && ISSET(wWord0, IR_FORMAT);
  decoded.nTag = (uint8_t) ((wWord0 & IR_TAG) >> 8);
  decoded.bModifiers = LOBYTE(wWord0);
  if (decoded.fLong) {
    decoded.wDisplacement = wWord1;
    decoded.fIndirect = ISSET(wWord0, IR_INDIRECT);
  } else {
    decoded.wDisplacement = wWord0 & IR_DISP;
    decoded.fIndirect = false;
  }
  return true;
}

PRIVATE string DecodeConditions (uint8_t bModifiers)
{
  //++
  // Convert the BSC/BSI condition bits to the assembler letters ...
  //--
  string sCond;
  if (ISSET(bModifiers, COND_ZERO))      sCond += "Z";
  if (ISSET(bModifiers, COND_MINUS))     sCond += "-";
  if (ISSET(bModifiers, COND_PLUS))      sCond += "+";
  if (ISSET(bModifiers, COND_EVEN))      sCond += "E";
  if (ISSET(bModifiers, COND_CARRY_OFF)) sCond += "C";
  if (ISSET(bModifiers, COND_OVFL_OFF))  sCond += "O";
  return sCond;
}

PRIVATE string FormatField (const DECODED &decoded)
{
  //++
  //   Return the format/tag field - "L" or "I" for long or indirect, plus
  // the tag digit if the tag isn't zero ...
  //--
  string sField;
  if (decoded.fLong) sField = decoded.fIndirect ? "I" : "L";
  if (decoded.nTag != 0) sField += (char) ('0' + decoded.nTag);
  return sField;
}

PUBLIC string Disassemble (const DECODED &decoded)
{
  //++
  //   Convert a decoded instruction to a string, more or less the way the
  // 1130 assembler would have written it ...
  //--
  const OPCODE *pOpcode = decoded.pOpcode;
  assert(pOpcode != NULL);
  string sField = FormatField(decoded);
  switch (pOpcode->nType) {
    case OP_NONE:
      return string(pOpcode->pszName);

    case OP_STATUS:
      return FormatString("%-4s    %d", pOpcode->pszName, decoded.bModifiers & 3);

    case OP_SHIFT:
      // Either a count or the index register that holds it ...
      if (decoded.nTag != 0)
        return FormatString("%-4s %-2s", pOpcode->pszName, sField.c_str());
      return FormatString("%-4s    %d", pOpcode->pszName, decoded.bModifiers & IR_COUNT);

    case OP_COND:
      if (decoded.fLong) {
        string sCond = DecodeConditions(decoded.bModifiers);
        const char *pszName = pOpcode->pszName;
        if ((decoded.wOpcode == OP_BSC) && ISSET(decoded.bModifiers, COND_BOSC)) pszName = "BOSC";
        if (sCond.empty())
          return FormatString("%-4s %-2s /%04X", pszName, sField.c_str(), decoded.wDisplacement);
        return FormatString("%-4s %-2s /%04X,%s", pszName, sField.c_str(), decoded.wDisplacement, sCond.c_str());
      }
      // Short BSC is a skip and has no address at all ...
      if (decoded.wOpcode == OP_BSC)
        return FormatString("%-4s %-2s %s", pOpcode->pszName, sField.c_str(), DecodeConditions(decoded.bModifiers).c_str());
      return FormatString("%-4s %-2s /%02X", pOpcode->pszName, sField.c_str(), decoded.wDisplacement);

    case OP_INDEX:
      // MDX L with no tag adds the modifier byte to memory ...
      if ((decoded.wOpcode == OP_MDX) && decoded.fLong && (decoded.nTag == 0))
        return FormatString("%-4s %-2s /%04X,%d", pOpcode->pszName, sField.c_str(), decoded.wDisplacement, SIGNEX8(decoded.bModifiers));
      if ((decoded.wOpcode == OP_MDX) && !decoded.fLong && (decoded.nTag == 0) && (decoded.wDisplacement == 0))
        return string("NOP");
      // Fall thru ...

    case OP_MRI:
      if (decoded.fLong)
        return FormatString("%-4s %-2s /%04X", pOpcode->pszName, sField.c_str(), decoded.wDisplacement);
      return FormatString("%-4s %-2s /%02X", pOpcode->pszName, sField.c_str(), decoded.wDisplacement);
  }

  // We should never get here, but ...
  return FormatString("/%04X", decoded.wDisplacement);
}

PUBLIC string Disassemble (word_t wWord0, word_t wWord1)
{
  //++
  //   Decode and disassemble one instruction.  An invalid opcode is shown
  // as a DC (define constant) of the word ...
  //--
  DECODED decoded;
  if (!DecodeInstruction(wWord0, wWord1, decoded))
    return FormatString("DC      /%04X", wWord0);
  return Disassemble(decoded);
}
