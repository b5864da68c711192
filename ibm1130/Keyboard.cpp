//++
// Keyboard.cpp - IBM 1130 console keyboard implementation
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
//   The console keyboard is device code 1 and interrupts on level 4.  The
// host "types" characters with Type() and they wait in a queue until the
// program reads them.  Each character typed requests an interrupt with ILSW
// bit 0 set, assuming keyboard interrupts are enabled.
//
//      Function      Action
//      ------------  ----------------------------------------------------
//      Read          MEM(WCA) <- next character (no data if none waiting)
//      Control       enable interrupts if modifier bit 0x01 is set,
//                    otherwise disable them
//      Sense Device  ACC <- DSW (0x0001 character ready, 0x0002 busy)
//
//   Interrupts are enabled after a reset, the same as the SBC6120 console.
//
// REVISION HISTORY:
// dd-mmm-yy    who     description
//  3-MAR-25    RLA     Adapted from the SBC6120 SLU.
//--
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <ctype.h>              // isprint() ...
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CMemory interface
#include "Interrupt.hpp"        // CPriorityInterrupt definitions
#include "Device.hpp"           // generic device definitions
#include "IBM1130.hpp"          // global declarations for this project
#include "Keyboard.hpp"         // declarations for this module


CKeyboard::CKeyboard (address_t nDevice)
  : CDevice("KBD", "1131", "Console Keyboard", nDevice,
            IOCC_MASK(IOCC_READ) | IOCC_MASK(IOCC_CONTROL) | IOCC_MASK(IOCC_SENSE_DEVICE))
{
  m_fIEN = true;
}

void CKeyboard::ClearDevice()
{
  //++
  //   A reset enables interrupts and cancels any that are queued, but the
  // characters already typed stay put ...
  //--
  m_fIEN = true;
  CDevice::ClearDevice();
}

word_t CKeyboard::GetDSW() const
{
  return IsReady() ? DSW_READY : 0;
}

void CKeyboard::Type (char ch)
{
  //++
  //   Add one character to the input queue and, if interrupts are enabled,
  // request a keyboard interrupt ...
  //--
  m_queInput.push_back((word_t) (uint8_t) ch);
  if (m_fIEN) RequestInterrupt(ILSW_KEYBOARD);
}

void CKeyboard::Type (const string &str)
{
  for (string::const_iterator it = str.begin();  it != str.end();  ++it)  Type(*it);
}

CDevice::IOCC_STATUS CKeyboard::DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC)
{
  //++
  //   Handle all keyboard IOCCs.  Note that nothing is changed until we're
  // sure the operation will succeed ...
  //--
  switch (iocc.nFunction) {

    case IOCC_READ:
      // Store the next character at the WCA ...
      if (m_queInput.empty()) return IOCC_NO_DATA;
      if (!pMemory->IsValid(iocc.wWCA)) return IOCC_BAD_ADDRESS;
      pMemory->CPUwrite(iocc.wWCA, m_queInput.front());
      m_queInput.pop_front();
      return IOCC_OK;

    case IOCC_CONTROL:
      // Enable or disable interrupts ...
      m_fIEN = ISSET(iocc.bModifiers, CTL_ENABLE);
      return IOCC_OK;

    case IOCC_SENSE_DEVICE:
      wACC = GetDSW();
      return IOCC_OK;

    default:
      // Anything else is unimplemented!
      return IOCC_UNSUPPORTED;
  }
}

void CKeyboard::ShowDevice (ostringstream &ofs) const
{
  //++
  // Show the keyboard status for debugging ...
  //--
  CDevice::ShowDevice(ofs);
  ofs << FormatString(" IEN=%d pending=%d", m_fIEN, (int) m_queInput.size());
  if (!m_queInput.empty() && isprint(m_queInput.front()))
    ofs << FormatString(" (\"%c\")", (char) m_queInput.front());
  ofs << std::endl;
}
