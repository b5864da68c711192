//++
// Printer.cpp - IBM 1130 console printer implementation
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
//   The console printer is device code 2 and interrupts on level 4.  There's
// no simulated print time here - every character is "printed" immediately
// by appending it to an output buffer that the host can read later.
//
//      Function      Action
//      ------------  ----------------------------------------------------
//      Write         print the low byte of MEM(WCA)
//      Control       enable interrupts if modifier bit 0x01 is set,
//                    otherwise disable them
//      Sense Device  ACC <- DSW (0x0001 ready, which is always true)
//
//   Unlike the keyboard, printer interrupts are disabled after a reset.
// When they're enabled, every Write requests an interrupt with ILSW bit 1.
//
// REVISION HISTORY:
// dd-mmm-yy    who     description
//  3-MAR-25    RLA     Adapted from the SBC6120 SLU.
//--
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
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
#include "Printer.hpp"          // declarations for this module


CPrinter::CPrinter (address_t nDevice)
  : CDevice("PRT", "1131", "Console Printer", nDevice,
            IOCC_MASK(IOCC_WRITE) | IOCC_MASK(IOCC_CONTROL) | IOCC_MASK(IOCC_SENSE_DEVICE))
{
  m_fIEN = false;
}

void CPrinter::ClearDevice()
{
  //++
  // Disable interrupts but don't throw away the output ...
  //--
  m_fIEN = false;
  CDevice::ClearDevice();
}

CDevice::IOCC_STATUS CPrinter::DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC)
{
  //++
  // Handle all printer IOCCs ...
  //--
  switch (iocc.nFunction) {

    case IOCC_WRITE:
      // Print the low byte of the word at the WCA ...
      if (!pMemory->IsValid(iocc.wWCA)) return IOCC_BAD_ADDRESS;
      m_sOutput.push_back((char) LOBYTE(pMemory->CPUread(iocc.wWCA)));
      if (m_fIEN) RequestInterrupt(ILSW_PRINTER);
      return IOCC_OK;

    case IOCC_CONTROL:
      m_fIEN = ISSET(iocc.bModifiers, CTL_ENABLE);
      return IOCC_OK;

    case IOCC_SENSE_DEVICE:
      wACC = GetDSW();
      return IOCC_OK;

    default:
      return IOCC_UNSUPPORTED;
  }
}

void CPrinter::ShowDevice (ostringstream &ofs) const
{
  CDevice::ShowDevice(ofs);
  ofs << FormatString(" IEN=%d printed=%d", m_fIEN, (int) m_sOutput.size());
  ofs << std::endl;
}
