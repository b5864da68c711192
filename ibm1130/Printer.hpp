//++
// Printer.hpp - IBM 1130 console printer definitions
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
// REVISION HISTORY:
// dd-mmm-yy    who     description
//  3-MAR-25    RLA     Adapted from the SBC6120 SLU.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // generic device definitions
#include "IBM1130.hpp"          // device codes and levels
using std::string;              // ...


class CPrinter : public CDevice {
  //++
  // IBM 1130 console printer emulation ...
  //--

  // Registers and bits ...
public:
  enum {
    DSW_READY     = 0x0001,     // printer is ready for another character
    ILSW_PRINTER  = 0x4000,     // ILSW bit for a printer interrupt
    CTL_ENABLE    = 0x01,       // Control modifier - enable interrupts
  };

  // Constructor and destructor ...
public:
  CPrinter (address_t nDevice=PRINTER_DEVICE_CODE);
  virtual ~CPrinter() {};
private:
  // Disallow copy and assignments!
  CPrinter (const CPrinter&) = delete;
  CPrinter& operator= (CPrinter const &) = delete;

  // CPrinter device methods from CDevice ...
public:
  virtual void ClearDevice() override;
  virtual word_t GetDSW() const override {return DSW_READY;}
  virtual void ShowDevice (ostringstream &ofs) const override;
protected:
  virtual IOCC_STATUS DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC) override;

  // CPrinter public methods ...
public:
  // Return or discard everything printed so far ...
  const string &GetOutput() const {return m_sOutput;}
  void ClearOutput() {m_sOutput.clear();}
  // Printer interrupt enable ...
  bool IsInterruptEnabled() const {return m_fIEN;}

protected:
  // Printer member variables ...
  bool     m_fIEN;              // TRUE to interrupt when a character is done
  string   m_sOutput;           // everything printed
};
