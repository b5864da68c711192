//++
// Keyboard.hpp - IBM 1130 console keyboard definitions
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
#include <deque>                // C++ std::deque template
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // generic device definitions
#include "IBM1130.hpp"          // device codes and levels
using std::string;              // ...
using std::deque;               // ...


class CKeyboard : public CDevice {
  //++
  // IBM 1130 console keyboard emulation ...
  //--

  // Registers and bits ...
public:
  enum {
    DSW_READY     = 0x0001,     // a character is waiting
    DSW_BUSY      = 0x0002,     // keyboard is busy
    ILSW_KEYBOARD = 0x8000,     // ILSW bit for a keyboard interrupt
    CTL_ENABLE    = 0x01,       // Control modifier - enable interrupts
  };

  // Constructor and destructor ...
public:
  CKeyboard (address_t nDevice=KEYBOARD_DEVICE_CODE);
  virtual ~CKeyboard() {};
private:
  // Disallow copy and assignments!
  CKeyboard (const CKeyboard&) = delete;
  CKeyboard& operator= (CKeyboard const &) = delete;

  // CKeyboard device methods from CDevice ...
public:
  virtual void ClearDevice() override;
  virtual word_t GetDSW() const override;
  virtual void ShowDevice (ostringstream &ofs) const override;
protected:
  virtual IOCC_STATUS DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC) override;

  // CKeyboard public methods ...
public:
  // Type one character or a whole string ...
  void Type (char ch);
  void Type (const string &str);
  // Return the number of characters waiting ...
  size_t GetPending() const {return m_queInput.size();}
  bool IsReady() const {return !m_queInput.empty();}
  // Keyboard interrupt enable ...
  bool IsInterruptEnabled() const {return m_fIEN;}

protected:
  // Keyboard member variables ...
  bool          m_fIEN;         // TRUE to interrupt when a key is typed
  deque<word_t> m_queInput;     // characters typed but not yet read
};
