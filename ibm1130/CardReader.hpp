//++
// CardReader.hpp - IBM 2501 card reader definitions
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
//  3-MAR-25    RLA     New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <deque>                // C++ std::deque template
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // generic device definitions
#include "IBM1130.hpp"          // device codes and levels
using std::string;              // ...
using std::vector;              // ...
using std::deque;               // ...


class CCardReader : public CDevice {
  //++
  // IBM 2501 card reader emulation ...
  //--

  // Registers and bits ...
public:
  enum {
    CARD_COLUMNS  = 80,         // columns (words) on a card
    DSW_LAST_CARD = 0x1000,     // the card just read was the last one
    DSW_COMPLETE  = 0x0800,     // operation complete
    DSW_BUSY      = 0x0002,     // read in progress
    DSW_NOT_READY = 0x0001,     // hopper empty
    ILSW_READER   = 0x1000,     // ILSW bit for a 2501 interrupt
    SENSE_RESET   = 0x01,       // Sense Device modifier - reset DSW bits
  };
  typedef vector<word_t> CARD;

  // Constructor and destructor ...
public:
  CCardReader (address_t nDevice=READER_DEVICE_CODE);
  virtual ~CCardReader() {};
private:
  // Disallow copy and assignments!
  CCardReader (const CCardReader&) = delete;
  CCardReader& operator= (CCardReader const &) = delete;

  // CCardReader device methods from CDevice ...
public:
  virtual void ClearDevice() override;
  virtual word_t GetDSW() const override;
  virtual bool IsBusy() const override {return m_fBusy;}
  virtual void ShowDevice (ostringstream &ofs) const override;
protected:
  virtual IOCC_STATUS DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC) override;

  // CCardReader public methods ...
public:
  // Put one card (padded or truncated to 80 columns) in the hopper ...
  void LoadCard (const CARD &card);
  //   Load a deck from a text file, one card per line.  Returns the number of
  // cards loaded or -1 if the file can't be read ...
  int32_t LoadDeck (string sFileName);
  // Return the number of cards in the hopper, or empty it ...
  size_t GetCardCount() const {return m_queHopper.size();}
  bool IsHopperEmpty() const {return m_queHopper.empty();}
  void EmptyHopper() {m_queHopper.clear();}
  // Return the status bits ...
  bool IsComplete() const {return m_fComplete;}
  bool IsLastCard() const {return m_fLastCard;}

  // Private methods ...
private:
  static int32_t FileError (string sFileName, const char *pszMsg, int nError=0);

protected:
  // Card reader member variables ...
  deque<CARD>   m_queHopper;    // cards waiting to be read
  bool          m_fComplete;    // operation complete
  bool          m_fLastCard;    // last card read
  bool          m_fBusy;        // read in progress
};
