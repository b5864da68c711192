//++
// CardReader.cpp - IBM 2501 card reader implementation
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
//   The 2501 is a block mode card reader - one Initiate Read transfers a
// whole card into memory without any help from the CPU.  It's device code 9
// and it interrupts on level 4 when the read is done.  There's no simulated
// card read time here, so the card is transferred and the operation is
// complete before the XIO even finishes.
//
//      Function       Action
//      -------------  ---------------------------------------------------
//      Initiate Read  MEM(WCA) is the word count (a negative number!) and
//                     the card columns go to MEM(WCA+1) and up.  At most
//                     80 words are transferred.
//      Sense Device   ACC <- DSW.  If modifier bit 0x01 is set, also reset
//                     the last card and complete bits and cancel any
//                     interrupt that hasn't been delivered yet.
//
//   The DSW bits are 0x1000 last card, 0x0800 operation complete, 0x0002
// busy and 0x0001 not ready (hopper empty and no operation complete).
//
//   The hopper is loaded by the host, either one card at a time or from a
// text file with one card per line and the columns in hex, separated by
// commas or blanks.  Anything after a "#" is ignored.  A reset clears the
// status bits but it does NOT empty the hopper.
//
// REVISION HISTORY:
// dd-mmm-yy    who     description
//  3-MAR-25    RLA     New file.
//--
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdio.h>              // fopen(), fgets(), etc ...
#include <errno.h>              // errno ...
#include <string.h>             // strerror(), strchr(), etc ...
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
#include "CardReader.hpp"       // declarations for this module


CCardReader::CCardReader (address_t nDevice)
  : CDevice("CDR", "2501", "Card Reader", nDevice,
            IOCC_MASK(IOCC_INITIATE_READ) | IOCC_MASK(IOCC_SENSE_DEVICE))
{
  m_fComplete = m_fLastCard = m_fBusy = false;
}

void CCardReader::ClearDevice()
{
  //++
  // Reset the status, but leave the cards in the hopper ...
  //--
  m_fComplete = m_fLastCard = m_fBusy = false;
  CDevice::ClearDevice();
}

word_t CCardReader::GetDSW() const
{
  //++
  // Assemble the device status word ...
  //--
  word_t wDSW = 0;
  if (m_fLastCard) wDSW |= DSW_LAST_CARD;
  if (m_fComplete) wDSW |= DSW_COMPLETE;
  if (m_fBusy)     wDSW |= DSW_BUSY;
  if (m_queHopper.empty() && !m_fComplete) wDSW |= DSW_NOT_READY;
  return wDSW;
}

void CCardReader::LoadCard (const CARD &card)
{
  //++
  // Add a card to the end of the hopper.  Short cards are padded with blanks.
  //--
  CARD col(CARD_COLUMNS, 0);
  for (size_t i = 0;  (i < card.size()) && (i < CARD_COLUMNS);  ++i)  col[i] = card[i];
  if (card.size() > CARD_COLUMNS)
    LOGF(WARNING, "%s card truncated to %d columns", m_pszName, CARD_COLUMNS);
  m_queHopper.push_back(col);
}

int32_t CCardReader::FileError (string sFileName, const char *pszMsg, int nError)
{
  //++
  // Report a deck file error and return -1 ...
  //--
  if (nError > 0)
    LOGF(ERROR, "error (%d) %s %s - %s", nError, pszMsg, sFileName.c_str(), strerror(nError))
  else
    LOGF(ERROR, "error %s %s", pszMsg, sFileName.c_str());
  return -1;
}

int32_t CCardReader::LoadDeck (string sFileName)
{
  //++
  //   Read a deck of cards from a text file and put them in the hopper.  Bad
  // columns are reported and the card is skipped, but the rest of the deck
  // is still loaded.  Blank lines are NOT cards.
  //--
  FILE *pFile = fopen(sFileName.c_str(), "rt");
  if (pFile == NULL) return FileError(sFileName, "opening", errno);

  char szLine[1024];  int32_t nCards = 0;  uint32_t nLine = 0;
  while (fgets(szLine, sizeof(szLine), pFile) != NULL) {
    ++nLine;
    char *psz = strchr(szLine, '#');
    if (psz != NULL) *psz = '\0';
    CARD card;  bool fError = false;
    for (char *pszToken = strtok(szLine, ", \t\r\n");  pszToken != NULL;  pszToken = strtok(NULL, ", \t\r\n")) {
      char *pszEnd;
      unsigned long lColumn = strtoul(pszToken, &pszEnd, 16);
      if ((*pszEnd != '\0') || (lColumn > WORD_MAX)) {
        LOGF(WARNING, "bad column \"%s\" at line %u in %s", pszToken, nLine, sFileName.c_str());
        fError = true;  break;
      }
      card.push_back(WORD(lColumn));
    }
    if (fError || card.empty()) continue;
    LoadCard(card);  ++nCards;
  }

  if (ferror(pFile)) {
    int nError = errno;  fclose(pFile);
    return FileError(sFileName, "reading", nError);
  }
  fclose(pFile);
  LOGF(DEBUG, "%d cards loaded from %s", nCards, sFileName.c_str());
  return nCards;
}

CDevice::IOCC_STATUS CCardReader::DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC)
{
  //++
  // Handle all 2501 IOCCs ...
  //--
  switch (iocc.nFunction) {

    case IOCC_INITIATE_READ: {
      //   The word count is stored as a negative number, and anything that
      // isn't negative means zero words.  Check the whole buffer before we
      // touch anything!
      if (!pMemory->IsValid(iocc.wWCA)) return IOCC_BAD_ADDRESS;
      if (m_queHopper.empty()) return IOCC_NO_DATA;
      int32_t nCount = -(int32_t) (int16_t) pMemory->CPUread(iocc.wWCA);
      if (nCount < 0) nCount = 0;
      if (nCount > CARD_COLUMNS) nCount = CARD_COLUMNS;
      if (((size_t) iocc.wWCA + nCount) >= pMemory->Size()) return IOCC_BAD_ADDRESS;
      const CARD &card = m_queHopper.front();
      for (int32_t i = 0;  i < nCount;  ++i)
        pMemory->CPUwrite(ADDRESS(iocc.wWCA+1+i), card[i]);
      m_queHopper.pop_front();
      m_fComplete = true;  m_fLastCard = m_queHopper.empty();
      RequestInterrupt(ILSW_READER);
      return IOCC_OK;
    }

    case IOCC_SENSE_DEVICE:
      wACC = GetDSW();
      if (ISSET(iocc.bModifiers, SENSE_RESET)) {
        m_fComplete = m_fLastCard = false;
        CancelInterrupt();
      }
      return IOCC_OK;

    default:
      return IOCC_UNSUPPORTED;
  }
}

void CCardReader::ShowDevice (ostringstream &ofs) const
{
  CDevice::ShowDevice(ofs);
  ofs << FormatString(" hopper=%d", (int) m_queHopper.size());
  if (m_fComplete) ofs << " COMPLETE";
  if (m_fLastCard) ofs << " LAST";
  ofs << std::endl;
}
