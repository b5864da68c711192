//++
// Memory.cpp -> CGenericMemory (generic memory emulation) methods
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
//   The CGenericMemory class implements a simple, flat, array of words
// for the CPU.  Unlike the byte addressed micros, every location on the
// 1130 is a full 16 bit word and there's no ROM, no memory mapped I/O and
// no non-existent memory in the middle of the address space.  Memory simply
// starts at address zero and ends at Size()-1.
//
// IMAGE FILES
//   The LoadImage() method reads a simple text memory image.  Each line
// contains an address and a data word, both in hexadecimal, separated by
// white space or a colon.  Blank lines and anything after a "#" are ignored.
// This is the format produced by the assembler's listing, and it's how the
// host loads programs.  For example -
//
//      # LD L /0105 at 0x100
//      0100 C400
//      0101 0105
//      0105 1234
//
// REVISION HISTORY:
// 24-JUL-19  RLA   New file.
// 21-JAN-20  RLA   Remove singleton assumptions.
// 26-AUG-22  RLA   Clean up Linux/WIN32 conditionals.
//  3-MAR-25  RLA   Word addressed memory, write journal, and LoadImage().
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdio.h>              // fopen(), fgets(), etc ...
#include <errno.h>              // errno ...
#include <string.h>             // strerror(), strchr(), etc ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // declarations for this module
using std::string;              // too lazy to type "std::string..."!


CGenericMemory::CGenericMemory (size_t cwMemory)
{
  //++
  // Initialize our members and allocate space for the memory ...
  //--
  assert((cwMemory > 0)  &&  (cwMemory <= ((size_t) ADDRESS_MAX+1)));
  m_cwMemory = cwMemory;  m_fJournal = false;
  m_pawMemory = DBGNEW word_t[m_cwMemory];
  ClearMemory();
}

CGenericMemory:: ~CGenericMemory()
{
  //++
  // Delete the memory array ...
  //--
  assert(m_pawMemory != NULL);
  delete[] m_pawMemory;
  m_cwMemory = 0;  m_pawMemory = NULL;
}

void CGenericMemory::CPUwrite (address_t a, word_t d)
{
  //++
  //   Called by the CPU emulation (or a DMA device) to write a word to memory.
  // If the journal is open, remember what used to be here first ...
  //--
  assert(IsValid(a));
  if (m_fJournal) {
    JOURNAL_ENTRY je;  je.nAddress = a;  je.wOldData = MemRead(a);
    m_vecJournal.push_back(je);
  }
  MemWrite(a, d);
}

void CGenericMemory::RollbackJournal()
{
  //++
  //   Undo every write made since the journal was opened.  The entries have
  // to be undone in reverse order in case the same location was written
  // more than once!  The journal is closed afterwards.
  //--
  while (!m_vecJournal.empty()) {
    const JOURNAL_ENTRY &je = m_vecJournal.back();
    MemWrite(je.nAddress, je.wOldData);
    m_vecJournal.pop_back();
  }
  m_fJournal = false;
}

void CGenericMemory::ClearMemory (word_t wData)
{
  //++
  //   Set every location to wData (usually zero).  Note that this doesn't
  // go thru the journal ...
  //--
  assert(m_pawMemory != NULL);
  for (size_t i = 0;  i < m_cwMemory;  ++i)  m_pawMemory[i] = wData;
}

int32_t CGenericMemory::FileError (string sFileName, const char *pszMsg, int nError)
{
  //++
  // Print a file related error message and then always return -1.  Why
  // always return -1?  So we can say something like
  //
  //    if ... return FileError("fail", errno);
  //--
  if (nError > 0) {
    LOGS(ERROR, "error (" << strerror(nError) << ") " << pszMsg << " " << sFileName);
  } else {
    LOGS(ERROR, pszMsg << " - " << sFileName);
  }
  return -1;
}

int32_t CGenericMemory::LoadImage (string sFileName)
{
  //++
  //   Load a text memory image file (see the description at the top of this
  // module) and return the number of words loaded, or -1 if the file can't
  // be opened.  Lines that can't be parsed and addresses that are outside
  // of this memory are reported and skipped, but they don't stop the load.
  //--
  FILE *pFile = fopen(sFileName.c_str(), "rt");
  if (pFile == NULL) return FileError(sFileName, "opening", errno);

  char szLine[256];  int32_t nWords = 0;  uint32_t nLine = 0;
  while (fgets(szLine, sizeof(szLine), pFile) != NULL) {
    ++nLine;
    char *psz = strchr(szLine, '#');
    if (psz != NULL) *psz = '\0';
    for (psz = szLine;  *psz != '\0';  ++psz)
      if (*psz == ':') *psz = ' ';
    unsigned int nAddress, nData;  char chExtra;
    int nFields = sscanf(szLine, " %x %x %c", &nAddress, &nData, &chExtra);
    if (nFields <= 0) continue;
    if (nFields != 2) {
      LOGF(WARNING, "syntax error at line %u in %s", nLine, sFileName.c_str());
      continue;
    }
    if ((nAddress > ADDRESS_MAX) || !IsValid(ADDRESS(nAddress))) {
      LOGF(WARNING, "address %04X out of range at line %u in %s", nAddress, nLine, sFileName.c_str());
      continue;
    }
    if (nData > WORD_MAX) {
      LOGF(WARNING, "data %X too large at line %u in %s", nData, nLine, sFileName.c_str());
      continue;
    }
    MemWrite(ADDRESS(nAddress), WORD(nData));  ++nWords;
  }

  if (ferror(pFile)) {
    int nError = errno;  fclose(pFile);
    return FileError(sFileName, "reading", nError);
  }
  fclose(pFile);
  LOGF(DEBUG, "%d words loaded from %s", nWords, sFileName.c_str());
  return nWords;
}
