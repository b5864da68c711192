//++
// Memory.hpp -> CMemory (abstract memory) and CGenericMemory classes
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
//   There are two classes defined here - CMemory is an abstract interface
// that defines the functions the CPU and any DMA devices use to access
// memory.  CGenericMemory is a concrete implementation of CMemory that's a
// simple, flat, array of words.  It suffices for most emulations.
//
//   BTW, note that two sets of functions are provided for accessing memory -
// CPUread() and CPUwrite(), and UIread() and UIwrite().  The former are what
// the CPU and devices use, and CPUwrite() records every change in the write
// journal (see below) while a journal is open.  The UI functions are used by
// the host to examine and deposit and are never journaled.  NONE of these
// functions check the address - the caller is expected to call IsValid()
// first.  Memory bounds violations are a CPU problem, not a memory problem!
//
// WRITE JOURNAL
//   An instruction that fails part way thru (a memory violation while
// storing the second word of a double, say) must leave memory exactly the
// way it was before the instruction started.  The easiest way to guarantee
// that is for the CPU to open a journal at the start of each instruction.
// Every CPUwrite() while the journal is open saves the old contents of the
// location, and RollbackJournal() puts them all back in reverse order.
// CommitJournal() just throws the saved contents away.
//
// REVISION HISTORY:
// 24-Jul-19  RLA   New file.
// 21-JAN-20  RLA   Remove singleton assumptions.
// 16-JUN-22  RLA   Split up CMemory interface and CGenericMemory implementation
//  3-MAR-25  RLA   Remove memory mapped I/O and flags; add the write journal.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "MemoryTypes.h"        // address_t and word_t data types
using std::string;              // ...
using std::vector;              // ...

// Standard extension for memory image files ...
#define DEFAULT_IMAGE_FILE_TYPE     ".img"


class CMemory {
  //++
  // Abstract memory interface for CPUs and devices ...
  //--

  // This is an abstract class - no constructor or destructor here!

  // CPU memory access functions ...
public:
  virtual size_t Size() const = 0;
  virtual bool IsValid (address_t a) const = 0;
  virtual word_t CPUread (address_t a) const = 0;
  virtual void CPUwrite (address_t a, word_t d) = 0;
};


class CGenericMemory : public CMemory {
  //++
  // Generic word addressed memory emulation class ...
  //--

  // One entry in the write journal ...
public:
  struct _JOURNAL_ENTRY {
    address_t   nAddress;       // location that was written
    word_t      wOldData;       // and what it contained before
  };
  typedef struct _JOURNAL_ENTRY JOURNAL_ENTRY;

public:
  // Constructor and destructor ...
  CGenericMemory (size_t cwMemory);
  virtual ~CGenericMemory();
private:
  // Disallow copy and assignments!
  CGenericMemory (const CGenericMemory &) = delete;
  CGenericMemory& operator= (CGenericMemory const &) = delete;

  // Basic memory properties ...
public:
  virtual size_t Size() const override {return m_cwMemory;}
  inline address_t Top() const {return ADDRESS(m_cwMemory-1);}

  //   These inline methods should be used for all access to the actual memory
  // contents.  They're the only ones that know how the data is stored, and
  // they all assume the caller will validate the address with IsValid() first!
public:
  virtual bool IsValid (address_t a) const override {return (size_t) a < m_cwMemory;}
  inline bool IsValid (address_t nFirst, size_t cwCount) const
    {return (cwCount == 0) || ((size_t) nFirst + cwCount <= m_cwMemory);}
  inline word_t MemRead (address_t a) const {return m_pawMemory[a];}
  inline void MemWrite (address_t a, word_t d) {m_pawMemory[a] = d;}

  // Basic memory functions ...
public:
  // Read or write the location for the CPU ...
  virtual word_t CPUread (address_t a) const override
    {assert(IsValid(a));  return MemRead(a);}
  virtual void CPUwrite (address_t a, word_t d) override;
  // Other (UI) access functions ...
  virtual word_t UIread (address_t a) const {assert(IsValid(a));  return MemRead(a);}
  virtual void UIwrite (address_t a, word_t d) {assert(IsValid(a));  MemWrite(a, d);}

  // Write journal functions ...
public:
  void BeginJournal() {m_vecJournal.clear();  m_fJournal = true;}
  void CommitJournal() {m_vecJournal.clear();  m_fJournal = false;}
  void RollbackJournal();
  bool IsJournalOpen() const {return m_fJournal;}
  size_t GetJournalCount() const {return m_vecJournal.size();}

  // Other memory routines ...
public:
  // Clear all of memory ...
  virtual void ClearMemory (word_t wData=0);
  //   Load a text image file of "address data" pairs (both in hex).  The
  // result is the number of words loaded, or -1 if the file can't be read.
  virtual int32_t LoadImage (string sFileName);

  // Private methods ...
private:
  // Report load file errors ...
  static int32_t FileError (string sFileName, const char *pszMsg, int nError=0);

  // Members ...
private:
  size_t      m_cwMemory;     // size of the memory
  word_t     *m_pawMemory;    // the actual memory data lives here
  bool        m_fJournal;     // TRUE if the write journal is open
  vector<JOURNAL_ENTRY> m_vecJournal; // old contents of locations written
};
