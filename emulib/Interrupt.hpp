//++
// Interrupt.hpp -> CInterrupt and CPriorityInterrupt classes
//
//   COPYRIGHT (C) 2015-2025 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
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
//   This file gives the definitions for two classes - CInterrupt is an
// abstract class which defines the common interface to the interrupt system.
// This is used by the CPU and allows it to be independent of the actual
// interrupt implementation.
//
//   CPriorityInterrupt emulates the IBM 1130 six level priority interrupt
// system.  Level 0 is the HIGHEST priority and level 5 the lowest (that's
// backwards from the DEC convention!).  Each level has a FIFO queue of
// pending interrupt records, and the controller also keeps a stack of the
// levels currently "in service" (i.e. delivered but not yet returned from).
//
// REVISION HISTORY:
// 23-JUN-22  RLA   New file.
//  3-MAR-25  RLA   Rewrite CPriorityInterrupt for the 1130 queued levels.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <deque>                // C++ std::deque template
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // generic project wide declarations
#include "MemoryTypes.h"        // address_t and word_t data types
using std::deque;               // ...
using std::vector;              // ...


class CInterrupt {
  //++
  // Abstract interrupt system interface for CPUs ...
  //--

  // This is an abstract class - no constructor or destructor here!

  // Interrupt methods ...
public:
  // Return TRUE if any interrupt should be delivered now ...
  virtual bool IsRequested() const = 0;
  // Clear all interrupt requests ...
  virtual void ClearInterrupt() = 0;
};


class CPriorityInterrupt : public CInterrupt {
  //++
  //  Multi-level, queued, priority interrupt system emulation ...
  //--

  // Magic numbers and constants ...
public:
  enum {
    MAXLEVEL    = 6,          // number of priority levels (0..5)
    NOLEVEL     = 0xFF,       // returned when no level is pending or active
  };
  typedef uint8_t IRQLEVEL;   // an interrupt level

  //   This is one pending (or delivered) interrupt.  The level and device
  // never change once the record is created.  fInBag is set when the
  // interrupt is actually delivered to the CPU.
  struct _INTERRUPT {
    IRQLEVEL  nLevel;         // priority level (0..5)
    uint8_t   nDevice;        // device code of the device that caused it
    word_t    wILSW;          // interrupt level status word bits
    bool      fInBag;         // TRUE once delivered
  };
  typedef struct _INTERRUPT INTERRUPT;

  //   And this is one entry on the "in service" stack.  The return address
  // is the IAR that was saved when the interrupt was delivered ...
  struct _IN_SERVICE {
    INTERRUPT  irq;           // the interrupt that's being serviced
    address_t  wReturn;       // IAR to restore on return
  };
  typedef struct _IN_SERVICE IN_SERVICE;

public:
  // Constructor and destructor ...
  CPriorityInterrupt();
  virtual ~CPriorityInterrupt() {};
private:
  // Disallow copy and assignments!
  CPriorityInterrupt (const CPriorityInterrupt &) = delete;
  CPriorityInterrupt& operator= (CPriorityInterrupt const &) = delete;

  // CPriorityInterrupt properties ...
public:
  // Return the number of levels implemented ...
  IRQLEVEL GetLevels() const {return MAXLEVEL;}
  // Return TRUE if nLevel is a legal level number ...
  static bool IsValidLevel (IRQLEVEL nLevel) {return nLevel < MAXLEVEL;}
  // Return the number of interrupts queued on one level ...
  size_t GetQueued (IRQLEVEL nLevel) const;
  // Return the highest priority level with a queued interrupt ...
  IRQLEVEL GetPendingLevel() const;
  // Return the level currently in service, if any ...
  IRQLEVEL GetActiveLevel() const
    {return m_vecActive.empty() ? (IRQLEVEL) NOLEVEL : m_vecActive.back().irq.nLevel;}
  bool IsActive() const {return !m_vecActive.empty();}
  size_t GetActiveDepth() const {return m_vecActive.size();}
  // Return the ILSW of the level in service (zero if none) ...
  word_t GetActiveILSW() const
    {return m_vecActive.empty() ? 0 : m_vecActive.back().irq.wILSW;}
  // Return TRUE if device nDevice has any interrupt queued ...
  bool IsQueued (uint8_t nDevice) const;

  // Interrupt methods ...
public:
  // Queue a new interrupt (returns FALSE if the level is illegal) ...
  bool Raise (IRQLEVEL nLevel, uint8_t nDevice, word_t wILSW);
  // Return TRUE if any queued interrupt can preempt the active level ...
  virtual bool IsRequested() const override;
  // Deliver the highest priority interrupt and mark that level in service ...
  bool Deliver (address_t wReturn, INTERRUPT &irq);
  // Leave the active level, returning the saved IAR ...
  bool Return (address_t &wReturn);
  // Leave the active level without any saved IAR (i.e. BOSC) ...
  bool Dismiss();
  // Remove all queued (not delivered!) interrupts for a device ...
  size_t Cancel (uint8_t nDevice);
  // Clear all interrupt requests on all levels ...
  virtual void ClearInterrupt() override;

  // CPriorityInterrupt members ...
private:
  deque<INTERRUPT>    m_aqPending[MAXLEVEL];  // FIFO for each level
  vector<IN_SERVICE>  m_vecActive;            // levels in service (top = current)
};
