//++
// Interrupt.cpp -> CPriorityInterrupt (1130 priority interrupt) methods
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
//   CInterrupt is a pure abstract class that defines the CPU interface to the
// interrupt system.  CPriorityInterrupt implements it for the IBM 1130 six
// level priority interrupt system.
//
//   Devices call Raise() to queue an interrupt on their level.  Raise() never
// blocks and never fails except for an illegal level number, which can only
// happen thru a programming error.  Interrupts on the same level are delivered
// in the order they were raised.
//
//   The CPU calls IsRequested() after every instruction.  That returns TRUE
// if there's a queued interrupt AND either no level is in service now or the
// queued level is STRICTLY higher priority (i.e. numerically smaller) than
// the level in service.  A same or lower priority interrupt waits in its
// queue until the active level is finished.  If IsRequested() is TRUE, the
// CPU saves the IAR in memory (that's the CPU's business, not ours) and calls
// Deliver() to move the head of the queue onto the in service stack.
//
//   The interrupt service routine finishes either with Return(), which pops
// the in service stack and gives back the IAR saved by Deliver(), or Dismiss()
// which just pops the stack.  The latter is what the BOSC instruction does,
// since the service routine has already done its own branch back.  Either
// way, a lower priority interrupt can now be delivered.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 22-JUN-22  RLA   Add priority levels.
//  3-MAR-25  RLA   Rewrite for the 1130 queued levels and in service stack.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // generic project wide declarations
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Interrupt.hpp"        // declarations for this module


CPriorityInterrupt::CPriorityInterrupt()
{
  //++
  // Start out with all levels empty and nothing in service ...
  //--
  ClearInterrupt();
}

size_t CPriorityInterrupt::GetQueued (IRQLEVEL nLevel) const
{
  //++
  // Return the number of interrupts waiting on nLevel ...
  //--
  return IsValidLevel(nLevel) ? m_aqPending[nLevel].size() : 0;
}

CPriorityInterrupt::IRQLEVEL CPriorityInterrupt::GetPendingLevel() const
{
  //++
  //   Scan the queues from level 0 (the highest priority) down and return
  // the first one that isn't empty.  Note that this says nothing about
  // whether that level can actually be delivered - see IsRequested() ...
  //--
  for (IRQLEVEL i = 0;  i < MAXLEVEL;  ++i)
    if (!m_aqPending[i].empty()) return i;
  return NOLEVEL;
}

bool CPriorityInterrupt::IsQueued (uint8_t nDevice) const
{
  //++
  // Return TRUE if this device has an interrupt waiting on any level ...
  //--
  for (IRQLEVEL i = 0;  i < MAXLEVEL;  ++i) {
    for (deque<INTERRUPT>::const_iterator it = m_aqPending[i].begin();  it != m_aqPending[i].end();  ++it)
      if (it->nDevice == nDevice) return true;
  }
  return false;
}

bool CPriorityInterrupt::Raise (IRQLEVEL nLevel, uint8_t nDevice, word_t wILSW)
{
  //++
  //   Add a new interrupt to the end of nLevel's queue.  The only possible
  // failure is an illegal level number ...
  //--
  if (!IsValidLevel(nLevel)) {
    LOGF(ERROR, "device %d raised illegal interrupt level %d", nDevice, nLevel);
    return false;
  }
  INTERRUPT irq;
  irq.nLevel = nLevel;  irq.nDevice = nDevice;
  irq.wILSW = wILSW;  irq.fInBag = false;
  m_aqPending[nLevel].push_back(irq);
  LOGF(TRACE, "interrupt level %d raised by device %d, ILSW=%04X", nLevel, nDevice, wILSW);
  return true;
}

bool CPriorityInterrupt::IsRequested() const
{
  //++
  //   Return TRUE if there's a queued interrupt that can be delivered now.
  // Only a strictly higher priority level can preempt the one in service!
  //--
  IRQLEVEL nPending = GetPendingLevel();
  if (nPending == NOLEVEL) return false;
  return !IsActive() || (nPending < GetActiveLevel());
}

bool CPriorityInterrupt::Deliver (address_t wReturn, INTERRUPT &irq)
{
  //++
  //   Remove the interrupt at the head of the highest priority queue, mark it
  // delivered, and push it on the in service stack along with the IAR that
  // should be restored when it's finished.  Returns FALSE (and does nothing)
  // if IsRequested() would have been false ...
  //--
  if (!IsRequested()) return false;
  IRQLEVEL nLevel = GetPendingLevel();
  irq = m_aqPending[nLevel].front();
  m_aqPending[nLevel].pop_front();
  irq.fInBag = true;
  IN_SERVICE is;  is.irq = irq;  is.wReturn = wReturn;
  m_vecActive.push_back(is);
  return true;
}

bool CPriorityInterrupt::Return (address_t &wReturn)
{
  //++
  //   Finish the level that's currently in service and return the IAR that
  // was saved when it was delivered.  Returns FALSE if no level is active.
  //--
  if (!IsActive()) return false;
  wReturn = m_vecActive.back().wReturn;
  m_vecActive.pop_back();
  return true;
}

bool CPriorityInterrupt::Dismiss()
{
  //++
  // Same as Return(), but without the saved IAR ...
  //--
  if (!IsActive()) return false;
  m_vecActive.pop_back();
  return true;
}

size_t CPriorityInterrupt::Cancel (uint8_t nDevice)
{
  //++
  //   Remove every queued interrupt that was raised by nDevice.  This is used
  // when a device is reset or when the program resets the device's status.
  // Interrupts that have already been delivered aren't affected, and the
  // order of the remaining interrupts is preserved.  Returns the number of
  // interrupts removed ...
  //--
  size_t nRemoved = 0;
  for (IRQLEVEL i = 0;  i < MAXLEVEL;  ++i) {
    deque<INTERRUPT>::iterator it = m_aqPending[i].begin();
    while (it != m_aqPending[i].end()) {
      if (it->nDevice == nDevice) {
        it = m_aqPending[i].erase(it);  ++nRemoved;
      } else
        ++it;
    }
  }
  return nRemoved;
}

void CPriorityInterrupt::ClearInterrupt()
{
  //++
  //   This is a reset of the interrupt system - it empties every queue AND
  // the in service stack.
  //--
  for (IRQLEVEL i = 0;  i < MAXLEVEL;  ++i)  m_aqPending[i].clear();
  m_vecActive.clear();
}
