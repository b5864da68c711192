//++
// CPU.cpp -> CCPU generic CPU emulation base class methods
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
//   This module contains some basic methods that are shared by all CPU
// emulations.  This includes 
// 
//   * The collection of I/O devices, keyed by device code.
// 
//   * Generic routines for accessing internal processor state and registers.
// 
//   * Stop codes and the messages that go with them.
//
// REVISION HISTORY:
// 17-JAN-20  RLA  New file.
//  4-JUL-22  RLA  Remove breakpoint stuff (it's handled by memory now!)
// 22-Aug-22  RLA  Constructor should call ClearCPU(), not MasterClear()!
//  3-MAR-25  RLA  One device bus keyed by device code.  No event queue.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "Interrupt.hpp"        // interrupt simulation logic
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // basic memory emulation declarations ...
#include "CPU.hpp"              // CCPU base class definitions
#include "Device.hpp"           // basic I/O device emulation declarations ...


CCPU::CCPU (CMemory *pMemory, CInterrupt *pInterrupt)
{
  //++
  // CCPU constructor - initialize everything...
  //--
  assert(pMemory != NULL);
  m_pInterrupt = pInterrupt;
  m_pMemory = pMemory;
  m_nLastPC = 0;
  ClearCPU();
}

CCPU::~CCPU()
{
  //++
  //   Delete all linked devices before the CPU goes away.  Note that this 
  // DOES NOT delete the memory - that's up to the caller.
  //--
  RemoveAllDevices();
}

const char *CCPU::StopCodeToString (STOP_CODE nStop)
{
  //++
  // Convert a stop code to a message for the user ...
  //--
  switch (nStop) {
    case STOP_NONE:             return "running";
    case STOP_FINISHED:         return "instruction count reached";
    case STOP_ILLEGAL_IO:       return "illegal I/O";
    case STOP_ILLEGAL_OPCODE:   return "illegal opcode";
    case STOP_ILLEGAL_ADDRESS:  return "memory violation";
    case STOP_ARITHMETIC:       return "divide by zero";
    case STOP_HALT:             return "wait";
    case STOP_BREAK:            return "break";
    default:                    return "unknown";
  }
}

void CCPU::MasterClear()
{
  //++
  //   Clear (reset) the CPU and all I/O devices!  This is the equivalent of a
  // power on or pressing the RESET key and clears way more than just the
  // internal state of the CPU.  Most derived CPU implementations just need
  // to implement ClearCPU() and don't need to implement this one!
  //--
  ClearAllDevices();
  ClearCPU();
}

void CCPU::ClearCPU()
{
  //++
  //   This clears the internal state of the CPU, however it does NOT clear
  // any interrupts or external devices!
  //--
  m_nStopCode = STOP_NONE;
}

void CCPU::ClearAllDevices()
{
  //++
  // Throw away all interrupt requests and then clear every I/O device ...
  //--
  if (m_pInterrupt != NULL) m_pInterrupt->ClearInterrupt();
  m_Devices.ClearAll();
}

bool CCPU::InstallDevice (CDevice *pDevice)
{
  //++
  //   Install the specified I/O device into this CPU.  The device code comes
  // from the device itself.  This method will return false if any other
  // device already has the same code.  In that case, the new device is not
  // installed, nothing is changed, and the caller still owns pDevice.
  //--
  assert(pDevice != NULL);
  if (!m_Devices.Install(pDevice)) return false;
  LOGF(DEBUG, "%s attached to device code %02X", pDevice->GetDescription(), pDevice->GetDeviceCode());
  return true;
}

bool CCPU::RemoveDevice (address_t nDevice)
{
  //++
  //   Remove the device with the given code.  The devices "belong" to the
  // CPU after they're installed, so this DELETES THE DEVICE object too.
  // Returns FALSE if no device has that code.
  //--
  LOGF(DEBUG, "removing device code %02X", nDevice);
  return m_Devices.Remove(nDevice);
}

void CCPU::RemoveAllDevices()
{
  //++
  // Remove and delete ALL I/O devices ...
  //--
  m_Devices.RemoveAll();
}
