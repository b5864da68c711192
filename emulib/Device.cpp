//++
// Device.cpp -> CDevice (generic I/O device emulation) methods
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
//   CDevice is the base class for all 1130 I/O devices.  Every device has a
// five bit device code, and the XIO instruction addresses it by that code.
// The CPU fetches the two IOCC words, decodes them with DecodeIOCC(), looks
// up the device in its CDeviceMap and then calls ExecuteIOCC().
//
// FUNCTIONS
//   Each device declares, in the constructor, the set of IOCC functions it
// implements.  ExecuteIOCC() rejects anything else with IOCC_UNSUPPORTED
// before the device ever sees it, so DevIOCC() implementations don't need
// to worry about bogus function codes.  IOCC_SENSE_INTERRUPT never gets
// here - the CPU handles that one itself since it's not really directed at
// any device.
//
//   DevIOCC() must either do the whole operation or nothing at all.  If it
// returns anything other than IOCC_OK then the CPU rolls back the XIO, and
// the device state needs to be unchanged for that to work.
//
// INTERRUPTS
//   To support interrupts, after the CDevice object is constructed you must
// call AttachInterrupt() to connect it to the CPriorityInterrupt controller
// and pick a level.  RequestInterrupt() then queues an interrupt on that
// level, tagged with this device's code and the ILSW bits given.  Unlike
// the "wire-OR" interrupts of the microprocessors, 1130 interrupts are
// queued - each request is delivered exactly once - and CancelInterrupt()
// removes any requests that haven't been delivered yet.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 15-JUL-22  RLA   Add second interrupt channel.
//                  Create a .cpp file for some of the implementation.
//  3-MAR-25  RLA   Replace DevIOT() with the 1130 IOCC protocol.
//                  Only one interrupt channel, with levels and ILSW bits.
//--
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CMemory interface
#include "Interrupt.hpp"        // CPriorityInterrupt definitions
#include "Device.hpp"           // declarations for this module


CDevice::CDevice (const char *pszName, const char *pszType, const char *pszDescription, address_t nDevice, uint8_t bFunctions)
{
  //++
  //   The constructor specifies all the basic device properties, as follows -
  //
  //   Name should be a short alphanumeric identifier that names the device
  //        (e.g. "KBD", "PRT", "CDR", etc).
  // 
  //   Type is a generic type of this device (e.g. "1442", "2501", etc)
  //
  //   Description is an arbitrary ASCII string that's used to describe the
  //        device in show commands (e.g. "Console Keyboard") ...
  //
  //   nDevice is the device code, 0..31, used in the IOCC.
  //
  //   bFunctions is a mask, built with IOCC_MASK(), of the IOCC functions
  //        this device implements.
  //--
  assert(nDevice < 32);
  m_pszName = pszName;  m_pszType = pszType;  m_pszDescription = pszDescription;
  m_nDevice = nDevice;  m_bFunctions = bFunctions;
  m_pInterrupt = NULL;  m_nLevel = CPriorityInterrupt::NOLEVEL;
}

CDevice::~CDevice()
{
  //++
  //   Cancel any interrupts we have queued when this device is deleted.
  // Otherwise the CPU could deliver an interrupt for a device that no longer
  // exists!
  //--
  CancelInterrupt();
}

IOCC CDevice::DecodeIOCC (word_t wWord0, word_t wWord1)
{
  //++
  //   Unpack the two IOCC words.  Word 0 is the WCA, and word 1 is the
  // device code (5 bits), function (3 bits) and modifiers (8 bits) ...
  //--
  IOCC iocc;
  iocc.wWCA = ADDRESS(wWord0);
  iocc.nDevice = MASK5(wWord1 >> 11);
  iocc.nFunction = MASK3(wWord1 >> 8);
  iocc.bModifiers = LOBYTE(wWord1);
  return iocc;
}

void CDevice::EncodeIOCC (const IOCC &iocc, word_t &wWord0, word_t &wWord1)
{
  //++
  // The opposite of DecodeIOCC() - pack an IOCC back into two words ...
  //--
  wWord0 = iocc.wWCA;
  wWord1 = WORD((MASK5(iocc.nDevice) << 11) | (MASK3(iocc.nFunction) << 8) | MASK8(iocc.bModifiers));
}

const char *CDevice::FunctionName (uint8_t nFunction)
{
  //++
  // Return the mnemonic for an IOCC function code (for trace messages) ...
  //--
  switch (nFunction) {
    case IOCC_RESERVED:         return "RESERVED";
    case IOCC_WRITE:            return "WRITE";
    case IOCC_READ:             return "READ";
    case IOCC_SENSE_INTERRUPT:  return "SENSE INTERRUPT";
    case IOCC_CONTROL:          return "CONTROL";
    case IOCC_INITIATE_WRITE:   return "INITIATE WRITE";
    case IOCC_INITIATE_READ:    return "INITIATE READ";
    case IOCC_SENSE_DEVICE:     return "SENSE DEVICE";
    default:                    return "???";
  }
}

void CDevice::ClearDevice()
{
  //++
  //   The default reset just throws away any interrupts we have queued.
  // Derived classes that override this should call us too ...
  //--
  CancelInterrupt();
}

CDevice::IOCC_STATUS CDevice::ExecuteIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC)
{
  //++
  //   Check that this device implements the requested function and, if it
  // does, call the device specific DevIOCC().  Sense Device is common to
  // all devices, and we handle that one here too unless the derived class
  // has something special to do for it ...
  //--
  assert(pMemory != NULL);
  if (!IsSupported(iocc.nFunction)) {
    LOGF(DEBUG, "%s function %s (%d) not supported", m_pszName, FunctionName(iocc.nFunction), iocc.nFunction);
    return IOCC_UNSUPPORTED;
  }
  IOCC_STATUS status = DevIOCC(iocc, pMemory, wACC);
  if (status == IOCC_OK)
    LOGF(TRACE, "%s %s WCA=%04X MOD=%02X ACC=%04X", m_pszName, FunctionName(iocc.nFunction), iocc.wWCA, iocc.bModifiers, wACC);
  return status;
}

CDevice::DEVICE_STATUS CDevice::GetStatus() const
{
  //++
  // Collect the device status for the host ...
  //--
  DEVICE_STATUS status;
  status.nDevice = m_nDevice;
  status.pszName = m_pszName;
  status.fBusy = IsBusy();
  status.wDSW = GetDSW();
  status.fInterrupt = IsInterruptRequested();
  return status;
}

void CDevice::ShowDevice (ostringstream &ofs) const
{
  //++
  //   Show the generic device state.  Derived classes add their own details
  // and call us first ...
  //--
  ofs << FormatString("%-4s %-6s %-26s code %02X DSW %04X", m_pszName, m_pszType, m_pszDescription, m_nDevice, GetDSW());
  if (m_pInterrupt != NULL)
    ofs << FormatString(" level %d", m_nLevel);
  if (IsBusy()) ofs << " BUSY";
  if (IsInterruptRequested()) ofs << " IRQ";
}

void CDevice::AttachInterrupt (CPriorityInterrupt *pInterrupt, CPriorityInterrupt::IRQLEVEL nLevel)
{
  //++
  // Attach this device to the interrupt controller on level nLevel ...
  //--
  assert((pInterrupt != NULL) && CPriorityInterrupt::IsValidLevel(nLevel));
  CancelInterrupt();
  m_pInterrupt = pInterrupt;  m_nLevel = nLevel;
}

bool CDevice::RequestInterrupt (word_t wILSW)
{
  //++
  //   Queue an interrupt on our level with the ILSW bits given.  If this
  // device isn't attached to an interrupt controller, then do nothing and
  // return FALSE ...
  //--
  if (m_pInterrupt == NULL) return false;
  return m_pInterrupt->Raise(m_nLevel, (uint8_t) m_nDevice, wILSW);
}

void CDevice::CancelInterrupt()
{
  //++
  // Remove any of our interrupts that haven't been delivered yet ...
  //--
  if (m_pInterrupt != NULL) m_pInterrupt->Cancel((uint8_t) m_nDevice);
}

bool CDevice::IsInterruptRequested() const
{
  //++
  // Return TRUE if we have an interrupt queued ...
  //--
  return (m_pInterrupt != NULL) && m_pInterrupt->IsQueued((uint8_t) m_nDevice);
}
