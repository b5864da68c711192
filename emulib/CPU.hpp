//++
// CPU.hpp -> CCPU generic CPU emulation base class
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
//   CCPU is an abstract class intended to be used as the base class for all
// CPU emulations.  CCPU is to processors what the CDevice class is to
// peripherals, however unlike CDevice, CCPU is an incomplete class and can
// never be instanciated directly.  It's only used as a base class for real
// CPU emulation ...
//
// WARNING:
//   This code assumes, for better or worse, that uint8_t variables are really
// exactly 8 bits and that uint16_t variables are exactly 16 bits.  This has
// important consequences for the handling of overflows and wrap around for
// 16 bit arithmetic.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 21-JAN-20  RLA   Add devices, software serial, and much more.
// 22-JUN-22  RLA   Change m_Interrupt to m_pInterrupt.  Make the interrupt
//                    control a constructor parameter and make it optional.
//  5-JUL-22  RLA   Change to use CDeviceMap class ...
//  3-MAR-25  RLA   One device bus keyed by device code.  No event queue.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ string functions
#include "Interrupt.hpp"        // interrupt simulation logic
#include "MemoryTypes.h"        // address_t and word_t data types
#include "DeviceMap.hpp"        // CDeviceMap class
#include "Memory.hpp"           // basic memory emulation declarations ...
using std::string;              // ...


class CCPU {
  //++
  // Generic CPU emulator class ...
  //--
 
  // Return codes from the CPU Run() method...
public:
  enum _STOP_CODES {
    STOP_NONE,  	// (used internally while emulation is running)
    STOP_FINISHED,	// instruction count was reached
    STOP_ILLEGAL_IO,	// an illegal device or IOCC function was found
    STOP_ILLEGAL_OPCODE,//  "    "    opcode           "    "
    STOP_ILLEGAL_ADDRESS,// memory reference outside of memory
    STOP_ARITHMETIC,    // divide by zero
    STOP_HALT,		// a halt (WAIT) instruction was executed
    STOP_BREAK		// Break() was called
  };
  typedef enum _STOP_CODES STOP_CODE;

  // Constructors and destructors...
public:
  CCPU (CMemory *pMemory, CInterrupt *pInterrupt=NULL);
  virtual ~CCPU();
private:
  // Disallow copy and assignments!
  CCPU (const CCPU&) = delete;
  CCPU& operator= (CCPU const &) = delete;

  // CCPU properties ...
public:
  // Get the address of the instruction that was just executed ...
  inline address_t GetLastPC() const {return m_nLastPC;}
  // Get or set the address of the next instruction to be executed ...
  virtual address_t GetPC() const {return 0;}
  virtual void SetPC (address_t a) {};
  // Get a constant string for the CPU name, type or options ...
  virtual const char *GetDescription() const {return "unknown";}
  virtual const char *GetName() const {return "none";}
  // Return the reason the last Run() stopped ...
  inline STOP_CODE GetStopCode() const {return m_nStopCode;}
  static const char *StopCodeToString (STOP_CODE nStop);

  // Emulation control...
public:
  // Reset the CPU ...
  virtual void MasterClear();
  virtual void ClearCPU();
  // Simulate one or more instructions ...
  virtual STOP_CODE Run (uint32_t nCount=0) = 0;
  // Interrupt the simulation gracefully ...
  virtual void Break (STOP_CODE nStop=STOP_BREAK) {m_nStopCode = nStop;}

  // Read or write CPU registers ... 
public:
  virtual cpureg_t GetRegisterCount() const {return 0;}
  virtual const char *GetRegisterName (cpureg_t nReg) const {return "???";}
  virtual unsigned GetRegisterSize (cpureg_t nReg) const {return 16;}
  virtual uint16_t GetRegister (cpureg_t nReg) const = 0;
  virtual void SetRegister (cpureg_t nReg, uint16_t nVal) = 0;

  // Device functions ...
public:
  // Install or remove I/O devices ...
  virtual bool InstallDevice (CDevice *pDevice);
  virtual bool RemoveDevice (address_t nDevice);
  // Search for devices by code or by name ...
  virtual CDevice *FindDevice (address_t nDevice) const {return m_Devices.Find(nDevice);}
  virtual CDevice *FindDevice (const string sName) const {return m_Devices.Find(sName);}
  // Return the device bus itself (for iterating over all devices) ...
  const CDeviceMap &GetDevices() const {return m_Devices;}
  // Clear (simulate a hardware reset) for all devices ...
  virtual void ClearAllDevices();
  // Delete all attached I/O devices ...
  virtual void RemoveAllDevices();

  // Private member data...
protected:
  STOP_CODE       m_nStopCode;      // reason for stopping the emulator
  address_t       m_nLastPC;        // address of instruction that was just executed
  CMemory        *m_pMemory;        // main memory for this CPU
  CInterrupt     *m_pInterrupt;     // interrupt control logic (if any!)
  CDeviceMap      m_Devices;        // I/O devices by device code
};
