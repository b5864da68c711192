//++
// Device.hpp -> CDevice (generic I/O device emulation) class
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
//   CDevice is the base class for all device emulation.  It defines the
// standard methods that all devices support - execute an I/O channel command
// (IOCC), report status, clear (initialize), etc.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 15-JUL-22  RLA   Add second interrupt channel.
//                  Create a .cpp file for some of the implementation.
//  3-MAR-25  RLA   Replace DevIOT() with the 1130 IOCC protocol.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CMemory interface for DMA
#include "Interrupt.hpp"        // CPriorityInterrupt definitions
using std::string;              // ...
using std::ostringstream;       // ...


//++
//   An IOCC (I/O Channel Command) is two consecutive words in memory.  The
// first is the word count/address (aka WCA) - usually the address of a data
// buffer.  The second word contains the device code in bits 0-4, the
// function in bits 5-7 and device specific modifier bits in 8-15 (IBM bit
// numbering, remember!).  The XIO instruction hands the decoded IOCC to the
// device.
//--
struct _IOCC {
  address_t wWCA;             // word count/address
  uint8_t   nDevice;          // device code (0..31)
  uint8_t   nFunction;        // function code (0..7)
  uint8_t   bModifiers;       // function modifier bits
};
typedef struct _IOCC IOCC;


class CDevice {
  //++
  // Generic 1130 I/O device emulation ...
  //--

  // IOCC function codes (bits 5-7 of the second IOCC word) ...
public:
  enum _IOCC_FUNCTIONS {
    IOCC_RESERVED         = 0,  // not used by any device
    IOCC_WRITE            = 1,  // write one word
    IOCC_READ             = 2,  // read one word
    IOCC_SENSE_INTERRUPT  = 3,  // ACC <- ILSW of the level in service
    IOCC_CONTROL          = 4,  // device specific control operation
    IOCC_INITIATE_WRITE   = 5,  // start a block (DMA) write
    IOCC_INITIATE_READ    = 6,  // start a block (DMA) read
    IOCC_SENSE_DEVICE     = 7,  // ACC <- device status word
  };
  typedef enum _IOCC_FUNCTIONS IOCC_FUNCTION;
  // Build the "supported functions" mask for the constructor ...
#define IOCC_MASK(f)  ((uint8_t) (1 << (f)))

  // Results from an IOCC ...
  enum _IOCC_STATUS {
    IOCC_OK,                    // success
    IOCC_NO_DATA,               // read with no data available
    IOCC_UNSUPPORTED,           // function not supported by this device
    IOCC_BAD_ADDRESS,           // WCA (or the buffer) is outside of memory
  };
  typedef enum _IOCC_STATUS IOCC_STATUS;

  // The status of a device, as reported to the host ...
  struct _DEVICE_STATUS {
    address_t     nDevice;      // device code
    const char   *pszName;      // device name
    bool          fBusy;        // TRUE if an operation is in progress
    word_t        wDSW;         // device status word
    bool          fInterrupt;   // TRUE if an interrupt is queued
  };
  typedef struct _DEVICE_STATUS DEVICE_STATUS;

  // Constructor and destructor...
public:
  CDevice (const char *pszName, const char *pszType, const char *pszDescription, address_t nDevice, uint8_t bFunctions);
  virtual ~CDevice();
private:
  // Disallow copy and assignments!
  CDevice (const CDevice&) = delete;
  CDevice& operator= (CDevice const &) = delete;

  // IOCC encoding and decoding ...
public:
  static IOCC DecodeIOCC (word_t wWord0, word_t wWord1);
  static void EncodeIOCC (const IOCC &iocc, word_t &wWord0, word_t &wWord1);
  static const char *FunctionName (uint8_t nFunction);

  // Device properties ...
public:
  // Return the name, type and/or description ...
  const char *GetName() const {return m_pszName;}
  const char *GetType() const {return m_pszType;}
  const char *GetDescription() const {return m_pszDescription;}
  // Return the device code for this device ...
  address_t GetDeviceCode() const {return m_nDevice;}
  void SetDeviceCode (address_t nDevice) {m_nDevice = nDevice;}
  // Return TRUE if this device supports the IOCC function ...
  bool IsSupported (uint8_t nFunction) const
    {return (nFunction < 8) && ISSET(m_bFunctions, IOCC_MASK(nFunction));}
  uint8_t GetFunctions() const {return m_bFunctions;}

  // Device methods used by the CPU to interact with this device ...
public:
  // Clear (i.e. a hardware reset) this device ...
  virtual void ClearDevice();
  //   Execute an IOCC.  This checks the function against the supported set
  // and then calls DevIOCC() to do the real work.  wACC is the CPU's
  // accumulator, which sense functions update ...
  IOCC_STATUS ExecuteIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC);
  // Return the device status word (for Sense Device) ...
  virtual word_t GetDSW() const {return 0;}
  // Return TRUE if an operation is in progress ...
  virtual bool IsBusy() const {return false;}
  // Return the status of this device for the host ...
  DEVICE_STATUS GetStatus() const;
  // Dump the device state for the user ...
  virtual void ShowDevice (ostringstream &ofs) const;
protected:
  //   This is the method that derived classes implement.  It's only called
  // for supported functions, and it must not change ANY state unless it
  // returns IOCC_OK!
  virtual IOCC_STATUS DevIOCC (const IOCC &iocc, CMemory *pMemory, word_t &wACC) {return IOCC_UNSUPPORTED;}

  // Device interrupt support ...
public:
  // Attach this device to an interrupt controller and level ...
  virtual void AttachInterrupt (CPriorityInterrupt *pInterrupt, CPriorityInterrupt::IRQLEVEL nLevel);
  // Queue an interrupt with the given ILSW bits ...
  virtual bool RequestInterrupt (word_t wILSW);
  // Remove any queued (but not delivered) interrupts for this device ...
  virtual void CancelInterrupt();
  // Return TRUE if an interrupt is queued ...
  virtual bool IsInterruptRequested() const;
  // Return the attached interrupt controller and level ...
  CPriorityInterrupt *GetInterrupt() const {return m_pInterrupt;}
  CPriorityInterrupt::IRQLEVEL GetInterruptLevel() const {return m_nLevel;}

  // Private member data...
protected:
  const char   *m_pszName;        // name of this device instance (e.g. "KBD")
  const char   *m_pszType;        // generic type of this device (e.g. "1134")
  const char   *m_pszDescription; // long form description of the device
  address_t     m_nDevice;        // device code (0..31)
  uint8_t       m_bFunctions;     // mask of supported IOCC functions
  CPriorityInterrupt           *m_pInterrupt; // interrupt controller emulation
  CPriorityInterrupt::IRQLEVEL  m_nLevel;     // our interrupt level
};
