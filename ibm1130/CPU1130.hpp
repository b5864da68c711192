//++
// CPU1130.hpp -> IBM 1130 CPU emulation
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
//   This file contains the class definition for the IBM 1130 CPU emulation.
//
// REVISION HISTORY:
//  3-MAR-25  RLA   Adapted from the HD6120.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CGenericMemory declarations
#include "Interrupt.hpp"        // CPriorityInterrupt declarations
#include "CPU.hpp"              // CCPU base class definitions
#include "Device.hpp"           // CDevice and IOCC declarations
#include "CPU1130opcodes.hpp"   // DECODED instruction structure
using std::string;              // ...
using std::vector;              // ...


class C1130 : public CCPU
{
  //++
  // IBM 1130 CPU emulation ...
  //--

  // Internal CPU registers ...
  //   These codes are passed to the GetRegister() and SetRegister() methods to
  // access internal CPU registers and state.  Note that the index registers
  // are actually core locations 1, 2 and 3!
public:
  enum _REGISTERS {
    REG_ACC     =  0,         // accumulator
    REG_EXT     =  1,         // accumulator extension
    REG_IAR     =  2,         // instruction address register
    REG_XR1     =  3,         // index register 1 (core location 1)
    REG_XR2     =  4,         //   "     "   "  2 (  "     "     2)
    REG_XR3     =  5,         //   "     "   "  3 (  "     "     3)
    REG_CARRY   =  6,         // carry indicator
    REG_OVERFLOW=  7,         // overflow indicator
    REG_WAIT    =  8,         // wait state
    MAXREG      =  9,         // number of registers
  };

  //   Every operation returns one of these status codes.  Anything but CPU_OK
  // means that the operation failed and, for Step(), that the machine state
  // is exactly what it was before the instruction started ...
public:
  enum _CPU_STATUS {
    CPU_OK,                   // success
    CPU_INVALID_OPCODE,       // unrecognized opcode field
    CPU_MEMORY_VIOLATION,     // address outside of memory (see GetFaultAddress())
    CPU_DIVIDE_BY_ZERO,       // D instruction with a zero divisor
    CPU_WAIT_STATE,           // Step() called while in the wait state
    CPU_NO_DATA,              // device read with no data available
    CPU_UNSUPPORTED_FUNCTION, // device doesn't implement the IOCC function
    CPU_DEVICE_NOT_FOUND,     // no device with that code
    CPU_INVALID_LEVEL,        // bad interrupt level or no level in service
  };
  typedef enum _CPU_STATUS CPU_STATUS;

  //   A snapshot of everything the program can see, for the host.  The level
  // in service is NOLEVEL if no interrupt is being serviced ...
  struct _CPU_STATE {
    word_t    wACC;           // accumulator
    word_t    wEXT;           // extension
    address_t wIAR;           // instruction address register
    word_t    awXR[3];        // XR1, XR2 and XR3
    bool      fCarry;         // carry indicator
    bool      fOverflow;      // overflow indicator
    bool      fWait;          // wait state
    uint64_t  llInstructions; // instructions executed since the last reset
    CPriorityInterrupt::IRQLEVEL nActiveLevel;  // interrupt level in service
  };
  typedef struct _CPU_STATE CPU_STATE;

  // Constructors and destructor ...
public:
  C1130 (size_t cwMemory=DEFAULT_CORE_SIZE);
  virtual ~C1130();
private:
  // Disallow copy and assignments!
  C1130 (const C1130 &) = delete;
  C1130& operator= (C1130 const &) = delete;

  // Magic numbers ...
public:
  enum {
    DEFAULT_CORE_SIZE = 32768,  // standard 32K word core
    MINIMUM_CORE_SIZE =    64,  // room for the XRs and interrupt vectors
    MAXIMUM_CORE_SIZE = 65536,  // all that 16 bits can address
    XR_BASE           =     0,  // XRn is core location XR_BASE+n
    VECTOR_BASE       =     8,  // level n vector is at VECTOR_BASE+n
  };

  // IBM 1130 properties ...
public:
  // Get a constant string for the CPU name, type or options ...
  virtual const char *GetDescription() const override {return "16 Bit Minicomputer";}
  virtual const char *GetName() const override {return "IBM1130";}
  // Get or set the address of the next instruction to be executed ...
  virtual address_t GetPC() const override {return m_wIAR;}
  virtual void SetPC (address_t a) override {m_wIAR = a;}
  // Return the memory and interrupt system ...
  CGenericMemory *GetMemory() const {return m_pCore;}
  CPriorityInterrupt *GetInterrupt() const {return m_pInterrupts;}
  // Return TRUE if the memory size is legal ...
  static bool IsValidCoreSize (size_t cw)
    {return (cw >= MINIMUM_CORE_SIZE) && (cw <= MAXIMUM_CORE_SIZE);}
  // Wait state ...
  bool IsWait() const {return m_fWait;}
  void ClearWait() {m_fWait = false;}
  // Carry and overflow indicators ...
  bool IsCarry() const {return m_fCarry;}
  bool IsOverflow() const {return m_fOverflow;}
  // Return the number of instructions executed since the last reset ...
  uint64_t GetInstructionCount() const {return m_llInstructions;}
  // Return the number of instructions executed by the last Run() ...
  uint32_t GetRunCount() const {return m_nRunCount;}
  // Return the status of the last failed Step() ...
  CPU_STATUS GetLastStatus() const {return m_nLastStatus;}
  // Return the address that caused the last memory violation ...
  address_t GetFaultAddress() const {return m_wFaultAddress;}
  // Enable or disable the instruction trace ...
  void SetTrace (bool fTrace=true) {m_fTrace = fTrace;}
  bool IsTrace() const {return m_fTrace;}
  // Convert status codes to strings and stop codes ...
  static const char *StatusToString (CPU_STATUS nStatus);
  static STOP_CODE StatusToStopCode (CPU_STATUS nStatus);

  // IBM 1130 public methods ...
public:
  // Reset the CPU ...
  virtual void ClearCPU() override;
  void Reset() {MasterClear();}
  // Execute exactly one instruction ...
  CPU_STATUS Step();
  // Execute instructions until something stops us ...
  virtual STOP_CODE Run (uint32_t nCount=0) override;
  // Examine and deposit memory, bounds checked ...
  CPU_STATUS ReadMemory (address_t nAddress, word_t &wData);
  CPU_STATUS WriteMemory (address_t nAddress, word_t wData);
  CPU_STATUS ReadMemory (address_t nAddress, size_t cwCount, vector<word_t> &vecData);
  CPU_STATUS WriteMemory (address_t nAddress, const vector<word_t> &vecData);
  // Return a snapshot of the registers ...
  CPU_STATE GetState() const;
  // Queue an interrupt ...
  CPU_STATUS Raise (CPriorityInterrupt::IRQLEVEL nLevel, uint8_t nDevice, word_t wILSW);
  // Leave the interrupt level in service and return to the interrupted code ...
  CPU_STATUS ReturnFromInterrupt();
  // Install a device and connect it to an interrupt level ...
  bool AttachDevice (CDevice *pDevice, CPriorityInterrupt::IRQLEVEL nLevel);
  // Return the status of a device ...
  CPU_STATUS DeviceStatus (address_t nDevice, CDevice::DEVICE_STATUS &status) const;
  // Disassemble the instruction at the specified address ...
  string Disassemble (address_t nAddress) const;
  // Read or write CPU registers ... 
  virtual cpureg_t GetRegisterCount() const override {return MAXREG;}
  virtual const char *GetRegisterName (cpureg_t nReg) const override;
  virtual unsigned GetRegisterSize (cpureg_t nReg) const override;
  virtual uint16_t GetRegister (cpureg_t nReg) const override;
  virtual void SetRegister (cpureg_t nReg, uint16_t nVal) override;

  //   The registers that Step() saves before each instruction and restores
  // if the instruction fails.  The XRs aren't here because they're in core,
  // and the write journal takes care of them ...
private:
  struct _SAVED {
    word_t    wACC, wEXT;     // accumulator and extension
    address_t wIAR;           // instruction address register
    bool      fCarry, fOverflow, fWait;
  };
  typedef struct _SAVED SAVED;
  void SaveRegisters (SAVED &save) const;
  void RestoreRegisters (const SAVED &save);

  // Core memory access primitives ...
private:
  // Read or write core, with bounds checking ...
  CPU_STATUS ReadCore (address_t nAddress, word_t &wData);
  CPU_STATUS WriteCore (address_t nAddress, word_t wData);
  // Report a memory violation ...
  CPU_STATUS MemoryViolation (address_t nAddress)
    {m_wFaultAddress = nAddress;  return CPU_MEMORY_VIOLATION;}
  // Index registers (tag 1..3) - these are core locations 1..3 ...
  inline word_t GetXR (uint8_t nTag) const {return m_pCore->MemRead(XR_BASE+nTag);}
  inline void SetXR (uint8_t nTag, word_t w) {m_pCore->CPUwrite(XR_BASE+nTag, w);}
  // Return the register selected by a tag for LDX, STX and MDX ...
  inline word_t GetTagRegister (uint8_t nTag) const {return (nTag == 0) ? m_wIAR : GetXR(nTag);}
  inline void SetTagRegister (uint8_t nTag, word_t w)
    {if (nTag == 0) m_wIAR = w;  else SetXR(nTag, w);}

  // Instruction fetch and decode ...
private:
  CPU_STATUS Fetch (DECODED &decoded);
  CPU_STATUS EffectiveAddress (const DECODED &decoded, address_t &wEA, bool fIndex=true);
  CPU_STATUS Execute (const DECODED &decoded);

  // Arithmetic primitives ...
private:
  void Add (word_t wOperand, bool fSubtract);
  void AddDouble (uint32_t lOperand, bool fSubtract);
  void Multiply (word_t wOperand);
  CPU_STATUS Divide (word_t wOperand);
  // Evaluate the BSC/BSI conditions and return TRUE if any is true ...
  bool TestConditions (uint8_t bConditions);

  // Instruction groups ...
private:
  CPU_STATUS DoLoadStore (const DECODED &decoded);
  CPU_STATUS DoArithmetic (const DECODED &decoded);
  CPU_STATUS DoShiftLeft (const DECODED &decoded);
  CPU_STATUS DoShiftRight (const DECODED &decoded);
  CPU_STATUS DoBSC (const DECODED &decoded);
  CPU_STATUS DoBSI (const DECODED &decoded);
  CPU_STATUS DoIndex (const DECODED &decoded);
  CPU_STATUS DoMDX (const DECODED &decoded);
  CPU_STATUS DoXIO (const DECODED &decoded);
  // Deliver an interrupt, if one is requested ...
  CPU_STATUS PollInterrupts();

  // Private member data ...
private:
  CGenericMemory     *m_pCore;        // core memory (we own this)
  CPriorityInterrupt *m_pInterrupts;  // interrupt system (this too)
  word_t        m_wACC;           // accumulator
  word_t        m_wEXT;           // accumulator extension
  address_t     m_wIAR;           // instruction address register
  bool          m_fCarry;         // carry indicator
  bool          m_fOverflow;      // overflow indicator
  bool          m_fWait;          // wait state
  uint64_t      m_llInstructions; // instructions executed
  uint32_t      m_nRunCount;      // instructions executed by the last Run()
  CPU_STATUS    m_nLastStatus;    // status of the last failed Step()
  address_t     m_wFaultAddress;  // address of the last memory violation
  bool          m_fTrace;         // log every instruction
};
