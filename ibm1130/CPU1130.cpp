//++
// CPU1130.cpp -> IBM 1130 CPU emulation
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
//   This module implements the IBM 1130 CPU - the accumulator, extension,
// instruction address register, carry and overflow indicators, and the three
// index registers.  Remember that the index registers are really core
// locations 1, 2 and 3, so anything that writes those locations changes the
// XRs too, and vice versa.  That's the way the hardware works and lots of
// 1130 code depends on it.
//
// INSTRUCTION FORMATS
//   Every instruction has a five bit opcode, a format bit (F), a two bit tag
// (T) and an eight bit displacement.  Short (F=0) instructions are one word
// and the effective address is the IAR, which already points to the next
// instruction, plus the sign extended displacement.  Long (F=1) instructions
// are two words and the second word is the address.  In either case a non-
// zero tag adds the selected XR, and long instructions with the IA bit set
// use the word at that address as the effective address.  There's only one
// level of indirection.
//
// ERRORS
//   Step() executes exactly one instruction and returns a CPU_STATUS.  If the
// instruction fails for any reason - invalid opcode, memory violation, divide
// by zero, or an I/O error - then all the registers are restored to the
// values they had before the instruction started and every core location
// the instruction wrote is put back via the CGenericMemory write journal.
// That guarantees that a failed step is invisible to the program.  Note that
// devices and the interrupt system are NOT rolled back, however devices are
// required to not change anything unless their IOCC succeeds.
//
// INTERRUPTS
//   After every successful instruction (unless the CPU is now in the wait
// state) we check the interrupt system.  If an interrupt can be delivered on
// level L, then the CPU does the equivalent of a BSI I through location 8+L,
// storing the IAR in the first word of the service routine.  The interrupt
// system remembers the level and the return address on its in service stack,
// and either BOSC or ReturnFromInterrupt() ends the level.  The instruction
// is committed before the interrupt is delivered, so a bad vector is reported
// as an error but it never undoes an instruction (e.g. an XIO) that already
// succeeded.  The interrupt stays queued in that case.
//
// REVISION HISTORY:
//  3-MAR-25  RLA   Adapted from the HD6120.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CGenericMemory declarations
#include "Interrupt.hpp"        // CPriorityInterrupt declarations
#include "CPU.hpp"              // CCPU base class definitions
#include "Device.hpp"           // CDevice and IOCC declarations
#include "CPU1130opcodes.hpp"   // opcode definitions and disassembler
#include "CPU1130.hpp"          // declarations for this module

// Internal CPU register names for GetRegisterName() ...
PRIVATE const char *g_apszRegisters[C1130::MAXREG] = {
  "ACC", "EXT", "IAR", "XR1", "XR2", "XR3", "C", "V", "WAIT"
};


C1130::C1130 (size_t cwMemory)
  : CCPU(DBGNEW CGenericMemory(cwMemory), DBGNEW CPriorityInterrupt())
{
  //++
  //   The 1130 CPU creates and owns its own core memory and interrupt system.
  // The memory must be at least big enough for the XRs and the interrupt
  // vectors, and no bigger than 16 bits can address.
  //--
  assert(IsValidCoreSize(cwMemory));
  m_pCore = dynamic_cast<CGenericMemory *> (m_pMemory);
  m_pInterrupts = dynamic_cast<CPriorityInterrupt *> (m_pInterrupt);
  assert((m_pCore != NULL) && (m_pInterrupts != NULL));
  m_fTrace = false;
  C1130::ClearCPU();
}

C1130::~C1130()
{
  //++
  //   Delete the devices first, because they still reference the interrupt
  // system, and then the memory and interrupts ...
  //--
  RemoveAllDevices();
  delete m_pInterrupts;  m_pInterrupts = NULL;  m_pInterrupt = NULL;
  delete m_pCore;  m_pCore = NULL;  m_pMemory = NULL;
}

void C1130::ClearCPU()
{
  //++
  //   Reset the CPU to its power on state.  All the registers, including the
  // XRs, are zeroed but the rest of core is left alone so that any program
  // stays loaded ...
  //--
  CCPU::ClearCPU();
  m_wACC = m_wEXT = 0;  m_wIAR = 0;
  m_fCarry = m_fOverflow = m_fWait = false;
  m_llInstructions = 0;  m_nRunCount = 0;
  m_nLastStatus = CPU_OK;  m_wFaultAddress = 0;
  for (uint8_t n = 1;  n <= 3;  ++n)  m_pCore->UIwrite(XR_BASE+n, 0);
}

const char *C1130::StatusToString (CPU_STATUS nStatus)
{
  //++
  // Convert a CPU_STATUS to a message for the user ...
  //--
  switch (nStatus) {
    case CPU_OK:                    return "OK";
    case CPU_INVALID_OPCODE:        return "invalid opcode";
    case CPU_MEMORY_VIOLATION:      return "memory violation";
    case CPU_DIVIDE_BY_ZERO:        return "divide by zero";
    case CPU_WAIT_STATE:            return "wait state";
    case CPU_NO_DATA:               return "no data available";
    case CPU_UNSUPPORTED_FUNCTION:  return "unsupported IOCC function";
    case CPU_DEVICE_NOT_FOUND:      return "device not found";
    case CPU_INVALID_LEVEL:         return "invalid interrupt level";
    default:                        return "unknown";
  }
}

CCPU::STOP_CODE C1130::StatusToStopCode (CPU_STATUS nStatus)
{
  //++
  // Map the status of a failed Step() to the reason Run() stops ...
  //--
  switch (nStatus) {
    case CPU_OK:                    return STOP_NONE;
    case CPU_INVALID_OPCODE:        return STOP_ILLEGAL_OPCODE;
    case CPU_MEMORY_VIOLATION:      return STOP_ILLEGAL_ADDRESS;
    case CPU_DIVIDE_BY_ZERO:        return STOP_ARITHMETIC;
    case CPU_WAIT_STATE:            return STOP_HALT;
    case CPU_NO_DATA:
    case CPU_UNSUPPORTED_FUNCTION:
    case CPU_DEVICE_NOT_FOUND:
    case CPU_INVALID_LEVEL:         return STOP_ILLEGAL_IO;
    default:                        return STOP_BREAK;
  }
}

const char *C1130::GetRegisterName (cpureg_t nReg) const
{
  return (nReg < MAXREG) ? g_apszRegisters[nReg] : "???";
}

unsigned C1130::GetRegisterSize (cpureg_t nReg) const
{
  //++
  // Return the size of a register, in bits ...
  //--
  switch (nReg) {
    case REG_CARRY:
    case REG_OVERFLOW:
    case REG_WAIT:    return 1;
    default:          return 16;
  }
}

uint16_t C1130::GetRegister (cpureg_t nReg) const
{
  //++
  // This method will return the contents of an internal CPU register ...
  //--
  switch (nReg) {
    case REG_ACC:       return m_wACC;
    case REG_EXT:       return m_wEXT;
    case REG_IAR:       return m_wIAR;
    case REG_XR1:       return GetXR(1);
    case REG_XR2:       return GetXR(2);
    case REG_XR3:       return GetXR(3);
    case REG_CARRY:     return m_fCarry ? 1 : 0;
    case REG_OVERFLOW:  return m_fOverflow ? 1 : 0;
    case REG_WAIT:      return m_fWait ? 1 : 0;
    default:            return 0;
  }
}

void C1130::SetRegister (cpureg_t nReg, uint16_t wData)
{
  //++
  //   Change the contents of an internal CPU register.  Setting an XR is the
  // same as depositing in core location 1, 2 or 3 ...
  //--
  switch (nReg) {
    case REG_ACC:       m_wACC = wData;              break;
    case REG_EXT:       m_wEXT = wData;              break;
    case REG_IAR:       m_wIAR = ADDRESS(wData);     break;
    case REG_XR1:       m_pCore->UIwrite(XR_BASE+1, wData);  break;
    case REG_XR2:       m_pCore->UIwrite(XR_BASE+2, wData);  break;
    case REG_XR3:       m_pCore->UIwrite(XR_BASE+3, wData);  break;
    case REG_CARRY:     m_fCarry = (wData != 0);     break;
    case REG_OVERFLOW:  m_fOverflow = (wData != 0);  break;
    case REG_WAIT:      m_fWait = (wData != 0);      break;
  }
}

C1130::CPU_STATE C1130::GetState() const
{
  //++
  // Return a snapshot of all the registers, for the host ...
  //--
  CPU_STATE state;
  state.wACC = m_wACC;  state.wEXT = m_wEXT;  state.wIAR = m_wIAR;
  for (uint8_t n = 1;  n <= 3;  ++n)  state.awXR[n-1] = GetXR(n);
  state.fCarry = m_fCarry;  state.fOverflow = m_fOverflow;  state.fWait = m_fWait;
  state.llInstructions = m_llInstructions;
  state.nActiveLevel = m_pInterrupts->GetActiveLevel();
  return state;
}

void C1130::SaveRegisters (SAVED &save) const
{
  save.wACC = m_wACC;  save.wEXT = m_wEXT;  save.wIAR = m_wIAR;
  save.fCarry = m_fCarry;  save.fOverflow = m_fOverflow;  save.fWait = m_fWait;
}

void C1130::RestoreRegisters (const SAVED &save)
{
  m_wACC = save.wACC;  m_wEXT = save.wEXT;  m_wIAR = save.wIAR;
  m_fCarry = save.fCarry;  m_fOverflow = save.fOverflow;  m_fWait = save.fWait;
}

C1130::CPU_STATUS C1130::ReadCore (address_t nAddress, word_t &wData)
{
  //++
  //   Read a word from core for the CPU.  If the address is outside of core,
  // then wData is unchanged and we return a memory violation ...
  //--
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  wData = m_pCore->CPUread(nAddress);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::WriteCore (address_t nAddress, word_t wData)
{
  //++
  //   Write a word to core for the CPU.  This goes thru the write journal
  // so that it can be undone if the instruction fails later on ...
  //--
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  m_pCore->CPUwrite(nAddress, wData);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::ReadMemory (address_t nAddress, word_t &wData)
{
  //++
  // Examine one word of memory for the host ...
  //--
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  wData = m_pCore->UIread(nAddress);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::WriteMemory (address_t nAddress, word_t wData)
{
  //++
  //   Deposit one word of memory for the host.  Remember that writing to
  // locations 1, 2 or 3 changes the corresponding XR!
  //--
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  m_pCore->UIwrite(nAddress, wData);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::ReadMemory (address_t nAddress, size_t cwCount, vector<word_t> &vecData)
{
  //++
  //   Examine a block of memory.  The whole range is checked first and if
  // any part of it is outside of core then nothing is returned ...
  //--
  vecData.clear();
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  if (!m_pCore->IsValid(nAddress, cwCount)) return MemoryViolation(ADDRESS(m_pCore->Size()));
  for (size_t i = 0;  i < cwCount;  ++i)
    vecData.push_back(m_pCore->UIread(ADDRESS(nAddress+i)));
  return CPU_OK;
}

C1130::CPU_STATUS C1130::WriteMemory (address_t nAddress, const vector<word_t> &vecData)
{
  //++
  //   Deposit a block of memory (e.g. a program image).  Like ReadMemory(),
  // the whole range is checked first and there are no partial writes ...
  //--
  if (!m_pCore->IsValid(nAddress)) return MemoryViolation(nAddress);
  if (!m_pCore->IsValid(nAddress, vecData.size())) return MemoryViolation(ADDRESS(m_pCore->Size()));
  for (size_t i = 0;  i < vecData.size();  ++i)
    m_pCore->UIwrite(ADDRESS(nAddress+i), vecData[i]);
  return CPU_OK;
}

string C1130::Disassemble (address_t nAddress) const
{
  //++
  //   Disassemble the instruction at nAddress.  The second word is only used
  // if this turns out to be a long instruction, and it's OK if that's off
  // the end of memory ...
  //--
  if (!m_pCore->IsValid(nAddress)) return string();
  word_t wWord0 = m_pCore->UIread(nAddress);
  address_t nNext = ADDRESS(nAddress+1);
  word_t wWord1 = m_pCore->IsValid(nNext) ? m_pCore->UIread(nNext) : 0;
  return ::Disassemble(wWord0, wWord1);
}

C1130::CPU_STATUS C1130::Raise (CPriorityInterrupt::IRQLEVEL nLevel, uint8_t nDevice, word_t wILSW)
{
  //++
  // Queue an interrupt request on behalf of the host or a device ...
  //--
  return m_pInterrupts->Raise(nLevel, nDevice, wILSW) ? CPU_OK : CPU_INVALID_LEVEL;
}

C1130::CPU_STATUS C1130::ReturnFromInterrupt()
{
  //++
  //   End the interrupt level in service and go back to the instruction that
  // was interrupted.  It's an error if no level is in service now ...
  //--
  CPriorityInterrupt::IRQLEVEL nLevel = m_pInterrupts->GetActiveLevel();
  address_t wReturn;
  if (!m_pInterrupts->Return(wReturn)) return CPU_INVALID_LEVEL;
  m_wIAR = wReturn;
  LOGF(TRACE, "return from interrupt level %d to %04X", nLevel, wReturn);
  return CPU_OK;
}

bool C1130::AttachDevice (CDevice *pDevice, CPriorityInterrupt::IRQLEVEL nLevel)
{
  //++
  //   Connect a device to the interrupt system on the given level and then
  // install it on the I/O bus.  If that fails (because something else has the
  // same device code) then the caller still owns the device.  The device code
  // is checked first so that a rejected device is never connected to the
  // interrupt system, and deleting it can't cancel the other device's
  // interrupts ...
  //--
  assert(pDevice != NULL);
  if (!CPriorityInterrupt::IsValidLevel(nLevel)) {
    LOGF(ERROR, "invalid interrupt level %d for %s", nLevel, pDevice->GetName());
    return false;
  }
  if (FindDevice(pDevice->GetDeviceCode()) != NULL) {
    LOGF(ERROR, "device code %02X already assigned to %s",
      pDevice->GetDeviceCode(), FindDevice(pDevice->GetDeviceCode())->GetName());
    return false;
  }
  pDevice->AttachInterrupt(m_pInterrupts, nLevel);
  return InstallDevice(pDevice);
}

C1130::CPU_STATUS C1130::DeviceStatus (address_t nDevice, CDevice::DEVICE_STATUS &status) const
{
  //++
  // Return the status of the device with this code ...
  //--
  CDevice *pDevice = FindDevice(nDevice);
  if (pDevice == NULL) return CPU_DEVICE_NOT_FOUND;
  status = pDevice->GetStatus();
  return CPU_OK;
}

C1130::CPU_STATUS C1130::Fetch (DECODED &decoded)
{
  //++
  //   Fetch the next instruction, one or two words as required, and decode
  // it.  The IAR is left pointing to the next instruction ...
  //--
  word_t wWord0, wWord1 = 0;
  CPU_STATUS nStatus = ReadCore(m_wIAR, wWord0);
  if (nStatus != CPU_OK) return nStatus;
  m_wIAR = ADDRESS(m_wIAR+1);
  if (IsLongInstruction(wWord0)) {
    nStatus = ReadCore(m_wIAR, wWord1);
    if (nStatus != CPU_OK) return nStatus;
    m_wIAR = ADDRESS(m_wIAR+1);
  }
  if (!DecodeInstruction(wWord0, wWord1, decoded)) return CPU_INVALID_OPCODE;
  return CPU_OK;
}

C1130::CPU_STATUS C1130::EffectiveAddress (const DECODED &decoded, address_t &wEA, bool fIndex)
{
  //++
  //   Calculate the effective address.  Short instructions are relative to
  // the IAR (which already points past this instruction!), long ones use the
  // second word directly.  Add the XR if there's a tag (and fIndex is TRUE -
  // LDX, STX and MDX use the tag for something else) and then do one level
  // of indirection if IA is set.  All of this wraps around at 16 bits.
  //--
  address_t wAddress;
  if (decoded.fLong)
    wAddress = decoded.wDisplacement;
  else
    wAddress = ADDRESS(m_wIAR + SIGNEX8(decoded.wDisplacement));
  if (fIndex && (decoded.nTag != 0))
    wAddress = ADDRESS(wAddress + GetXR(decoded.nTag));
  if (decoded.fIndirect) {
    word_t wPointer;
    CPU_STATUS nStatus = ReadCore(wAddress, wPointer);
    if (nStatus != CPU_OK) return nStatus;
    wAddress = ADDRESS(wPointer);
  }
  wEA = wAddress;
  return CPU_OK;
}

void C1130::Add (word_t wOperand, bool fSubtract)
{
  //++
  //   Add or subtract a word to/from the ACC.  Carry is the carry out of bit
  // 0 (or the borrow for subtract), and overflow is set (but never cleared!)
  // if the signed result doesn't fit ...
  //--
  uint32_t lResult;  bool fOverflow;
  if (!fSubtract) {
    lResult = (uint32_t) m_wACC + wOperand;
    m_fCarry = lResult > 0xFFFF;
    fOverflow = ISSET(~(m_wACC ^ wOperand) & (m_wACC ^ lResult), 0x8000);
  } else {
    lResult = (uint32_t) m_wACC - wOperand;
    m_fCarry = m_wACC < wOperand;
    fOverflow = ISSET((m_wACC ^ wOperand) & (m_wACC ^ lResult), 0x8000);
  }
  if (fOverflow) m_fOverflow = true;
  m_wACC = WORD(lResult);
}

void C1130::AddDouble (uint32_t lOperand, bool fSubtract)
{
  //++
  // Same as Add(), but for the 32 bit ACC,EXT pair ...
  //--
  uint32_t lACC = MKLONG(m_wACC, m_wEXT);
  uint64_t llResult;  bool fOverflow;
  if (!fSubtract) {
    llResult = (uint64_t) lACC + lOperand;
    m_fCarry = llResult > 0xFFFFFFFFULL;
    fOverflow = ISSET(~(lACC ^ lOperand) & (lACC ^ (uint32_t) llResult), 0x80000000UL);
  } else {
    llResult = (uint64_t) lACC - lOperand;
    m_fCarry = lACC < lOperand;
    fOverflow = ISSET((lACC ^ lOperand) & (lACC ^ (uint32_t) llResult), 0x80000000UL);
  }
  if (fOverflow) m_fOverflow = true;
  m_wACC = HIWORD(llResult);  m_wEXT = LOWORD(llResult);
}

void C1130::Multiply (word_t wOperand)
{
  //++
  // Signed 16x16 multiply with a 32 bit product in ACC,EXT ...
  //--
  int32_t lProduct = (int32_t) (int16_t) m_wACC * (int32_t) (int16_t) wOperand;
  m_wACC = HIWORD((uint32_t) lProduct);  m_wEXT = LOWORD((uint32_t) lProduct);
}

C1130::CPU_STATUS C1130::Divide (word_t wOperand)
{
  //++
  //   Signed divide of ACC,EXT by the operand.  The quotient goes to the ACC
  // and the remainder to EXT.  If the quotient won't fit in 16 bits then set
  // overflow and leave ACC and EXT alone ...
  //--
  int16_t nDivisor = (int16_t) wOperand;
  if (nDivisor == 0) return CPU_DIVIDE_BY_ZERO;
  int64_t llDividend = (int32_t) MKLONG(m_wACC, m_wEXT);
  int64_t llQuotient = llDividend / nDivisor;
  int64_t llRemainder = llDividend % nDivisor;
  if ((llQuotient > INT16_MAX) || (llQuotient < INT16_MIN)) {
    m_fOverflow = true;
  } else {
    m_wACC = WORD(llQuotient);  m_wEXT = WORD(llRemainder);
  }
  return CPU_OK;
}

bool C1130::TestConditions (uint8_t bConditions)
{
  //++
  //   Return TRUE if ANY of the selected conditions is true.  Note that just
  // testing the overflow indicator resets it!
  //--
  bool fTrue = false;
  if (ISSET(bConditions, COND_ZERO)      && (m_wACC == 0))          fTrue = true;
  if (ISSET(bConditions, COND_MINUS)     && ISSET(m_wACC, 0x8000))  fTrue = true;
  if (ISSET(bConditions, COND_PLUS)      && (m_wACC != 0) && !ISSET(m_wACC, 0x8000)) fTrue = true;
  if (ISSET(bConditions, COND_EVEN)      && ISEVEN(m_wACC))         fTrue = true;
  if (ISSET(bConditions, COND_CARRY_OFF) && !m_fCarry)              fTrue = true;
  if (ISSET(bConditions, COND_OVFL_OFF)) {
    if (!m_fOverflow) fTrue = true;
    m_fOverflow = false;
  }
  return fTrue;
}

C1130::CPU_STATUS C1130::DoLoadStore (const DECODED &decoded)
{
  //++
  // LD, LDD, STO, STD, LDS and STS ...
  //--
  if (decoded.wOpcode == OP_LDS) {
    m_fCarry = ISSET(decoded.bModifiers, 2);
    m_fOverflow = ISSET(decoded.bModifiers, 1);
    return CPU_OK;
  }

  address_t wEA;
  CPU_STATUS nStatus = EffectiveAddress(decoded, wEA);
  if (nStatus != CPU_OK) return nStatus;
  word_t wHigh, wLow;
  switch (decoded.wOpcode) {
    case OP_LD:
      return ReadCore(wEA, m_wACC);

    case OP_LDD:
      if ((nStatus = ReadCore(wEA, wHigh)) != CPU_OK) return nStatus;
      if ((nStatus = ReadCore(ADDRESS(wEA+1), wLow)) != CPU_OK) return nStatus;
      m_wACC = wHigh;  m_wEXT = wLow;
      return CPU_OK;

    case OP_STO:
      return WriteCore(wEA, m_wACC);

    case OP_STD:
      if ((nStatus = WriteCore(wEA, m_wACC)) != CPU_OK) return nStatus;
      return WriteCore(ADDRESS(wEA+1), m_wEXT);

    case OP_STS:
      // Keep the high byte, carry -> bit 14, overflow -> bit 15 ...
      if ((nStatus = ReadCore(wEA, wHigh)) != CPU_OK) return nStatus;
      wHigh = (wHigh & 0xFF00) | (m_fCarry ? 2 : 0) | (m_fOverflow ? 1 : 0);
      if ((nStatus = WriteCore(wEA, wHigh)) != CPU_OK) return nStatus;
      m_fOverflow = false;
      return CPU_OK;
  }
  return CPU_INVALID_OPCODE;
}

C1130::CPU_STATUS C1130::DoArithmetic (const DECODED &decoded)
{
  //++
  // A, AD, S, SD, M, D, AND, OR and EOR ...
  //--
  address_t wEA;  word_t wOperand, wLow = 0;
  CPU_STATUS nStatus = EffectiveAddress(decoded, wEA);
  if (nStatus != CPU_OK) return nStatus;
  if ((nStatus = ReadCore(wEA, wOperand)) != CPU_OK) return nStatus;
  if ((decoded.wOpcode == OP_AD) || (decoded.wOpcode == OP_SD)) {
    if ((nStatus = ReadCore(ADDRESS(wEA+1), wLow)) != CPU_OK) return nStatus;
  }

  switch (decoded.wOpcode) {
    case OP_A:    Add(wOperand, false);                           break;
    case OP_S:    Add(wOperand, true);                            break;
    case OP_AD:   AddDouble(MKLONG(wOperand, wLow), false);       break;
    case OP_SD:   AddDouble(MKLONG(wOperand, wLow), true);        break;
    case OP_M:    Multiply(wOperand);                             break;
    case OP_D:    return Divide(wOperand);
    case OP_AND:  m_wACC &= wOperand;                             break;
    case OP_OR:   m_wACC |= wOperand;                             break;
    case OP_EOR:  m_wACC ^= wOperand;                             break;
    default:      return CPU_INVALID_OPCODE;
  }
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoShiftLeft (const DECODED &decoded)
{
  //++
  //   SLA, SLCA, SLT and SLC.  The count is the low six bits of either the
  // displacement or, if there's a tag, the XR.  SLA and SLCA shift only the
  // ACC and SLT and SLC shift ACC,EXT, but it's easier to do them all in
  // 32 bits.  Carry is the last bit shifted out.
  //
  //   SLCA and SLC with a tag normalize - they stop early when the high bit
  // is a one, store the remaining count back into the low byte of the XR,
  // and set carry if the shift ended early.  A zero count never changes
  // carry, normalizing or not ...
  //--
  uint8_t nTag = decoded.nTag;
  uint8_t nCount = (nTag != 0) ? (GetXR(nTag) & IR_COUNT) : (decoded.bModifiers & IR_COUNT);
  bool fDouble = (decoded.wOpcode == OP_SLT) || (decoded.wOpcode == OP_SLC);
  bool fNormalize = (nTag != 0) && ((decoded.wOpcode == OP_SLCA) || (decoded.wOpcode == OP_SLC));
  uint32_t lValue = fDouble ? MKLONG(m_wACC, m_wEXT) : ((uint32_t) m_wACC << 16);

  if (fNormalize) {
    uint8_t nStart = nCount;
    while ((nCount > 0) && !ISSET(lValue, 0x80000000UL)) {
      lValue <<= 1;  --nCount;
    }
    if (nStart != 0) m_fCarry = (nCount != 0);
    SetXR(nTag, (GetXR(nTag) & 0xFF00) | nCount);
  } else {
    for (;  nCount > 0;  --nCount) {
      m_fCarry = ISSET(lValue, 0x80000000UL);
      lValue <<= 1;
    }
  }

  m_wACC = HIWORD(lValue);
  if (fDouble) m_wEXT = LOWORD(lValue);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoShiftRight (const DECODED &decoded)
{
  //++
  //   SRA is an arithmetic (sign extending) shift of the ACC, SRT is a logical
  // shift of ACC,EXT, and RTE rotates ACC,EXT.  SRA and SRT set carry to the
  // last bit shifted out, but RTE doesn't change any indicators.
  //--
  uint8_t nCount = (decoded.nTag != 0) ? (GetXR(decoded.nTag) & IR_COUNT) : (decoded.bModifiers & IR_COUNT);
  uint32_t lValue = MKLONG(m_wACC, m_wEXT);
  switch (decoded.wOpcode) {
    case OP_SRA:
      for (;  nCount > 0;  --nCount) {
        m_fCarry = ISODD(m_wACC);
        m_wACC = (m_wACC >> 1) | (m_wACC & 0x8000);
      }
      return CPU_OK;

    case OP_SRT:
      for (;  nCount > 0;  --nCount) {
        m_fCarry = ISODD(lValue);
        lValue >>= 1;
      }
      break;

    case OP_RTE:
      for (;  nCount > 0;  --nCount)
        lValue = (lValue >> 1) | ((lValue & 1) << 31);
      break;

    default:
      return CPU_INVALID_OPCODE;
  }
  m_wACC = HIWORD(lValue);  m_wEXT = LOWORD(lValue);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoBSC (const DECODED &decoded)
{
  //++
  //   BSC (branch or skip on condition).  The short form skips the next word
  // if ANY selected condition is true.  The long form is the other way around
  // and branches only if NONE of them is true.  A long BSC with bit 9 set is
  // BOSC and, if it branches, it also ends the interrupt level in service.
  //--
  uint8_t bConditions = decoded.bModifiers & 0x3F;
  if (!decoded.fLong) {
    if (TestConditions(bConditions)) m_wIAR = ADDRESS(m_wIAR+1);
    return CPU_OK;
  }

  address_t wEA;
  CPU_STATUS nStatus = EffectiveAddress(decoded, wEA);
  if (nStatus != CPU_OK) return nStatus;
  if (TestConditions(bConditions)) return CPU_OK;
  m_wIAR = wEA;
  if (ISSET(decoded.bModifiers, COND_BOSC)) {
    CPriorityInterrupt::IRQLEVEL nLevel = m_pInterrupts->GetActiveLevel();
    if (m_pInterrupts->Dismiss()) LOGF(TRACE, "BOSC exits interrupt level %d", nLevel);
  }
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoBSI (const DECODED &decoded)
{
  //++
  //   BSI (branch and store IAR) stores the return address in the first word
  // of the subroutine and jumps to the second.  The long form is conditional,
  // just like BSC - it branches only if none of the conditions is true.
  //--
  address_t wEA;
  CPU_STATUS nStatus = EffectiveAddress(decoded, wEA);
  if (nStatus != CPU_OK) return nStatus;
  if (decoded.fLong && TestConditions(decoded.bModifiers & 0x3F)) return CPU_OK;
  if ((nStatus = WriteCore(wEA, m_wIAR)) != CPU_OK) return nStatus;
  m_wIAR = ADDRESS(wEA+1);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoIndex (const DECODED &decoded)
{
  //++
  //   LDX and STX.  Here the tag selects the register - XR1, XR2 or XR3, or
  // the IAR for tag 0 - and so it doesn't index the address.  Short LDX loads
  // the sign extended displacement itself, which makes LDX 0 a short jump.
  //--
  address_t wEA;  word_t wData;  CPU_STATUS nStatus;
  if ((decoded.wOpcode == OP_LDX) && !decoded.fLong) {
    SetTagRegister(decoded.nTag, WORD(SIGNEX8(decoded.bModifiers)));
    return CPU_OK;
  }
  if ((nStatus = EffectiveAddress(decoded, wEA, false)) != CPU_OK) return nStatus;
  if (decoded.wOpcode == OP_LDX) {
    if ((nStatus = ReadCore(wEA, wData)) != CPU_OK) return nStatus;
    SetTagRegister(decoded.nTag, wData);
    return CPU_OK;
  }
  return WriteCore(wEA, GetTagRegister(decoded.nTag));
}

C1130::CPU_STATUS C1130::DoMDX (const DECODED &decoded)
{
  //++
  //   MDX (modify index and skip) comes in four flavors -
  //
  //      MDX    disp       IAR <- IAR + disp (a relative jump, no skip)
  //      MDX  n disp       XRn <- XRn + disp
  //      MDX L n addr      XRn <- XRn + MEM(addr)
  //      MDX L addr,mod    MEM(addr) <- MEM(addr) + mod
  //
  // All but the first skip the next word if the result is zero or if its
  // sign is different from the original value ...
  //--
  uint8_t nTag = decoded.nTag;
  if (!decoded.fLong && (nTag == 0)) {
    m_wIAR = ADDRESS(m_wIAR + SIGNEX8(decoded.bModifiers));
    return CPU_OK;
  }

  word_t wOld, wNew, wDelta;  CPU_STATUS nStatus;
  if (decoded.fLong && (nTag == 0)) {
    address_t wAddress = decoded.wDisplacement;
    if ((nStatus = ReadCore(wAddress, wOld)) != CPU_OK) return nStatus;
    wNew = WORD(wOld + SIGNEX8(decoded.bModifiers));
    if ((nStatus = WriteCore(wAddress, wNew)) != CPU_OK) return nStatus;
  } else {
    if (decoded.fLong) {
      address_t wEA;
      if ((nStatus = EffectiveAddress(decoded, wEA, false)) != CPU_OK) return nStatus;
      if ((nStatus = ReadCore(wEA, wDelta)) != CPU_OK) return nStatus;
    } else
      wDelta = WORD(SIGNEX8(decoded.bModifiers));
    wOld = GetXR(nTag);  wNew = WORD(wOld + wDelta);
    SetXR(nTag, wNew);
  }

  if ((wNew == 0) || (ISSET(wNew, 0x8000) != ISSET(wOld, 0x8000)))
    m_wIAR = ADDRESS(m_wIAR+1);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::DoXIO (const DECODED &decoded)
{
  //++
  //   XIO (execute I/O).  The effective address points to the two word IOCC.
  // Sense Interrupt isn't really directed at any device - it just loads the
  // ILSW of the level in service into the ACC.  Everything else goes to the
  // device, which first checks that it supports the function.
  //--
  address_t wEA;  word_t wWord0, wWord1;  CPU_STATUS nStatus;
  if ((nStatus = EffectiveAddress(decoded, wEA)) != CPU_OK) return nStatus;
  if ((nStatus = ReadCore(wEA, wWord0)) != CPU_OK) return nStatus;
  if ((nStatus = ReadCore(ADDRESS(wEA+1), wWord1)) != CPU_OK) return nStatus;
  IOCC iocc = CDevice::DecodeIOCC(wWord0, wWord1);

  if (iocc.nFunction == CDevice::IOCC_SENSE_INTERRUPT) {
    m_wACC = m_pInterrupts->GetActiveILSW();
    return CPU_OK;
  }

  CDevice *pDevice = FindDevice((address_t) iocc.nDevice);
  if (pDevice == NULL) {
    LOGF(WARNING, "XIO at %04X to non-existent device %02X", m_nLastPC, iocc.nDevice);
    return CPU_DEVICE_NOT_FOUND;
  }

  word_t wACC = m_wACC;
  switch (pDevice->ExecuteIOCC(iocc, m_pCore, wACC)) {
    case CDevice::IOCC_OK:
      m_wACC = wACC;
      return CPU_OK;
    case CDevice::IOCC_NO_DATA:
      LOGF(WARNING, "XIO at %04X no data from %s", m_nLastPC, pDevice->GetName());
      return CPU_NO_DATA;
    case CDevice::IOCC_BAD_ADDRESS:
      LOGF(WARNING, "XIO at %04X %s buffer %04X outside of memory", m_nLastPC, pDevice->GetName(), iocc.wWCA);
      return MemoryViolation(iocc.wWCA);
    case CDevice::IOCC_UNSUPPORTED:
    default:
      LOGF(WARNING, "XIO at %04X %s doesn't support %s", m_nLastPC, pDevice->GetName(), CDevice::FunctionName(iocc.nFunction));
      return CPU_UNSUPPORTED_FUNCTION;
  }
}

C1130::CPU_STATUS C1130::Execute (const DECODED &decoded)
{
  //++
  // Dispatch a decoded instruction to the code that implements it ...
  //--
  switch (decoded.wOpcode) {
    case OP_LD:   case OP_LDD:  case OP_STO:  case OP_STD:
    case OP_LDS:  case OP_STS:
      return DoLoadStore(decoded);

    case OP_A:    case OP_AD:   case OP_S:    case OP_SD:
    case OP_M:    case OP_D:
    case OP_AND:  case OP_OR:   case OP_EOR:
      return DoArithmetic(decoded);

    case OP_SLA:  case OP_SLCA: case OP_SLT:  case OP_SLC:
      return DoShiftLeft(decoded);
    case OP_SRA:  case OP_SRT:  case OP_RTE:
      return DoShiftRight(decoded);

    case OP_BSC:  return DoBSC(decoded);
    case OP_BSI:  return DoBSI(decoded);
    case OP_LDX:
    case OP_STX:  return DoIndex(decoded);
    case OP_MDX:  return DoMDX(decoded);
    case OP_XIO:  return DoXIO(decoded);

    case OP_WAIT:
      m_fWait = true;
      return CPU_OK;

    default:
      return CPU_INVALID_OPCODE;
  }
}

C1130::CPU_STATUS C1130::PollInterrupts()
{
  //++
  //   If the interrupt system says an interrupt can be delivered now, then
  // do the equivalent of a BSI I thru the vector for that level.  Everything
  // that can fail is checked before the interrupt is taken off its queue,
  // so a bad vector leaves the interrupt queued and changes nothing.
  //--
  if (m_fWait || !m_pInterrupts->IsRequested()) return CPU_OK;
  CPriorityInterrupt::IRQLEVEL nLevel = m_pInterrupts->GetPendingLevel();
  word_t wHandler;  CPU_STATUS nStatus;
  if ((nStatus = ReadCore(VECTOR_BASE+nLevel, wHandler)) != CPU_OK) return nStatus;
  if (!m_pCore->IsValid(wHandler)) return MemoryViolation(wHandler);
  CPriorityInterrupt::INTERRUPT irq;
  if (!m_pInterrupts->Deliver(m_wIAR, irq)) return CPU_INVALID_LEVEL;
  m_pCore->CPUwrite(wHandler, m_wIAR);
  LOGF(TRACE, "interrupt level %d from device %02X ILSW %04X, IAR %04X -> %04X",
    irq.nLevel, irq.nDevice, irq.wILSW, m_wIAR, ADDRESS(wHandler+1));
  m_wIAR = ADDRESS(wHandler+1);
  return CPU_OK;
}

C1130::CPU_STATUS C1130::Step()
{
  //++
  //   Execute exactly one instruction and then check for interrupts.  If
  // the instruction fails then restore the registers, roll back any core
  // writes, and return the error.  The instruction count is incremented only
  // for instructions that succeed.
  //
  //   Once the instruction succeeds it's committed, because any device it
  // talked to has already done its part.  If delivering an interrupt after
  // that fails, then the error is returned but the instruction stays done.
  //--
  if (m_fWait) return CPU_WAIT_STATE;
  SAVED save;  SaveRegisters(save);
  m_nLastPC = m_wIAR;
  m_pCore->BeginJournal();

  DECODED decoded;
  CPU_STATUS nStatus = Fetch(decoded);
  if (nStatus == CPU_OK) {
    if (m_fTrace) LOGF(TRACE, "%04X  %s", m_nLastPC, ::Disassemble(decoded).c_str());
    nStatus = Execute(decoded);
  }

  if (nStatus != CPU_OK) {
    m_pCore->RollbackJournal();
    RestoreRegisters(save);
    m_nLastStatus = nStatus;
    if (nStatus == CPU_MEMORY_VIOLATION)
      LOGF(DEBUG, "%s (%04X) at %04X", StatusToString(nStatus), m_wFaultAddress, m_nLastPC)
    else
      LOGF(DEBUG, "%s at %04X", StatusToString(nStatus), m_nLastPC);
    return nStatus;
  }

  m_pCore->CommitJournal();
  ++m_llInstructions;

  nStatus = PollInterrupts();
  if (nStatus != CPU_OK) {
    m_nLastStatus = nStatus;
    if (nStatus == CPU_MEMORY_VIOLATION)
      LOGF(WARNING, "interrupt vector %04X outside of memory after %04X", m_wFaultAddress, m_nLastPC)
    else
      LOGF(WARNING, "%s delivering interrupt after %04X", StatusToString(nStatus), m_nLastPC);
  }
  return nStatus;
}

CCPU::STOP_CODE C1130::Run (uint32_t nCount)
{
  //++
  //   This is the main "engine" of the 1130 emulator.  It executes
  // instructions until it either a) executes the number of instructions
  // specified by nCount, or b) some condition arises to stop the simulation
  // such as a WAIT, an error, or a call to Break().  If nCount is zero on
  // entry, then we run forever until one of those things happens.  The
  // number of instructions actually executed is left in m_nRunCount.
  //--
  m_nStopCode = STOP_NONE;  m_nRunCount = 0;
  uint64_t llStart = m_llInstructions;
  while (m_nStopCode == STOP_NONE) {
    CPU_STATUS nStatus = Step();
    m_nRunCount = (uint32_t) (m_llInstructions - llStart);
    if (nStatus != CPU_OK) {
      Break(StatusToStopCode(nStatus));
    } else {
      if (m_fWait)
        Break(STOP_HALT);
      else if ((nCount != 0) && (m_nRunCount >= nCount))
        Break(STOP_FINISHED);
    }
  }
  return m_nStopCode;
}
