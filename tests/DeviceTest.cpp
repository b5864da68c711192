//++
// DeviceTest.cpp -> IOCC device bus and peripheral tests
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
//   The first group of tests drives each device directly with ExecuteIOCC()
// and a private memory and interrupt system.  The rest run real XIO
// instructions on a CPU with all three devices attached.
//
// REVISION HISTORY:
//  3-MAR-25  RLA   New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <stdio.h>              // fopen(), fputs(), etc ...
#include <string>               // C++ std::string class, et al ...
#include <sstream>              // C++ std::ostringstream
#include <gtest/gtest.h>        // GoogleTest framework
#include "MachineTest.hpp"      // common 1130 test fixture
#include "IBM1130.hpp"          // device codes and levels
#include "Keyboard.hpp"         // console keyboard
#include "Printer.hpp"          // console printer
#include "CardReader.hpp"       // 2501 card reader
using std::string;
using std::ostringstream;


// Build an IOCC from its parts ...
static IOCC MakeIOCC (address_t wWCA, uint8_t nDevice, uint8_t nFunction, uint8_t bModifiers=0)
{
  IOCC iocc;
  iocc.wWCA = wWCA;  iocc.nDevice = nDevice;
  iocc.nFunction = nFunction;  iocc.bModifiers = bModifiers;
  return iocc;
}

class CDeviceUnitTest : public ::testing::Test {
protected:
  CDeviceUnitTest() : m_Memory(256) {}
  CGenericMemory     m_Memory;
  CPriorityInterrupt m_Interrupt;
};

TEST_F(CDeviceUnitTest, KeyboardReadsInOrder)
{
  CKeyboard kbd;  word_t wACC = 0;
  kbd.AttachInterrupt(&m_Interrupt, CONSOLE_LEVEL);
  kbd.Type("AB");
  EXPECT_EQ(2u, kbd.GetPending());
  EXPECT_EQ(2u, m_Interrupt.GetQueued(CONSOLE_LEVEL));
  IOCC iocc = MakeIOCC(0x10, KEYBOARD_DEVICE_CODE, CDevice::IOCC_READ);
  EXPECT_EQ(CDevice::IOCC_OK, kbd.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ('A', m_Memory.MemRead(0x10));
  EXPECT_EQ(CDevice::IOCC_OK, kbd.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ('B', m_Memory.MemRead(0x10));
  EXPECT_EQ(CDevice::IOCC_NO_DATA, kbd.ExecuteIOCC(iocc, &m_Memory, wACC));
}

TEST_F(CDeviceUnitTest, KeyboardSenseAndControl)
{
  CKeyboard kbd;  word_t wACC = 0xFFFF;
  kbd.AttachInterrupt(&m_Interrupt, CONSOLE_LEVEL);
  IOCC sense = MakeIOCC(0, KEYBOARD_DEVICE_CODE, CDevice::IOCC_SENSE_DEVICE);
  EXPECT_EQ(CDevice::IOCC_OK, kbd.ExecuteIOCC(sense, &m_Memory, wACC));
  EXPECT_EQ(0, wACC);

  // With interrupts disabled typing queues the key but no interrupt ...
  IOCC disable = MakeIOCC(0, KEYBOARD_DEVICE_CODE, CDevice::IOCC_CONTROL, 0);
  EXPECT_EQ(CDevice::IOCC_OK, kbd.ExecuteIOCC(disable, &m_Memory, wACC));
  EXPECT_FALSE(kbd.IsInterruptEnabled());
  kbd.Type('X');
  EXPECT_FALSE(m_Interrupt.IsRequested());
  EXPECT_EQ(CDevice::IOCC_OK, kbd.ExecuteIOCC(sense, &m_Memory, wACC));
  EXPECT_EQ(CKeyboard::DSW_READY, wACC);
}

TEST_F(CDeviceUnitTest, KeyboardBadAddressChangesNothing)
{
  CKeyboard kbd;  word_t wACC = 0;
  kbd.Type('Q');
  IOCC iocc = MakeIOCC(0x1000, KEYBOARD_DEVICE_CODE, CDevice::IOCC_READ);
  EXPECT_EQ(CDevice::IOCC_BAD_ADDRESS, kbd.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(1u, kbd.GetPending());
}

TEST_F(CDeviceUnitTest, KeyboardRejectsWrite)
{
  CKeyboard kbd;  word_t wACC = 0x1234;
  IOCC iocc = MakeIOCC(0x10, KEYBOARD_DEVICE_CODE, CDevice::IOCC_WRITE);
  EXPECT_EQ(CDevice::IOCC_UNSUPPORTED, kbd.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(0x1234, wACC);
}

TEST_F(CDeviceUnitTest, PrinterPrintsLowByte)
{
  CPrinter prt;  word_t wACC = 0;
  prt.AttachInterrupt(&m_Interrupt, CONSOLE_LEVEL);
  m_Memory.MemWrite(0x20, 0x1248);
  IOCC iocc = MakeIOCC(0x20, PRINTER_DEVICE_CODE, CDevice::IOCC_WRITE);
  EXPECT_EQ(CDevice::IOCC_OK, prt.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ("H", prt.GetOutput());
  // Interrupts are off until the program turns them on ...
  EXPECT_FALSE(m_Interrupt.IsRequested());
  IOCC enable = MakeIOCC(0, PRINTER_DEVICE_CODE, CDevice::IOCC_CONTROL, CPrinter::CTL_ENABLE);
  EXPECT_EQ(CDevice::IOCC_OK, prt.ExecuteIOCC(enable, &m_Memory, wACC));
  EXPECT_EQ(CDevice::IOCC_OK, prt.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ("HH", prt.GetOutput());
  EXPECT_TRUE(m_Interrupt.IsQueued(PRINTER_DEVICE_CODE));
  prt.ClearOutput();
  EXPECT_TRUE(prt.GetOutput().empty());
}

TEST_F(CDeviceUnitTest, PrinterBadAddress)
{
  CPrinter prt;  word_t wACC = 0;
  IOCC iocc = MakeIOCC(0x0100, PRINTER_DEVICE_CODE, CDevice::IOCC_WRITE);
  EXPECT_EQ(CDevice::IOCC_BAD_ADDRESS, prt.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_TRUE(prt.GetOutput().empty());
}

TEST_F(CDeviceUnitTest, ReaderReadsOneCard)
{
  CCardReader cdr;  word_t wACC = 0;
  cdr.AttachInterrupt(&m_Interrupt, READER_LEVEL);
  CCardReader::CARD card;
  card.push_back(0x8000);  card.push_back(0x4000);  card.push_back(0x2000);
  cdr.LoadCard(card);
  EXPECT_EQ(0, cdr.GetDSW());
  m_Memory.MemWrite(0x40, WORD(-2));
  IOCC iocc = MakeIOCC(0x40, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(0x8000, m_Memory.MemRead(0x41));
  EXPECT_EQ(0x4000, m_Memory.MemRead(0x42));
  EXPECT_EQ(0, m_Memory.MemRead(0x43));
  EXPECT_TRUE(cdr.IsHopperEmpty());
  EXPECT_EQ(CCardReader::DSW_COMPLETE|CCardReader::DSW_LAST_CARD, cdr.GetDSW());
  EXPECT_EQ(1u, m_Interrupt.GetQueued(READER_LEVEL));
}

TEST_F(CDeviceUnitTest, ReaderEmptyHopper)
{
  CCardReader cdr;  word_t wACC = 0;
  EXPECT_EQ(CCardReader::DSW_NOT_READY, cdr.GetDSW());
  m_Memory.MemWrite(0x40, WORD(-80));
  IOCC iocc = MakeIOCC(0x40, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_NO_DATA, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
}

TEST_F(CDeviceUnitTest, ReaderBufferPastEnd)
{
  // 80 words starting at 0xF0 doesn't fit in a 256 word memory ...
  CCardReader cdr;  word_t wACC = 0;
  cdr.LoadCard(CCardReader::CARD(80, 0x0001));
  m_Memory.MemWrite(0xF0, WORD(-80));
  IOCC iocc = MakeIOCC(0xF0, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_BAD_ADDRESS, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(1u, cdr.GetCardCount());
  EXPECT_EQ(0, m_Memory.MemRead(0xF1));
}

TEST_F(CDeviceUnitTest, ReaderCountIsClamped)
{
  CCardReader cdr;  word_t wACC = 0;
  cdr.LoadCard(CCardReader::CARD(80, 0x0FFF));
  m_Memory.MemWrite(0x10, 0xFF00);
  IOCC iocc = MakeIOCC(0x10, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(0x0FFF, m_Memory.MemRead(0x10+80));
  EXPECT_EQ(0, m_Memory.MemRead(0x10+81));
}

TEST_F(CDeviceUnitTest, ReaderPositiveCountReadsNothing)
{
  CCardReader cdr;  word_t wACC = 0;
  cdr.LoadCard(CCardReader::CARD(80, 0x0FFF));
  m_Memory.MemWrite(0x10, 5);
  IOCC iocc = MakeIOCC(0x10, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(0, m_Memory.MemRead(0x11));
  EXPECT_TRUE(cdr.IsHopperEmpty());
}

TEST_F(CDeviceUnitTest, ReaderSenseReset)
{
  CCardReader cdr;  word_t wACC = 0;
  cdr.AttachInterrupt(&m_Interrupt, READER_LEVEL);
  cdr.LoadCard(CCardReader::CARD(1, 0x1234));
  m_Memory.MemWrite(0x10, WORD(-1));
  IOCC read = MakeIOCC(0x10, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  ASSERT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(read, &m_Memory, wACC));
  IOCC sense = MakeIOCC(0, READER_DEVICE_CODE, CDevice::IOCC_SENSE_DEVICE, CCardReader::SENSE_RESET);
  EXPECT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(sense, &m_Memory, wACC));
  EXPECT_EQ(0x1800, wACC);
  EXPECT_EQ(CCardReader::DSW_NOT_READY, cdr.GetDSW());
  EXPECT_FALSE(m_Interrupt.IsRequested());
}

TEST_F(CDeviceUnitTest, ReaderLongCardTruncated)
{
  CCardReader cdr;
  cdr.LoadCard(CCardReader::CARD(100, 1));
  EXPECT_EQ(1u, cdr.GetCardCount());
}

TEST_F(CDeviceUnitTest, ReaderLoadDeck)
{
  string sFileName = ::testing::TempDir() + "ibm1130_deck.txt";
  FILE *pFile = fopen(sFileName.c_str(), "wt");
  ASSERT_TRUE(pFile != NULL);
  fputs("# two good cards and one bad one\n", pFile);
  fputs("8000, 4000 2000\n", pFile);
  fputs("\n", pFile);
  fputs("0001 XYZZY\n", pFile);
  fputs("0FFF\n", pFile);
  fclose(pFile);

  CCardReader cdr;  word_t wACC = 0;
  EXPECT_EQ(2, cdr.LoadDeck(sFileName));
  EXPECT_EQ(2u, cdr.GetCardCount());
  m_Memory.MemWrite(0x10, WORD(-3));
  IOCC iocc = MakeIOCC(0x10, READER_DEVICE_CODE, CDevice::IOCC_INITIATE_READ);
  EXPECT_EQ(CDevice::IOCC_OK, cdr.ExecuteIOCC(iocc, &m_Memory, wACC));
  EXPECT_EQ(0x2000, m_Memory.MemRead(0x13));
  EXPECT_FALSE(cdr.IsLastCard());
  remove(sFileName.c_str());
}

TEST_F(CDeviceUnitTest, ReaderLoadDeckMissingFile)
{
  CCardReader cdr;
  EXPECT_EQ(-1, cdr.LoadDeck("/nonexistent/directory/deck.txt"));
  EXPECT_TRUE(cdr.IsHopperEmpty());
}

TEST_F(CDeviceUnitTest, ShowDevice)
{
  CKeyboard kbd;  ostringstream ofs;
  kbd.AttachInterrupt(&m_Interrupt, CONSOLE_LEVEL);
  kbd.ShowDevice(ofs);
  EXPECT_NE(string::npos, ofs.str().find("KBD"));
  EXPECT_NE(string::npos, ofs.str().find("level 4"));
}


class CDeviceTest : public CMachineTest {
protected:
  virtual void SetUp() override
  {
    m_pKeyboard = DBGNEW CKeyboard();
    m_pPrinter = DBGNEW CPrinter();
    m_pReader = DBGNEW CCardReader();
    ASSERT_TRUE(m_CPU.AttachDevice(m_pKeyboard, CONSOLE_LEVEL));
    ASSERT_TRUE(m_CPU.AttachDevice(m_pPrinter, CONSOLE_LEVEL));
    ASSERT_TRUE(m_CPU.AttachDevice(m_pReader, READER_LEVEL));
    CMachineTest::SetUp();
  }

  // Deposit an XIO L at the IAR that points to a two word IOCC at 0x180 ...
  void DepositXIO (word_t wWCA, word_t wWord1)
  {
    Deposit(IAR(), {0x0C00, 0x0180});
    Deposit(0x180, {wWCA, wWord1});
  }

  // These are owned by the CPU ...
  CKeyboard   *m_pKeyboard;
  CPrinter    *m_pPrinter;
  CCardReader *m_pReader;
};

TEST_F(CDeviceTest, FindDevices)
{
  EXPECT_EQ(m_pKeyboard, m_CPU.FindDevice((address_t) KEYBOARD_DEVICE_CODE));
  EXPECT_EQ(m_pReader, m_CPU.FindDevice(string("CDR")));
  EXPECT_TRUE(m_CPU.FindDevice((address_t) 31) == NULL);
}

TEST_F(CDeviceTest, DuplicateDeviceCode)
{
  //   The rejected printer has the keyboard's code, so deleting it must not
  // cancel the keyboard's pending interrupt ...
  m_pKeyboard->Type('A');
  CPrinter *pPrinter = DBGNEW CPrinter(KEYBOARD_DEVICE_CODE);
  EXPECT_FALSE(m_CPU.AttachDevice(pPrinter, CONSOLE_LEVEL));
  delete pPrinter;
  EXPECT_EQ(m_pKeyboard, m_CPU.FindDevice((address_t) KEYBOARD_DEVICE_CODE));
  EXPECT_TRUE(m_CPU.GetInterrupt()->IsQueued(KEYBOARD_DEVICE_CODE));
  EXPECT_EQ(1u, m_CPU.GetInterrupt()->GetQueued(CONSOLE_LEVEL));
}

TEST_F(CDeviceTest, InvalidLevel)
{
  CPrinter *pPrinter = DBGNEW CPrinter(20);
  EXPECT_FALSE(m_CPU.AttachDevice(pPrinter, 6));
  delete pPrinter;
}

TEST_F(CDeviceTest, DeviceStatus)
{
  CDevice::DEVICE_STATUS status;
  m_pKeyboard->Type('Z');
  EXPECT_EQ(C1130::CPU_OK, m_CPU.DeviceStatus(KEYBOARD_DEVICE_CODE, status));
  EXPECT_STREQ("KBD", status.pszName);
  EXPECT_EQ(CKeyboard::DSW_READY, status.wDSW);
  EXPECT_TRUE(status.fInterrupt);
  EXPECT_FALSE(status.fBusy);
  EXPECT_EQ(C1130::CPU_DEVICE_NOT_FOUND, m_CPU.DeviceStatus(31, status));
}

TEST_F(CDeviceTest, XIOReadKeyboard)
{
  // Disable keyboard interrupts, then read a character ...
  DepositXIO(0, 0x0C00);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  m_pKeyboard->Type('K');
  DepositXIO(0x0190, 0x0A00);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ('K', Examine(0x0190));
  EXPECT_EQ(ORIGIN+4, IAR());
  EXPECT_FALSE(m_pKeyboard->IsReady());
}

TEST_F(CDeviceTest, XIOSenseDevice)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0xFFFF);
  DepositXIO(0, 0x4F00);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(CCardReader::DSW_NOT_READY, ACC());
}

TEST_F(CDeviceTest, XIOWithNoData)
{
  DepositXIO(0x0190, 0x0A00);
  EXPECT_EQ(C1130::CPU_NO_DATA, m_CPU.Step());
  EXPECT_EQ(ORIGIN, IAR());
  EXPECT_EQ(0u, m_CPU.GetInstructionCount());
}

TEST_F(CDeviceTest, XIOUnsupportedChangesNothing)
{
  // The printer can't read ...
  m_CPU.SetRegister(C1130::REG_ACC, 0x5555);
  DepositXIO(0x0190, 0x1200);
  Deposit(0x0190, {0x7777});
  EXPECT_EQ(C1130::CPU_UNSUPPORTED_FUNCTION, m_CPU.Step());
  EXPECT_EQ(0x5555, ACC());
  EXPECT_EQ(ORIGIN, IAR());
  EXPECT_EQ(0x7777, Examine(0x0190));
  EXPECT_FALSE(m_CPU.GetInterrupt()->IsRequested());
  EXPECT_EQ(CCPU::STOP_ILLEGAL_IO, C1130::StatusToStopCode(C1130::CPU_UNSUPPORTED_FUNCTION));
}

TEST_F(CDeviceTest, XIOToMissingDevice)
{
  DepositXIO(0x0190, 0xFF00);
  EXPECT_EQ(C1130::CPU_DEVICE_NOT_FOUND, m_CPU.Step());
  EXPECT_EQ(ORIGIN, IAR());
}

TEST_F(CDeviceTest, XIOBufferOutsideCore)
{
  m_pKeyboard->Type('!');
  DepositXIO(0x9000, 0x0A00);
  EXPECT_EQ(C1130::CPU_MEMORY_VIOLATION, m_CPU.Step());
  EXPECT_EQ(0x9000, m_CPU.GetFaultAddress());
  EXPECT_EQ(1u, m_pKeyboard->GetPending());
}

TEST_F(CDeviceTest, XIOPrint)
{
  Deposit(0x0190, {'P'});
  DepositXIO(0x0190, 0x1100);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ("P", m_pPrinter->GetOutput());
}

TEST_F(CDeviceTest, CardReadInterruptsAndSenses)
{
  //   Read three columns, take the level 4 interrupt in the same step, and
  // then sense (with reset) from the handler ...
  CCardReader::CARD card;
  card.push_back(1);  card.push_back(2);  card.push_back(3);  card.push_back(4);
  m_pReader->LoadCard(card);
  Deposit(8+READER_LEVEL, {0x0500});
  Deposit(0x0300, {WORD(-3)});
  DepositXIO(0x0300, 0x4E00);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(1, Examine(0x301));
  EXPECT_EQ(3, Examine(0x303));
  EXPECT_EQ(0, Examine(0x304));
  EXPECT_EQ(ORIGIN+2, Examine(0x500));
  EXPECT_EQ(0x501, IAR());

  Deposit(0x501, {0x0C00, 0x0184});
  Deposit(0x184, {0x0000, 0x4F01});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x1800, ACC());
  EXPECT_EQ(CCardReader::DSW_NOT_READY, m_pReader->GetDSW());
}

TEST_F(CDeviceTest, CardReadWithBadVectorKeepsData)
{
  //   The read completes but the level 4 vector points outside of core.  The
  // card is gone from the hopper, so the data and the interrupt must stay
  // too, and fixing the vector lets the interrupt in ...
  m_pReader->LoadCard(CCardReader::CARD(80, 7));
  m_pReader->LoadCard(CCardReader::CARD(80, 9));
  Deposit(8+READER_LEVEL, {0x9000});
  Deposit(0x0300, {WORD(-3)});
  DepositXIO(0x0300, 0x4E00);
  Deposit(ORIGIN+2, {0x7000});
  EXPECT_EQ(C1130::CPU_MEMORY_VIOLATION, m_CPU.Step());
  EXPECT_EQ(0x9000, m_CPU.GetFaultAddress());
  EXPECT_EQ(7, Examine(0x301));
  EXPECT_EQ(7, Examine(0x303));
  EXPECT_EQ(ORIGIN+2, IAR());
  EXPECT_EQ(1u, m_pReader->GetCardCount());
  EXPECT_EQ(1u, m_CPU.GetInterrupt()->GetQueued(READER_LEVEL));

  Deposit(8+READER_LEVEL, {0x0500});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+3, Examine(0x500));
  EXPECT_EQ(0x501, IAR());
  EXPECT_EQ(0u, m_CPU.GetInterrupt()->GetQueued(READER_LEVEL));
  EXPECT_EQ(1u, m_pReader->GetCardCount());
}

TEST_F(CDeviceTest, ResetKeepsHopperAndKeys)
{
  m_pReader->LoadCard(CCardReader::CARD(80, 0));
  m_pKeyboard->Type('R');
  m_CPU.Reset();
  EXPECT_EQ(1u, m_pReader->GetCardCount());
  EXPECT_EQ(1u, m_pKeyboard->GetPending());
  EXPECT_FALSE(m_CPU.GetInterrupt()->IsRequested());
  EXPECT_TRUE(m_pKeyboard->IsInterruptEnabled());
}

TEST_F(CDeviceTest, RemoveDevice)
{
  EXPECT_TRUE(m_CPU.GetDevices().IsInstalled(m_pReader));
  EXPECT_EQ(3, m_CPU.GetDevices().GetCount());
  EXPECT_TRUE(m_CPU.RemoveDevice(READER_DEVICE_CODE));
  EXPECT_TRUE(m_CPU.FindDevice((address_t) READER_DEVICE_CODE) == NULL);
  EXPECT_FALSE(m_CPU.RemoveDevice(READER_DEVICE_CODE));
  EXPECT_EQ(2, m_CPU.GetDevices().GetCount());
}
