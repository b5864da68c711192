//++
// ExecuteTest.cpp -> IBM 1130 instruction execution tests
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
// REVISION HISTORY:
//  3-MAR-25  RLA   New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "MachineTest.hpp"      // common 1130 test fixture


class CExecuteTest : public CMachineTest {
protected:
  // Execute one instruction that uses the operand(s) at 0x200 ...
  void Execute (word_t wOpcode, word_t wACC, word_t wEXT=0)
  {
    m_CPU.SetRegister(C1130::REG_ACC, wACC);
    m_CPU.SetRegister(C1130::REG_EXT, wEXT);
    m_CPU.SetPC(ORIGIN);
    Deposit(ORIGIN, {wOpcode, 0x0200});
    ASSERT_EQ(C1130::CPU_OK, m_CPU.Step());
  }
  // Add wA to wB and return the ACC, carry and overflow ...
  void Add (word_t wA, word_t wB, word_t &wSum, bool &fCarry, bool &fOverflow)
  {
    SetUp();
    Deposit(0x200, {wB});
    Execute(0x8400, wA);
    wSum = ACC();  fCarry = m_CPU.IsCarry();  fOverflow = m_CPU.IsOverflow();
  }
};


TEST_F(CExecuteTest, LoadAndStore)
{
  Deposit(0x200, {0x1234});
  Execute(0xC400, 0);
  EXPECT_EQ(0x1234, ACC());
  Execute(0xD400, 0x5678);
  EXPECT_EQ(0x5678, Examine(0x200));
}

TEST_F(CExecuteTest, LoadAndStoreDouble)
{
  Deposit(0x200, {0x1111, 0x2222});
  Execute(0xCC00, 0);
  EXPECT_EQ(0x1111, ACC());
  EXPECT_EQ(0x2222, EXT());
  Execute(0xDC00, 0xAAAA, 0xBBBB);
  EXPECT_EQ(0xAAAA, Examine(0x200));
  EXPECT_EQ(0xBBBB, Examine(0x201));
}

TEST_F(CExecuteTest, AddCarryAndOverflow)
{
  word_t w;  bool fC, fV;
  Add(0x7FFF, 1, w, fC, fV);
  EXPECT_EQ(0x8000, w);  EXPECT_FALSE(fC);  EXPECT_TRUE(fV);
  Add(0xFFFF, 1, w, fC, fV);
  EXPECT_EQ(0x0000, w);  EXPECT_TRUE(fC);   EXPECT_FALSE(fV);
  Add(0x8000, 0x8000, w, fC, fV);
  EXPECT_EQ(0x0000, w);  EXPECT_TRUE(fC);   EXPECT_TRUE(fV);
}

TEST_F(CExecuteTest, AddIsCommutative)
{
  const word_t awValues[] = {0x0000, 0x0001, 0x7FFF, 0x8000, 0xFFFF, 0x1234, 0xC350};
  for (size_t i = 0;  i < sizeof(awValues)/sizeof(word_t);  ++i) {
    for (size_t j = 0;  j < sizeof(awValues)/sizeof(word_t);  ++j) {
      word_t wAB, wBA;  bool fCAB, fCBA, fVAB, fVBA;
      Add(awValues[i], awValues[j], wAB, fCAB, fVAB);
      Add(awValues[j], awValues[i], wBA, fCBA, fVBA);
      EXPECT_EQ(wAB, wBA);
      EXPECT_EQ(fCAB, fCBA);
      EXPECT_EQ(fVAB, fVBA);
    }
  }
}

TEST_F(CExecuteTest, SubtractBorrow)
{
  Deposit(0x200, {1});
  Execute(0x9400, 0);
  EXPECT_EQ(0xFFFF, ACC());
  EXPECT_TRUE(m_CPU.IsCarry());
  EXPECT_FALSE(m_CPU.IsOverflow());
  Deposit(0x200, {1});
  Execute(0x9400, 0x8000);
  EXPECT_EQ(0x7FFF, ACC());
  EXPECT_TRUE(m_CPU.IsOverflow());
}

TEST_F(CExecuteTest, OverflowIsSticky)
{
  Deposit(0x200, {1});
  Execute(0x8400, 0x7FFF);
  EXPECT_TRUE(m_CPU.IsOverflow());
  Execute(0x8400, 0x0001);
  EXPECT_EQ(2, ACC());
  EXPECT_TRUE(m_CPU.IsOverflow());
}

TEST_F(CExecuteTest, AddAndSubtractDouble)
{
  Deposit(0x200, {0x0000, 0x0001});
  Execute(0x8C00, 0x0000, 0xFFFF);
  EXPECT_EQ(0x0001, ACC());
  EXPECT_EQ(0x0000, EXT());
  EXPECT_FALSE(m_CPU.IsCarry());
  Execute(0x9C00, 0x0000, 0x0000);
  EXPECT_EQ(0xFFFF, ACC());
  EXPECT_EQ(0xFFFF, EXT());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, MultiplySigned)
{
  Deposit(0x200, {3});
  Execute(0xA400, 0xFFFE);
  EXPECT_EQ(0xFFFF, ACC());
  EXPECT_EQ(0xFFFA, EXT());
  Deposit(0x200, {0x8000});
  Execute(0xA400, 0x8000);
  EXPECT_EQ(0x4000, ACC());
  EXPECT_EQ(0x0000, EXT());
}

TEST_F(CExecuteTest, DivideSigned)
{
  Deposit(0x200, {2});
  Execute(0xAC00, 0x0000, 0x0007);
  EXPECT_EQ(3, ACC());
  EXPECT_EQ(1, EXT());
  Execute(0xAC00, 0xFFFF, 0xFFF9);
  EXPECT_EQ(0xFFFD, ACC());
  EXPECT_EQ(0xFFFF, EXT());
}

TEST_F(CExecuteTest, DivideOverflowLeavesRegisters)
{
  Deposit(0x200, {1});
  Execute(0xAC00, 0x0001, 0x0000);
  EXPECT_TRUE(m_CPU.IsOverflow());
  EXPECT_EQ(0x0001, ACC());
  EXPECT_EQ(0x0000, EXT());
}

TEST_F(CExecuteTest, DivideByZero)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1234);
  Deposit(ORIGIN, {0xAC00, 0x0200});
  EXPECT_EQ(C1130::CPU_DIVIDE_BY_ZERO, m_CPU.Step());
  EXPECT_EQ(ORIGIN, IAR());
  EXPECT_EQ(0x1234, ACC());
}

TEST_F(CExecuteTest, Logical)
{
  Deposit(0x200, {0x0FF0});
  Execute(0xE400, 0x3C3C);
  EXPECT_EQ(0x0C30, ACC());
  Execute(0xEC00, 0x3C3C);
  EXPECT_EQ(0x3FFC, ACC());
  Execute(0xF400, 0x3C3C);
  EXPECT_EQ(0x33CC, ACC());
}

TEST_F(CExecuteTest, LoadAndStoreStatus)
{
  Deposit(ORIGIN, {0x2003});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_TRUE(m_CPU.IsCarry());
  EXPECT_TRUE(m_CPU.IsOverflow());
  Deposit(0x200, {0xABFF});
  Execute(0x2C00, ACC());
  EXPECT_EQ(0xAB03, Examine(0x200));
  EXPECT_FALSE(m_CPU.IsOverflow());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, StoreStatusRestoresWithLDS)
{
  // STS leaves an LDS in memory that puts the indicators back ...
  m_CPU.SetRegister(C1130::REG_CARRY, 1);
  Deposit(0x200, {0x2000});
  Execute(0x2C00, 0);
  m_CPU.SetRegister(C1130::REG_CARRY, 0);
  m_CPU.SetPC(0x200);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_TRUE(m_CPU.IsCarry());
  EXPECT_FALSE(m_CPU.IsOverflow());
}

TEST_F(CExecuteTest, ShiftLeft)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1234);
  Deposit(ORIGIN, {0x1004});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x2340, ACC());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, ShiftLeftDouble)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1234);
  m_CPU.SetRegister(C1130::REG_EXT, 0x5678);
  Deposit(ORIGIN, {0x1084});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x2345, ACC());
  EXPECT_EQ(0x6780, EXT());
}

TEST_F(CExecuteTest, ShiftCountFromIndexRegister)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x0001);
  m_CPU.SetRegister(C1130::REG_XR2, 0xFF03);
  Deposit(ORIGIN, {0x1200});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x0008, ACC());
}

TEST_F(CExecuteTest, ShiftLeftAndCountNormalizes)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x0100);
  m_CPU.SetRegister(C1130::REG_XR1, 0x1210);
  Deposit(ORIGIN, {0x1140});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x8000, ACC());
  EXPECT_EQ(0x1209, XR(1));
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, ShiftLeftAndCountZeroKeepsCarry)
{
  // A zero count shifts nothing and leaves carry alone, set or clear ...
  m_CPU.SetRegister(C1130::REG_ACC, 0x0100);
  m_CPU.SetRegister(C1130::REG_XR1, 0x1200);
  m_CPU.SetRegister(C1130::REG_CARRY, 1);
  Deposit(ORIGIN, {0x1140, 0x1140});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x0100, ACC());
  EXPECT_EQ(0x1200, XR(1));
  EXPECT_TRUE(m_CPU.IsCarry());
  m_CPU.SetRegister(C1130::REG_CARRY, 0);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x1200, XR(1));
  EXPECT_FALSE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, ShiftRightArithmetic)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x8011);
  Deposit(ORIGIN, {0x1801});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0xC008, ACC());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, ShiftRightDouble)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1234);
  m_CPU.SetRegister(C1130::REG_EXT, 0x5678);
  Deposit(ORIGIN, {0x1884});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x0123, ACC());
  EXPECT_EQ(0x4567, EXT());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, RotateRight)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1234);
  m_CPU.SetRegister(C1130::REG_EXT, 0x5678);
  m_CPU.SetRegister(C1130::REG_CARRY, 1);
  Deposit(ORIGIN, {0x18D0});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x5678, ACC());
  EXPECT_EQ(0x1234, EXT());
  EXPECT_TRUE(m_CPU.IsCarry());
}

TEST_F(CExecuteTest, ShortBranchSkips)
{
  // BSC Z skips when the ACC is zero ...
  Deposit(ORIGIN, {0x4820});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+2, IAR());
  m_CPU.SetPC(ORIGIN);  m_CPU.SetRegister(C1130::REG_ACC, 5);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+1, IAR());
}

TEST_F(CExecuteTest, LongBranchOnCondition)
{
  // BSC L /0200,Z- branches only if the ACC is positive ...
  Deposit(ORIGIN, {0x4C30, 0x0200});
  m_CPU.SetRegister(C1130::REG_ACC, 0xFFFF);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+2, IAR());
  m_CPU.SetPC(ORIGIN);  m_CPU.SetRegister(C1130::REG_ACC, 1);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x200, IAR());
}

TEST_F(CExecuteTest, TestingOverflowResetsIt)
{
  m_CPU.SetRegister(C1130::REG_OVERFLOW, 1);
  Deposit(ORIGIN, {0x4801});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+1, IAR());
  EXPECT_FALSE(m_CPU.IsOverflow());
}

TEST_F(CExecuteTest, EvenAndCarryConditions)
{
  Deposit(ORIGIN, {0x4804, 0x4802});
  m_CPU.SetRegister(C1130::REG_ACC, 3);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+1, IAR());
  m_CPU.SetRegister(C1130::REG_CARRY, 0);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+3, IAR());
}

TEST_F(CExecuteTest, BranchAndStoreIAR)
{
  Deposit(ORIGIN, {0x4400, 0x0300});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+2, Examine(0x300));
  EXPECT_EQ(0x301, IAR());
}

TEST_F(CExecuteTest, ConditionalBranchAndStore)
{
  // BSI L /0300,Z doesn't branch when the ACC is zero ...
  Deposit(ORIGIN, {0x4420, 0x0300});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+2, IAR());
  EXPECT_EQ(0, Examine(0x300));
}

TEST_F(CExecuteTest, LoadIndex)
{
  Deposit(ORIGIN, {0x61FF, 0x6500, 0x0200});
  Deposit(0x200, {0x4321});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0xFFFF, XR(1));
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x4321, XR(1));
}

TEST_F(CExecuteTest, LoadIndexZeroIsJump)
{
  Deposit(ORIGIN, {0x6040});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x0040, IAR());
}

TEST_F(CExecuteTest, StoreIndex)
{
  m_CPU.SetRegister(C1130::REG_XR3, 0x7777);
  Deposit(ORIGIN, {0x6F00, 0x0200});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x7777, Examine(0x200));
}

TEST_F(CExecuteTest, ModifyIndexSkipsOnZero)
{
  m_CPU.SetRegister(C1130::REG_XR1, 0xFFFF);
  Deposit(ORIGIN, {0x7101});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0, XR(1));
  EXPECT_EQ(ORIGIN+2, IAR());
}

TEST_F(CExecuteTest, ModifyIndexNoSkip)
{
  m_CPU.SetRegister(C1130::REG_XR1, 5);
  Deposit(ORIGIN, {0x7101});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(6, XR(1));
  EXPECT_EQ(ORIGIN+1, IAR());
}

TEST_F(CExecuteTest, ModifyIndexSkipsOnSignChange)
{
  m_CPU.SetRegister(C1130::REG_XR2, 0x7FFF);
  Deposit(ORIGIN, {0x7201});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0x8000, XR(2));
  EXPECT_EQ(ORIGIN+2, IAR());
}

TEST_F(CExecuteTest, ModifyIndexLong)
{
  m_CPU.SetRegister(C1130::REG_XR1, 10);
  Deposit(ORIGIN, {0x7500, 0x0200});
  Deposit(0x200, {0xFFF6});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0, XR(1));
  EXPECT_EQ(ORIGIN+3, IAR());
}

TEST_F(CExecuteTest, ModifyIARIsRelativeJump)
{
  Deposit(ORIGIN, {0x7005});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(ORIGIN+6, IAR());
}

TEST_F(CExecuteTest, ModifyMemory)
{
  // MDX L /0200,-1 counts MEM(0200) down and skips at zero ...
  Deposit(ORIGIN, {0x74FF, 0x0200});
  Deposit(0x200, {2});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(1, Examine(0x200));
  EXPECT_EQ(ORIGIN+2, IAR());
  m_CPU.SetPC(ORIGIN);
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(0, Examine(0x200));
  EXPECT_EQ(ORIGIN+3, IAR());
}

TEST_F(CExecuteTest, WaitHoldsTheIAR)
{
  Deposit(ORIGIN, {0x3000});
  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_TRUE(m_CPU.IsWait());
  address_t wIAR = IAR();
  EXPECT_EQ(C1130::CPU_WAIT_STATE, m_CPU.Step());
  EXPECT_EQ(wIAR, IAR());
  m_CPU.ClearWait();
  EXPECT_FALSE(m_CPU.IsWait());
}

TEST_F(CExecuteTest, InvalidOpcodeChangesNothing)
{
  m_CPU.SetRegister(C1130::REG_ACC, 0x1111);
  Deposit(ORIGIN, {0xB000});
  EXPECT_EQ(C1130::CPU_INVALID_OPCODE, m_CPU.Step());
  EXPECT_EQ(ORIGIN, IAR());
  EXPECT_EQ(0x1111, ACC());
  EXPECT_EQ(C1130::CPU_INVALID_OPCODE, m_CPU.GetLastStatus());
}

TEST_F(CExecuteTest, FailedStepRollsBackMemory)
{
  // STD at the last word of core writes one word and then faults ...
  Deposit(0x7FFF, {0x5A5A});
  m_CPU.SetRegister(C1130::REG_ACC, 0x1111);
  Deposit(ORIGIN, {0xDC00, 0x7FFF});
  EXPECT_EQ(C1130::CPU_MEMORY_VIOLATION, m_CPU.Step());
  EXPECT_EQ(0x8000, m_CPU.GetFaultAddress());
  EXPECT_EQ(0x5A5A, Examine(0x7FFF));
  EXPECT_EQ(ORIGIN, IAR());
}

TEST_F(CExecuteTest, InstructionCount)
{
  Deposit(ORIGIN, {0x7000, 0x7000, 0x7000});
  for (int i = 0;  i < 3;  ++i)  EXPECT_EQ(C1130::CPU_OK, m_CPU.Step());
  EXPECT_EQ(3u, m_CPU.GetInstructionCount());
  EXPECT_EQ(ORIGIN+2, m_CPU.GetLastPC());
}
