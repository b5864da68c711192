//++
// DecoderTest.cpp -> instruction decoder, disassembler and IOCC tests
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
#include <string>               // C++ std::string class, et al ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // CDevice and IOCC declarations
#include "CPU1130opcodes.hpp"   // opcode definitions and disassembler
using std::string;


TEST(Decoder, LongLoad)
{
  DECODED d;
  ASSERT_TRUE(DecodeInstruction(0xC400, 0x0105, d));
  EXPECT_EQ(OP_LD, d.wOpcode);
  EXPECT_STREQ("LD", d.pOpcode->pszName);
  EXPECT_TRUE(d.fLong);
  EXPECT_FALSE(d.fIndirect);
  EXPECT_EQ(0, d.nTag);
  EXPECT_EQ(0x0105, d.wDisplacement);
}

TEST(Decoder, ShortIndexed)
{
  DECODED d;
  ASSERT_TRUE(DecodeInstruction(0x8205, 0xFFFF, d));
  EXPECT_EQ(OP_A, d.wOpcode);
  EXPECT_FALSE(d.fLong);
  EXPECT_EQ(2, d.nTag);
  EXPECT_EQ(0x05, d.wDisplacement);
}

TEST(Decoder, LongIndirectIndexed)
{
  DECODED d;
  ASSERT_TRUE(DecodeInstruction(0xD780, 0x0400, d));
  EXPECT_EQ(OP_STO, d.wOpcode);
  EXPECT_TRUE(d.fLong);
  EXPECT_TRUE(d.fIndirect);
  EXPECT_EQ(3, d.nTag);
}

TEST(Decoder, ShortIgnoresIndirectBit)
{
  DECODED d;
  ASSERT_TRUE(DecodeInstruction(0xC080, 0, d));
  EXPECT_FALSE(d.fIndirect);
  EXPECT_EQ(0x80, d.wDisplacement);
}

TEST(Decoder, LongInstructionLength)
{
  EXPECT_TRUE(IsLongInstruction(0xC400));
  EXPECT_FALSE(IsLongInstruction(0xC000));
  // The F bit means nothing for shifts, LDS and WAIT ...
  EXPECT_FALSE(IsLongInstruction(0x1404));
  EXPECT_FALSE(IsLongInstruction(0x2403));
  EXPECT_FALSE(IsLongInstruction(0x3400));
  // ... or an invalid opcode ...
  EXPECT_FALSE(IsLongInstruction(0x0400));
}

TEST(Decoder, InvalidOpcodes)
{
  DECODED d;
  EXPECT_FALSE(DecodeInstruction(0x0000, 0, d));
  EXPECT_FALSE(DecodeInstruction(0x3800, 0, d));
  EXPECT_FALSE(DecodeInstruction(0x5000, 0, d));
  EXPECT_FALSE(DecodeInstruction(0xB000, 0, d));
  EXPECT_FALSE(DecodeInstruction(0xF800, 0, d));
  // Shift right with type 01 doesn't exist ...
  EXPECT_FALSE(DecodeInstruction(0x1840, 0, d));
  EXPECT_TRUE(LookupOpcode(0x1040) != NULL);
}

TEST(Decoder, ShiftTypes)
{
  EXPECT_EQ(OP_SLA,  LookupOpcode(0x1003)->wOpcode);
  EXPECT_EQ(OP_SLCA, LookupOpcode(0x1043)->wOpcode);
  EXPECT_EQ(OP_SLT,  LookupOpcode(0x1083)->wOpcode);
  EXPECT_EQ(OP_SLC,  LookupOpcode(0x10C3)->wOpcode);
  EXPECT_EQ(OP_SRA,  LookupOpcode(0x1803)->wOpcode);
  EXPECT_EQ(OP_SRT,  LookupOpcode(0x1883)->wOpcode);
  EXPECT_EQ(OP_RTE,  LookupOpcode(0x18C3)->wOpcode);
}

TEST(Disassembler, MemoryReference)
{
  EXPECT_EQ("LD   L  /0105", Disassemble(0xC400, 0x0105));
  EXPECT_EQ("A    1  /10",   Disassemble(0x8110));
  EXPECT_EQ("STO  I2 /0400", Disassemble(0xD680, 0x0400));
  EXPECT_EQ("XIO  L  /0200", Disassemble(0x0C00, 0x0200));
}

TEST(Disassembler, ShiftsAndStatus)
{
  EXPECT_EQ("SLA     4",  Disassemble(0x1004));
  EXPECT_EQ("SRT     16", Disassemble(0x1890));
  EXPECT_EQ("SLCA 1 ",    Disassemble(0x1140));
  EXPECT_EQ("LDS     3",  Disassemble(0x2003));
  EXPECT_EQ("WAIT",       Disassemble(0x3000));
}

TEST(Disassembler, BranchesAndSkips)
{
  EXPECT_EQ("BSC  L  /0200,Z-", Disassemble(0x4C30, 0x0200));
  EXPECT_EQ("BSC  L  /0200",    Disassemble(0x4C00, 0x0200));
  EXPECT_EQ("BOSC L  /0200",    Disassemble(0x4C40, 0x0200));
  EXPECT_EQ("BSC     Z",        Disassemble(0x4820));
  EXPECT_EQ("BSI  L  /0300",    Disassemble(0x4400, 0x0300));
}

TEST(Disassembler, IndexInstructions)
{
  EXPECT_EQ("NOP",              Disassemble(0x7000));
  EXPECT_EQ("MDX  1  /01",      Disassemble(0x7101));
  EXPECT_EQ("MDX  L  /0200,-1", Disassemble(0x74FF, 0x0200));
  EXPECT_EQ("LDX  L1 /0200",    Disassemble(0x6500, 0x0200));
}

TEST(Disassembler, InvalidWordIsConstant)
{
  EXPECT_EQ("DC      /0000", Disassemble(0x0000));
  EXPECT_EQ("DC      /B123", Disassemble(0xB123));
}

TEST(IOCC, Decode)
{
  IOCC iocc = CDevice::DecodeIOCC(0x0200, 0x4E01);
  EXPECT_EQ(0x0200, iocc.wWCA);
  EXPECT_EQ(9, iocc.nDevice);
  EXPECT_EQ(CDevice::IOCC_INITIATE_READ, iocc.nFunction);
  EXPECT_EQ(0x01, iocc.bModifiers);
}

TEST(IOCC, Encode)
{
  IOCC iocc;
  iocc.wWCA = 0x1234;  iocc.nDevice = 2;
  iocc.nFunction = CDevice::IOCC_WRITE;  iocc.bModifiers = 0x80;
  word_t w0, w1;
  CDevice::EncodeIOCC(iocc, w0, w1);
  EXPECT_EQ(0x1234, w0);
  EXPECT_EQ(0x1180, w1);
}

TEST(IOCC, FunctionNames)
{
  EXPECT_STREQ("READ", CDevice::FunctionName(CDevice::IOCC_READ));
  EXPECT_STREQ("SENSE DEVICE", CDevice::FunctionName(CDevice::IOCC_SENSE_DEVICE));
  EXPECT_STREQ("???", CDevice::FunctionName(8));
}
