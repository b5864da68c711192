//++
// IBM1130.cpp -> IBM 1130 Emulator main program
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
//   This file is the main program for the IBM 1130 Emulator.  There's no
// command parser here - everything comes from the command line options.  We
// build the machine, load a memory image and (optionally) a card deck and
// some keyboard input, run the program until it stops, and then print the
// registers, anything the program printed, and the reason it stopped.
//
//      ibm1130 [options]
//        -m, --memory=words     core size (default 32768)
//        -l, --load=file        memory image ("address data" in hex)
//        -s, --start=address    starting IAR (hex, default 0)
//        -n, --steps=count      stop after this many instructions
//        -c, --cards=file       card deck for the 2501 reader
//        -k, --keyboard=text    characters to "type" on the console keyboard
//        -t, --trace            trace every instruction
//        -L, --log=file         also log messages to this file
//        -d, --debug            show debugging messages on the console
//        -h, --help             print this text
//
// REVISION HISTORY:
//  3-MAR-25  RLA   Adapted from SBC6120.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdio.h>              // fprintf(), etc ...
#include <getopt.h>             // getopt_long() ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "IBM1130.hpp"          // global declarations for this project
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // main memory emulation
#include "Interrupt.hpp"        // interrupt simulation logic
#include "CPU.hpp"              // CCPU base class definitions
#include "Device.hpp"           // generic device definitions
#include "CPU1130.hpp"          // IBM 1130 CPU specific emulation
#include "Keyboard.hpp"         // console keyboard
#include "Printer.hpp"          // console printer
#include "CardReader.hpp"       // 2501 card reader
using std::string;              // ...


// Global objects ....
//   These objects are used (more or less) everywhere within this program, and
// you'll find "extern ..." declarations for them in IBM1130.hpp.  Note that
// they are declared as pointers rather than the actual objects because we
// want to control the exact order in which they're created and destroyed!
CLog               *g_pLog       = NULL;  // message logging object
CGenericMemory     *g_pMemory    = NULL;  // 1130 core memory (owned by the CPU)
CPriorityInterrupt *g_pInterrupt = NULL;  // interrupt system (owned by the CPU)
C1130              *g_pCPU       = NULL;  // 1130 CPU
CKeyboard          *g_pKeyboard  = NULL;  // console keyboard (owned by the CPU)
CPrinter           *g_pPrinter   = NULL;  // console printer (   "   "   "  " )
CCardReader        *g_pReader    = NULL;  // 2501 card reader (  "   "   "  " )

// Command line options ...
struct _OPTIONS {
  size_t      cwMemory;         // core size in words
  string      sImage;           // memory image to load
  address_t   wStart;           // starting address
  uint32_t    nSteps;           // instruction limit (0 -> no limit)
  string      sCards;           // card deck file
  string      sKeyboard;        // keyboard input
  bool        fTrace;           // trace instructions
  string      sLogFile;         // log file name
  bool        fDebug;           // show debugging messages
};
typedef struct _OPTIONS OPTIONS;


static void ShowUsage()
{
  //++
  // Print the command line help ...
  //--
  fprintf(stderr,
    "Usage: %s [options]\n"
    "Runs a program on an emulated IBM 1130.\n\n"
    "  -m, --memory=words     core size (default %d)\n"
    "  -l, --load=file        memory image (\"address data\" in hex)\n"
    "  -s, --start=address    starting IAR (hex, default 0)\n"
    "  -n, --steps=count      stop after this many instructions\n"
    "  -c, --cards=file       card deck for the 2501 reader\n"
    "  -k, --keyboard=text    characters to type on the console keyboard\n"
    "  -t, --trace            trace every instruction\n"
    "  -L, --log=file         also log messages to this file\n"
    "  -d, --debug            show debugging messages on the console\n"
    "  -h, --help             print this text\n",
    PROGRAM, C1130::DEFAULT_CORE_SIZE);
}

static bool ParseNumber (const char *pszText, int nRadix, unsigned long lMax, unsigned long &lValue)
{
  //++
  // Parse an unsigned number and check its range ...
  //--
  char *pszEnd;
  if ((pszText == NULL) || (*pszText == '\0')) return false;
  lValue = strtoul(pszText, &pszEnd, nRadix);
  return (*pszEnd == '\0') && (lValue <= lMax);
}

static bool ParseOptions (int argc, char *argv[], OPTIONS &opt)
{
  //++
  //   Parse the command line and fill in the OPTIONS structure.  Returns
  // FALSE if the program should exit now - either there was an error, or
  // the user asked for help ...
  //--
  static const struct option aLongOptions[] = {
    {"memory",   required_argument, NULL, 'm'},
    {"load",     required_argument, NULL, 'l'},
    {"start",    required_argument, NULL, 's'},
    {"steps",    required_argument, NULL, 'n'},
    {"cards",    required_argument, NULL, 'c'},
    {"keyboard", required_argument, NULL, 'k'},
    {"trace",    no_argument,       NULL, 't'},
    {"log",      required_argument, NULL, 'L'},
    {"debug",    no_argument,       NULL, 'd'},
    {"help",     no_argument,       NULL, 'h'},
    {NULL,       0,                 NULL,  0 }
  };
  opt.cwMemory = C1130::DEFAULT_CORE_SIZE;  opt.wStart = 0;  opt.nSteps = 0;
  opt.fTrace = opt.fDebug = false;

  int ch;  unsigned long lValue;
  while ((ch = getopt_long(argc, argv, "m:l:s:n:c:k:tL:dh", aLongOptions, NULL)) != -1) {
    switch (ch) {
      case 'm':
        if (!ParseNumber(optarg, 0, C1130::MAXIMUM_CORE_SIZE, lValue) || !C1130::IsValidCoreSize(lValue)) {
          CMDERRF("memory size must be %d to %d words", C1130::MINIMUM_CORE_SIZE, C1130::MAXIMUM_CORE_SIZE);
          return false;
        }
        opt.cwMemory = (size_t) lValue;  break;
      case 'l':
        opt.sImage = optarg;  break;
      case 's':
        if (!ParseNumber(optarg, 16, ADDRESS_MAX, lValue)) {
          CMDERRF("invalid start address \"%s\"", optarg);
          return false;
        }
        opt.wStart = ADDRESS(lValue);  break;
      case 'n':
        if (!ParseNumber(optarg, 10, UINT32_MAX, lValue)) {
          CMDERRF("invalid step count \"%s\"", optarg);
          return false;
        }
        opt.nSteps = (uint32_t) lValue;  break;
      case 'c':
        opt.sCards = optarg;  break;
      case 'k':
        opt.sKeyboard = optarg;  break;
      case 't':
        opt.fTrace = true;  break;
      case 'L':
        opt.sLogFile = optarg;  break;
      case 'd':
        opt.fDebug = true;  break;
      case 'h':
      default:
        ShowUsage();
        return false;
    }
  }
  if (optind < argc) {
    CMDERRF("unexpected argument \"%s\"", argv[optind]);
    return false;
  }
  return true;
}

static bool CreateMachine (const OPTIONS &opt)
{
  //++
  //   Create the CPU, which creates its own memory and interrupt system, and
  // then attach the peripherals.  Once a device is attached the CPU owns it,
  // but if the attach fails we still have to delete it ourselves ...
  //--
  g_pCPU = DBGNEW C1130(opt.cwMemory);
  g_pMemory = g_pCPU->GetMemory();
  g_pInterrupt = g_pCPU->GetInterrupt();
  g_pCPU->SetTrace(opt.fTrace);

  g_pKeyboard = DBGNEW CKeyboard();
  if (!g_pCPU->AttachDevice(g_pKeyboard, CONSOLE_LEVEL)) {
    delete g_pKeyboard;  g_pKeyboard = NULL;  return false;
  }
  g_pPrinter = DBGNEW CPrinter();
  if (!g_pCPU->AttachDevice(g_pPrinter, CONSOLE_LEVEL)) {
    delete g_pPrinter;  g_pPrinter = NULL;  return false;
  }
  g_pReader = DBGNEW CCardReader();
  if (!g_pCPU->AttachDevice(g_pReader, READER_LEVEL)) {
    delete g_pReader;  g_pReader = NULL;  return false;
  }
  return true;
}

static void ShowState()
{
  //++
  // Print the final register snapshot ...
  //--
  C1130::CPU_STATE state = g_pCPU->GetState();
  CMDOUTF("ACC=%04X EXT=%04X IAR=%04X XR1=%04X XR2=%04X XR3=%04X C=%d V=%d WAIT=%d",
    state.wACC, state.wEXT, state.wIAR, state.awXR[0], state.awXR[1], state.awXR[2],
    state.fCarry, state.fOverflow, state.fWait);
  CMDOUTS(state.llInstructions << " instructions executed");
  if (state.nActiveLevel != CPriorityInterrupt::NOLEVEL)
    CMDOUTF("interrupt level %d in service", state.nActiveLevel);
}

int main (int argc, char *argv[])
{
  //++
  // Here's the main program for the IBM 1130 Emulator.
  //--
  int nExit = EXIT_FAILURE;  OPTIONS opt;

  //   The very first thing is to create the log object.  We can't issue any
  // error messages until we've done that!
  g_pLog = DBGNEW CLog(PROGRAM);
  g_pLog->SetDefaultConsoleLevel(CLog::WARNING);
  if (!ParseOptions(argc, argv, opt)) goto shutdown;
  if (opt.fDebug) g_pLog->SetDefaultConsoleLevel(CLog::DEBUG);
  if (opt.fTrace) g_pLog->SetDefaultConsoleLevel(CLog::TRACE);
  if (!opt.sLogFile.empty()) {
    if (!g_pLog->OpenLog(opt.sLogFile, opt.fTrace ? CLog::TRACE : CLog::DEBUG, false)) goto shutdown;
  }
  LOGF(DEBUG, "IBM 1130 Emulator v%d Emulator Library v%d", IBMVER, EMUVER);

  // Create the emulated CPU, memory and peripheral devices ...
  if (!CreateMachine(opt)) goto shutdown;

  // Load the program, the card deck and the keyboard input ...
  if (opt.sImage.empty()) {
    CMDERRS("no memory image given (use --load)");
    goto shutdown;
  }
  if (g_pMemory->LoadImage(opt.sImage) < 0) goto shutdown;
  if (!opt.sCards.empty() && (g_pReader->LoadDeck(opt.sCards) < 0)) goto shutdown;
  if (!opt.sKeyboard.empty()) g_pKeyboard->Type(opt.sKeyboard);

  // Run it ...
  g_pCPU->SetPC(opt.wStart);
  {
    CCPU::STOP_CODE nStop = g_pCPU->Run(opt.nSteps);
    ShowState();
    if (!g_pPrinter->GetOutput().empty())
      CMDOUTS("printer output:" << std::endl << g_pPrinter->GetOutput());
    if ((nStop == CCPU::STOP_HALT) || (nStop == CCPU::STOP_FINISHED)) {
      CMDOUTF("%s at %04X", CCPU::StopCodeToString(nStop), g_pCPU->GetLastPC());
      nExit = EXIT_SUCCESS;
    } else if (g_pCPU->GetLastStatus() == C1130::CPU_MEMORY_VIOLATION) {
      CMDERRF("%s (%s %04X) at %04X", CCPU::StopCodeToString(nStop),
        C1130::StatusToString(g_pCPU->GetLastStatus()), g_pCPU->GetFaultAddress(), g_pCPU->GetLastPC());
    } else {
      CMDERRF("%s (%s) at %04X", CCPU::StopCodeToString(nStop),
        C1130::StatusToString(g_pCPU->GetLastStatus()), g_pCPU->GetLastPC());
    }
  }

  // Delete all our global objects.  Once again, the order here is important!
shutdown:
  delete g_pCPU;              // the CPU deletes the devices, memory and interrupts
  g_pCPU = NULL;  g_pMemory = NULL;  g_pInterrupt = NULL;
  g_pKeyboard = NULL;  g_pPrinter = NULL;  g_pReader = NULL;
  delete g_pLog;              // close the log file
  return nExit;
}
