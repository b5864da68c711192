//++
// EMULIB.cpp -> emulator library global helper functions
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
//   This module contains a few small helper functions, declared in EMULIB.hpp,
// that are used everywhere ...
//
// REVISION HISTORY:
// 20-MAY-15  RLA   New file.
//  3-MAR-25  RLA   Pare down to just FormatString() for the 1130.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <stdio.h>              // vsnprintf() ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // declarations for this module


PRIVATE void FormatStringV (string &sResult, const char *pszFormat, va_list args)
{
  //++
  //   Do the real work for both flavors of FormatString().  We try once with
  // a reasonable sized buffer, and if that isn't big enough then we allocate
  // exactly what's needed and try again ...
  //--
  char szBuffer[256];  va_list args2;
  va_copy(args2, args);
  int cch = vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  if (cch < 0) {
    sResult.clear();
  } else if ((size_t) cch < sizeof(szBuffer)) {
    sResult = szBuffer;
  } else {
    std::vector<char> vecBuffer(cch+1);
    vsnprintf(vecBuffer.data(), vecBuffer.size(), pszFormat, args2);
    sResult = vecBuffer.data();
  }
  va_end(args2);
}

PUBLIC string FormatString (const char *pszFormat, ...)
{
  //++
  // Just like sprintf(), but the result is a C++ string ...
  //--
  string sResult;  va_list args;
  va_start(args, pszFormat);
  FormatStringV(sResult, pszFormat, args);
  va_end(args);
  return sResult;
}

PUBLIC void FormatString (string &sResult, const char *pszFormat, ...)
{
  //++
  // Ditto, but store the result in an existing string ...
  //--
  va_list args;
  va_start(args, pszFormat);
  FormatStringV(sResult, pszFormat, args);
  va_end(args);
}
