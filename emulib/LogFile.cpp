//++
// LogFile.cpp -> CLog (emulator library log file) methods
//
//   COPYRIGHT (C) 2015-2024 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
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
//   The CLog class defines a generic logging facility for the emulator library.
// Messages may be logged to the console, to a file, or both depending on the
// message severity.  Messages logged to the log file are automatically time
// stamped.  Log files may be opened and closed, and the message level for
// both console and log file may be changed dynamically.
//
//   The 1130 emulator is strictly single threaded, so none of this needs to
// worry about being re-entrant.  
//
//   Lastly, note that it is intended that there be only one CLog instance per
// application, and it follows a somewhat modified Singleton design pattern.
// It's modified because the constructor has parameters and we want it to be
// explicitly called, but only once.  A pointer to the original CLog instance
// can be retrieved at any time by calling CLog::GetLog().
//
// Bob Armstrong <bob@jfcl.com>   [20-MAY-2015]
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
//  2-JUN-17  RLA   Linux port.
// 26-AUG-22  RLA   Clean up Linux/WIN32 conditionals.
//  6-FEB-24  RLA   Create single threaded version.
//  3-MAR-25  RLA   Console output always goes to stderr now.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <assert.h>             // assert() (what else??)
#include <errno.h>              // errno ...
#include <string.h>             // strchr(), strerror(), etc ...
#include <time.h>               // localtime_r(), ...
#include <sys/time.h>           // gettimeofday() ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // declarations for this module


// Initialize the pointer to the one and only CLog instance ...
CLog *CLog::m_pLog = NULL;


CLog::CLog (const char *pszProgram)
  : m_sProgram(pszProgram)
{
  //++
  //   The log file constructor just initializes all the members.  The
  // initial console logging level is set to WARNING and the log file is
  // initially closed.
  //
  //   Note that the pszProgram parameter is the name of the application that
  // uses EMULIB. It's only used as a prefix on error messages.
  //--

  // This had better be the first and only instance of this object!
  assert(m_pLog == NULL);
  m_pLog = this;

  // Initialize all the members ...
  m_pLogFile = NULL;  m_sLogName.clear();  m_lvlFile = NOLOG;
#if defined(_DEBUG)
  m_lvlConsole = DEBUG;
#else
  m_lvlConsole = WARNING;
#endif
}

CLog::~CLog()
{
  //++
  // Destroying the log closes the log file ...
  //--
  if (IsLogFileOpen()) CloseLog();

  //   Reset the pointer to this Singleton object. In theory this would allow
  // another CLog instance to be created, and the unit tests take advantage
  // of that.
  assert(m_pLog == this);
  m_pLog = NULL;
}

/*static*/ string CLog::LevelToString (SEVERITY nLevel)
{
  //++
  //   Return a simple string corresponding to nLevel.   This is used to
  // put the message level into the log file...
  //--
  switch (nLevel) {
    case CMDOUT:  return string("CMDOUT");
    case CMDERR:  return string("CMDERR");
    case TRACE:   return string("TRACE");
    case DEBUG:   return string("DEBUG");
    case WARNING: return string("WARN");
    case ERROR:   return string("ERROR");
    case ABORT:   return string("ABORT");
    default:      return string("UNKNOWN");
  }
}

/*static*/ void CLog::GetTimeStamp (TIMESTAMP *ptb)
{
  //++
  //   Return the time stamp for right now!  Yes, this is a trivial function
  // but it's here to help hide the actual implementation of TIMESTAMP.
  //--
  gettimeofday(ptb, NULL);
}

/*static*/ string CLog::TimeStampToString (const TIMESTAMP *ptb)
{
  //++
  //   This method will convert the specified timestamp into the local time of
  // day as a string in the format "HH:MM:SS.ddd". Notice that the milliseconds
  // are included because many messages get logged in short intervals, however
  // the date is not.
  //--
  struct tm tmNow;  time_t tSeconds = ptb->tv_sec;
  localtime_r(&tSeconds, &tmNow);
  return FormatString("%02d:%02d:%02d.%03ld",
    tmNow.tm_hour, tmNow.tm_min, tmNow.tm_sec, (long) (ptb->tv_usec / 1000));
}

/*static*/ string CLog::GetTimeStamp()
{
  //++
  // Return a time stamp string for right now ...
  //--
  TIMESTAMP tbNow;
  GetTimeStamp(&tbNow);
  return TimeStampToString(&tbNow);
}

string CLog::GetDefaultLogFileName()
{
  //++
  //   This method returns a default name for the log file, something like
  // "ibm1130_yyyymmdd.log".  It's used when the operator doesn't specify an
  // explicit log file name...
  //--
  time_t tNow;  struct tm tmNow;
  time(&tNow);  localtime_r(&tNow, &tmNow);
  return FormatString("%s_%04d%02d%02d.log",
    m_sProgram.c_str(), tmNow.tm_year+1900, tmNow.tm_mon+1, tmNow.tm_mday);
}

bool CLog::OpenLog (const string &sFileName, SEVERITY nLevel, bool fAppend)
{
  //++
  //   This method opens a new log file and sets the default message level for
  // it. If the file name passed is null, then a default file name will be used
  // instead.  Normally new text is appended to any existsing file, however
  // if fAppend is false then any existing log will be overwritten.  In either
  // case a new, empty, file will be created if one does not exist.
  //--
  if (IsLogFileOpen()) CloseLog();
  m_sLogName = sFileName.empty() ? GetDefaultLogFileName() : sFileName;
  m_pLogFile = fopen(m_sLogName.c_str(), fAppend ? "a+" : "w+");
  if (m_pLogFile == NULL) {
    CMDERRS("error (" << strerror(errno) << ") opening log " << m_sLogName);
    m_sLogName.clear();  return false;
  }
  SetDefaultFileLevel(nLevel);
  LOGS(DEBUG, "log " << m_sLogName << " opened");
  return true;
}

void CLog::CloseLog()
{
  //++
  //   Close the currently open log file (if any).  Console logging is not
  // affected by this operation.
  //--
  if (!IsLogFileOpen()) return;
  LOGS(DEBUG, "log " << m_sLogName << " closed");
  fclose(m_pLogFile);
  m_pLogFile = NULL;  m_sLogName.clear();  SetDefaultFileLevel(NOLOG);
}

void CLog::Print (SEVERITY nLevel, ostringstream &osText)
{
  //++
  //   This method does the work for the LOGS() macro - it sends output from
  // an ostringstream to the console and/or log file.
  //--
  if (IsLoggedToFile(nLevel)) SendLog(nLevel, osText.str().c_str());
  if (IsLoggedToConsole(nLevel)) SendConsole(nLevel, osText.str().c_str());
}

void CLog::Print (SEVERITY nLevel, const char *pszFormat, ...)
{
  //++
  //   And this method does the work for the LOGF() macro - it sends printf()
  // formatted output to the console and/or log file.  This takes a tiny bit
  // more work than the I/O streams version ...
  //--
  char szBuffer[MAXMSG];  va_list args;
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  if (IsLoggedToFile(nLevel)) SendLog(nLevel, szBuffer);
  if (IsLoggedToConsole(nLevel)) SendConsole(nLevel, szBuffer);
}

void CLog::LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText)
{
  //++
  //   This private method writes a text string, which must be guaranteed to
  // be a single line, to the log file.  A date/time stamp and the message
  // severity is also printed at the start of the line (which is why the
  // message text shouldn't contain newlines!)
  //--
  if (!IsLogFileOpen()) return;
  fprintf(m_pLogFile, "%s %s\t%s\n",
    TimeStampToString(ptb).c_str(),  sPrefix.c_str(), pszText);
  fflush(m_pLogFile);
}

void CLog::SendLog (SEVERITY nLevel, const char *pszText, const TIMESTAMP *ptb)
{
  //++
  //   This method sends text to the log file, where the text may contain
  // newline characters.  That's messy, because we have to split the text up
  // into individual lines for logging.
  //
  //   Note that the time stamp is optional and, if not specified, defaults to
  // "right now" ...
  //--
  const char *pszEnd;  TIMESTAMP tmNow;
  if (ptb == NULL) {
    GetTimeStamp(&tmNow);  ptb = &tmNow;
  }
  while ((pszEnd = strchr(pszText, '\n')) != NULL) {
    string sLine(pszText, pszEnd-pszText);
    LogSingleLine(ptb, nLevel, sLine.c_str());
    pszText = pszEnd+1;
  }
  if (*pszText != '\0') LogSingleLine(ptb, nLevel, pszText);
}

void CLog::SendConsole (SEVERITY nLevel, const char *pszText)
{
  //++
  //   This method sends a message to the console.  The exact formatting and
  // the destination (stderr vs stdout) depend on the severity of the
  // message.  CMDOUT, for example, goes to stdout with no decoration at
  // all.  Everything else goes to stderr.
  //--
  switch (nLevel) {
    case CMDOUT:  fprintf(stdout, "%s\n", pszText);                      break;
    case TRACE:   fprintf(stderr, "-- %s\n", pszText);                   break;
    case DEBUG:   fprintf(stderr, "[%s]\n", pszText);                    break;
    default:      fprintf(stderr, "%s: %s\n", m_sProgram.c_str(), pszText); break;
  }
}
