//++
// LogFile.hpp -> CLog (emulator library log file) class
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
//   The CLog class defines a generic logging facility for the emulator
// library.  Messages may be logged to the console (stderr), to a file, or
// both depending on the message severity.  There is only one CLog instance
// per application and a pointer to it can be had at any time by calling
// CLog::GetLog().
//
//   Most code never calls CLog directly and uses the LOGF() (printf style)
// or LOGS() (C++ stream style) macros instead.  For example -
//
//      LOGF(WARNING, "unknown device code %d", nDevice);
//      LOGS(DEBUG, "interrupt level " << nLevel << " delivered");
//
//   If no CLog object has been created (e.g. in unit tests) then these
// macros quietly do nothing at all.
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
//  6-FEB-24  RLA   Create single threaded version.
//  3-MAR-25  RLA   Remove the console window and command parser dependencies.
//--
#pragma once
#include <stdio.h>              // FILE, fopen(), fprintf(), etc ...
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <sys/time.h>           // struct timeval, gettimeofday() ...
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
using std::string;              // ...
using std::ostringstream;       // ...


class CLog {
  //++
  // Message logging class ...
  //--

  // Message severity levels ...
public:
  enum _SEVERITIES {
    CMDOUT,           // normal command output (always printed!)
    CMDERR,           // command error message (always printed!)
    TRACE,            // instruction and interrupt trace
    DEBUG,            // debugging messages
    WARNING,          // warning (non-fatal) messages
    ERROR,            // error (but still recoverable) messages
    ABORT,            // fatal error messages
    NOLOG             // logging disabled
  };
  typedef enum _SEVERITIES SEVERITY;

  // Magic constants ...
  enum {
    MAXMSG = 1024     // longest possible message, in characters
  };

  //   A time stamp for the log file.  The milliseconds (well, microseconds)
  // are included because many messages get logged in short intervals ...
  typedef struct timeval TIMESTAMP;

  // Constructor and destructor ...
public:
  CLog (const char *pszProgram);
  virtual ~CLog();
private:
  // Disallow copy and assignments!
  CLog (const CLog&) = delete;
  CLog& operator= (CLog const &) = delete;

  // Public properties ...
public:
  // Return the one and only CLog instance (or NULL if none exists) ...
  static CLog *GetLog() {return m_pLog;}
  // Get or set the console and log file message levels ...
  SEVERITY GetDefaultConsoleLevel() const {return m_lvlConsole;}
  void SetDefaultConsoleLevel (SEVERITY lvl) {m_lvlConsole = lvl;}
  SEVERITY GetDefaultFileLevel() const {return m_lvlFile;}
  void SetDefaultFileLevel (SEVERITY lvl) {m_lvlFile = lvl;}
  SEVERITY GetConsoleLevel() const {return GetDefaultConsoleLevel();}
  SEVERITY GetFileLevel() const {return GetDefaultFileLevel();}
  // Return TRUE if a message of this severity goes anywhere ...
  bool IsLoggedToConsole (SEVERITY lvl) const
    {return (lvl == CMDOUT) || (lvl == CMDERR) || (lvl >= GetConsoleLevel());}
  bool IsLoggedToFile (SEVERITY lvl) const
    {return IsLogFileOpen() && (lvl >= GetFileLevel());}
  static bool IsLogged (SEVERITY lvl)
    {return (m_pLog != NULL) && (m_pLog->IsLoggedToConsole(lvl) || m_pLog->IsLoggedToFile(lvl));}
  // Return the program name (used as a message prefix) ...
  string GetProgram() const {return m_sProgram;}

  // Log file methods ...
public:
  // Open or close a log file ...
  bool OpenLog (const string &sFileName, SEVERITY nLevel=WARNING, bool fAppend=true);
  void CloseLog();
  // Return TRUE if a log file is open ...
  bool IsLogFileOpen() const {return m_pLogFile != NULL;}
  // Return the name of the current log file ...
  string GetLogFileName() const {return m_sLogName;}
  // Return a default log file name ...
  string GetDefaultLogFileName();

  // Message logging methods ...
public:
  // Log a message from an ostringstream (LOGS) or a printf() format (LOGF) ...
  void Print (SEVERITY nLevel, ostringstream &osText);
  void Print (SEVERITY nLevel, const char *pszFormat, ...);
  // Convert a severity level to a string for the log file ...
  static string LevelToString (SEVERITY nLevel);
  // Time stamp functions ...
  static void GetTimeStamp (TIMESTAMP *ptb);
  static string GetTimeStamp();
  static string TimeStampToString (const TIMESTAMP *ptb);

  // Private methods ...
private:
  // Send a message to the console or the log file ...
  void SendConsole (SEVERITY nLevel, const char *pszText);
  void SendLog (SEVERITY nLevel, const char *pszText, const TIMESTAMP *ptb=NULL);
  void LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText);
  void LogSingleLine (const TIMESTAMP *ptb, SEVERITY nLevel, const char *pszText)
    {LogSingleLine(ptb, LevelToString(nLevel), pszText);}

  // Private member data ...
private:
  string    m_sProgram;         // program name (for message prefixes)
  string    m_sLogName;         // name of the log file
  FILE     *m_pLogFile;         // handle of the log file (NULL if none)
  SEVERITY  m_lvlConsole;       // current console message level
  SEVERITY  m_lvlFile;          // current log file message level
  static CLog *m_pLog;          // the one and only CLog instance
};


//++
//   These macros are the preferred way to log messages.  LOGF() takes a
// printf() style argument list and LOGS() takes a C++ stream expression.
// CMDOUTx() and CMDERRx() are the same but always print the message ...
//--
#define LOGF(l,...) {                                                     \
  if (CLog::IsLogged(CLog::l)) CLog::GetLog()->Print(CLog::l, __VA_ARGS__); \
}
#define LOGS(l,m) {                                                       \
  if (CLog::IsLogged(CLog::l)) {                                          \
    ostringstream osMsg;  osMsg << m;                                     \
    CLog::GetLog()->Print(CLog::l, osMsg);                                \
  }                                                                       \
}
#define CMDOUTF(...)  LOGF(CMDOUT, __VA_ARGS__)
#define CMDOUTS(m)    LOGS(CMDOUT, m)
#define CMDERRF(...)  LOGF(CMDERR, __VA_ARGS__)
#define CMDERRS(m)    LOGS(CMDERR, m)
