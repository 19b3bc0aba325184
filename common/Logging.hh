// ----------------------------------------------------------------------
// File: Logging.hh
// Author: Andreas-Joachim Peters - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2011 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

/**
 * @file   Logging.hh
 *
 * @brief  Class for message logging.
 *
 * You can use this class without creating an instance object (it provides a
 * global singleton). All the 'sower_<state>' functions require that the
 * logging class inherits from the 'LogId' class. As an alternative a set of
 * static 'sower_static_<state>' logging functions are provided. To define the
 * log level one uses the 'SetLogPriority' function. 'SetFilter' allows to
 * filter out log messages which are identified by their function/method name
 * (__FUNCTION__). If you prefix this comma separated list with 'PASS:' it is
 * used as an acceptance filter. By default all logging is printed to 'stderr',
 * 'SetOutput' redirects it to any other stream.
 */

#ifndef __SOWERCOMMON_LOGGING_HH__
#define __SOWERCOMMON_LOGGING_HH__

#include "common/Namespace.hh"
#include "XrdOuc/XrdOucString.hh"
#include "XrdOuc/XrdOucHash.hh"
#include "XrdSys/XrdSysPthread.hh"
#include <stdio.h>
#include <string.h>
#include <sys/syslog.h>
#include <sys/time.h>
#include <uuid/uuid.h>
#include <string>
#include <vector>
#include <sstream>

#define SSTR(message) static_cast<std::ostringstream&>(std::ostringstream().flush() << message).str()

SOWERCOMMONNAMESPACE_BEGIN

#define LOG_SILENT 0xffff

//------------------------------------------------------------------------------
//! Log Macros usable in objects inheriting from the LogId Class
//------------------------------------------------------------------------------
#define sower_log(__SOWERCOMMON_LOG_PRIORITY__ , ...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, __SOWERCOMMON_LOG_PRIORITY__, __VA_ARGS__)
#define sower_debug(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_DEBUG), __VA_ARGS__)
#define sower_info(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_INFO), __VA_ARGS__)
#define sower_notice(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_NOTICE), __VA_ARGS__)
#define sower_warning(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_WARNING), __VA_ARGS__)
#define sower_err(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_ERR), __VA_ARGS__)
#define sower_crit(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_CRIT), __VA_ARGS__)
#define sower_alert(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_ALERT), __VA_ARGS__)
#define sower_emerg(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      this->logId, this->cident, (LOG_EMERG), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros usable from static member functions without LogId object
//------------------------------------------------------------------------------
#define sower_static_debug(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_DEBUG), __VA_ARGS__)
#define sower_static_info(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_INFO), __VA_ARGS__)
#define sower_static_notice(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_NOTICE), __VA_ARGS__)
#define sower_static_warning(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_WARNING), __VA_ARGS__)
#define sower_static_err(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_ERR), __VA_ARGS__)
#define sower_static_crit(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_CRIT), __VA_ARGS__)
#define sower_static_alert(...) \
  sower::common::Logging::GetInstance().log(__FUNCTION__, __FILE__, __LINE__, \
      "static..............................", "", (LOG_ALERT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros to check if a function would log in a certain log level
//------------------------------------------------------------------------------
#define SOWER_LOGS_DEBUG   sower::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_DEBUG)  )
#define SOWER_LOGS_INFO    sower::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_INFO)   )

#define SOWERCOMMONLOGGING_CIRCULARINDEXSIZE 10000

//------------------------------------------------------------------------------
//! Class carrying the log identifier of an object
//------------------------------------------------------------------------------
class LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  LogId()
  {
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, logId);
    snprintf(cident, sizeof(cident), "<service>");
  }

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~LogId() = default;

  //----------------------------------------------------------------------------
  //! Generate log id value
  //----------------------------------------------------------------------------
  static std::string GenerateLogId()
  {
    char log_id[40];
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, log_id);
    return log_id;
  }

  //----------------------------------------------------------------------------
  //! For calls which are not client initiated this function sets a unique
  //! dummy log id
  //----------------------------------------------------------------------------
  void
  SetSingleShotLogId(const char* td = "<single-exec>")
  {
    snprintf(logId, sizeof(logId), "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    snprintf(cident, sizeof(cident), "%s", td);
  }

  //----------------------------------------------------------------------------
  //! Set the logid and trace identifier
  //----------------------------------------------------------------------------
  void
  SetLogId(const char* newlogid, const char* td)
  {
    if (newlogid && (newlogid != logId)) {
      snprintf(logId, sizeof(logId), "%s", newlogid);
    }

    if (td) {
      snprintf(cident, sizeof(cident), "%s", td);
    }
  }

  char logId[40]; //< the log Id for message printout
  char cident[256]; //< the trace identifier e.g. destination name
};

//------------------------------------------------------------------------------
//! Class wrapping global singleton objects for logging
//------------------------------------------------------------------------------
class Logging
{
public:
  //! Typedef for circular index pointing to the next message position
  typedef std::vector<unsigned long> LogCircularIndex;
  //! Typedef for log message array
  typedef std::vector<std::vector<XrdOucString>> LogArray;
  LogCircularIndex gLogCircularIndex; //< global circular index
  LogArray gLogMemory; //< global logging memory
  unsigned long gCircularIndexSize; //< global circular index size
  int gLogMask; //< log mask
  int gPriorityLevel; //< log priority
  XrdSysMutex gMutex; //< global mutex
  XrdOucString gUnit; //< global unit name
  //! Global list of function names allowed to log
  XrdOucHash<const char*> gAllowFilter;
  //! Global list of function names denied to log
  XrdOucHash<const char*> gDenyFilter;
  int gShortFormat; //< indicating if the log-output is in short format
  FILE* gOutput; //< stream receiving the log lines

  //----------------------------------------------------------------------------
  //! Get singleton instance
  //----------------------------------------------------------------------------
  static Logging& GetInstance();

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  Logging();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~Logging() = default;

  //----------------------------------------------------------------------------
  //! Get current log mask
  //----------------------------------------------------------------------------
  int
  GetLogMask() const
  {
    return gLogMask;
  }

  //----------------------------------------------------------------------------
  //! Set the log priority (like syslog)
  //----------------------------------------------------------------------------
  void
  SetLogPriority(int pri)
  {
    // silent masks every message priority
    gLogMask = (pri == LOG_SILENT) ? 0 : LOG_UPTO(pri);
    gPriorityLevel = pri;
  }

  //----------------------------------------------------------------------------
  //! Set the log unit name
  //----------------------------------------------------------------------------
  void
  SetUnit(const char* unit)
  {
    gUnit = unit;
  }

  //----------------------------------------------------------------------------
  //! Switch between the short and the long line format
  //----------------------------------------------------------------------------
  void
  SetShortFormat(bool onoff)
  {
    gShortFormat = onoff ? 1 : 0;
  }

  //----------------------------------------------------------------------------
  //! Redirect the log lines, nullptr restores stderr
  //----------------------------------------------------------------------------
  void
  SetOutput(FILE* fd)
  {
    XrdSysMutexHelper scope_lock(gMutex);
    gOutput = fd ? fd : stderr;
  }

  //----------------------------------------------------------------------------
  //! Set the log filter
  //----------------------------------------------------------------------------
  void SetFilter(const char* filter);

  //----------------------------------------------------------------------------
  //! Return priority as string
  //----------------------------------------------------------------------------
  const char* GetPriorityString(int pri) const;

  //----------------------------------------------------------------------------
  //! Return priority int from string, -1 if unknown
  //----------------------------------------------------------------------------
  int GetPriorityByString(const char* pri) const;

  //----------------------------------------------------------------------------
  //! Get the most recent message logged with the given priority
  //----------------------------------------------------------------------------
  std::string GetLastMessage(int priority);

  //----------------------------------------------------------------------------
  //! Check if we should log in the defined level/filter
  //!
  //! @param func name of the calling function
  //! @param priority priority level of the message
  //----------------------------------------------------------------------------
  bool shouldlog(const char* func, int priority);

  //----------------------------------------------------------------------------
  //! Log a message into the global buffer
  //!
  //! @param func name of the calling function
  //! @param file name of the source file calling
  //! @param line line in the source file
  //! @param logid log message identifier
  //! @param cident trace identifier
  //! @param priority priority level of the message
  //! @param msg the actual log message
  //!
  //! @return pointer to the log message
  //----------------------------------------------------------------------------
  const char* log(const char* func, const char* file, int line,
                  const char* logid, const char* cident, int priority,
                  const char* msg, ...)
  __attribute__((format(printf, 8, 9)));
};

extern Logging& gLogging; ///< Global logging object

//------------------------------------------------------------------------------
//! Static Logging initializer
//------------------------------------------------------------------------------
static struct LoggingInitializer {
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  LoggingInitializer();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~LoggingInitializer();
} sLoggingInit; ///< Static initializer for every translation unit

SOWERCOMMONNAMESPACE_END

#endif
