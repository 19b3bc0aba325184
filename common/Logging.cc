// ----------------------------------------------------------------------
// File: Logging.cc
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

#include "common/Namespace.hh"
#include "common/Logging.hh"
#include <stdarg.h>
#include <time.h>
#include <new>
#include <type_traits>
#include <atomic>

SOWERCOMMONNAMESPACE_BEGIN

static std::atomic<int> sCounter {0};
static typename std::aligned_storage<sizeof(Logging), alignof(Logging)>::type
logging_buf; ///< Memory for the global logging object
Logging& gLogging = reinterpret_cast<Logging&>(logging_buf);

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
LoggingInitializer::LoggingInitializer()
{
  if (sCounter++ == 0) {
    new (&gLogging) Logging(); // placement new
  }
}

//------------------------------------------------------------------------------
// Destructor
//------------------------------------------------------------------------------
LoggingInitializer::~LoggingInitializer()
{
  if (--sCounter == 0) {
    (&gLogging)->~Logging();
  }
}

//------------------------------------------------------------------------------
// Get singleton instance
//------------------------------------------------------------------------------
Logging&
Logging::GetInstance()
{
  return gLogging;
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Logging::Logging():
  gCircularIndexSize(SOWERCOMMONLOGGING_CIRCULARINDEXSIZE),
  gLogMask(LOG_UPTO(LOG_INFO)), gPriorityLevel(LOG_INFO), gUnit("sower"),
  gShortFormat(0), gOutput(stderr)
{
  // Initialize the log array and sets the log circular size
  gLogCircularIndex.resize(LOG_DEBUG + 1);
  gLogMemory.resize(LOG_DEBUG + 1);

  for (int i = 0; i <= LOG_DEBUG; i++) {
    gLogCircularIndex[i] = 0;
    gLogMemory[i].resize(gCircularIndexSize);
  }

  if (getenv("SOWER_LOG_LEVEL")) {
    int pri = GetPriorityByString(getenv("SOWER_LOG_LEVEL"));

    if (pri != -1) {
      SetLogPriority(pri);
    }
  }
}

//------------------------------------------------------------------------------
// Set the log filter
//------------------------------------------------------------------------------
void
Logging::SetFilter(const char* filter)
{
  int pos = 0;
  char del = ',';
  XrdOucString token;
  XrdOucString pass_tag = "PASS:";
  XrdOucString sfilter = filter;
  XrdSysMutexHelper scope_lock(gMutex);
  // Clear both maps
  gDenyFilter.Purge();
  gAllowFilter.Purge();

  if ((pos = sfilter.find(pass_tag)) != STR_NPOS) {
    // Extract the function names which are allowed to log
    pos += pass_tag.length();

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gAllowFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  } else {
    // Extract the function names which are denied to log
    pos = 0;

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gDenyFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  }
}

//------------------------------------------------------------------------------
// Return priority as string
//------------------------------------------------------------------------------
const char*
Logging::GetPriorityString(int pri) const
{
  switch (pri) {
  case LOG_INFO:
    return "INFO ";

  case LOG_DEBUG:
    return "DEBUG";

  case LOG_ERR:
    return "ERROR";

  case LOG_EMERG:
    return "EMERG";

  case LOG_ALERT:
    return "ALERT";

  case LOG_CRIT:
    return "CRIT ";

  case LOG_WARNING:
    return "WARN ";

  case LOG_NOTICE:
    return "NOTE ";

  case LOG_SILENT:
    return "";

  default:
    return "NONE ";
  }
}

//------------------------------------------------------------------------------
// Return priority int from string
//------------------------------------------------------------------------------
int
Logging::GetPriorityByString(const char* pri) const
{
  if (!pri) {
    return -1;
  }

  if (!strcmp(pri, "info")) {
    return LOG_INFO;
  }

  if (!strcmp(pri, "debug")) {
    return LOG_DEBUG;
  }

  if (!strcmp(pri, "err")) {
    return LOG_ERR;
  }

  if (!strcmp(pri, "emerg")) {
    return LOG_EMERG;
  }

  if (!strcmp(pri, "alert")) {
    return LOG_ALERT;
  }

  if (!strcmp(pri, "crit")) {
    return LOG_CRIT;
  }

  if (!strcmp(pri, "warning")) {
    return LOG_WARNING;
  }

  if (!strcmp(pri, "notice")) {
    return LOG_NOTICE;
  }

  if (!strcmp(pri, "silent")) {
    return LOG_SILENT;
  }

  return -1;
}

//------------------------------------------------------------------------------
// Get the most recent message logged with the given priority
//------------------------------------------------------------------------------
std::string
Logging::GetLastMessage(int priority)
{
  if ((priority < 0) || (priority > LOG_DEBUG)) {
    return "";
  }

  XrdSysMutexHelper scope_lock(gMutex);

  if (gLogCircularIndex[priority] == 0) {
    return "";
  }

  unsigned long idx = (gLogCircularIndex[priority] - 1) % gCircularIndexSize;
  return gLogMemory[priority][idx].c_str();
}

//------------------------------------------------------------------------------
// Should log function
//------------------------------------------------------------------------------
bool
Logging::shouldlog(const char* func, int priority)
{
  if (priority == LOG_SILENT) {
    return true;
  }

  // short cut if log messages are masked
  if (!((LOG_MASK(priority) & gLogMask))) {
    return false;
  }

  // apply filter to avoid message flooding for debug messages
  if (priority >= LOG_INFO) {
    XrdSysMutexHelper scope_lock(gMutex);

    if (gAllowFilter.Num()) {
      return (gAllowFilter.Find(func) != nullptr);
    }

    if (gDenyFilter.Num() && gDenyFilter.Find(func)) {
      return false;
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Log a message
//------------------------------------------------------------------------------
const char*
Logging::log(const char* func, const char* file, int line, const char* logid,
             const char* cident, int priority, const char* msg, ...)
{
  bool silent = (priority == LOG_SILENT);

  if (!shouldlog(func, priority)) {
    return "";
  }

  static thread_local char buffer[16384];
  XrdOucString File = file;
  // we show only the file name without directory and extension
  File.erase(0, File.rfind("/") + 1);
  File.erase(File.length() - 3);
  time_t current_time;
  struct timeval tv;
  struct tm tm;
  va_list args;
  va_start(args, msg);
  gettimeofday(&tv, nullptr);
  current_time = tv.tv_sec;
  localtime_r(&current_time, &tm);
  char sourceline[64];
  snprintf(sourceline, sizeof(sourceline) - 1, "%s:%d", File.c_str(), line);

  if (gShortFormat) {
    snprintf(buffer, sizeof(buffer),
             "%02d%02d%02d %02d:%02d:%02d t=%lu.%06lu f=%-16s l=%s tid=%016lx "
             "s=%-24s ", tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, (unsigned long) current_time,
             (unsigned long) tv.tv_usec, func, GetPriorityString(priority),
             (unsigned long) XrdSysThread::ID(), sourceline);
  } else {
    snprintf(buffer, sizeof(buffer),
             "%02d%02d%02d %02d:%02d:%02d time=%lu.%06lu func=%-24s level=%s "
             "logid=%s unit=%s tid=%016lx source=%-30s tident=%s ",
             tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
             tm.tm_min, tm.tm_sec, (unsigned long) current_time,
             (unsigned long) tv.tv_usec, func, GetPriorityString(priority),
             logid, gUnit.c_str(), (unsigned long) XrdSysThread::ID(),
             sourceline, (cident && strlen(cident)) ? cident : "<static>");
  }

  char* ptr = buffer + strlen(buffer);
  // limit the length of the output to buffer-1 length
  vsnprintf(ptr, sizeof(buffer) - (ptr - buffer + 1), msg, args);
  va_end(args);

  if (silent) {
    priority = LOG_DEBUG;
  }

  const char* rptr;
  XrdSysMutexHelper scope_lock(gMutex);
  gLogMemory[priority][(gLogCircularIndex[priority]) % gCircularIndexSize] =
    buffer;
  rptr = gLogMemory[priority][(gLogCircularIndex[priority]) %
                              gCircularIndexSize].c_str();
  gLogCircularIndex[priority]++;

  if (!silent) {
    fprintf(gOutput, "%s\n", buffer);
    fflush(gOutput);
  }

  return rptr;
}

SOWERCOMMONNAMESPACE_END
