// ----------------------------------------------------------------------
// File: ShellCmd.hh
// Author: Michal Kamin Simon - CERN
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

#ifndef __SOWERCOMMON_SHELLCMD__HH__
#define __SOWERCOMMON_SHELLCMD__HH__

/*----------------------------------------------------------------------------*/
#include "common/Namespace.hh"
#include "common/IoPriority.hh"
/*----------------------------------------------------------------------------*/
#include <signal.h>
#include <sys/types.h>
#include <exception>
#include <string>

SOWERCOMMONNAMESPACE_BEGIN

/*----------------------------------------------------------------------------*/
/*                                                                            */
/*----------------------------------------------------------------------------*/
class ShellException : public std::exception {
public:
  // ---------------------------------------------------------------------------
  // constructor
  // ---------------------------------------------------------------------------

  ShellException (std::string const & msg) : msg (msg)
  {
  }

  // ---------------------------------------------------------------------------
  // destructor
  // ---------------------------------------------------------------------------

  virtual ~ShellException () throw ()
  {
  }

  // ---------------------------------------------------------------------------
  // getter for message
  // ---------------------------------------------------------------------------

  char const * what () const throw ()
  {
    return msg.c_str();
  }
private:
  std::string const msg;
};

struct cmd_status {

  cmd_status () : exited (false), exit_code (-1), signaled (false), signo (0),
    status (0), timed_out (false)
  {
  }

  bool exited;
  int exit_code;
  bool signaled;
  int signo;
  int status;
  bool timed_out;
};

//------------------------------------------------------------------------------
//! Runs '/bin/sh -c <cmd>' in a child process with its own process group.
//! stdout and stderr of the command are collected through pipes while
//! waiting. An optional io priority is applied in the child before exec.
//------------------------------------------------------------------------------
class ShellCmd {
public:
  //----------------------------------------------------------------------------
  // constructor - forks the command, throws ShellException on failure
  //----------------------------------------------------------------------------
  ShellCmd (std::string const & cmd, int iopriority = kIoPriorityUnset);
  //----------------------------------------------------------------------------
  // destructor
  //----------------------------------------------------------------------------
  ~ShellCmd ();

  ShellCmd (const ShellCmd&) = delete;
  ShellCmd& operator= (const ShellCmd&) = delete;

  //----------------------------------------------------------------------------
  // waits until the 'command' process terminates
  //----------------------------------------------------------------------------
  cmd_status wait ();

  //----------------------------------------------------------------------------
  // waits until the 'command' process terminates or the timeout has passed
  //----------------------------------------------------------------------------
  cmd_status wait (size_t timeout);

  //----------------------------------------------------------------------------
  // kills the 'command' process group
  //----------------------------------------------------------------------------
  void kill (int sig = SIGKILL) const;

  //----------------------------------------------------------------------------
  // checks if the 'command' process is active
  //----------------------------------------------------------------------------
  bool is_active () const;

  //----------------------------------------------------------------------------
  // the pid of the 'command' process
  //----------------------------------------------------------------------------

  pid_t get_pid () const
  {
    return pid;
  }

  //----------------------------------------------------------------------------
  // collected output of the 'command' process, complete after wait()
  //----------------------------------------------------------------------------
  const std::string& get_stdout () const
  {
    return stdout_buf;
  }

  const std::string& get_stderr () const
  {
    return stderr_buf;
  }

  //----------------------------------------------------------------------------
  // max. number of bytes kept per output stream, older output is discarded
  //----------------------------------------------------------------------------
  static constexpr size_t max_output = 64 * 1024;

private:

  //----------------------------------------------------------------------------
  // read the pipes until EOF or until the deadline (ms, <0 = none) passed
  //
  // @return true if both pipes reached EOF
  //----------------------------------------------------------------------------
  bool collect (long long timeout_ms);

  //----------------------------------------------------------------------------
  // reap the child and fill cmd_stat
  //----------------------------------------------------------------------------
  void reap ();

  static void append (std::string& buf, const char* data, size_t len);

  std::string cmd;
  pid_t pid;
  int outfd; //< 'stdout' of the command
  int errfd; //< 'stderr' of the command
  std::string stdout_buf;
  std::string stderr_buf;
  bool reaped;
  cmd_status cmd_stat;
};

SOWERCOMMONNAMESPACE_END

#endif	/* __SOWERCOMMON_SHELLCMD__HH__ */
