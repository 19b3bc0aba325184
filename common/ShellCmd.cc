// ----------------------------------------------------------------------
// File: ShellCmd.cc
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

/*----------------------------------------------------------------------------*/
#include "common/Namespace.hh"
#include "common/ShellCmd.hh"
/*----------------------------------------------------------------------------*/
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>
#include <chrono>
/*----------------------------------------------------------------------------*/

SOWERCOMMONNAMESPACE_BEGIN

/*----------------------------------------------------------------------------*/
ShellCmd::ShellCmd (std::string const & cmd, int iopriority) :
  cmd (cmd), pid (-1), outfd (-1), errfd (-1), reaped (false)
{
  int outpipe[2];
  int errpipe[2];

  // create the pipes for 'stdout' and 'stderr', close-on-exec from the start
  // so that commands forked concurrently by other threads never inherit them
  if (pipe2(outpipe, O_CLOEXEC) == -1)
  {
    throw ShellException("Not able to create a pipe!");
  }

  if (pipe2(errpipe, O_CLOEXEC) == -1)
  {
    close(outpipe[0]);
    close(outpipe[1]);
    throw ShellException("Not able to create a pipe!");
  }

  if ((pid = fork()) < 0)
  {
    close(outpipe[0]);
    close(outpipe[1]);
    close(errpipe[0]);
    close(errpipe[1]);
    throw ShellException(std::string("Not able to fork: ") + strerror(errno));
  }

  if (pid == 0)
  {
    //--------------------------------------------------------------------------
    // child: only async-signal-safe calls until exec
    //--------------------------------------------------------------------------
    // own process group, a terminal interrupt must not reach the command
    setpgid(0, 0);
    // the daemon blocks the termination signals for sigwait, don't inherit it
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, 0);

    if (iopriority != kIoPriorityUnset)
    {
      ioprio_set(IOPRIO_WHO_PROCESS, iopriority);
    }

    int devnull = open("/dev/null", O_RDONLY);

    if (devnull >= 0)
    {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    // dup2 clears close-on-exec on the standard descriptors
    dup2(outpipe[1], STDOUT_FILENO);
    dup2(errpipe[1], STDERR_FILENO);
    close(outpipe[0]);
    close(outpipe[1]);
    close(errpipe[0]);
    close(errpipe[1]);
    execl("/bin/sh", "sh", "-c", this->cmd.c_str(), (char*) 0);
    _exit(127);
  }

  // parent: avoid a race with the child's own setpgid
  setpgid(pid, pid);
  close(outpipe[1]);
  close(errpipe[1]);
  outfd = outpipe[0];
  errfd = errpipe[0];
}

/*----------------------------------------------------------------------------*/
ShellCmd::~ShellCmd ()
{
  //----------------------------------------------------------------------------
  // never leave a running child or a zombie behind
  //----------------------------------------------------------------------------
  if (!reaped)
  {
    if (is_active())
    {
      kill();
    }

    reap();
  }

  //----------------------------------------------------------------------------
  // close file descriptors
  //----------------------------------------------------------------------------
  if (outfd >= 0)
  {
    close(outfd);
  }

  if (errfd >= 0)
  {
    close(errfd);
  }
}

/*----------------------------------------------------------------------------*/
void
ShellCmd::append (std::string& buf, const char* data, size_t len)
{
  buf.append(data, len);

  if (buf.size() > max_output)
  {
    buf.erase(0, buf.size() - max_output);
  }
}

/*----------------------------------------------------------------------------*/
bool
ShellCmd::collect (long long timeout_ms)
{
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_ms);
  char buffer[4096];

  while ((outfd >= 0) || (errfd >= 0))
  {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    std::string* bufs[2];
    int* fdptr[2];

    if (outfd >= 0)
    {
      fds[nfds].fd = outfd;
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      bufs[nfds] = &stdout_buf;
      fdptr[nfds] = &outfd;
      ++nfds;
    }

    if (errfd >= 0)
    {
      fds[nfds].fd = errfd;
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      bufs[nfds] = &stderr_buf;
      fdptr[nfds] = &errfd;
      ++nfds;
    }

    int wait_ms = -1;

    if (timeout_ms >= 0)
    {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>
                  (deadline - std::chrono::steady_clock::now()).count();

      if (left <= 0)
      {
        return false;
      }

      wait_ms = (int) left;
    }

    int rc = poll(fds, nfds, wait_ms);

    if (rc < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }

      return false;
    }

    if (rc == 0)
    {
      return false;
    }

    for (nfds_t i = 0; i < nfds; ++i)
    {
      if (!fds[i].revents)
      {
        continue;
      }

      ssize_t nread = read(fds[i].fd, buffer, sizeof(buffer));

      if (nread > 0)
      {
        append(*bufs[i], buffer, nread);
      }
      else if ((nread == 0) || (errno != EINTR))
      {
        // EOF or broken pipe
        close(fds[i].fd);
        *fdptr[i] = -1;
      }
    }
  }

  return true;
}

/*----------------------------------------------------------------------------*/
void
ShellCmd::reap ()
{
  int status = 0;

  while (waitpid(pid, &status, 0) == -1)
  {
    if (errno != EINTR)
    {
      reaped = true;
      return;
    }
  }

  // the status of the 'command' process
  cmd_stat.exited = WIFEXITED(status);
  cmd_stat.exit_code = cmd_stat.exited ? WEXITSTATUS(status) : -1;
  cmd_stat.signaled = WIFSIGNALED(status);
  cmd_stat.signo = cmd_stat.signaled ? WTERMSIG(status) : 0;
  cmd_stat.status = status;
  reaped = true;
}

/*----------------------------------------------------------------------------*/
cmd_status
ShellCmd::wait ()
{
  if (!reaped)
  {
    collect(-1);
    reap();
  }

  return cmd_stat;
}

/*----------------------------------------------------------------------------*/
cmd_status
ShellCmd::wait (size_t timeout)
{
  if (!reaped)
  {
    if (!collect((long long) timeout * 1000))
    {
      // stop it if the timeout is exceeded
      if (is_active())
      {
        kill();
        cmd_stat.timed_out = true;
      }

      collect(-1);
    }

    bool timed_out = cmd_stat.timed_out;
    reap();
    cmd_stat.timed_out = timed_out;
  }

  return cmd_stat;
}

/*----------------------------------------------------------------------------*/
void
ShellCmd::kill (int sig) const
{
  if (pid > 0)
  {
    ::kill(-pid, sig);
  }
}

/*----------------------------------------------------------------------------*/
bool
ShellCmd::is_active () const
{
  if (reaped || (pid <= 0))
  {
    return false;
  }

  //----------------------------------------------------------------------------
  // a terminated but not yet reaped child still answers the null signal, ask
  // waitid without consuming the status
  //----------------------------------------------------------------------------
  siginfo_t info;
  memset(&info, 0, sizeof(info));

  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == -1)
  {
    return false;
  }

  return info.si_pid == 0;
}

SOWERCOMMONNAMESPACE_END
