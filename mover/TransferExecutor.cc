// ----------------------------------------------------------------------
// File: TransferExecutor.cc
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2024 CERN/Switzerland                                  *
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

#include "mover/TransferExecutor.hh"
#include "mover/MoverConfig.hh"
#include "common/ShellCmd.hh"
#include "common/StringConversion.hh"

SOWERMOVERNAMESPACE_BEGIN

using sower::common::StringConversion;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
TransferExecutor::TransferExecutor(const MoverConfig& config):
  mConfig(config)
{
  SetLogId(nullptr, "transfer");
}

//------------------------------------------------------------------------------
// Build the transfer command line
//------------------------------------------------------------------------------
std::string
TransferExecutor::BuildCommand(const PlotFile& plot,
                               const Destination& dest) const
{
  std::string cmdline = mConfig.mTransferCommand;
  cmdline += " --remove-source-files --preallocate --whole-file";

  if (!mConfig.mBwLimit.empty()) {
    cmdline += " --bwlimit=";
    cmdline += mConfig.mBwLimit;
  } else if (mConfig.mProgress) {
    cmdline += " --progress -h";
  }

  cmdline += " ";
  cmdline += StringConversion::ShellQuote(plot.GetPath());
  cmdline += " ";
  cmdline += StringConversion::ShellQuote(dest.GetAddress());
  return cmdline;
}

//------------------------------------------------------------------------------
// Transfer a plot
//------------------------------------------------------------------------------
TransferOutcome
TransferExecutor::Transfer(const PlotFile& plot, const Destination& dest,
                           uint64_t size)
{
  std::string cmdline = BuildCommand(plot, dest);
  sower_info("msg=\"transfer started\" plot=%s dest=%s size=%llu",
             plot.GetPath().c_str(), dest.GetAddress().c_str(),
             (unsigned long long) size);
  auto start = std::chrono::steady_clock::now();
  sower::common::cmd_status rc;
  std::string out, err;

  try {
    sower::common::ShellCmd cmd(cmdline, mConfig.mIoPriority);
    rc = cmd.wait();
    out = StringConversion::Trim(cmd.get_stdout());
    err = StringConversion::Trim(cmd.get_stderr());
  } catch (const sower::common::ShellException& e) {
    sower_err("msg=\"transfer could not run\" cmd=\"%s\" err=\"%s\"",
              cmdline.c_str(), e.what());
    return TransferOutcome::FromExitCode(-1);
  }

  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>
                  (std::chrono::steady_clock::now() - start);

  if (!out.empty()) {
    sower_debug("msg=\"transfer output\" plot=%s output=\"%s\"",
                plot.GetName().c_str(), out.c_str());
  }

  if (!err.empty()) {
    sower_warning("msg=\"transfer error output\" plot=%s stderr=\"%s\"",
                  plot.GetName().c_str(), err.c_str());
  }

  // a signaled transfer tool is reported as 128+signo like the shell does
  int exit_code = rc.exited ? rc.exit_code : (rc.signaled ? 128 + rc.signo : -1);
  TransferOutcome outcome = TransferOutcome::FromExitCode(exit_code, size,
                            duration);

  switch (outcome.GetKind()) {
  case TransferOutcome::Kind::Success:
    sower_info("msg=\"transfer complete\" plot=%s dest=%s rate=%.02fMB/s "
               "duration=%.03fs", plot.GetName().c_str(),
               dest.GetAddress().c_str(), outcome.GetRateMBs(),
               duration.count() / 1000.0);
    break;

  case TransferOutcome::Kind::RetryableIOFault:
    sower_warning("msg=\"transfer failed with socket I/O error, retry later\" "
                  "cmd=\"%s\" exit_code=%d", cmdline.c_str(), exit_code);
    break;

  case TransferOutcome::Kind::DestinationExhausted:
    sower_err("msg=\"transfer failed with file I/O error\" cmd=\"%s\" "
              "exit_code=%d", cmdline.c_str(), exit_code);
    break;

  default:
    sower_err("msg=\"transfer failed\" cmd=\"%s\" exit_code=%d",
              cmdline.c_str(), exit_code);
    break;
  }

  return outcome;
}

SOWERMOVERNAMESPACE_END
