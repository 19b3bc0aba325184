// ----------------------------------------------------------------------
// File: ProductionController.cc
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

#include "mover/ProductionController.hh"
#include "mover/MoverConfig.hh"
#include "mover/RunStats.hh"
#include "common/ShellCmd.hh"
#include "common/Statfs.hh"
#include "common/StringConversion.hh"
#include <chrono>

SOWERMOVERNAMESPACE_BEGIN

using sower::common::StringConversion;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
ProductionController::ProductionController(const MoverConfig& config,
    RunStats& stats):
  mConfig(config), mStats(stats), mProducing(false)
{
  SetLogId(nullptr, "plotter");
}

//------------------------------------------------------------------------------
// Check if the staging volume has room for a full batch
//------------------------------------------------------------------------------
bool
ProductionController::HasRoom()
{
  const std::string& dir = mConfig.mPlotDir;

  if (mConfig.mRequireMount && !sower::common::Statfs::IsMountPoint(dir)) {
    sower_warning("msg=\"plotting destination is not mounted\" path=%s",
                  dir.c_str());
    return false;
  }

  std::unique_ptr<sower::common::Statfs> sfs =
    sower::common::Statfs::DoStatfs(dir.c_str());

  if (!sfs) {
    sower_err("msg=\"error checking plotting drive space\" path=%s",
              dir.c_str());
    return false;
  }

  std::string free_str, need_str;
  uint64_t free_bytes = sfs->GetFreeBytes();
  uint64_t need_bytes = mConfig.GetBatchBytes();
  sower_debug("msg=\"plotting drive space\" path=%s free=%s required=%s",
              dir.c_str(),
              StringConversion::GetReadableSizeString(free_str, free_bytes, "B"),
              StringConversion::GetReadableSizeString(need_str, need_bytes, "B"));
  return free_bytes >= need_bytes;
}

//------------------------------------------------------------------------------
// Build the generator command line
//------------------------------------------------------------------------------
std::string
ProductionController::BuildCommand() const
{
  std::string cmdline = mConfig.mPlotterCommand;

  if (!mConfig.mFarmerKey.empty()) {
    cmdline += " -f ";
    cmdline += StringConversion::ShellQuote(mConfig.mFarmerKey);
  }

  if (!mConfig.mContractKey.empty()) {
    cmdline += " -c ";
    cmdline += StringConversion::ShellQuote(mConfig.mContractKey);
  }

  cmdline += " -n " + std::to_string(mConfig.mPlotCount);
  cmdline += " --compress " + std::to_string(mConfig.mCompression);
  cmdline += " ";
  cmdline += mConfig.mPlotMode;
  cmdline += " ";
  cmdline += StringConversion::ShellQuote(mConfig.mPlotDir);
  return cmdline;
}

//------------------------------------------------------------------------------
// Run the generator once
//------------------------------------------------------------------------------
bool
ProductionController::Produce()
{
  std::string cmdline = BuildCommand();
  sower_info("msg=\"creating plots\" count=%u dest=%s", mConfig.mPlotCount,
             mConfig.mPlotDir.c_str());
  auto start = std::chrono::steady_clock::now();
  sower::common::cmd_status rc;
  std::string err;
  mProducing = true;

  try {
    sower::common::ShellCmd cmd(cmdline);
    rc = cmd.wait();
    err = StringConversion::Trim(cmd.get_stderr());
    std::string out = StringConversion::Trim(cmd.get_stdout());

    if (!out.empty()) {
      sower_debug("msg=\"plotter output\" output=\"%s\"", out.c_str());
    }
  } catch (const sower::common::ShellException& e) {
    mProducing = false;
    sower_err("msg=\"plot creation error\" cmd=\"%s\" err=\"%s\"",
              cmdline.c_str(), e.what());
    return false;
  }

  mProducing = false;
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>
                 (std::chrono::steady_clock::now() - start);

  if (!rc.exited || rc.exit_code) {
    sower_err("msg=\"plot creation failed\" exit_code=%d signal=%d "
              "stderr=\"%s\"", rc.exit_code, rc.signo, err.c_str());
    return false;
  }

  // the generator output is not cross-checked against the staging directory
  mStats.AddCreated(mConfig.mPlotCount);
  sower_info("msg=\"plot creation completed\" count=%u elapsed=\"%s\"",
             mConfig.mPlotCount,
             StringConversion::GetReadableDuration(elapsed).c_str());
  return true;
}

SOWERMOVERNAMESPACE_END
