// ----------------------------------------------------------------------
// File: DestinationProbe.cc
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

#include "mover/DestinationProbe.hh"
#include "mover/MoverConfig.hh"
#include "common/ShellCmd.hh"
#include "common/Statfs.hh"
#include "common/StringConversion.hh"

SOWERMOVERNAMESPACE_BEGIN

using sower::common::StringConversion;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
DestinationProbe::DestinationProbe(const MoverConfig& config):
  mConfig(config)
{
  SetLogId(nullptr, "probe");
}

//------------------------------------------------------------------------------
// Build the reachability test command line
//------------------------------------------------------------------------------
std::string
DestinationProbe::BuildTestCommand(const Destination& dest) const
{
  return mConfig.mTransferCommand + " " +
         StringConversion::ShellQuote(mConfig.mTestArtifact) + " " +
         StringConversion::ShellQuote(dest.GetAddress());
}

//------------------------------------------------------------------------------
// Transfer the test artifact to the destination
//------------------------------------------------------------------------------
bool
DestinationProbe::Reachable(const Destination& dest)
{
  std::string cmdline = BuildTestCommand(dest);

  try {
    sower::common::ShellCmd cmd(cmdline);
    sower::common::cmd_status rc = cmd.wait(mConfig.mProbeTimeout.count());

    if (rc.timed_out) {
      sower_warning("msg=\"destination test timed out\" dest=%s cmd=\"%s\" "
                    "timeout=%llds", dest.GetAddress().c_str(), cmdline.c_str(),
                    (long long) mConfig.mProbeTimeout.count());
      return false;
    }

    if (!rc.exited || rc.exit_code) {
      sower_warning("msg=\"destination test failed\" dest=%s cmd=\"%s\" "
                    "exit_code=%d stderr=\"%s\"", dest.GetAddress().c_str(),
                    cmdline.c_str(), rc.exit_code,
                    StringConversion::Trim(cmd.get_stderr()).c_str());
      return false;
    }
  } catch (const sower::common::ShellException& e) {
    sower_err("msg=\"destination test could not run\" dest=%s cmd=\"%s\" "
              "err=\"%s\"", dest.GetAddress().c_str(), cmdline.c_str(), e.what());
    return false;
  }

  sower_debug("msg=\"destination reachable\" dest=%s",
              dest.GetAddress().c_str());
  return true;
}

//------------------------------------------------------------------------------
// Free space of the filesystem behind the destination
//------------------------------------------------------------------------------
FreeSpace
DestinationProbe::GetFreeSpace(const Destination& dest)
{
  std::string path = dest.GetMeteredPath();

  if (path.empty()) {
    if (mConfig.mAdmitUnmetered) {
      sower_debug("msg=\"destination capacity is not metered\" dest=%s",
                  dest.GetAddress().c_str());
      return FreeSpace::Unmetered();
    }

    sower_warning("msg=\"destination has no local path to query capacity, "
                  "configure statpath\" dest=%s", dest.GetAddress().c_str());
    return FreeSpace::Unavailable();
  }

  if (mConfig.mRequireMount &&
      !sower::common::Statfs::IsMountPoint(path)) {
    sower_warning("msg=\"destination is not mounted\" dest=%s path=%s",
                  dest.GetAddress().c_str(), path.c_str());
    return FreeSpace::Unavailable();
  }

  std::unique_ptr<sower::common::Statfs> sfs =
    sower::common::Statfs::DoStatfs(path.c_str());

  if (!sfs) {
    sower_warning("msg=\"unable to query destination capacity\" dest=%s "
                  "path=%s", dest.GetAddress().c_str(), path.c_str());
    return FreeSpace::Unavailable();
  }

  return FreeSpace::Known(sfs->GetFreeBytes());
}

SOWERMOVERNAMESPACE_END
