// ----------------------------------------------------------------------
// File: MoverConfig.hh
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

#pragma once
#include "mover/Namespace.hh"
#include "mover/Destination.hh"
#include "common/IoPriority.hh"
#include <stdint.h>
#include <chrono>
#include <string>
#include <vector>

namespace sower::common
{
class Config;
}

SOWERMOVERNAMESPACE_BEGIN

//! Default location of the daemon configuration file
static constexpr const char* kDefaultConfigPath = "/etc/sower/sower.conf";

//------------------------------------------------------------------------------
//! Immutable daemon configuration built once at startup and handed by const
//! reference to every component.
//------------------------------------------------------------------------------
struct MoverConfig {
  //! Staging directories scanned for plots
  std::vector<std::string> mSources;
  //! Transfer targets in configuration order
  std::vector<Destination> mDestinations;

  // [transfer]
  std::string mTransferCommand {"rsync"};
  bool mShuffle {true};
  std::string mBwLimit; ///< Empty disables --bwlimit
  bool mProgress {true};
  int mIoPriority {IOPRIO_PRIO_VALUE(sower::common::IOPRIO_CLASS_IDLE, 0)};
  std::string mIoPriorityName {"idle"};
  std::string mTestArtifact {"/etc/hostname"};
  bool mRequireMount {true};
  bool mAdmitUnmetered {false}; ///< Admit destinations without a free space view
  std::chrono::seconds mProbeTimeout {120};

  // [backoff]
  std::chrono::seconds mShortBackoff {180};
  std::chrono::seconds mLongBackoff {1200};
  std::chrono::seconds mSettleDelay {5};

  // [plotter]
  std::string mPlotterCommand {"./bladebit_cuda"};
  uint32_t mPlotCount {20};
  uint32_t mCompression {7};
  std::string mFarmerKey;
  std::string mContractKey;
  std::string mPlotDir; ///< Defaults to the first source directory
  std::string mPlotMode {"cudaplot"};
  uint64_t mPlotSize {84000000000ull};

  // [logging]
  std::string mLogLevel {"info"};

  //----------------------------------------------------------------------------
  //! Build and validate the configuration from a parsed config file
  //!
  //! @param cfg parsed chapter configuration
  //! @param out returned configuration
  //! @param err error message in case of failure
  //!
  //! @return true if the configuration is valid, otherwise false
  //----------------------------------------------------------------------------
  static bool FromConfig(const sower::common::Config& cfg, MoverConfig& out,
                         std::string& err);

  //----------------------------------------------------------------------------
  //! Bytes required on the staging volume to generate one batch
  //----------------------------------------------------------------------------
  uint64_t GetBatchBytes() const
  {
    return mPlotSize * mPlotCount;
  }

  //----------------------------------------------------------------------------
  //! Human readable multi-line summary used for the startup banner
  //----------------------------------------------------------------------------
  std::string Dump() const;
};

SOWERMOVERNAMESPACE_END
