// ----------------------------------------------------------------------
// File: MoverConfigTest.cc
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

#include "gtest/gtest.h"
#include "mover/MoverConfig.hh"
#include "common/Config.hh"

using sower::common::Config;
using sower::mover::MoverConfig;

namespace
{
const std::string sMinimal =
  "[sources]\n"
  "/mnt/Plotter_2TB\n"
  "/mnt/Plotter_4TB\n"
  "[destinations]\n"
  "/mnt/HDD1\n";

//------------------------------------------------------------------------------
// Parse a configuration text and return the validation error, empty if valid
//------------------------------------------------------------------------------
std::string
Validate(const std::string& text, MoverConfig& conf)
{
  Config cfg;
  cfg.LoadFromString(text);
  std::string err;

  if (MoverConfig::FromConfig(cfg, conf, err)) {
    EXPECT_TRUE(err.empty());
  } else {
    EXPECT_FALSE(err.empty());
  }

  return err;
}
}

TEST(MoverConfig, Defaults)
{
  MoverConfig conf;
  ASSERT_EQ(Validate(sMinimal, conf), "");
  ASSERT_EQ(conf.mSources.size(), 2u);
  ASSERT_EQ(conf.mDestinations.size(), 1u);
  ASSERT_EQ(conf.mTransferCommand, "rsync");
  ASSERT_TRUE(conf.mShuffle);
  ASSERT_TRUE(conf.mBwLimit.empty());
  ASSERT_TRUE(conf.mRequireMount);
  ASSERT_FALSE(conf.mAdmitUnmetered);
  ASSERT_EQ(conf.mIoPriorityName, "idle");
  ASSERT_EQ(conf.mIoPriority,
            (int) IOPRIO_PRIO_VALUE(sower::common::IOPRIO_CLASS_IDLE, 0));
  ASSERT_EQ(conf.mShortBackoff.count(), 180);
  ASSERT_EQ(conf.mLongBackoff.count(), 1200);
  ASSERT_EQ(conf.mSettleDelay.count(), 5);
  ASSERT_EQ(conf.mPlotCount, 20u);
  ASSERT_EQ(conf.mCompression, 7u);
  // plots are written to the first staging directory by default
  ASSERT_EQ(conf.mPlotDir, "/mnt/Plotter_2TB");
  ASSERT_EQ(conf.mPlotSize, 84000000000ull);
  ASSERT_EQ(conf.GetBatchBytes(), 20ull * 84000000000ull);
  ASSERT_EQ(conf.mLogLevel, "info");
}

TEST(MoverConfig, FullConfig)
{
  MoverConfig conf;
  std::string text = sMinimal +
                     "farm01::plots statpath=/mnt/nfs-farm01\n"
                     "[transfer]\n"
                     "command=/usr/local/bin/rsync\n"
                     "shuffle=off\n"
                     "bwlimit=50M\n"
                     "progress=no\n"
                     "ionice=be:4\n"
                     "require-mount=false\n"
                     "admit-unmetered=yes\n"
                     "probe-timeout=30s\n"
                     "[backoff]\n"
                     "short=1min\n"
                     "long=1h\n"
                     "settle=10\n"
                     "[plotter]\n"
                     "command=/opt/bladebit/bladebit_cuda\n"
                     "count=4\n"
                     "compress=3\n"
                     "farmer-key=abcdef\n"
                     "contract-key=xch1contract\n"
                     "dest=/mnt/Plotter_4TB\n"
                     "plot-size=100G\n"
                     "[logging]\n"
                     "level=debug\n";
  ASSERT_EQ(Validate(text, conf), "");
  ASSERT_EQ(conf.mDestinations.size(), 2u);
  ASSERT_EQ(conf.mDestinations[1].GetAddress(), "farm01::plots");
  ASSERT_EQ(conf.mDestinations[1].GetStatPath(), "/mnt/nfs-farm01");
  ASSERT_EQ(conf.mTransferCommand, "/usr/local/bin/rsync");
  ASSERT_FALSE(conf.mShuffle);
  ASSERT_EQ(conf.mBwLimit, "50M");
  ASSERT_FALSE(conf.mProgress);
  ASSERT_EQ(conf.mIoPriorityName, "be:4");
  ASSERT_EQ(conf.mIoPriority,
            (int) IOPRIO_PRIO_VALUE(sower::common::IOPRIO_CLASS_BE, 4));
  ASSERT_FALSE(conf.mRequireMount);
  ASSERT_TRUE(conf.mAdmitUnmetered);
  ASSERT_EQ(conf.mProbeTimeout.count(), 30);
  ASSERT_EQ(conf.mShortBackoff.count(), 60);
  ASSERT_EQ(conf.mLongBackoff.count(), 3600);
  ASSERT_EQ(conf.mSettleDelay.count(), 10);
  ASSERT_EQ(conf.mPlotterCommand, "/opt/bladebit/bladebit_cuda");
  ASSERT_EQ(conf.mPlotCount, 4u);
  ASSERT_EQ(conf.mCompression, 3u);
  ASSERT_EQ(conf.mFarmerKey, "abcdef");
  ASSERT_EQ(conf.mContractKey, "xch1contract");
  ASSERT_EQ(conf.mPlotDir, "/mnt/Plotter_4TB");
  ASSERT_EQ(conf.mPlotSize, 100000000000ull);
  ASSERT_EQ(conf.mLogLevel, "debug");
  std::string dump = conf.Dump();
  ASSERT_NE(dump.find("farm01::plots(statpath=/mnt/nfs-farm01)"),
            std::string::npos);
  ASSERT_NE(dump.find("ionice=be:4"), std::string::npos);
}

TEST(MoverConfig, IoPriorityNone)
{
  MoverConfig conf;
  ASSERT_EQ(Validate(sMinimal + "[transfer]\nionice=none\n", conf), "");
  ASSERT_EQ(conf.mIoPriority, sower::common::kIoPriorityUnset);
  ASSERT_EQ(conf.mIoPriorityName, "none");
}

TEST(MoverConfig, Errors)
{
  MoverConfig conf;
  ASSERT_NE(Validate("[destinations]\n/mnt/HDD1\n", conf).find("[sources]"),
            std::string::npos);
  ASSERT_NE(Validate("[sources]\n/mnt/Plotter\n", conf).find("[destinations]"),
            std::string::npos);
  ASSERT_NE(Validate("/mnt/HDD1\n", conf).find("no chapter header"),
            std::string::npos);
  ASSERT_NE(Validate(sMinimal + "/mnt/HDD2 quota=1T\n", conf).find("quota=1T"),
            std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[transfer]\nshuffle=maybe\n", conf)
            .find("[transfer] shuffle"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[transfer]\nadmit-unmetered=2\n", conf)
            .find("[transfer] admit-unmetered"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[transfer]\nionice=fast\n", conf)
            .find("ionice"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[transfer]\nbwlimit=50M;rm\n", conf)
            .find("bwlimit"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[transfer]\ncommand=\n", conf)
            .find("[transfer] command"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[backoff]\nshort=soon\n", conf)
            .find("[backoff] short"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[plotter]\ncompress=12\n", conf)
            .find("out of range"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[plotter]\ncount=0\n", conf)
            .find("out of range"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[plotter]\ncount=-3\n", conf)
            .find("not a number"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[plotter]\nplot-size=0\n", conf)
            .find("plot-size"), std::string::npos);
  ASSERT_NE(Validate(sMinimal + "[logging]\nlevel=verbose\n", conf)
            .find("verbose"), std::string::npos);
}

TEST(MoverConfig, FailedValidationKeepsOutput)
{
  MoverConfig conf;
  ASSERT_EQ(Validate(sMinimal, conf), "");
  ASSERT_NE(Validate(sMinimal + "[plotter]\ncompress=12\n", conf), "");
  ASSERT_EQ(conf.mCompression, 7u);
  ASSERT_EQ(conf.mSources.size(), 2u);
}
