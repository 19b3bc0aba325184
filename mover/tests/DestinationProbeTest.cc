// ----------------------------------------------------------------------
// File: DestinationProbeTest.cc
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

#include "MoverTestsUtils.hh"

using namespace sower::mover;
using namespace sower::mover::test;

TEST(DestinationProbe, TestCommand)
{
  MoverConfig config = MakeTestConfig("/mnt/Plotter_2TB", {"/mnt/HDD1"});
  DestinationProbe probe(config);
  ASSERT_EQ(probe.BuildTestCommand(Destination("192.168.1.10::hdd1")),
            "rsync /etc/hostname 192.168.1.10::hdd1");
  ASSERT_EQ(probe.BuildTestCommand(Destination("/mnt/HDD 1")),
            "rsync /etc/hostname '/mnt/HDD 1'");
}

TEST(DestinationProbe, Reachable)
{
  TempDir tmp;
  MoverConfig config = MakeTestConfig(tmp.Path(), {tmp.Path()});
  DestinationProbe probe(config);
  Destination dest(tmp.MakeDir("dest"));
  config.mTransferCommand = "true";
  ASSERT_TRUE(probe.Reachable(dest));
  config.mTransferCommand = "false";
  ASSERT_FALSE(probe.Reachable(dest));
  // positional arguments are the artifact and the destination
  config.mTestArtifact = tmp.MakeFile("artifact", 10);
  config.mTransferCommand = "sh -c 'cp \"$1\" \"$2\"' sh";
  ASSERT_TRUE(probe.Reachable(dest));
  ASSERT_TRUE(PlotFile(dest.GetAddress() + "/artifact").Exists());
}

TEST(DestinationProbe, ReachableTimeout)
{
  TempDir tmp;
  MoverConfig config = MakeTestConfig(tmp.Path(), {tmp.Path()});
  config.mTransferCommand = "sh -c 'sleep 30'";
  config.mProbeTimeout = std::chrono::seconds(1);
  DestinationProbe probe(config);
  auto start = std::chrono::steady_clock::now();
  ASSERT_FALSE(probe.Reachable(Destination(tmp.Path())));
  ASSERT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(20));
}

TEST(DestinationProbe, FreeSpace)
{
  TempDir tmp;
  std::string dir = tmp.MakeDir("dest");
  MoverConfig config = MakeTestConfig(tmp.Path(), {dir});
  DestinationProbe probe(config);
  FreeSpace space = probe.GetFreeSpace(Destination(dir));
  ASSERT_EQ(space.GetState(), FreeSpace::State::Known);
  ASSERT_GT(space.GetBytes(), 0u);
  ASSERT_TRUE(space.Admits(1));
  ASSERT_FALSE(space.Admits(space.GetBytes() + 1));
  // remote destinations are metered through their statpath only
  FreeSpace remote = probe.GetFreeSpace(Destination("farm01::plots"));
  ASSERT_EQ(remote.GetState(), FreeSpace::State::Unavailable);
  ASSERT_FALSE(remote.Admits(1));
  config.mAdmitUnmetered = true;
  remote = probe.GetFreeSpace(Destination("farm01::plots"));
  ASSERT_EQ(remote.GetState(), FreeSpace::State::Unmetered);
  ASSERT_TRUE(remote.Admits(1ull << 62));
  config.mAdmitUnmetered = false;
  ASSERT_EQ(probe.GetFreeSpace(Destination("farm01::plots", dir)).GetState(),
            FreeSpace::State::Known);
  FreeSpace missing = probe.GetFreeSpace(Destination(tmp.Path() + "/missing"));
  ASSERT_EQ(missing.GetState(), FreeSpace::State::Unavailable);
  ASSERT_FALSE(missing.Admits(0));
  // an unmounted drive must not fill the root filesystem
  config.mRequireMount = true;
  ASSERT_EQ(probe.GetFreeSpace(Destination(dir)).GetState(),
            FreeSpace::State::Unavailable);
}
