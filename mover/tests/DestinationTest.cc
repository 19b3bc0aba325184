// ----------------------------------------------------------------------
// File: DestinationTest.cc
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
#include "mover/Destination.hh"

using namespace sower::mover;

TEST(Destination, Parse)
{
  Destination dest;
  std::string err;
  ASSERT_TRUE(Destination::Parse("/mnt/HDD1", dest, err));
  ASSERT_EQ(dest.GetAddress(), "/mnt/HDD1");
  ASSERT_FALSE(dest.IsRemote());
  ASSERT_EQ(dest.GetMeteredPath(), "/mnt/HDD1");
  ASSERT_TRUE(Destination::Parse("192.168.1.10::hdd1 statpath=/mnt/nfs-hdd1",
                                 dest, err));
  ASSERT_EQ(dest.GetAddress(), "192.168.1.10::hdd1");
  ASSERT_TRUE(dest.IsRemote());
  ASSERT_EQ(dest.GetMeteredPath(), "/mnt/nfs-hdd1");
  ASSERT_FALSE(Destination::Parse("/mnt/HDD1 size=1T", dest, err));
  ASSERT_NE(err.find("size=1T"), std::string::npos);
  ASSERT_FALSE(Destination::Parse("   ", dest, err));
}

TEST(Destination, Remote)
{
  ASSERT_TRUE(Destination("farm01::plots").IsRemote());
  ASSERT_TRUE(Destination("farm01:/srv/plots").IsRemote());
  ASSERT_TRUE(Destination("rsync://farm01/plots").IsRemote());
  ASSERT_FALSE(Destination("/mnt/disk:1").IsRemote());
  ASSERT_FALSE(Destination("./relative").IsRemote());
  ASSERT_EQ(Destination("farm01::plots").GetMeteredPath(), "");
}
