// ----------------------------------------------------------------------
// File: ConfigTest.cc
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
#include "common/Config.hh"
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fstream>

using sower::common::Config;

static const char* sConfigText =
  "# staging\n"
  "[sources]\n"
  "/mnt/Plotter_2TB\n"
  "  /mnt/Plotter_4TB  \n"
  "\n"
  "[destinations]\n"
  "/mnt/HDD1\n"
  "192.168.1.10::hdd1 statpath=/mnt/nfs-hdd1\n"
  "[transfer]\n"
  "shuffle=false\n"
  "bwlimit = 50M\n"
  "; old style comment\n";

TEST(Config, ParseChapters)
{
  Config cfg;
  ASSERT_TRUE(cfg.LoadFromString(sConfigText));
  ASSERT_TRUE(cfg.ok());
  ASSERT_TRUE(cfg.Has("sources"));
  ASSERT_TRUE(cfg.Has("destinations"));
  ASSERT_FALSE(cfg.Has("plotter"));
  ASSERT_EQ(cfg["sources"].size(), 2u);
  ASSERT_EQ(cfg["sources"][1], "/mnt/Plotter_4TB");
  ASSERT_EQ(cfg["destinations"][1], "192.168.1.10::hdd1 statpath=/mnt/nfs-hdd1");
  ASSERT_TRUE(cfg["plotter"].empty());
}

TEST(Config, AsMapAndValueByKey)
{
  Config cfg;
  ASSERT_TRUE(cfg.LoadFromString(sConfigText));
  auto map = cfg.AsMap("transfer");
  ASSERT_EQ(map.size(), 2u);
  ASSERT_EQ(map["shuffle"], "false");
  ASSERT_EQ(map["bwlimit"], "50M");
  ASSERT_EQ(cfg.GetValueByKey("transfer", "shuffle"), "false");
  ASSERT_EQ(cfg.GetValueByKey("transfer", "missing"), "");
  ASSERT_TRUE(cfg.AsMap("unknown").empty());
}

TEST(Config, MissingChapter)
{
  Config cfg;
  ASSERT_FALSE(cfg.LoadFromString("/mnt/HDD1\n[sources]\n"));
  ASSERT_FALSE(cfg.ok());
  ASSERT_EQ(cfg.getErrc(), EINVAL);
  ASSERT_NE(cfg.getMsg().find("no chapter"), std::string::npos);
}

TEST(Config, LoadFile)
{
  char path[] = "/tmp/sower-config.XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(fd, -1);
  close(fd);
  {
    std::ofstream out(path);
    out << sConfigText;
  }
  Config cfg;
  ASSERT_TRUE(cfg.Load(path));
  ASSERT_EQ(cfg["destinations"].size(), 2u);
  ASSERT_EQ(unlink(path), 0);
  ASSERT_FALSE(cfg.Load(path));
  ASSERT_EQ(cfg.getErrc(), ENOENT);
  ASSERT_FALSE((bool) cfg);
}
