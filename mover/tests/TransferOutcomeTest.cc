// ----------------------------------------------------------------------
// File: TransferOutcomeTest.cc
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
#include "mover/TransferOutcome.hh"

using namespace sower::mover;

TEST(TransferOutcome, Classification)
{
  typedef TransferOutcome::Kind Kind;
  ASSERT_EQ(TransferOutcome::ClassifyExitCode(0), Kind::Success);
  ASSERT_EQ(TransferOutcome::ClassifyExitCode(10), Kind::RetryableIOFault);
  ASSERT_EQ(TransferOutcome::ClassifyExitCode(11), Kind::DestinationExhausted);
  ASSERT_EQ(TransferOutcome::ClassifyExitCode(23), Kind::DestinationExhausted);

  for (int code : {-1, 1, 2, 12, 20, 24, 30, 127, 255}) {
    ASSERT_EQ(TransferOutcome::ClassifyExitCode(code), Kind::Unknown) << code;
  }
}

TEST(TransferOutcome, Exclusion)
{
  ASSERT_FALSE(TransferOutcome::FromExitCode(0).ExcludesDestination());
  ASSERT_FALSE(TransferOutcome::FromExitCode(10).ExcludesDestination());
  ASSERT_TRUE(TransferOutcome::FromExitCode(11).ExcludesDestination());
  ASSERT_TRUE(TransferOutcome::FromExitCode(23).ExcludesDestination());
  ASSERT_TRUE(TransferOutcome::FromExitCode(5).ExcludesDestination());
}

TEST(TransferOutcome, Rate)
{
  auto ok = TransferOutcome::FromExitCode(0, 100 * 1024 * 1024,
                                          std::chrono::milliseconds(2000));
  ASSERT_TRUE(ok.IsSuccess());
  ASSERT_DOUBLE_EQ(ok.GetRateMBs(), 50.0);
  ASSERT_EQ(ok.GetBytes(), 100u * 1024 * 1024);
  // failed attempts never account bytes
  auto failed = TransferOutcome::FromExitCode(23, 1000,
                std::chrono::milliseconds(10));
  ASSERT_EQ(failed.GetBytes(), 0u);
  ASSERT_EQ(failed.GetRateMBs(), 0.0);
  ASSERT_EQ(failed.GetExitCode(), 23);
  ASSERT_NE(failed.ToString().find("destination-exhausted"), std::string::npos);
}
