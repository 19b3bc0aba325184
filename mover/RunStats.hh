// ----------------------------------------------------------------------
// File: RunStats.hh
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
#include <stdint.h>
#include <atomic>
#include <chrono>
#include <string>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Counters of one daemon run. All counters only grow and are safe to update
//! from concurrent workers.
//------------------------------------------------------------------------------
class RunStats
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param start start timestamp of the run
  //----------------------------------------------------------------------------
  explicit RunStats(std::chrono::steady_clock::time_point start =
                      std::chrono::steady_clock::now()):
    mStart(start), mPlotsCreated(0), mPlotsMoved(0), mBytesMoved(0)
  {}

  void AddCreated(uint64_t count)
  {
    mPlotsCreated += count;
  }

  void AddMoved(uint64_t bytes)
  {
    mPlotsMoved++;
    mBytesMoved += bytes;
  }

  uint64_t GetPlotsCreated() const
  {
    return mPlotsCreated;
  }

  uint64_t GetPlotsMoved() const
  {
    return mPlotsMoved;
  }

  uint64_t GetBytesMoved() const
  {
    return mBytesMoved;
  }

  std::chrono::steady_clock::time_point GetStartTime() const
  {
    return mStart;
  }

  //----------------------------------------------------------------------------
  //! Average speed over the whole runtime in MB/s (1024^2)
  //----------------------------------------------------------------------------
  double GetAverageSpeed(std::chrono::steady_clock::time_point now =
                           std::chrono::steady_clock::now()) const;

  //----------------------------------------------------------------------------
  //! Render the final statistics
  //!
  //! @param now reference time for the runtime computation
  //----------------------------------------------------------------------------
  std::string Summary(std::chrono::steady_clock::time_point now =
                        std::chrono::steady_clock::now()) const;

private:
  const std::chrono::steady_clock::time_point mStart;
  std::atomic<uint64_t> mPlotsCreated;
  std::atomic<uint64_t> mPlotsMoved;
  std::atomic<uint64_t> mBytesMoved;
};

SOWERMOVERNAMESPACE_END
