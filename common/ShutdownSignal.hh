// ----------------------------------------------------------------------
// File: ShutdownSignal.hh
// Author: Georgios Bitzes - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2018 CERN/Switzerland                                  *
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

#include "common/Namespace.hh"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

SOWERCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Process wide stop flag with interruptible sleeps.
//!
//! Long running loops sleep through WaitFor, which returns early as soon as
//! a shutdown is requested. A fake signal never blocks: it only accumulates
//! the requested sleep time, which lets tests drive backoff logic without
//! waiting for real.
//------------------------------------------------------------------------------
class ShutdownSignal
{
public:
  //----------------------------------------------------------------------------
  //! Constructor: Specify whether we're faking sleeps, or not.
  //----------------------------------------------------------------------------
  explicit ShutdownSignal(bool fake = false) : mFake(fake), mStopFlag(false),
    mSleepCount(0), mSlept(0) {}

  //----------------------------------------------------------------------------
  //! Request shutdown and wake up all sleepers
  //----------------------------------------------------------------------------
  void RequestShutdown()
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (!mStopFlag) {
      mStopFlag = true;
      mNotifier.notify_all();
    }
  }

  //----------------------------------------------------------------------------
  //! Check if shutdown was requested
  //----------------------------------------------------------------------------
  bool IsRequested() const
  {
    return mStopFlag;
  }

  //----------------------------------------------------------------------------
  //! Sleep for the given duration or until shutdown is requested
  //!
  //! @return true if the full duration elapsed, false if interrupted
  //----------------------------------------------------------------------------
  template<typename T>
  bool WaitFor(T duration)
  {
    std::unique_lock<std::mutex> lock(mMutex);

    if (mStopFlag) {
      return false;
    }

    mSleepCount++;
    mSlept += std::chrono::duration_cast<std::chrono::milliseconds>(duration);

    if (mFake) {
      return true;
    }

    return !mNotifier.wait_for(lock, duration, [this] {
      return mStopFlag.load();
    });
  }

  //----------------------------------------------------------------------------
  //! Number of WaitFor calls which started to sleep
  //----------------------------------------------------------------------------
  size_t GetSleepCount() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSleepCount;
  }

  //----------------------------------------------------------------------------
  //! Sum of all requested sleep durations
  //----------------------------------------------------------------------------
  std::chrono::milliseconds GetSleptTime() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSlept;
  }

private:
  bool mFake;
  std::atomic<bool> mStopFlag;
  mutable std::mutex mMutex;
  std::condition_variable mNotifier;
  size_t mSleepCount;
  std::chrono::milliseconds mSlept;
};

SOWERCOMMONNAMESPACE_END
