// ----------------------------------------------------------------------
// File: DestinationWorker.hh
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
#include "common/Logging.hh"
#include <stdint.h>
#include <atomic>

namespace sower::common
{
class ShutdownSignal;
}

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;
class WorkQueue;
class IDestinationProbe;
class ITransferExecutor;
class RunStats;

//------------------------------------------------------------------------------
//! Worker moving plots from the shared queue to one destination until the
//! queue is drained or the destination drops out of the pass
//------------------------------------------------------------------------------
class DestinationWorker: public sower::common::LogId
{
public:
  //! Final state of a worker
  enum class State {
    Running, ///< still processing
    Drained, ///< no work left in the queue
    Unreachable, ///< destination failed the reachability test
    NoSpace, ///< destination cannot admit the next plot
    Exhausted, ///< transfer tool reported a file level or unknown error
    Interrupted ///< shutdown was requested
  };

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param dest destination served by this worker
  //! @param queue shared work queue
  //! @param probe destination probe
  //! @param executor transfer executor
  //! @param stats run statistics
  //! @param shutdown process shutdown signal
  //! @param config daemon configuration
  //----------------------------------------------------------------------------
  DestinationWorker(const Destination& dest, WorkQueue& queue,
                    IDestinationProbe& probe, ITransferExecutor& executor,
                    RunStats& stats, sower::common::ShutdownSignal& shutdown,
                    const MoverConfig& config);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~DestinationWorker() = default;

  //----------------------------------------------------------------------------
  //! Method doing the actual work, runs in its own thread
  //!
  //! @return final state of the worker
  //----------------------------------------------------------------------------
  virtual State DoIt();

  static const char* StateToString(State state);

  inline const Destination& GetDestination() const
  {
    return mDestination;
  }

  inline State GetState() const
  {
    return mState;
  }

  //----------------------------------------------------------------------------
  //! Number of plots delivered by this worker
  //----------------------------------------------------------------------------
  inline uint64_t GetMoved() const
  {
    return mMoved;
  }

  //----------------------------------------------------------------------------
  //! Number of plots left on the source after a retryable fault
  //----------------------------------------------------------------------------
  inline uint64_t GetDeferred() const
  {
    return mDeferred;
  }

private:
  Destination mDestination;
  WorkQueue& mQueue;
  IDestinationProbe& mProbe;
  ITransferExecutor& mExecutor;
  RunStats& mStats;
  sower::common::ShutdownSignal& mShutdown;
  const MoverConfig& mConfig;
  std::atomic<State> mState;
  std::atomic<uint64_t> mMoved;
  std::atomic<uint64_t> mDeferred;
};

SOWERMOVERNAMESPACE_END
