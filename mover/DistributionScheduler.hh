// ----------------------------------------------------------------------
// File: DistributionScheduler.hh
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
#include "mover/WorkQueue.hh"
#include "common/Logging.hh"
#include <stdint.h>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace sower::common
{
class ShutdownSignal;
}

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;
class IDestinationProbe;
class ITransferExecutor;
class RunStats;

//------------------------------------------------------------------------------
//! Result of one drain pass
//------------------------------------------------------------------------------
struct DrainResult {
  uint64_t mDiscovered {0}; ///< plots found on the staging directories
  uint64_t mMoved {0}; ///< plots delivered during the pass
  uint64_t mDeferred {0}; ///< plots left on source after a retryable fault
  uint64_t mRemaining {0}; ///< plots pending or in-transit after the pass
  bool mInterrupted {false}; ///< pass stopped by a shutdown request
  std::vector<std::string> mRemainingPaths; ///< pending plots after the pass
};

//------------------------------------------------------------------------------
//! Owns the work queue and the destination workers of a drain pass
//------------------------------------------------------------------------------
class DistributionScheduler: public sower::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param config daemon configuration
  //! @param probe destination probe shared by all workers
  //! @param executor transfer executor shared by all workers
  //! @param stats run statistics
  //! @param shutdown process shutdown signal
  //----------------------------------------------------------------------------
  DistributionScheduler(const MoverConfig& config, IDestinationProbe& probe,
                        ITransferExecutor& executor, RunStats& stats,
                        sower::common::ShutdownSignal& shutdown);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~DistributionScheduler() = default;

  //----------------------------------------------------------------------------
  //! Scan the staging directories, distribute all plots found and wait for
  //! all workers to finish
  //!
  //! @return result of the pass, mRemaining > 0 means no destination could
  //!         take the rest of the plots
  //----------------------------------------------------------------------------
  virtual DrainResult Drain();

  //----------------------------------------------------------------------------
  //! Discover the plots of all staging directories and enqueue them
  //!
  //! @param queue queue to fill
  //!
  //! @return number of plots enqueued
  //----------------------------------------------------------------------------
  uint64_t Scan(WorkQueue& queue);

  //----------------------------------------------------------------------------
  //! Destination order for the next pass, shuffled if configured
  //----------------------------------------------------------------------------
  std::vector<Destination> OrderDestinations();

  //----------------------------------------------------------------------------
  //! Logical size of the queue of the running pass, 0 if idle
  //----------------------------------------------------------------------------
  size_t GetQueueSize() const;

private:
  const MoverConfig& mConfig;
  IDestinationProbe& mProbe;
  ITransferExecutor& mExecutor;
  RunStats& mStats;
  sower::common::ShutdownSignal& mShutdown;
  std::mt19937 mRandom;
  std::shared_ptr<WorkQueue> mQueue; ///< queue of the running pass
  mutable std::mutex mQueueMutex;
};

SOWERMOVERNAMESPACE_END
