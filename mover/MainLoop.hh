// ----------------------------------------------------------------------
// File: MainLoop.hh
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
#include "mover/DistributionScheduler.hh"
#include "common/Logging.hh"
#include <stdint.h>
#include <chrono>

namespace sower::common
{
class ShutdownSignal;
}

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;
class ProductionController;
class RunStats;

//------------------------------------------------------------------------------
//! State machine alternating drain and produce passes
//!
//!  Draining  -> Producing   nothing left behind by the drain pass
//!  Draining  -> Terminated  plots left behind, every destination dropped out
//!  Producing -> Waiting     settle delay after a batch, short backoff after
//!                           a failed batch or when staging has no room
//!  Waiting   -> Draining
//!
//! A shutdown request moves every state to Terminated.
//------------------------------------------------------------------------------
class MainLoop: public sower::common::LogId
{
public:
  enum class State {Draining, Producing, Waiting, Terminated};

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  MainLoop(const MoverConfig& config, DistributionScheduler& scheduler,
           ProductionController& producer, sower::common::ShutdownSignal& shutdown);

  //----------------------------------------------------------------------------
  //! Execute the current state and move to the next one
  //!
  //! @return new state
  //----------------------------------------------------------------------------
  State Step();

  //----------------------------------------------------------------------------
  //! Run until Terminated
  //!
  //! @param max_iterations stop after this many drain passes, skipping the
  //!        final backoff, 0 means no limit
  //!
  //! @return final state
  //----------------------------------------------------------------------------
  State Run(uint64_t max_iterations = 0);

  static const char* StateToString(State state);

  inline State GetState() const
  {
    return mState;
  }

  //----------------------------------------------------------------------------
  //! Number of drain passes started
  //----------------------------------------------------------------------------
  inline uint64_t GetIterations() const
  {
    return mIterations;
  }

  //----------------------------------------------------------------------------
  //! Result of the last drain pass
  //----------------------------------------------------------------------------
  inline const DrainResult& GetLastDrain() const
  {
    return mLastDrain;
  }

  //----------------------------------------------------------------------------
  //! Delay applied by the next Waiting state
  //----------------------------------------------------------------------------
  inline std::chrono::seconds GetPendingWait() const
  {
    return mWait;
  }

private:
  State DoDrain();
  State DoProduce();
  State DoWait();

  const MoverConfig& mConfig;
  DistributionScheduler& mScheduler;
  ProductionController& mProducer;
  sower::common::ShutdownSignal& mShutdown;
  State mState;
  std::chrono::seconds mWait;
  uint64_t mIterations;
  DrainResult mLastDrain;
};

SOWERMOVERNAMESPACE_END
