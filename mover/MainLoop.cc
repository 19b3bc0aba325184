// ----------------------------------------------------------------------
// File: MainLoop.cc
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

#include "mover/MainLoop.hh"
#include "mover/MoverConfig.hh"
#include "mover/ProductionController.hh"
#include "common/ShutdownSignal.hh"
#include <exception>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
MainLoop::MainLoop(const MoverConfig& config, DistributionScheduler& scheduler,
                   ProductionController& producer,
                   sower::common::ShutdownSignal& shutdown):
  mConfig(config), mScheduler(scheduler), mProducer(producer),
  mShutdown(shutdown), mState(State::Draining), mWait(0), mIterations(0)
{
  SetLogId(nullptr, "mainloop");
}

//------------------------------------------------------------------------------
// State to string
//------------------------------------------------------------------------------
const char*
MainLoop::StateToString(State state)
{
  switch (state) {
  case State::Draining:
    return "draining";

  case State::Producing:
    return "producing";

  case State::Waiting:
    return "waiting";

  case State::Terminated:
    return "terminated";
  }

  return "unknown";
}

//------------------------------------------------------------------------------
// Drain pass
//------------------------------------------------------------------------------
MainLoop::State
MainLoop::DoDrain()
{
  ++mIterations;
  mLastDrain = mScheduler.Drain();

  if (mShutdown.IsRequested()) {
    return State::Terminated;
  }

  if (mLastDrain.mRemaining) {
    sower_crit("msg=\"all destinations are full\" remaining=%llu",
               (unsigned long long) mLastDrain.mRemaining);
    return State::Terminated;
  }

  return State::Producing;
}

//------------------------------------------------------------------------------
// Produce pass
//------------------------------------------------------------------------------
MainLoop::State
MainLoop::DoProduce()
{
  if (!mProducer.HasRoom()) {
    sower_info("msg=\"not enough space for plotting, waiting\" backoff=%llds",
               (long long) mConfig.mShortBackoff.count());
    mWait = mConfig.mShortBackoff;
    return State::Waiting;
  }

  if (!mProducer.Produce()) {
    sower_warning("msg=\"plot creation failed, waiting before retry\" "
                  "backoff=%llds", (long long) mConfig.mShortBackoff.count());
    mWait = mConfig.mShortBackoff;
  } else {
    mWait = mConfig.mSettleDelay;
  }

  return mShutdown.IsRequested() ? State::Terminated : State::Waiting;
}

//------------------------------------------------------------------------------
// Backoff
//------------------------------------------------------------------------------
MainLoop::State
MainLoop::DoWait()
{
  if (!mShutdown.WaitFor(mWait)) {
    return State::Terminated;
  }

  return State::Draining;
}

//------------------------------------------------------------------------------
// Execute the current state
//------------------------------------------------------------------------------
MainLoop::State
MainLoop::Step()
{
  if (mShutdown.IsRequested()) {
    mState = State::Terminated;
    return mState;
  }

  State previous = mState;

  try {
    switch (mState) {
    case State::Draining:
      mState = DoDrain();
      break;

    case State::Producing:
      mState = DoProduce();
      break;

    case State::Waiting:
      mState = DoWait();
      break;

    case State::Terminated:
      break;
    }
  } catch (const std::exception& e) {
    sower_err("msg=\"error in main loop\" state=%s err=\"%s\" backoff=%llds",
              StateToString(previous), e.what(),
              (long long) mConfig.mLongBackoff.count());
    mWait = mConfig.mLongBackoff;
    mState = State::Waiting;
  }

  if (previous != mState) {
    sower_debug("msg=\"state change\" from=%s to=%s", StateToString(previous),
                StateToString(mState));
  }

  return mState;
}

//------------------------------------------------------------------------------
// Run until Terminated
//------------------------------------------------------------------------------
MainLoop::State
MainLoop::Run(uint64_t max_iterations)
{
  while (mState != State::Terminated) {
    if (max_iterations && (mIterations >= max_iterations) &&
        (mState != State::Producing)) {
      sower_info("msg=\"iteration limit reached\" iterations=%llu",
                 (unsigned long long) mIterations);
      break;
    }

    Step();
  }

  return mState;
}

SOWERMOVERNAMESPACE_END
