// ----------------------------------------------------------------------
// File: DestinationWorker.cc
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

#include "mover/DestinationWorker.hh"
#include "mover/DestinationProbe.hh"
#include "mover/MoverConfig.hh"
#include "mover/RunStats.hh"
#include "mover/TransferExecutor.hh"
#include "mover/WorkQueue.hh"
#include "common/ShutdownSignal.hh"
#include <errno.h>
#include <string.h>
#include <unistd.h>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
DestinationWorker::DestinationWorker(const Destination& dest, WorkQueue& queue,
                                     IDestinationProbe& probe,
                                     ITransferExecutor& executor,
                                     RunStats& stats,
                                     sower::common::ShutdownSignal& shutdown,
                                     const MoverConfig& config):
  mDestination(dest), mQueue(queue), mProbe(probe), mExecutor(executor),
  mStats(stats), mShutdown(shutdown), mConfig(config), mState(State::Running),
  mMoved(0), mDeferred(0)
{
  SetLogId(nullptr, dest.GetAddress().c_str());
}

//------------------------------------------------------------------------------
// State to string
//------------------------------------------------------------------------------
const char*
DestinationWorker::StateToString(State state)
{
  switch (state) {
  case State::Running:
    return "running";

  case State::Drained:
    return "drained";

  case State::Unreachable:
    return "unreachable";

  case State::NoSpace:
    return "no-space";

  case State::Exhausted:
    return "exhausted";

  case State::Interrupted:
    return "interrupted";
  }

  return "unknown";
}

//------------------------------------------------------------------------------
// Method doing the actual work
//------------------------------------------------------------------------------
DestinationWorker::State
DestinationWorker::DoIt()
{
  const char* addr = mDestination.GetAddress().c_str();
  sower_debug("msg=\"worker started\" dest=%s", addr);
  State state = State::Drained;

  while (!mQueue.IsDrained()) {
    if (mShutdown.IsRequested()) {
      state = State::Interrupted;
      break;
    }

    PlotFile plot;

    if (!mQueue.WaitDequeue(plot, std::chrono::seconds(1))) {
      // other workers hold the remaining plots, they may requeue them
      continue;
    }

    uint64_t size = 0;

    if (!plot.GetSize(size)) {
      sower_debug("msg=\"plot vanished before transfer\" plot=%s",
                  plot.GetPath().c_str());
      mQueue.Complete(plot);
      continue;
    }

    if (!mProbe.Reachable(mDestination)) {
      sower_warning("msg=\"destination not accessible, skipping\" dest=%s",
                    addr);
      mQueue.Requeue(plot);
      state = State::Unreachable;
      break;
    }

    FreeSpace space = mProbe.GetFreeSpace(mDestination);

    if (!space.Admits(size)) {
      sower_notice("msg=\"destination is full, removing from rotation\" "
                   "dest=%s free=%llu required=%llu space_known=%d", addr,
                   (unsigned long long) space.GetBytes(),
                   (unsigned long long) size,
                   (space.GetState() == FreeSpace::State::Known) ? 1 : 0);
      mQueue.Requeue(plot);
      state = State::NoSpace;
      break;
    }

    TransferOutcome outcome = mExecutor.Transfer(plot, mDestination, size);

    if (outcome.IsSuccess()) {
      mStats.AddMoved(outcome.GetBytes());
      mMoved++;
      sower_debug("msg=\"plot delivered\" plot=%s dest=%s waited=%llds",
                  plot.GetPath().c_str(), addr, (long long)
                  std::chrono::duration_cast<std::chrono::seconds>
                  (std::chrono::system_clock::now() -
                   plot.GetDiscoveryTime()).count());

      // the transfer tool drops the source already, this only catches tools
      // configured without --remove-source-files support
      if (plot.Exists() && ::unlink(plot.GetPath().c_str())) {
        sower_warning("msg=\"failed to remove delivered plot\" plot=%s "
                      "errno=%d strerror=\"%s\"", plot.GetPath().c_str(), errno,
                      strerror(errno));
      }

      mQueue.Complete(plot);
      continue;
    }

    if (outcome.GetKind() == TransferOutcome::Kind::RetryableIOFault) {
      sower_warning("msg=\"plot stays on source for a later pass\" plot=%s "
                    "dest=%s", plot.GetPath().c_str(), addr);
      mDeferred++;
      mQueue.Complete(plot);
      continue;
    }

    // exhausted or unknown: hand the plot to the other destinations
    mQueue.Requeue(plot);

    if (outcome.GetKind() == TransferOutcome::Kind::Unknown) {
      sower_warning("msg=\"backing off after unknown transfer error\" dest=%s "
                    "exit_code=%d backoff=%llds", addr, outcome.GetExitCode(),
                    (long long) mConfig.mShortBackoff.count());
      mShutdown.WaitFor(mConfig.mShortBackoff);
    }

    sower_notice("msg=\"destination planting stopping\" dest=%s %s", addr,
                 outcome.ToString().c_str());
    state = State::Exhausted;
    break;
  }

  mState = state;
  sower_info("msg=\"worker finished\" dest=%s state=%s moved=%llu deferred=%llu",
             addr, StateToString(state), (unsigned long long) mMoved.load(),
             (unsigned long long) mDeferred.load());
  return state;
}

SOWERMOVERNAMESPACE_END
