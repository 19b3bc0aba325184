// ----------------------------------------------------------------------
// File: DistributionScheduler.cc
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

#include "mover/DistributionScheduler.hh"
#include "mover/DestinationProbe.hh"
#include "mover/DestinationWorker.hh"
#include "mover/MoverConfig.hh"
#include "mover/TransferExecutor.hh"
#include "common/ShutdownSignal.hh"
#include "common/StdFSWalkTree.hh"
#include <algorithm>
#include <future>
#include <system_error>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
DistributionScheduler::DistributionScheduler(const MoverConfig& config,
    IDestinationProbe& probe, ITransferExecutor& executor, RunStats& stats,
    sower::common::ShutdownSignal& shutdown):
  mConfig(config), mProbe(probe), mExecutor(executor), mStats(stats),
  mShutdown(shutdown), mRandom(std::random_device{}())
{
  SetLogId(nullptr, "scheduler");
}

//------------------------------------------------------------------------------
// Discover the plots of all staging directories
//------------------------------------------------------------------------------
uint64_t
DistributionScheduler::Scan(WorkQueue& queue)
{
  namespace stdfs = sower::common::stdfs;
  uint64_t enqueued = 0;

  for (const auto& source : mConfig.mSources) {
    std::vector<std::string> found;
    std::error_code ec;
    stdfs::WalkFSTree(source, [](const stdfs::fs::directory_entry & entry) {
      return stdfs::IsRegularFileWithExtension(entry, ".plot");
    }, [&found](const stdfs::fs::path & p, uint64_t) {
      found.push_back(p.string());
    }, ec);

    if (ec) {
      sower_err("msg=\"failed to scan staging directory\" path=%s err=\"%s\"",
                source.c_str(), ec.message().c_str());
    }

    // stable order independent of the directory layout on disk
    std::sort(found.begin(), found.end());

    for (const auto& path : found) {
      if (queue.Enqueue(PlotFile(path))) {
        ++enqueued;
      }
    }
  }

  return enqueued;
}

//------------------------------------------------------------------------------
// Destination order for the next pass
//------------------------------------------------------------------------------
std::vector<Destination>
DistributionScheduler::OrderDestinations()
{
  std::vector<Destination> dests = mConfig.mDestinations;

  if (mConfig.mShuffle) {
    std::shuffle(dests.begin(), dests.end(), mRandom);
  }

  return dests;
}

//------------------------------------------------------------------------------
// Logical size of the queue of the running pass
//------------------------------------------------------------------------------
size_t
DistributionScheduler::GetQueueSize() const
{
  std::lock_guard<std::mutex> lock(mQueueMutex);
  return mQueue ? mQueue->GetSize() : 0;
}

//------------------------------------------------------------------------------
// Run one drain pass
//------------------------------------------------------------------------------
DrainResult
DistributionScheduler::Drain()
{
  DrainResult result;
  auto queue = std::make_shared<WorkQueue>();
  {
    std::lock_guard<std::mutex> lock(mQueueMutex);
    mQueue = queue;
  }
  result.mDiscovered = Scan(*queue);

  if (result.mDiscovered == 0) {
    sower_debug("%s", "msg=\"no plots found on staging directories\"");
    std::lock_guard<std::mutex> lock(mQueueMutex);
    mQueue.reset();
    return result;
  }

  sower_info("msg=\"found plots to move\" count=%llu destinations=%zu",
             (unsigned long long) result.mDiscovered,
             mConfig.mDestinations.size());
  std::vector<std::unique_ptr<DestinationWorker>> workers;
  std::vector<std::future<DestinationWorker::State>> futures;

  for (const auto& dest : OrderDestinations()) {
    std::unique_ptr<DestinationWorker> worker(new DestinationWorker(dest,
        *queue, mProbe, mExecutor, mStats, mShutdown, mConfig));

    try {
      futures.push_back(std::async(std::launch::async,
                                   &DestinationWorker::DoIt, worker.get()));
      workers.push_back(std::move(worker));
    } catch (const std::system_error& e) {
      sower_err("msg=\"failed to start destination worker\" dest=%s "
                "err=\"%s\"", dest.GetAddress().c_str(), e.what());
    }
  }

  for (size_t i = 0; i < futures.size(); ++i) {
    DestinationWorker::State state = futures[i].get();
    result.mMoved += workers[i]->GetMoved();
    result.mDeferred += workers[i]->GetDeferred();
    sower_debug("msg=\"worker joined\" dest=%s state=%s",
                workers[i]->GetDestination().GetAddress().c_str(),
                DestinationWorker::StateToString(state));
  }

  result.mRemaining = queue->GetSize();
  result.mInterrupted = mShutdown.IsRequested();

  for (const auto& plot : queue->GetPending()) {
    result.mRemainingPaths.push_back(plot.GetPath());
  }

  if (result.mInterrupted) {
    sower_notice("msg=\"drain pass interrupted by shutdown\" remaining=%llu",
                 (unsigned long long) result.mRemaining);
  } else if (result.mRemaining) {
    sower_warning("msg=\"plots remaining but no destination has space\" "
                  "remaining=%llu", (unsigned long long) result.mRemaining);
  }

  sower_info("msg=\"drain pass finished\" discovered=%llu moved=%llu "
             "deferred=%llu remaining=%llu",
             (unsigned long long) result.mDiscovered,
             (unsigned long long) result.mMoved,
             (unsigned long long) result.mDeferred,
             (unsigned long long) result.mRemaining);
  {
    std::lock_guard<std::mutex> lock(mQueueMutex);
    mQueue.reset();
  }
  return result;
}

SOWERMOVERNAMESPACE_END
