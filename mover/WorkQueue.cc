// ----------------------------------------------------------------------
// File: WorkQueue.cc
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

#include "mover/WorkQueue.hh"

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Append a plot to the tail
//------------------------------------------------------------------------------
bool
WorkQueue::Enqueue(const PlotFile& plot)
{
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (mPendingPaths.count(plot.GetPath()) ||
        mInTransit.count(plot.GetPath())) {
      return false;
    }

    mPending.push_back(plot);
    mPendingPaths.insert(plot.GetPath());
  }

  mCond.notify_one();
  return true;
}

//------------------------------------------------------------------------------
// Move the head to the in-transit set, lock must be held
//------------------------------------------------------------------------------
bool
WorkQueue::PopFrontLocked(PlotFile& plot)
{
  if (mPending.empty()) {
    return false;
  }

  plot = mPending.front();
  mPending.pop_front();
  mPendingPaths.erase(plot.GetPath());
  mInTransit.emplace(plot.GetPath(), plot);
  return true;
}

//------------------------------------------------------------------------------
// Take the head of the queue, non-blocking
//------------------------------------------------------------------------------
bool
WorkQueue::TryDequeue(PlotFile& plot)
{
  std::lock_guard<std::mutex> lock(mMutex);
  return PopFrontLocked(plot);
}

//------------------------------------------------------------------------------
// Take the head of the queue with timeout
//------------------------------------------------------------------------------
bool
WorkQueue::WaitDequeue(PlotFile& plot, std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(mMutex);
  mCond.wait_for(lock, timeout, [this] {
    return !mPending.empty() || mInTransit.empty();
  });
  return PopFrontLocked(plot);
}

//------------------------------------------------------------------------------
// Put a checked out plot back to the tail
//------------------------------------------------------------------------------
bool
WorkQueue::Requeue(const PlotFile& plot)
{
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mInTransit.find(plot.GetPath());

    if (it == mInTransit.end()) {
      return false;
    }

    mPending.push_back(it->second);
    mPendingPaths.insert(plot.GetPath());
    mInTransit.erase(it);
  }

  mCond.notify_one();
  return true;
}

//------------------------------------------------------------------------------
// Release a checked out plot
//------------------------------------------------------------------------------
bool
WorkQueue::Complete(const PlotFile& plot)
{
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (!mInTransit.erase(plot.GetPath())) {
      return false;
    }
  }

  // waiters have to re-evaluate the drained condition
  mCond.notify_all();
  return true;
}

//------------------------------------------------------------------------------
// Check if there is neither pending nor in-transit work
//------------------------------------------------------------------------------
bool
WorkQueue::IsDrained() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mPending.empty() && mInTransit.empty();
}

size_t
WorkQueue::GetPendingCount() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mPending.size();
}

size_t
WorkQueue::GetInTransitCount() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mInTransit.size();
}

size_t
WorkQueue::GetSize() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mPending.size() + mInTransit.size();
}

//------------------------------------------------------------------------------
// Snapshot of the pending plots
//------------------------------------------------------------------------------
std::vector<PlotFile>
WorkQueue::GetPending() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return std::vector<PlotFile>(mPending.begin(), mPending.end());
}

SOWERMOVERNAMESPACE_END
