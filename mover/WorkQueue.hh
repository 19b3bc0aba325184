// ----------------------------------------------------------------------
// File: WorkQueue.hh
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
#include "mover/PlotFile.hh"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <vector>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Queue of plots waiting to be transferred, shared by all destination
//! workers. Every plot is either pending or in-transit, never both. A plot
//! is checked out by exactly one worker at a time and can only be put back
//! by the worker holding it.
//------------------------------------------------------------------------------
class WorkQueue
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  WorkQueue() = default;

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~WorkQueue() = default;

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  //----------------------------------------------------------------------------
  //! Append a plot to the tail and wake up one waiting consumer
  //!
  //! @return false if the plot is already pending or in-transit
  //----------------------------------------------------------------------------
  bool Enqueue(const PlotFile& plot);

  //----------------------------------------------------------------------------
  //! Take the head of the queue and mark it in-transit, non-blocking
  //!
  //! @param plot returned plot
  //!
  //! @return true if a plot was checked out, false if nothing is pending
  //----------------------------------------------------------------------------
  bool TryDequeue(PlotFile& plot);

  //----------------------------------------------------------------------------
  //! Take the head of the queue waiting up to timeout for a plot to become
  //! pending. Returns early without a plot once the queue is drained.
  //!
  //! @param plot returned plot
  //! @param timeout max time to wait
  //!
  //! @return true if a plot was checked out
  //----------------------------------------------------------------------------
  bool WaitDequeue(PlotFile& plot, std::chrono::milliseconds timeout);

  //----------------------------------------------------------------------------
  //! Put a checked out plot back to the tail of the queue
  //!
  //! @return false if the plot is not checked out
  //----------------------------------------------------------------------------
  bool Requeue(const PlotFile& plot);

  //----------------------------------------------------------------------------
  //! Release a checked out plot after a transfer attempt
  //!
  //! @return false if the plot is not checked out
  //----------------------------------------------------------------------------
  bool Complete(const PlotFile& plot);

  //----------------------------------------------------------------------------
  //! Check if there is neither pending nor in-transit work
  //----------------------------------------------------------------------------
  bool IsDrained() const;

  size_t GetPendingCount() const;

  size_t GetInTransitCount() const;

  //----------------------------------------------------------------------------
  //! Logical size of the queue i.e. pending plus in-transit plots
  //----------------------------------------------------------------------------
  size_t GetSize() const;

  //----------------------------------------------------------------------------
  //! Snapshot of the pending plots in queue order
  //----------------------------------------------------------------------------
  std::vector<PlotFile> GetPending() const;

private:
  bool PopFrontLocked(PlotFile& plot);

  mutable std::mutex mMutex;
  std::condition_variable mCond;
  std::deque<PlotFile> mPending; ///< Pending plots in FIFO order
  std::set<std::string> mPendingPaths; ///< Index of pending plot paths
  std::map<std::string, PlotFile> mInTransit; ///< Checked out plots
};

SOWERMOVERNAMESPACE_END
