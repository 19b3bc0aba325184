// ----------------------------------------------------------------------
// File: DestinationProbe.hh
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
#include <string>

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;

//------------------------------------------------------------------------------
//! Free space reported for a destination
//------------------------------------------------------------------------------
class FreeSpace
{
public:
  enum class State {
    Known, ///< free bytes are known
    Unavailable, ///< destination cannot be statted, cannot admit now
    Unmetered ///< no local view of the capacity, admitted when configured
  };

  static FreeSpace Known(uint64_t bytes)
  {
    return FreeSpace(State::Known, bytes);
  }

  static FreeSpace Unavailable()
  {
    return FreeSpace(State::Unavailable, 0);
  }

  static FreeSpace Unmetered()
  {
    return FreeSpace(State::Unmetered, 0);
  }

  State GetState() const
  {
    return mState;
  }

  uint64_t GetBytes() const
  {
    return mBytes;
  }

  //----------------------------------------------------------------------------
  //! Check if a plot of the given size can be admitted
  //----------------------------------------------------------------------------
  bool Admits(uint64_t size) const
  {
    switch (mState) {
    case State::Known:
      return mBytes >= size;

    case State::Unmetered:
      return true;

    case State::Unavailable:
      return false;
    }

    return false;
  }

private:
  FreeSpace(State state, uint64_t bytes): mState(state), mBytes(bytes) {}

  State mState;
  uint64_t mBytes;
};

//------------------------------------------------------------------------------
//! Interface for destination reachability and capacity queries
//------------------------------------------------------------------------------
class IDestinationProbe
{
public:
  virtual ~IDestinationProbe() = default;

  //----------------------------------------------------------------------------
  //! Check if the destination accepts a minimal transfer
  //----------------------------------------------------------------------------
  virtual bool Reachable(const Destination& dest) = 0;

  //----------------------------------------------------------------------------
  //! Query the free space of the destination
  //----------------------------------------------------------------------------
  virtual FreeSpace GetFreeSpace(const Destination& dest) = 0;
};

//------------------------------------------------------------------------------
//! Probe using the transfer tool for reachability and statfs for capacity
//------------------------------------------------------------------------------
class DestinationProbe: public IDestinationProbe, public sower::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param config daemon configuration
  //----------------------------------------------------------------------------
  explicit DestinationProbe(const MoverConfig& config);

  virtual ~DestinationProbe() = default;

  //----------------------------------------------------------------------------
  //! Transfer the test artifact to the destination
  //----------------------------------------------------------------------------
  bool Reachable(const Destination& dest) override;

  //----------------------------------------------------------------------------
  //! Free space of the filesystem behind the destination. A metered path
  //! which is not a mount point counts as unavailable when mounts are
  //! required, so that an unmounted disk never fills the root filesystem.
  //----------------------------------------------------------------------------
  FreeSpace GetFreeSpace(const Destination& dest) override;

  //----------------------------------------------------------------------------
  //! Build the reachability test command line
  //----------------------------------------------------------------------------
  std::string BuildTestCommand(const Destination& dest) const;

private:
  const MoverConfig& mConfig;
};

SOWERMOVERNAMESPACE_END
