// ----------------------------------------------------------------------
// File: Destination.hh
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
#include <string>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! A configured transfer target. The address is either a local directory or
//! a remote rsync location (host::module, host:path, rsync://...). Remote
//! targets can carry a local path (e.g. an NFS mount of the same disk) which
//! is used to query the free space.
//------------------------------------------------------------------------------
class Destination
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param address local path or remote rsync address
  //! @param statpath local path used for free space queries
  //----------------------------------------------------------------------------
  explicit Destination(const std::string& address = "",
                       const std::string& statpath = ""):
    mAddress(address), mStatPath(statpath)
  {}

  //----------------------------------------------------------------------------
  //! Parse a destination definition '<address> [statpath=<path>]'
  //!
  //! @param line definition
  //! @param dest parsed destination
  //! @param err error message in case of failure
  //!
  //! @return true if successful, otherwise false
  //----------------------------------------------------------------------------
  static bool Parse(const std::string& line, Destination& dest,
                    std::string& err);

  inline const std::string& GetAddress() const
  {
    return mAddress;
  }

  inline const std::string& GetStatPath() const
  {
    return mStatPath;
  }

  //----------------------------------------------------------------------------
  //! Check if the address refers to a remote host
  //----------------------------------------------------------------------------
  bool IsRemote() const;

  //----------------------------------------------------------------------------
  //! Get the local path whose filesystem represents the destination capacity
  //!
  //! @return statpath if configured, the address for local destinations,
  //!         otherwise an empty string (capacity unknown)
  //----------------------------------------------------------------------------
  std::string GetMeteredPath() const;

  bool operator==(const Destination& other) const
  {
    return (mAddress == other.mAddress) && (mStatPath == other.mStatPath);
  }

private:
  std::string mAddress; ///< Local path or remote rsync address
  std::string mStatPath; ///< Optional local path for free space queries
};

SOWERMOVERNAMESPACE_END
