// ----------------------------------------------------------------------
// File: PlotFile.hh
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
#include <stdint.h>
#include <chrono>
#include <string>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! A generated plot on a staging directory. The size is never cached and is
//! resolved from the filesystem each time it is requested.
//------------------------------------------------------------------------------
class PlotFile
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param path absolute path of the plot
  //! @param discovered discovery timestamp
  //----------------------------------------------------------------------------
  explicit PlotFile(const std::string& path = "",
                    std::chrono::system_clock::time_point discovered =
                      std::chrono::system_clock::now()):
    mPath(path), mDiscovered(discovered)
  {}

  inline const std::string& GetPath() const
  {
    return mPath;
  }

  //----------------------------------------------------------------------------
  //! Get the file name without the directory part
  //----------------------------------------------------------------------------
  std::string GetName() const;

  inline std::chrono::system_clock::time_point GetDiscoveryTime() const
  {
    return mDiscovered;
  }

  //----------------------------------------------------------------------------
  //! Check if the plot is still present on the staging directory
  //----------------------------------------------------------------------------
  bool Exists() const;

  //----------------------------------------------------------------------------
  //! Get the current size of the plot
  //!
  //! @param size returned size in bytes
  //!
  //! @return true if the file could be statted, otherwise false
  //----------------------------------------------------------------------------
  bool GetSize(uint64_t& size) const;

  bool operator==(const PlotFile& other) const
  {
    return mPath == other.mPath;
  }

  bool operator<(const PlotFile& other) const
  {
    return mPath < other.mPath;
  }

private:
  std::string mPath; ///< Absolute path of the plot
  std::chrono::system_clock::time_point mDiscovered; ///< Discovery timestamp
};

SOWERMOVERNAMESPACE_END
