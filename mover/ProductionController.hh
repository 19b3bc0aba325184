// ----------------------------------------------------------------------
// File: ProductionController.hh
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
#include "common/Logging.hh"
#include <atomic>
#include <string>

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;
class RunStats;

//------------------------------------------------------------------------------
//! Decides whether the staging volume can take another batch and runs the
//! plot generator
//------------------------------------------------------------------------------
class ProductionController: public sower::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param config daemon configuration
  //! @param stats run statistics
  //----------------------------------------------------------------------------
  ProductionController(const MoverConfig& config, RunStats& stats);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~ProductionController() = default;

  //----------------------------------------------------------------------------
  //! Check if the staging volume is mounted and has room for a full batch
  //----------------------------------------------------------------------------
  virtual bool HasRoom();

  //----------------------------------------------------------------------------
  //! Run the generator once. A zero exit code adds the batch size to the
  //! created plots counter.
  //!
  //! @return true if the generator succeeded, otherwise false
  //----------------------------------------------------------------------------
  virtual bool Produce();

  //----------------------------------------------------------------------------
  //! Build the generator command line
  //----------------------------------------------------------------------------
  std::string BuildCommand() const;

  //----------------------------------------------------------------------------
  //! Check if a generator run is in progress
  //----------------------------------------------------------------------------
  bool IsProducing() const
  {
    return mProducing;
  }

private:
  const MoverConfig& mConfig;
  RunStats& mStats;
  std::atomic<bool> mProducing;
};

SOWERMOVERNAMESPACE_END
