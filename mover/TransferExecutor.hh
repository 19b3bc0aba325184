// ----------------------------------------------------------------------
// File: TransferExecutor.hh
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
#include "mover/PlotFile.hh"
#include "mover/TransferOutcome.hh"
#include "common/Logging.hh"
#include <stdint.h>
#include <string>

SOWERMOVERNAMESPACE_BEGIN

struct MoverConfig;

//------------------------------------------------------------------------------
//! Interface for moving one plot to one destination
//------------------------------------------------------------------------------
class ITransferExecutor
{
public:
  virtual ~ITransferExecutor() = default;

  //----------------------------------------------------------------------------
  //! Transfer a plot. The source is only dropped if the outcome is Success.
  //!
  //! @param plot plot to transfer
  //! @param dest target destination
  //! @param size size of the plot measured before the transfer
  //!
  //! @return classified outcome of the attempt
  //----------------------------------------------------------------------------
  virtual TransferOutcome Transfer(const PlotFile& plot, const Destination& dest,
                                   uint64_t size) = 0;
};

//------------------------------------------------------------------------------
//! Executor running one rsync process per plot
//------------------------------------------------------------------------------
class TransferExecutor: public ITransferExecutor, public sower::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param config daemon configuration
  //----------------------------------------------------------------------------
  explicit TransferExecutor(const MoverConfig& config);

  virtual ~TransferExecutor() = default;

  TransferOutcome Transfer(const PlotFile& plot, const Destination& dest,
                           uint64_t size) override;

  //----------------------------------------------------------------------------
  //! Build the transfer command line for plot and destination
  //----------------------------------------------------------------------------
  std::string BuildCommand(const PlotFile& plot, const Destination& dest) const;

private:
  const MoverConfig& mConfig;
};

SOWERMOVERNAMESPACE_END
