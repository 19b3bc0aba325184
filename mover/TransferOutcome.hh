// ----------------------------------------------------------------------
// File: TransferOutcome.hh
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
//! Result of one transfer attempt, classified from the exit code of the
//! transfer tool
//------------------------------------------------------------------------------
class TransferOutcome
{
public:
  enum class Kind {
    Success, ///< plot delivered, source can be dropped
    RetryableIOFault, ///< socket level error, plot stays on the source
    DestinationExhausted, ///< file level error, most likely a full target
    Unknown ///< anything else, handled like an exhausted destination
  };

  //----------------------------------------------------------------------------
  //! Map an exit code of the transfer tool to an outcome kind
  //!
  //!  0      -> Success
  //!  10     -> RetryableIOFault (error in socket I/O)
  //!  11, 23 -> DestinationExhausted (error in file I/O, partial transfer)
  //!  other  -> Unknown
  //----------------------------------------------------------------------------
  static Kind ClassifyExitCode(int exit_code);

  //----------------------------------------------------------------------------
  //! Build an outcome from an exit code
  //!
  //! @param exit_code exit code of the transfer tool, -1 if it never ran
  //! @param bytes size of the transferred plot
  //! @param duration wall-clock duration of the attempt
  //----------------------------------------------------------------------------
  static TransferOutcome FromExitCode(int exit_code, uint64_t bytes = 0,
                                      std::chrono::milliseconds duration =
                                        std::chrono::milliseconds(0));

  static const char* KindToString(Kind kind);

  Kind GetKind() const
  {
    return mKind;
  }

  int GetExitCode() const
  {
    return mExitCode;
  }

  uint64_t GetBytes() const
  {
    return mBytes;
  }

  std::chrono::milliseconds GetDuration() const
  {
    return mDuration;
  }

  bool IsSuccess() const
  {
    return mKind == Kind::Success;
  }

  //----------------------------------------------------------------------------
  //! Check if the destination has to be dropped for the rest of the pass
  //----------------------------------------------------------------------------
  bool ExcludesDestination() const
  {
    return (mKind == Kind::DestinationExhausted) || (mKind == Kind::Unknown);
  }

  //----------------------------------------------------------------------------
  //! Throughput in MB/s (1024^2), 0 if not applicable
  //----------------------------------------------------------------------------
  double GetRateMBs() const;

  std::string ToString() const;

private:
  TransferOutcome(Kind kind, int exit_code, uint64_t bytes,
                  std::chrono::milliseconds duration):
    mKind(kind), mExitCode(exit_code), mBytes(bytes), mDuration(duration)
  {}

  Kind mKind;
  int mExitCode;
  uint64_t mBytes;
  std::chrono::milliseconds mDuration;
};

SOWERMOVERNAMESPACE_END
