// ----------------------------------------------------------------------
// File: TransferOutcome.cc
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

#include "mover/TransferOutcome.hh"
#include <sstream>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Map an exit code to an outcome kind
//------------------------------------------------------------------------------
TransferOutcome::Kind
TransferOutcome::ClassifyExitCode(int exit_code)
{
  switch (exit_code) {
  case 0:
    return Kind::Success;

  case 10:
    return Kind::RetryableIOFault;

  case 11:
  case 23:
    return Kind::DestinationExhausted;

  default:
    return Kind::Unknown;
  }
}

//------------------------------------------------------------------------------
// Build an outcome from an exit code
//------------------------------------------------------------------------------
TransferOutcome
TransferOutcome::FromExitCode(int exit_code, uint64_t bytes,
                              std::chrono::milliseconds duration)
{
  Kind kind = ClassifyExitCode(exit_code);
  return TransferOutcome(kind, exit_code,
                         (kind == Kind::Success) ? bytes : 0, duration);
}

//------------------------------------------------------------------------------
// Kind to string
//------------------------------------------------------------------------------
const char*
TransferOutcome::KindToString(Kind kind)
{
  switch (kind) {
  case Kind::Success:
    return "success";

  case Kind::RetryableIOFault:
    return "retryable-io-fault";

  case Kind::DestinationExhausted:
    return "destination-exhausted";

  default:
    return "unknown";
  }
}

//------------------------------------------------------------------------------
// Throughput in MB/s
//------------------------------------------------------------------------------
double
TransferOutcome::GetRateMBs() const
{
  if (!IsSuccess() || (mDuration.count() <= 0)) {
    return 0.0;
  }

  return (mBytes / 1024.0 / 1024.0) / (mDuration.count() / 1000.0);
}

std::string
TransferOutcome::ToString() const
{
  std::ostringstream oss;
  oss << "outcome=" << KindToString(mKind) << " exit_code=" << mExitCode;

  if (IsSuccess()) {
    oss << " bytes=" << mBytes << " duration_ms=" << mDuration.count();
  }

  return oss.str();
}

SOWERMOVERNAMESPACE_END
