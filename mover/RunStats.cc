// ----------------------------------------------------------------------
// File: RunStats.cc
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

#include "mover/RunStats.hh"
#include "common/StringConversion.hh"
#include <stdio.h>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Average speed over the whole runtime
//------------------------------------------------------------------------------
double
RunStats::GetAverageSpeed(std::chrono::steady_clock::time_point now) const
{
  double seconds = std::chrono::duration_cast<std::chrono::milliseconds>
                   (now - mStart).count() / 1000.0;

  if (seconds <= 0) {
    return 0.0;
  }

  return mBytesMoved / seconds / 1024.0 / 1024.0;
}

//------------------------------------------------------------------------------
// Render the final statistics
//------------------------------------------------------------------------------
std::string
RunStats::Summary(std::chrono::steady_clock::time_point now) const
{
  auto runtime = std::chrono::duration_cast<std::chrono::seconds>(now - mStart);
  char line[256];
  std::string out = "Final statistics:\n";
  snprintf(line, sizeof(line), "   Plots created: %llu\n",
           (unsigned long long) mPlotsCreated.load());
  out += line;
  snprintf(line, sizeof(line), "   Plots moved: %llu\n",
           (unsigned long long) mPlotsMoved.load());
  out += line;
  out += "   Runtime: ";
  out += sower::common::StringConversion::GetReadableDuration(runtime);
  out += "\n";
  snprintf(line, sizeof(line), "   Total data moved: %.2f GB\n",
           mBytesMoved.load() / 1024.0 / 1024.0 / 1024.0);
  out += line;
  snprintf(line, sizeof(line), "   Average transfer speed: %.2f MB/s\n",
           GetAverageSpeed(now));
  out += line;
  return out;
}

SOWERMOVERNAMESPACE_END
