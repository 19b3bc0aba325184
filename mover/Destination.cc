// ----------------------------------------------------------------------
// File: Destination.cc
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

#include "mover/Destination.hh"
#include "common/StringConversion.hh"
#include <vector>

SOWERMOVERNAMESPACE_BEGIN

using sower::common::StringConversion;

//------------------------------------------------------------------------------
// Parse a destination definition
//------------------------------------------------------------------------------
bool
Destination::Parse(const std::string& line, Destination& dest,
                   std::string& err)
{
  std::vector<std::string> tokens;
  StringConversion::Tokenize(line, tokens, " \t");

  if (tokens.empty()) {
    err = "empty destination definition";
    return false;
  }

  std::string statpath;

  for (size_t i = 1; i < tokens.size(); ++i) {
    std::string key, value;

    if (!StringConversion::SplitKeyValue(tokens[i], key, value, "=") ||
        (key != "statpath") || value.empty()) {
      err = "unknown destination option '" + tokens[i] + "' in '" + line + "'";
      return false;
    }

    statpath = value;
  }

  dest = Destination(tokens[0], statpath);
  return true;
}

//------------------------------------------------------------------------------
// Check if the address refers to a remote host
//------------------------------------------------------------------------------
bool
Destination::IsRemote() const
{
  if (mAddress.compare(0, 8, "rsync://") == 0) {
    return true;
  }

  // rsync treats a colon before the first slash as a host separator
  auto colon = mAddress.find(':');

  if (colon == std::string::npos) {
    return false;
  }

  auto slash = mAddress.find('/');
  return (slash == std::string::npos) || (colon < slash);
}

//------------------------------------------------------------------------------
// Get the local path representing the destination capacity
//------------------------------------------------------------------------------
std::string
Destination::GetMeteredPath() const
{
  if (!mStatPath.empty()) {
    return mStatPath;
  }

  return IsRemote() ? "" : mAddress;
}

SOWERMOVERNAMESPACE_END
