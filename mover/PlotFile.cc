// ----------------------------------------------------------------------
// File: PlotFile.cc
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

#include "mover/PlotFile.hh"
#include <sys/stat.h>

SOWERMOVERNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Get the file name without the directory part
//------------------------------------------------------------------------------
std::string
PlotFile::GetName() const
{
  auto pos = mPath.rfind('/');

  if (pos == std::string::npos) {
    return mPath;
  }

  return mPath.substr(pos + 1);
}

//------------------------------------------------------------------------------
// Check if the plot is still present
//------------------------------------------------------------------------------
bool
PlotFile::Exists() const
{
  struct stat buf;
  return (::stat(mPath.c_str(), &buf) == 0) && S_ISREG(buf.st_mode);
}

//------------------------------------------------------------------------------
// Get the current size of the plot
//------------------------------------------------------------------------------
bool
PlotFile::GetSize(uint64_t& size) const
{
  struct stat buf;

  if (::stat(mPath.c_str(), &buf) || !S_ISREG(buf.st_mode)) {
    size = 0;
    return false;
  }

  size = static_cast<uint64_t>(buf.st_size);
  return true;
}

SOWERMOVERNAMESPACE_END
