// ----------------------------------------------------------------------
// File: StdFSWalkDirTree
// Author: Abhishek Lekshmanan - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2022 CERN/Switzerland                                  *
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

#include <stdint.h>
#include <string_view>
#include <system_error>
#include <filesystem>

// std::filesystem based directory walking helpers
namespace sower::common::stdfs {

namespace fs = std::filesystem;

// A walk directory tree function using the recursive directory iterator.
// Hidden files or directories are not visited, and symlinks not followed.
// Errors stop the walk and are reported through ec; entries found before
// the error have already been handed to path_op.
template <typename FilterFn, typename PathOp>
uint64_t WalkFSTree(std::string_view path, FilterFn&& filter, PathOp&& path_op,
                    std::error_code& ec) noexcept
{
  uint64_t count {0};
  auto p = fs::recursive_directory_iterator(path,
                                            fs::directory_options::skip_permission_denied,
                                            ec);

  for (; !ec && p != fs::recursive_directory_iterator(); p.increment(ec)) {
    if (p->path().filename().c_str()[0] == '.') {
      p.disable_recursion_pending();
      continue;
    }

    if (filter(*p)) {
      path_op(p->path(), ++count);
    }
  }

  return count;
}

// Check if a directory entry is a regular file with the given extension
inline bool IsRegularFileWithExtension(const fs::directory_entry& entry,
                                       std::string_view extension)
{
  std::error_code ec;
  return entry.is_regular_file(ec) && !ec &&
         (entry.path().extension() == extension);
}

} // namespace sower::common::stdfs
