//------------------------------------------------------------------------------
// File: Statfs.hh
// Author: Andreas-Joachim Peters - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2011 CERN/Switzerland                                  *
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

#ifndef __SOWERCOMMON_STATFS_HH__
#define __SOWERCOMMON_STATFS_HH__

#include "common/Namespace.hh"
#include "common/Logging.hh"
#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <memory>
#include <string>
#ifndef __APPLE__
#include <sys/vfs.h>
#else
#include <sys/param.h>
#include <sys/mount.h>
#endif

SOWERCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Class storing a statfs struct and providing some convenience functions to
//! query free space and mount status of a path
//------------------------------------------------------------------------------
class Statfs: public LogId
{
public:

  //----------------------------------------------------------------------------
  //! Empty constructor, empty contents
  //----------------------------------------------------------------------------
  Statfs() {
    memset(&statFs, 0, sizeof(struct statfs));
  }

  //----------------------------------------------------------------------------
  //! Bytes available to an unprivileged writer
  //----------------------------------------------------------------------------
  uint64_t GetFreeBytes() const
  {
    return (uint64_t) statFs.f_bavail * (uint64_t) statFs.f_bsize;
  }

  //----------------------------------------------------------------------------
  //! Total capacity in bytes
  //----------------------------------------------------------------------------
  uint64_t GetCapacityBytes() const
  {
    return (uint64_t) statFs.f_blocks * (uint64_t) statFs.f_bsize;
  }

  //----------------------------------------------------------------------------
  //! Execute the statfs function on the given path
  //----------------------------------------------------------------------------
  int perform(const std::string &path)
  {
    int retc = ::statfs(path.c_str(), (struct statfs*) &statFs);

    if (retc) {
      sower_err("msg=\"failed statfs\" path=%s errno=%i strerror=\"%s\"",
                path.c_str(), errno, strerror(errno));
    }

    return retc;
  }

  //----------------------------------------------------------------------------
  //! Static function returning the statfs information for path or an empty
  //! pointer if the path cannot be statted
  //----------------------------------------------------------------------------
  static std::unique_ptr<Statfs> DoStatfs(const char* path) {
    std::unique_ptr<Statfs> sfs(new Statfs());
    if (!sfs->perform(path)) {
      return sfs;
    } else {
      return {};
    }
  }

  //----------------------------------------------------------------------------
  //! Check if path is the root of a mounted filesystem i.e. its device
  //! differs from the device of its parent or it is the root directory
  //----------------------------------------------------------------------------
  static bool IsMountPoint(const std::string& path) {
    struct stat self;
    struct stat parent;

    if (::stat(path.c_str(), &self) || !S_ISDIR(self.st_mode)) {
      return false;
    }

    std::string ppath = path;

    while ((ppath.length() > 1) && (ppath.back() == '/')) {
      ppath.pop_back();
    }

    ppath += "/..";

    if (::stat(ppath.c_str(), &parent)) {
      return false;
    }

    if (self.st_dev != parent.st_dev) {
      return true;
    }

    // the root directory is its own parent
    return (self.st_ino == parent.st_ino);
  }

private:
  struct statfs statFs; //< the stored statfs struct
};

SOWERCOMMONNAMESPACE_END

#endif
