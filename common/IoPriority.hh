// ----------------------------------------------------------------------
//! @file: IoPriority.hh
//! @author: Andreas Joachim Peters <andreas.joachim.peters@cern.ch>
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2021 CERN/Switzerland                                  *
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

#include "common/Namespace.hh"
#include <stdlib.h>
#include <string>
#ifndef __APPLE__
#include <sys/syscall.h>
#include <unistd.h>
#endif

SOWERCOMMONNAMESPACE_BEGIN

/*
 * Gives us 8 prio classes with 13-bits of data for each class
 */

#define IOPRIO_BITS             (16)
#define IOPRIO_CLASS_SHIFT      (13)
#define IOPRIO_PRIO_MASK        ((1UL << IOPRIO_CLASS_SHIFT) - 1)

#define IOPRIO_PRIO_CLASS(mask) ((mask) >> IOPRIO_CLASS_SHIFT)
#define IOPRIO_PRIO_DATA(mask)  ((mask) & IOPRIO_PRIO_MASK)
#define IOPRIO_PRIO_VALUE(class, data)  (((class) << IOPRIO_CLASS_SHIFT) | data)

/*
 * These are the io priority groups as implemented by CFQ. RT is the realtime
 * class, it always gets premium service. BE is the best-effort scheduling
 * class, the default for any process. IDLE is the idle scheduling class, it
 * is only served when no one else is using the disk.
 */

enum {
  IOPRIO_CLASS_NONE,
  IOPRIO_CLASS_RT,
  IOPRIO_CLASS_BE,
  IOPRIO_CLASS_IDLE,
};

enum {
  IOPRIO_WHO_PROCESS = 1,
  IOPRIO_WHO_PGRP,
  IOPRIO_WHO_USER,
};

//! marker for 'do not touch the inherited io priority'
static constexpr int kIoPriorityUnset = -1;

static inline int
ioprio_set(int which, int ioprio)
{
#ifdef __APPLE__
  return 0;
#else
  return syscall(SYS_ioprio_set, which, 0, ioprio);
#endif
}

static inline int
ioprio_class(const std::string& c)
{
  if (c == "idle") {
    return IOPRIO_CLASS_IDLE;
  } else if (c == "be") {
    return IOPRIO_CLASS_BE;
  } else if (c == "rt") {
    return IOPRIO_CLASS_RT;
  } else {
    return IOPRIO_CLASS_NONE;
  }
}

static inline int
ioprio_value(const std::string& v)
{
  if (v.length()) {
    int level = std::atoi(v.c_str());

    if ((level < 0) || (level > 7)) {
      return 0;
    } else {
      return level;
    }
  } else {
    return 0;
  }
}

//------------------------------------------------------------------------------
//! Parse an io priority definition '<class>[:<level>]' e.g. idle, be:4, rt:0
//!
//! @param spec definition, 'none' or empty leaves the priority unset
//! @param iopriority returned IOPRIO_PRIO_VALUE or kIoPriorityUnset
//!
//! @return true if the definition is valid
//------------------------------------------------------------------------------
static inline bool
ioprio_parse(const std::string& spec, int& iopriority)
{
  iopriority = kIoPriorityUnset;

  if (spec.empty() || (spec == "none")) {
    return true;
  }

  std::string cls = spec;
  std::string level;
  auto pos = spec.find(':');

  if (pos != std::string::npos) {
    cls = spec.substr(0, pos);
    level = spec.substr(pos + 1);

    if (level.empty() || (level.find_first_not_of("0123456789") != std::string::npos)) {
      return false;
    }
  }

  int c = ioprio_class(cls);

  if (c == IOPRIO_CLASS_NONE) {
    return false;
  }

  iopriority = IOPRIO_PRIO_VALUE(c, ioprio_value(level));
  return true;
}

SOWERCOMMONNAMESPACE_END
