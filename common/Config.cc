// ----------------------------------------------------------------------
// File: Config.cc
// Author: Andreas-Joachim Peters - CERN
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

#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fstream>

SOWERCOMMONNAMESPACE_BEGIN

//----------------------------------------------------------------------------
//! Load a configuration file
//!
//! @return true if loaded successfully, otherwise set error code/msg and false
//----------------------------------------------------------------------------
bool
Config::Load(const std::string& path, bool reset)
{
  sower_static_info("msg=\"loading configuration\" path=%s", path.c_str());
  struct stat buf;

  if (stat(path.c_str(), &buf)) {
    errcode = errno;
    errorMessage = "error: unable to load '" + path + "' : ";
    errorMessage += strerror(errno);
    return false;
  }

  std::ifstream file(path);

  if (!file.is_open()) {
    errcode = EIO;
    errorMessage = "error: unable to open '" + path + "'";
    return false;
  }

  std::stringstream in;
  in << file.rdbuf();
  return LoadFromString(in.str(), reset);
}

//----------------------------------------------------------------------------
//! Load configuration from a string
//!
//! @return true if parsed successfully, otherwise set error code/msg and false
//----------------------------------------------------------------------------
bool
Config::LoadFromString(const std::string& in, bool reset)
{
  if (reset) {
    // wipe previous configuration
    conf.clear();
    errcode = 0 ;
    errorMessage = "";
  }

  std::istringstream f(in);
  std::string line;
  std::string chapter;

  while (std::getline(f, line)) {
    std::string p = ParseChapter(line);

    if (p.empty()) {
      p = ParseSection(line);

      if (!p.empty()) {
        if (!chapter.empty()) {
          // store in chapter
          conf[chapter].push_back(p);
        } else {
          errcode = EINVAL;
          errorMessage = "error: no chapter header in config file";
          return false;
        }
      }
    } else {
      chapter = p;
      conf[chapter].size();
    }
  }

  return true;
}

//----------------------------------------------------------------------------
//! Parse and possibly return a chapter entry
//!
//! @return parsed chapter entry or empty if not applicable
//----------------------------------------------------------------------------
std::string
Config::ParseChapter(const std::string& line)
{
  std::string pline = StringConversion::Trim(line);

  if (pline.size() < 2) {
    return "";
  }

  if ((pline.front() == '[') && (pline.back() == ']')) {
    return StringConversion::Trim(pline.substr(1, pline.size() - 2));
  }

  return "";
}

//----------------------------------------------------------------------------
//! Parse and possibly return a section entry
//!
//! @return parsed section entry or empty if not applicable
//----------------------------------------------------------------------------
std::string
Config::ParseSection(const std::string& line)
{
  std::string pline = StringConversion::Trim(line);

  // skip comments
  if (!pline.empty() && ((pline.front() == '#') || (pline.front() == ';'))) {
    return "";
  }

  return pline;
}

//----------------------------------------------------------------------------
//! AsMap
//!
//! return a map with the lines matching x=y
//----------------------------------------------------------------------------
std::map<std::string, std::string>
Config::AsMap(const char* chapter) const
{
  std::map<std::string, std::string> map;
  auto it = chapter ? conf.find(chapter) : conf.end();

  if (it != conf.end()) {
    for (const auto& line : it->second) {
      std::string key, value;

      if (StringConversion::SplitKeyValue(line, key, value, "=")) {
        map[key] = value;
      }
    }
  }

  return map;
}

//----------------------------------------------------------------------------
//! Get <value> of line for a given key '<key> <value>'
//----------------------------------------------------------------------------
std::string
Config::GetValueByKey(const char* chapter, const char* key) const
{
  std::string skey = key;
  auto it = conf.find(chapter);

  if (it != conf.end()) {
    for (const auto& line : it->second) {
      if ((line.length() > skey.length()) &&
          (line.substr(0, skey.length()) == skey) &&
          ((line[skey.length()] == ' ') || (line[skey.length()] == '='))) {
        return StringConversion::Trim(line.substr(skey.length() + 1));
      }
    }
  }

  return "";
}

SOWERCOMMONNAMESPACE_END
