// ----------------------------------------------------------------------
// File: Config.hh
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

#ifndef SOWERCOMMON_CONFIG_HH
#define SOWERCOMMON_CONFIG_HH

#include "common/Namespace.hh"
#include <sstream>
#include <string>
#include <map>
#include <vector>

SOWERCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// systemd style configuration file support
//
// [chapter]
// line
// key=value
//------------------------------------------------------------------------------
class Config {
public:
  //----------------------------------------------------------------------------
  // Default constructor
  //----------------------------------------------------------------------------
  Config() : errcode(0) {}

  //----------------------------------------------------------------------------
  // Loader from a file path
  //----------------------------------------------------------------------------
  bool Load(const std::string& path, bool reset = true);

  //----------------------------------------------------------------------------
  // Loader from an in-memory configuration text
  //----------------------------------------------------------------------------
  bool LoadFromString(const std::string& in, bool reset = true);

  //----------------------------------------------------------------------------
  // Parse and possibly return a chapter entry
  //----------------------------------------------------------------------------
  std::string ParseChapter(const std::string& line);

  //----------------------------------------------------------------------------
  // Parse and possibly return a section entry
  //----------------------------------------------------------------------------
  std::string ParseSection(const std::string& line);

  //----------------------------------------------------------------------------
  // Is status ok?
  //----------------------------------------------------------------------------
  bool ok() const {
    return (errcode == 0);
  }

  //----------------------------------------------------------------------------
  // Get errorcode
  //----------------------------------------------------------------------------
  int getErrc() const {
    return errcode;
  }

  //----------------------------------------------------------------------------
  // Get error message
  //----------------------------------------------------------------------------
  std::string getMsg() const {
    return errorMessage;
  }

  //----------------------------------------------------------------------------
  // To string, including error code
  //----------------------------------------------------------------------------
  std::string toString() const {
    std::ostringstream ss;
    ss << "(" << errcode << "): " << errorMessage;
    return ss.str();
  }

  //----------------------------------------------------------------------------
  // Implicit conversion to boolean: Same value as ok()
  //----------------------------------------------------------------------------
  operator bool() const {
    return ok();
  }

  typedef std::vector<std::string> ConfigSection;
  typedef std::map<std::string, ConfigSection> ConfigChapter;

  //----------------------------------------------------------------------------
  // Overloaded [] operator
  //----------------------------------------------------------------------------
  const ConfigSection& operator[](const char* i) const {
    auto it = conf.find(i);

    if (it != conf.end()) {
      return it->second;
    } else {
      static ConfigSection none;
      return none;
    }
  }

  //----------------------------------------------------------------------------
  // Config Dumper
  //----------------------------------------------------------------------------
  std::string Dump(const char* chapter = 0) const {
    std::string out;

    for (const auto& c : conf) {
      if (chapter && (c.first != chapter)) {
        continue;
      }

      out += "[";
      out += c.first;
      out += "]\n";

      for (const auto& it : c.second) {
        out += it;
        out += "\n";
      }
    }

    return out;
  }

  //----------------------------------------------------------------------------
  // Test for configuration chapter
  //----------------------------------------------------------------------------
  bool Has(const char* chapter) const {
    return conf.count(chapter);
  }

  //----------------------------------------------------------------------------
  // Get <value> of line for a given key '<key> <value>'
  //----------------------------------------------------------------------------
  std::string GetValueByKey(const char* chapter, const char* key) const;

  //----------------------------------------------------------------------------
  // AsMap
  //----------------------------------------------------------------------------
  std::map<std::string, std::string> AsMap(const char* chapter) const;

private:
  int errcode;
  std::string errorMessage;
  ConfigChapter conf;
};

SOWERCOMMONNAMESPACE_END

#endif
