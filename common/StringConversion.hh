// ----------------------------------------------------------------------
// File: StringConversion.hh
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

#ifndef __SOWERCOMMON_STRINGCONVERSION_HH__
#define __SOWERCOMMON_STRINGCONVERSION_HH__

#include "common/Namespace.hh"
#include <stdint.h>
#include <chrono>
#include <map>
#include <string>
#include <vector>

SOWERCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Static helper class with convenience functions for string tokenizing,
//! value2string and split functions.
//------------------------------------------------------------------------------
class StringConversion
{
public:
  // ---------------------------------------------------------------------------
  /**
   * Tokenize a string
   *
   * @param str string to be tokenized
   * @param tokens  returned list of separated string tokens
   * @param delimiters delimiter used for tokenizing
   */
  // ---------------------------------------------------------------------------
  static void Tokenize(const std::string& str,
                       std::vector<std::string>& tokens,
                       const std::string& delimiters = " ");

  // ---------------------------------------------------------------------------
  /**
   * Split a 'key<split>value' definition into key + value
   *
   * @param keyval key-val string
   * @param key returned key
   * @param value returned value
   * @param split split string
   *
   * @return true if parsing ok, false if wrong format
   */
  // ---------------------------------------------------------------------------
  static bool SplitKeyValue(const std::string& keyval, std::string& key,
                            std::string& value, const std::string& split = "=");

  // ---------------------------------------------------------------------------
  /**
   * Convert a readable size string e.g. 84G, 1.5TB, 4096 into bytes. Factors
   * are decimal (k=1000).
   *
   * @param sizestring input string
   * @param out parsed number of bytes
   *
   * @return true if the string could be parsed, otherwise false
   */
  // ---------------------------------------------------------------------------
  static bool GetSizeFromString(const std::string& sizestring, uint64_t& out);

  // ---------------------------------------------------------------------------
  /**
   * Convert a duration string e.g. 180, 3min, 20m, 2h, 1d into seconds. A
   * bare number is interpreted as seconds.
   *
   * @param durstring input string
   * @param out parsed duration
   *
   * @return true if the string could be parsed, otherwise false
   */
  // ---------------------------------------------------------------------------
  static bool GetDurationFromString(const std::string& durstring,
                                    std::chrono::seconds& out);

  // ---------------------------------------------------------------------------
  /**
   * Convert a number of bytes into a readable string e.g. 84.00 GB
   *
   * @param sizestring returned string
   * @param insize number of bytes
   * @param unit unit appended to the decimal prefix
   *
   * @return sizestring.c_str()
   */
  // ---------------------------------------------------------------------------
  static const char* GetReadableSizeString(std::string& sizestring,
      unsigned long long insize, const char* unit);

  // ---------------------------------------------------------------------------
  /**
   * Convert a duration into the '<d>d <h>h <m>m <s>s' representation
   */
  // ---------------------------------------------------------------------------
  static std::string GetReadableDuration(std::chrono::seconds duration);

  // ---------------------------------------------------------------------------
  //! Lower-case copy of the input
  // ---------------------------------------------------------------------------
  static std::string ToLower(std::string is);

  // ---------------------------------------------------------------------------
  //! Strip leading and trailing white space
  // ---------------------------------------------------------------------------
  static std::string Trim(const std::string& is);

  // ---------------------------------------------------------------------------
  /**
   * Interpret a configuration flag
   *
   * @param value input string (true/false, yes/no, on/off, 1/0)
   * @param out parsed flag
   *
   * @return true if the value is a known flag spelling
   */
  // ---------------------------------------------------------------------------
  static bool GetBoolFromString(const std::string& value, bool& out);

  // ---------------------------------------------------------------------------
  /**
   * Quote an argument so that /bin/sh passes it through unchanged
   */
  // ---------------------------------------------------------------------------
  static std::string ShellQuote(const std::string& arg);

private:
  StringConversion() = delete;
};

SOWERCOMMONNAMESPACE_END

#endif
