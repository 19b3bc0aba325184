// ----------------------------------------------------------------------
// File: StringConversion.cc
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

#include "common/StringConversion.hh"
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>
#include <cctype>

SOWERCOMMONNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Parse a non-negative decimal number covering the whole string
//------------------------------------------------------------------------------
bool
ParseNumber(const std::string& number, double& out)
{
  if (number.empty() || (number[0] == '-') || (number[0] == '+')) {
    return false;
  }

  char* end = nullptr;
  errno = 0;
  out = strtod(number.c_str(), &end);
  return (errno == 0) && end && (*end == '\0');
}

//------------------------------------------------------------------------------
// Check if the string ends with the given suffix, case insensitive
//------------------------------------------------------------------------------
bool
EndsWith(const std::string& str, const std::string& suffix)
{
  if (str.length() < suffix.length()) {
    return false;
  }

  return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin(),
  [](char a, char b) {
    return std::tolower(a) == std::tolower(b);
  });
}
}

//------------------------------------------------------------------------------
// Tokenize a string
//------------------------------------------------------------------------------
void
StringConversion::Tokenize(const std::string& str,
                           std::vector<std::string>& tokens,
                           const std::string& delimiters)
{
  // Skip delimiters at the beginning
  std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
  // Find first "non-delimiter"
  std::string::size_type pos = str.find_first_of(delimiters, lastPos);

  while (std::string::npos != pos || std::string::npos != lastPos) {
    tokens.push_back(str.substr(lastPos, pos - lastPos));
    lastPos = str.find_first_not_of(delimiters, pos);
    pos = str.find_first_of(delimiters, lastPos);
  }
}

//------------------------------------------------------------------------------
// Split a key-value definition
//------------------------------------------------------------------------------
bool
StringConversion::SplitKeyValue(const std::string& keyval, std::string& key,
                                std::string& value, const std::string& split)
{
  auto equalpos = keyval.find(split);

  if (equalpos != std::string::npos) {
    key = Trim(keyval.substr(0, equalpos));
    value = Trim(keyval.substr(equalpos + split.length()));
    return true;
  } else {
    key = value = "";
    return false;
  }
}

//------------------------------------------------------------------------------
// Convert a readable size string into bytes
//------------------------------------------------------------------------------
bool
StringConversion::GetSizeFromString(const std::string& instring,
                                    uint64_t& out)
{
  std::string sizestring = Trim(instring);
  unsigned long long convfactor = 1ull;
  out = 0;

  if (sizestring.empty()) {
    return false;
  }

  if (EndsWith(sizestring, "B")) {
    sizestring.pop_back();
  }

  if (sizestring.empty()) {
    return false;
  }

  switch (std::toupper(sizestring.back())) {
  case 'E':
    convfactor = 1000ull * 1000ull * 1000ull * 1000ull * 1000ull * 1000ull;
    break;

  case 'P':
    convfactor = 1000ull * 1000ull * 1000ull * 1000ull * 1000ull;
    break;

  case 'T':
    convfactor = 1000ull * 1000ull * 1000ull * 1000ull;
    break;

  case 'G':
    convfactor = 1000ull * 1000ull * 1000ull;
    break;

  case 'M':
    convfactor = 1000ull * 1000ull;
    break;

  case 'K':
    convfactor = 1000ull;
    break;

  default:
    break;
  }

  if (convfactor > 1) {
    sizestring.pop_back();
  }

  double value = 0;

  if (!ParseNumber(sizestring, value)) {
    return false;
  }

  out = static_cast<uint64_t>(value * convfactor);
  return true;
}

//------------------------------------------------------------------------------
// Convert a duration string into seconds
//------------------------------------------------------------------------------
bool
StringConversion::GetDurationFromString(const std::string& instring,
                                        std::chrono::seconds& out)
{
  std::string durstring = Trim(instring);
  long long convfactor = 1ll;
  size_t suffix_len = 0;

  if (EndsWith(durstring, "min")) {
    convfactor = 60ll;
    suffix_len = 3;
  } else if (EndsWith(durstring, "s")) {
    suffix_len = 1;
  } else if (EndsWith(durstring, "m")) {
    convfactor = 60ll;
    suffix_len = 1;
  } else if (EndsWith(durstring, "h")) {
    convfactor = 3600ll;
    suffix_len = 1;
  } else if (EndsWith(durstring, "d")) {
    convfactor = 86400ll;
    suffix_len = 1;
  }

  durstring.erase(durstring.length() - suffix_len);
  double value = 0;

  if (!ParseNumber(durstring, value)) {
    return false;
  }

  out = std::chrono::seconds(static_cast<long long>(value * convfactor));
  return true;
}

//------------------------------------------------------------------------------
// Convert a number of bytes into a readable string
//------------------------------------------------------------------------------
const char*
StringConversion::GetReadableSizeString(std::string& sizestring,
                                        unsigned long long insize,
                                        const char* unit)
{
  char formsize[1024];

  if (insize >= 10000) {
    if (insize >= (1000 * 1000)) {
      if (insize >= (1000ll * 1000ll * 1000ll)) {
        if (insize >= (1000ll * 1000ll * 1000ll * 1000ll)) {
          if (insize >= (1000ll * 1000ll * 1000ll * 1000ll * 1000ll)) {
            // PB
            snprintf(formsize, sizeof(formsize), "%.02f P%s",
                     insize * 1.0 / (1000ll * 1000ll * 1000ll * 1000ll * 1000ll), unit);
          } else {
            // TB
            snprintf(formsize, sizeof(formsize), "%.02f T%s",
                     insize * 1.0 / (1000ll * 1000ll * 1000ll * 1000ll), unit);
          }
        } else {
          // GB
          snprintf(formsize, sizeof(formsize), "%.02f G%s",
                   insize * 1.0 / (1000ll * 1000ll * 1000ll), unit);
        }
      } else {
        // MB
        snprintf(formsize, sizeof(formsize), "%.02f M%s",
                 insize * 1.0 / (1000 * 1000), unit);
      }
    } else {
      snprintf(formsize, sizeof(formsize), "%.02f k%s", insize * 1.0 / (1000),
               unit);
    }
  } else {
    if (strlen(unit)) {
      snprintf(formsize, sizeof(formsize), "%llu %s", insize, unit);
    } else {
      snprintf(formsize, sizeof(formsize), "%llu", insize);
    }
  }

  sizestring = formsize;
  return sizestring.c_str();
}

//------------------------------------------------------------------------------
// Convert a duration into a readable string
//------------------------------------------------------------------------------
std::string
StringConversion::GetReadableDuration(std::chrono::seconds duration)
{
  long long total = duration.count();

  if (total < 0) {
    total = 0;
  }

  char out[128];
  snprintf(out, sizeof(out), "%lldd %lldh %lldm %llds", total / 86400,
           (total % 86400) / 3600, (total % 3600) / 60, total % 60);
  return out;
}

//------------------------------------------------------------------------------
// Lower-case copy of the input
//------------------------------------------------------------------------------
std::string
StringConversion::ToLower(std::string is)
{
  std::transform(is.begin(), is.end(), is.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return is;
}

//------------------------------------------------------------------------------
// Strip leading and trailing white space
//------------------------------------------------------------------------------
std::string
StringConversion::Trim(const std::string& is)
{
  const char* ws = " \t\r\n";
  auto start = is.find_first_not_of(ws);

  if (start == std::string::npos) {
    return "";
  }

  auto stop = is.find_last_not_of(ws);
  return is.substr(start, stop - start + 1);
}

//------------------------------------------------------------------------------
// Interpret a configuration flag
//------------------------------------------------------------------------------
bool
StringConversion::GetBoolFromString(const std::string& value, bool& out)
{
  std::string lvalue = ToLower(Trim(value));

  if ((lvalue == "1") || (lvalue == "true") || (lvalue == "yes") ||
      (lvalue == "on")) {
    out = true;
    return true;
  }

  if ((lvalue == "0") || (lvalue == "false") || (lvalue == "no") ||
      (lvalue == "off")) {
    out = false;
    return true;
  }

  return false;
}

//------------------------------------------------------------------------------
// Quote an argument for /bin/sh
//------------------------------------------------------------------------------
std::string
StringConversion::ShellQuote(const std::string& arg)
{
  if (!arg.empty() &&
      (arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "0123456789@%_+=:,./-") == std::string::npos)) {
    return arg;
  }

  std::string quoted = "'";

  for (auto c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }

  quoted += "'";
  return quoted;
}

SOWERCOMMONNAMESPACE_END
