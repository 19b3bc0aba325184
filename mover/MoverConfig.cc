// ----------------------------------------------------------------------
// File: MoverConfig.cc
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

#include "mover/MoverConfig.hh"
#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <map>
#include <sstream>

SOWERMOVERNAMESPACE_BEGIN

using sower::common::StringConversion;

namespace
{
//------------------------------------------------------------------------------
// Helper collecting the typed values of a chapter and the first error
//------------------------------------------------------------------------------
class ChapterReader
{
public:
  ChapterReader(const sower::common::Config& cfg, const char* chapter):
    mChapter(chapter), mMap(cfg.AsMap(chapter))
  {}

  bool GetString(const char* key, std::string& out)
  {
    auto it = mMap.find(key);

    if (it != mMap.end()) {
      out = it->second;
    }

    return true;
  }

  bool GetBool(const char* key, bool& out, std::string& err)
  {
    auto it = mMap.find(key);

    if ((it == mMap.end()) || it->second.empty()) {
      return true;
    }

    if (!StringConversion::GetBoolFromString(it->second, out)) {
      err = Where(key) + " is not a boolean: '" + it->second + "'";
      return false;
    }

    return true;
  }

  bool GetDuration(const char* key, std::chrono::seconds& out, std::string& err)
  {
    auto it = mMap.find(key);

    if ((it == mMap.end()) || it->second.empty()) {
      return true;
    }

    if (!StringConversion::GetDurationFromString(it->second, out)) {
      err = Where(key) + " is not a duration: '" + it->second + "'";
      return false;
    }

    return true;
  }

  bool GetSize(const char* key, uint64_t& out, std::string& err)
  {
    auto it = mMap.find(key);

    if ((it == mMap.end()) || it->second.empty()) {
      return true;
    }

    if (!StringConversion::GetSizeFromString(it->second, out) || (out == 0)) {
      err = Where(key) + " is not a valid size: '" + it->second + "'";
      return false;
    }

    return true;
  }

  bool GetNumber(const char* key, uint32_t& out, uint32_t min, uint32_t max,
                 std::string& err)
  {
    auto it = mMap.find(key);

    if ((it == mMap.end()) || it->second.empty()) {
      return true;
    }

    const std::string& value = it->second;

    if ((value.length() > 9) ||
        (value.find_first_not_of("0123456789") != std::string::npos)) {
      err = Where(key) + " is not a number: '" + value + "'";
      return false;
    }

    unsigned long number = std::stoul(value);

    if ((number < min) || (number > max)) {
      err = Where(key) + " out of range [" + std::to_string(min) + ", " +
            std::to_string(max) + "]: " + value;
      return false;
    }

    out = static_cast<uint32_t>(number);
    return true;
  }

private:
  std::string Where(const char* key) const
  {
    return std::string("[") + mChapter + "] " + key;
  }

  std::string mChapter;
  std::map<std::string, std::string> mMap;
};
}

//------------------------------------------------------------------------------
// Build and validate the configuration
//------------------------------------------------------------------------------
bool
MoverConfig::FromConfig(const sower::common::Config& cfg, MoverConfig& out,
                        std::string& err)
{
  MoverConfig conf;
  err.clear();

  if (!cfg.ok()) {
    err = cfg.getMsg();
    return false;
  }

  for (const auto& line : cfg["sources"]) {
    conf.mSources.push_back(line);
  }

  if (conf.mSources.empty()) {
    err = "no staging directory configured in [sources]";
    return false;
  }

  for (const auto& line : cfg["destinations"]) {
    Destination dest;

    if (!Destination::Parse(line, dest, err)) {
      return false;
    }

    conf.mDestinations.push_back(dest);
  }

  if (conf.mDestinations.empty()) {
    err = "no destination configured in [destinations]";
    return false;
  }

  ChapterReader transfer(cfg, "transfer");
  std::string ionice = conf.mIoPriorityName;
  transfer.GetString("command", conf.mTransferCommand);
  transfer.GetString("bwlimit", conf.mBwLimit);
  transfer.GetString("ionice", ionice);
  transfer.GetString("test-artifact", conf.mTestArtifact);

  if (!transfer.GetBool("shuffle", conf.mShuffle, err) ||
      !transfer.GetBool("progress", conf.mProgress, err) ||
      !transfer.GetBool("require-mount", conf.mRequireMount, err) ||
      !transfer.GetBool("admit-unmetered", conf.mAdmitUnmetered, err) ||
      !transfer.GetDuration("probe-timeout", conf.mProbeTimeout, err)) {
    return false;
  }

  if (conf.mTransferCommand.empty()) {
    err = "[transfer] command must not be empty";
    return false;
  }

  if (!conf.mBwLimit.empty() &&
      (conf.mBwLimit.find_first_not_of("0123456789.kKmMgG") !=
       std::string::npos)) {
    err = "[transfer] bwlimit is not a valid rate: '" + conf.mBwLimit + "'";
    return false;
  }

  if (!sower::common::ioprio_parse(ionice, conf.mIoPriority)) {
    err = "[transfer] ionice is not a valid io priority: '" + ionice + "'";
    return false;
  }

  conf.mIoPriorityName = ionice.empty() ? "none" : ionice;
  ChapterReader backoff(cfg, "backoff");

  if (!backoff.GetDuration("short", conf.mShortBackoff, err) ||
      !backoff.GetDuration("long", conf.mLongBackoff, err) ||
      !backoff.GetDuration("settle", conf.mSettleDelay, err)) {
    return false;
  }

  ChapterReader plotter(cfg, "plotter");
  plotter.GetString("command", conf.mPlotterCommand);
  plotter.GetString("farmer-key", conf.mFarmerKey);
  plotter.GetString("contract-key", conf.mContractKey);
  plotter.GetString("dest", conf.mPlotDir);
  plotter.GetString("mode", conf.mPlotMode);

  if (!plotter.GetNumber("count", conf.mPlotCount, 1, 100000, err) ||
      !plotter.GetNumber("compress", conf.mCompression, 0, 9, err) ||
      !plotter.GetSize("plot-size", conf.mPlotSize, err)) {
    return false;
  }

  if (conf.mPlotterCommand.empty()) {
    err = "[plotter] command must not be empty";
    return false;
  }

  if (conf.mPlotDir.empty()) {
    conf.mPlotDir = conf.mSources.front();
  }

  ChapterReader logging(cfg, "logging");
  logging.GetString("level", conf.mLogLevel);

  if (sower::common::Logging::GetInstance().GetPriorityByString(
        conf.mLogLevel.c_str()) == -1) {
    err = "[logging] unknown level '" + conf.mLogLevel + "'";
    return false;
  }

  out = conf;
  return true;
}

//------------------------------------------------------------------------------
// Human readable summary
//------------------------------------------------------------------------------
std::string
MoverConfig::Dump() const
{
  std::ostringstream oss;
  std::string sizestr;
  oss << "sources=";

  for (size_t i = 0; i < mSources.size(); ++i) {
    oss << (i ? "," : "") << mSources[i];
  }

  oss << "\ndestinations=";

  for (size_t i = 0; i < mDestinations.size(); ++i) {
    oss << (i ? "," : "") << mDestinations[i].GetAddress();

    if (!mDestinations[i].GetStatPath().empty()) {
      oss << "(statpath=" << mDestinations[i].GetStatPath() << ")";
    }
  }

  oss << "\ntransfer=" << mTransferCommand
      << " shuffle=" << (mShuffle ? "true" : "false")
      << " bwlimit=" << (mBwLimit.empty() ? "none" : mBwLimit)
      << " ionice=" << mIoPriorityName
      << " require-mount=" << (mRequireMount ? "true" : "false")
      << " admit-unmetered=" << (mAdmitUnmetered ? "true" : "false")
      << "\nbackoff short=" << mShortBackoff.count() << "s long="
      << mLongBackoff.count() << "s settle=" << mSettleDelay.count() << "s"
      << "\nplotter=" << mPlotterCommand << " mode=" << mPlotMode
      << " count=" << mPlotCount << " compress=" << mCompression
      << " dest=" << mPlotDir << " plot-size="
      << StringConversion::GetReadableSizeString(sizestr, mPlotSize, "B");
  return oss.str();
}

SOWERMOVERNAMESPACE_END
