// ----------------------------------------------------------------------
// File: DistributionSchedulerTest.cc
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

#include "MoverTestsUtils.hh"
#include "mover/DistributionScheduler.hh"
#include "mover/RunStats.hh"
#include "common/ShutdownSignal.hh"
#include <numeric>

using namespace sower::mover;
using namespace sower::mover::test;

//------------------------------------------------------------------------------
//! Scheduler over a temporary staging directory with fake probe and executor
//------------------------------------------------------------------------------
class DistributionSchedulerTest : public ::testing::Test
{
protected:
  DistributionSchedulerTest():
    mExecutor(&mProbe), mShutdown(true), mStaging(mTmp.MakeDir("staging"))
  {}

  void Configure(const std::vector<std::string>& dests)
  {
    mConfig = MakeTestConfig(mStaging, dests);

    for (const auto& addr : dests) {
      mProbe.SetFree(addr, kLargeCapacity);
    }

    mScheduler.reset(new DistributionScheduler(mConfig, mProbe, mExecutor,
                     mStats, mShutdown));
  }

  std::vector<std::string> AddPlots(size_t count, size_t size)
  {
    std::vector<std::string> paths;

    for (size_t i = 0; i < count; ++i) {
      paths.push_back(mTmp.MakeFile("staging/plot-" + std::to_string(i) +
                                    ".plot", size));
    }

    return paths;
  }

  static size_t CountExisting(const std::vector<std::string>& paths)
  {
    size_t count = 0;

    for (const auto& path : paths) {
      if (PlotFile(path).Exists()) {
        ++count;
      }
    }

    return count;
  }

  TempDir mTmp;
  FakeProbe mProbe;
  FakeExecutor mExecutor;
  RunStats mStats;
  sower::common::ShutdownSignal mShutdown;
  std::string mStaging;
  MoverConfig mConfig;
  std::unique_ptr<DistributionScheduler> mScheduler;
};

TEST_F(DistributionSchedulerTest, ScanFindsPlotsOnly)
{
  Configure({"X"});
  mConfig.mSources.push_back(mTmp.MakeDir("staging2"));
  mTmp.MakeFile("staging/b.plot", 10);
  mTmp.MakeFile("staging/a.plot", 10);
  mTmp.MakeFile("staging/a.plot.tmp", 10);
  mTmp.MakeFile("staging/.hidden.plot", 10);
  mTmp.MakeFile("staging/sub/c.plot", 10);
  mTmp.MakeFile("staging2/d.plot", 10);
  mConfig.mSources.push_back(mTmp.Path() + "/does-not-exist");
  WorkQueue queue;
  ASSERT_EQ(mScheduler->Scan(queue), 4u);
  auto pending = queue.GetPending();
  ASSERT_EQ(pending.size(), 4u);
  ASSERT_EQ(pending[0].GetName(), "a.plot");
  ASSERT_EQ(pending[1].GetName(), "b.plot");
  ASSERT_EQ(pending[2].GetName(), "c.plot");
  ASSERT_EQ(pending[3].GetName(), "d.plot");
  // a second scan does not duplicate queued plots
  ASSERT_EQ(mScheduler->Scan(queue), 0u);
}

TEST_F(DistributionSchedulerTest, NothingToMove)
{
  Configure({"X", "Y"});
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mDiscovered, 0u);
  ASSERT_EQ(result.mRemaining, 0u);
  ASSERT_EQ(mProbe.GetReachableCalls(), 0u);
  ASSERT_EQ(mScheduler->GetQueueSize(), 0u);
}

TEST_F(DistributionSchedulerTest, CapacityLimitsDelivery)
{
  Configure({"A", "B"});
  mProbe.SetFree("A", 25000);
  mProbe.SetFree("B", 5000);
  auto paths = AddPlots(3, 10000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mDiscovered, 3u);
  ASSERT_EQ(result.mMoved, 2u);
  ASSERT_EQ(result.mRemaining, 1u);
  ASSERT_EQ(result.mRemainingPaths.size(), 1u);
  ASSERT_FALSE(result.mInterrupted);
  ASSERT_EQ(mExecutor.Delivered("A").size(), 2u);
  ASSERT_EQ(mExecutor.Attempts("B"), 0u);
  ASSERT_EQ(CountExisting(paths), 1u);
  ASSERT_TRUE(PlotFile(result.mRemainingPaths[0]).Exists());
}

TEST_F(DistributionSchedulerTest, FileSystemFaultExcludesDestination)
{
  Configure({"X", "Y"});
  mExecutor.Script("X", {23});
  auto paths = AddPlots(3, 1000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved, 3u);
  ASSERT_EQ(result.mRemaining, 0u);
  ASSERT_TRUE(mExecutor.Delivered("X").empty());
  ASSERT_LE(mExecutor.Attempts("X"), 1u);
  ASSERT_EQ(mExecutor.Delivered("Y").size(), 3u);
  ASSERT_EQ(CountExisting(paths), 0u);
}

TEST_F(DistributionSchedulerTest, AllUnreachable)
{
  Configure({"X", "Y", "Z"});

  for (const auto& addr : {"X", "Y", "Z"}) {
    mProbe.SetReachable(addr, false);
  }

  auto paths = AddPlots(5, 1000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved, 0u);
  ASSERT_EQ(result.mRemaining, 5u);
  ASSERT_EQ(result.mRemainingPaths.size(), 5u);
  ASSERT_EQ(CountExisting(paths), 5u);
  ASSERT_EQ(mExecutor.TotalDelivered(), 0u);
}

TEST_F(DistributionSchedulerTest, EveryPlotDeliveredOnce)
{
  std::vector<std::string> dests {"D1", "D2", "D3", "D4"};
  Configure(dests);
  mConfig.mShuffle = true;
  auto paths = AddPlots(20, 100);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mDiscovered, 20u);
  ASSERT_EQ(result.mMoved, 20u);
  ASSERT_EQ(result.mRemaining, 0u);
  ASSERT_EQ(mStats.GetPlotsMoved(), 20u);
  std::multiset<std::string> delivered;

  for (const auto& addr : dests) {
    for (const auto& path : mExecutor.Delivered(addr)) {
      delivered.insert(path);
    }
  }

  ASSERT_EQ(delivered.size(), 20u);

  for (const auto& path : paths) {
    ASSERT_EQ(delivered.count(path), 1u) << path;
  }

  ASSERT_EQ(CountExisting(paths), 0u);
}

TEST_F(DistributionSchedulerTest, RetryableFaultKeepsPlot)
{
  Configure({"X"});
  mExecutor.Script("X", {10});
  auto paths = AddPlots(2, 1000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved, 1u);
  ASSERT_EQ(result.mDeferred, 1u);
  ASSERT_EQ(result.mRemaining, 0u);
  ASSERT_EQ(CountExisting(paths), 1u);
  // the next pass picks the deferred plot up again
  result = mScheduler->Drain();
  ASSERT_EQ(result.mDiscovered, 1u);
  ASSERT_EQ(result.mMoved, 1u);
  ASSERT_EQ(CountExisting(paths), 0u);
}

TEST_F(DistributionSchedulerTest, CapacityNeverExceeded)
{
  std::map<std::string, uint64_t> capacity {
    {"A", 25000}, {"B", 15000}, {"C", 35000}
  };
  Configure({"A", "B", "C"});

  for (const auto& it : capacity) {
    mProbe.SetFree(it.first, it.second);
  }

  for (size_t i = 0; i < 10; ++i) {
    mTmp.MakeFile("staging/plot-" + std::to_string(i) + ".plot",
                  4000 + 1000 * i);
  }

  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved + result.mRemaining, 10u);
  uint64_t delivered_total = 0;

  for (const auto& it : capacity) {
    auto sizes = mExecutor.DeliveredSizes(it.first);
    uint64_t sum = std::accumulate(sizes.begin(), sizes.end(), 0ull);
    ASSERT_LE(sum, it.second) << it.first;
    delivered_total += sum;
  }

  ASSERT_EQ(mStats.GetBytesMoved(), delivered_total);
}

TEST_F(DistributionSchedulerTest, ShutdownInterruptsPass)
{
  Configure({"X", "Y"});
  auto paths = AddPlots(4, 1000);
  mShutdown.RequestShutdown();
  DrainResult result = mScheduler->Drain();
  ASSERT_TRUE(result.mInterrupted);
  ASSERT_EQ(result.mDiscovered, 4u);
  ASSERT_EQ(result.mMoved, 0u);
  ASSERT_EQ(result.mRemaining, 4u);
  ASSERT_EQ(CountExisting(paths), 4u);
}

TEST_F(DistributionSchedulerTest, UnknownCapacityNotAdmitted)
{
  Configure({"A", "B"});
  mProbe.ClearFree("B");
  auto paths = AddPlots(3, 1000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved, 3u);
  ASSERT_EQ(result.mRemaining, 0u);
  ASSERT_EQ(mExecutor.Delivered("A").size(), 3u);
  ASSERT_EQ(mExecutor.Attempts("B"), 0u);
  ASSERT_EQ(CountExisting(paths), 0u);
}

TEST_F(DistributionSchedulerTest, NoDestinationCanBeStatted)
{
  Configure({"A", "B"});
  mProbe.ClearFree("A");
  mProbe.ClearFree("B");
  auto paths = AddPlots(2, 1000);
  DrainResult result = mScheduler->Drain();
  ASSERT_EQ(result.mMoved, 0u);
  ASSERT_EQ(result.mRemaining, 2u);
  ASSERT_EQ(CountExisting(paths), 2u);
}
