// ----------------------------------------------------------------------
// File: DestinationWorkerTest.cc
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
#include "mover/DestinationWorker.hh"
#include "mover/RunStats.hh"
#include "mover/WorkQueue.hh"
#include "common/ShutdownSignal.hh"

using namespace sower::mover;
using namespace sower::mover::test;

//------------------------------------------------------------------------------
//! Single destination worker over a staging directory with scripted probe
//! and executor
//------------------------------------------------------------------------------
class DestinationWorkerTest : public ::testing::Test
{
protected:
  DestinationWorkerTest():
    mExecutor(&mProbe), mShutdown(true),
    mConfig(MakeTestConfig(mTmp.MakeDir("staging"), {"X"}))
  {
    mProbe.SetFree("X", kLargeCapacity);
  }

  std::string AddPlot(const std::string& name, size_t size)
  {
    std::string path = mTmp.MakeFile("staging/" + name, size);
    mQueue.Enqueue(PlotFile(path));
    return path;
  }

  DestinationWorker::State Run()
  {
    return Run(mConfig.mDestinations.front(), mProbe);
  }

  DestinationWorker::State Run(const Destination& dest,
                               IDestinationProbe& probe)
  {
    DestinationWorker worker(dest, mQueue, probe, mExecutor, mStats, mShutdown,
                             mConfig);
    DestinationWorker::State state = worker.DoIt();
    EXPECT_EQ(worker.GetState(), state);
    mMoved = worker.GetMoved();
    mDeferred = worker.GetDeferred();
    return state;
  }

  TempDir mTmp;
  FakeProbe mProbe;
  FakeExecutor mExecutor;
  RunStats mStats;
  sower::common::ShutdownSignal mShutdown;
  MoverConfig mConfig;
  WorkQueue mQueue;
  uint64_t mMoved {0};
  uint64_t mDeferred {0};
};

TEST_F(DestinationWorkerTest, DeliversEverything)
{
  AddPlot("a.plot", 1000);
  AddPlot("b.plot", 2000);
  ASSERT_EQ(Run(), DestinationWorker::State::Drained);
  ASSERT_EQ(mMoved, 2u);
  ASSERT_EQ(mExecutor.Delivered("X").size(), 2u);
  ASSERT_TRUE(mQueue.IsDrained());
  ASSERT_EQ(mStats.GetPlotsMoved(), 2u);
  ASSERT_EQ(mStats.GetBytesMoved(), 3000u);
}

TEST_F(DestinationWorkerTest, ExhaustedRequeues)
{
  std::string path = AddPlot("a.plot", 1000);
  mExecutor.Script("X", {23});
  ASSERT_EQ(Run(), DestinationWorker::State::Exhausted);
  ASSERT_EQ(mMoved, 0u);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
  ASSERT_EQ(mQueue.GetInTransitCount(), 0u);
  ASSERT_TRUE(PlotFile(path).Exists());
  // file level errors do not back off
  ASSERT_EQ(mShutdown.GetSleepCount(), 0u);
  ASSERT_EQ(mStats.GetPlotsMoved(), 0u);
}

TEST_F(DestinationWorkerTest, UnknownErrorBacksOff)
{
  std::string path = AddPlot("a.plot", 1000);
  mExecutor.Script("X", {12});
  ASSERT_EQ(Run(), DestinationWorker::State::Exhausted);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
  ASSERT_TRUE(PlotFile(path).Exists());
  ASSERT_EQ(mShutdown.GetSleepCount(), 1u);
  ASSERT_EQ(mShutdown.GetSleptTime(), std::chrono::milliseconds(180000));
}

TEST_F(DestinationWorkerTest, RetryableFaultDefers)
{
  std::string first = AddPlot("a.plot", 1000);
  std::string second = AddPlot("b.plot", 1000);
  mExecutor.Script("X", {10});
  ASSERT_EQ(Run(), DestinationWorker::State::Drained);
  ASSERT_EQ(mMoved, 1u);
  ASSERT_EQ(mDeferred, 1u);
  // the deferred plot leaves the queue but stays on the source
  ASSERT_TRUE(mQueue.IsDrained());
  ASSERT_TRUE(PlotFile(first).Exists());
  ASSERT_FALSE(PlotFile(second).Exists());
}

TEST_F(DestinationWorkerTest, VanishedPlotSkipped)
{
  mQueue.Enqueue(PlotFile(mTmp.Path() + "/staging/gone.plot"));
  AddPlot("b.plot", 1000);
  ASSERT_EQ(Run(), DestinationWorker::State::Drained);
  ASSERT_EQ(mMoved, 1u);
  ASSERT_EQ(mExecutor.Attempts("X"), 1u);
  ASSERT_TRUE(mQueue.IsDrained());
}

TEST_F(DestinationWorkerTest, Unreachable)
{
  std::string path = AddPlot("a.plot", 1000);
  mProbe.SetReachable("X", false);
  ASSERT_EQ(Run(), DestinationWorker::State::Unreachable);
  ASSERT_EQ(mExecutor.Attempts("X"), 0u);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
  ASSERT_TRUE(PlotFile(path).Exists());
}

TEST_F(DestinationWorkerTest, NoSpace)
{
  AddPlot("a.plot", 1000);
  AddPlot("b.plot", 1000);
  mProbe.SetFree("X", 1500);
  ASSERT_EQ(Run(), DestinationWorker::State::NoSpace);
  ASSERT_EQ(mMoved, 1u);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
  ASSERT_EQ(mExecutor.Attempts("X"), 1u);
}

TEST_F(DestinationWorkerTest, UnavailableSpace)
{
  AddPlot("a.plot", 1000);
  mProbe.SetUnavailable("X");
  ASSERT_EQ(Run(), DestinationWorker::State::NoSpace);
  ASSERT_EQ(mExecutor.Attempts("X"), 0u);
}

TEST_F(DestinationWorkerTest, Interrupted)
{
  AddPlot("a.plot", 1000);
  mShutdown.RequestShutdown();
  ASSERT_EQ(Run(), DestinationWorker::State::Interrupted);
  ASSERT_EQ(mExecutor.Attempts("X"), 0u);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
}

TEST_F(DestinationWorkerTest, UnknownCapacity)
{
  AddPlot("a.plot", 1000);
  mProbe.ClearFree("X");
  ASSERT_EQ(Run(), DestinationWorker::State::NoSpace);
  ASSERT_EQ(mExecutor.Attempts("X"), 0u);
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
}

TEST_F(DestinationWorkerTest, RemoteWithoutStatPath)
{
  std::string path = AddPlot("a.plot", 1000);
  Destination remote("farm01::plots");
  mConfig.mTransferCommand = "true";
  DestinationProbe probe(mConfig);
  // a destination that cannot be statted is not admitted by default
  ASSERT_EQ(Run(remote, probe), DestinationWorker::State::NoSpace);
  ASSERT_EQ(mExecutor.Attempts("farm01::plots"), 0u);
  ASSERT_TRUE(PlotFile(path).Exists());
  ASSERT_EQ(mQueue.GetPendingCount(), 1u);
  mConfig.mAdmitUnmetered = true;
  ASSERT_EQ(Run(remote, probe), DestinationWorker::State::Drained);
  ASSERT_EQ(mExecutor.Delivered("farm01::plots").size(), 1u);
  ASSERT_FALSE(PlotFile(path).Exists());
}

TEST(DestinationWorker, StateNames)
{
  using State = DestinationWorker::State;
  ASSERT_STREQ(DestinationWorker::StateToString(State::Running), "running");
  ASSERT_STREQ(DestinationWorker::StateToString(State::Drained), "drained");
  ASSERT_STREQ(DestinationWorker::StateToString(State::Unreachable),
               "unreachable");
  ASSERT_STREQ(DestinationWorker::StateToString(State::NoSpace), "no-space");
  ASSERT_STREQ(DestinationWorker::StateToString(State::Exhausted), "exhausted");
  ASSERT_STREQ(DestinationWorker::StateToString(State::Interrupted),
               "interrupted");
}
