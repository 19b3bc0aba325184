// ----------------------------------------------------------------------
// File: sowerd.cc
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

#include "mover/DestinationProbe.hh"
#include "mover/DistributionScheduler.hh"
#include "mover/MainLoop.hh"
#include "mover/MoverConfig.hh"
#include "mover/ProductionController.hh"
#include "mover/RunStats.hh"
#include "mover/TransferExecutor.hh"
#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/ShutdownSignal.hh"
#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <sstream>
#include <thread>

using namespace sower::mover;
using sower::common::Logging;

//------------------------------------------------------------------------------
// Print usage
//------------------------------------------------------------------------------
static void
usage()
{
  std::cerr << "Usage: sowerd [-c <config>] [-l <level>] [-o] [-h]\n"
            "       creates plots on the staging volume and distributes them "
            "to the configured destinations\n"
            "\t\t  -c <config> : configuration file (default "
            << kDefaultConfigPath << ")\n"
            "\t\t   -l <level> : log level override (debug, info, notice, "
            "warning, err, crit)\n"
            "\t\t           -o : run exactly one main loop iteration\n"
            "\t\t           -h : display help\n";
}

//------------------------------------------------------------------------------
// Log a multi-line text line by line
//------------------------------------------------------------------------------
static void
log_lines(const std::string& text)
{
  std::istringstream iss(text);
  std::string line;

  while (std::getline(iss, line)) {
    sower_static_notice("%s", line.c_str());
  }
}

//------------------------------------------------------------------------------
// Main function of the sower daemon
//------------------------------------------------------------------------------
int main(int argc, char* argv[])
{
  std::string config_path = kDefaultConfigPath;
  std::string log_level;
  uint64_t max_iterations = 0;
  int c;

  while ((c = getopt(argc, argv, "c:l:oh")) != -1) {
    switch (c) {
    case 'c':
      config_path = optarg;
      break;

    case 'l':
      log_level = optarg;
      break;

    case 'o':
      max_iterations = 1;
      break;

    case 'h':
      usage();
      exit(0);

    default:
      usage();
      exit(1);
    }
  }

  Logging& g_logging = Logging::GetInstance();
  g_logging.SetUnit("sowerd");
  sower::common::Config cfg;

  if (!cfg.Load(config_path)) {
    sower_static_err("msg=\"failed to load configuration\" path=%s err=\"%s\"",
                     config_path.c_str(), cfg.getMsg().c_str());
    return 1;
  }

  MoverConfig config;
  std::string err;

  if (!MoverConfig::FromConfig(cfg, config, err)) {
    sower_static_err("msg=\"invalid configuration\" path=%s err=\"%s\"",
                     config_path.c_str(), err.c_str());
    return 1;
  }

  if (log_level.empty()) {
    log_level = config.mLogLevel;
  }

  int priority = g_logging.GetPriorityByString(log_level.c_str());

  if (priority == -1) {
    sower_static_err("msg=\"unknown log level\" level=%s", log_level.c_str());
    return 1;
  }

  g_logging.SetLogPriority(priority);

  // block the termination signals in all threads, a dedicated thread waits
  sigset_t sigset;
  sigemptyset(&sigset);
  sigaddset(&sigset, SIGINT);
  sigaddset(&sigset, SIGTERM);
  sigaddset(&sigset, SIGUSR1);

  if (pthread_sigmask(SIG_BLOCK, &sigset, nullptr)) {
    sower_static_crit("%s", "msg=\"failed to block termination signals\"");
    return 1;
  }

  sower::common::ShutdownSignal shutdown;
  RunStats stats;
  DestinationProbe probe(config);
  TransferExecutor executor(config);
  DistributionScheduler scheduler(config, probe, executor, stats, shutdown);
  ProductionController producer(config, stats);
  MainLoop loop(config, scheduler, producer, shutdown);
  std::thread signal_thread([&sigset, &shutdown, &producer, &scheduler]() {
    int sig = 0;

    while (sigwait(&sigset, &sig) == 0) {
      if (sig == SIGUSR1) {
        // internal wake-up after the main loop finished
        return;
      }

      if ((sig == SIGINT) || (sig == SIGTERM)) {
        sower_static_alert("msg=\"shutting down gracefully\" signal=%d", sig);

        if (producer.IsProducing()) {
          sower_static_notice("%s", "msg=\"waiting for current plotting to "
                              "complete\"");
        }

        size_t queued = scheduler.GetQueueSize();

        if (queued) {
          sower_static_notice("msg=\"waiting for in-flight transfers\" "
                              "queued=%zu", queued);
        }

        shutdown.RequestShutdown();
        return;
      }
    }
  });
  sower_static_notice("msg=\"starting sower\" config=%s", config_path.c_str());
  log_lines(config.Dump());
  loop.Run(max_iterations);

  // release the signal thread, a no-op if it already handled a signal
  pthread_kill(signal_thread.native_handle(), SIGUSR1);

  signal_thread.join();
  const DrainResult& last = loop.GetLastDrain();

  if (last.mRemaining) {
    sower_static_warning("msg=\"plots remaining in queue\" count=%llu",
                         (unsigned long long) last.mRemaining);

    for (const auto& path : last.mRemainingPaths) {
      sower_static_info("msg=\"plot remaining\" path=%s", path.c_str());
    }
  }

  sower_static_notice("msg=\"final statistics\" created=%llu moved=%llu "
                      "bytes=%llu state=%s",
                      (unsigned long long) stats.GetPlotsCreated(),
                      (unsigned long long) stats.GetPlotsMoved(),
                      (unsigned long long) stats.GetBytesMoved(),
                      MainLoop::StateToString(loop.GetState()));
  std::cout << stats.Summary() << std::flush;
  return 0;
}
