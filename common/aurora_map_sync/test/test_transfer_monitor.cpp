// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/test_entrypoint.hpp>
#include <aurora/device/simulated_device_channel.hpp>
#include <aurora/map_sync/transfer_monitor.hpp>

#include "fake_device_channel.hpp"

#include <cstdio>
#include <string>
#include <thread>

#include <unistd.h>

namespace {

std::string tempPath(const std::string& name)
{
  return "/tmp/aurora_" + name + "_" + std::to_string(::getpid()) + ".stcm";
}

aurora::SimulatedDeviceOptions threadedDevice(double bytes_per_second)
{
  aurora::SimulatedDeviceOptions options;
  options.tick_interval = aurora::Duration(0.005);
  options.keyframes_per_second = 0.0;
  options.initial_keyframes = 30u;
  options.storage_bytes_per_second = bytes_per_second;
  options.status_lags_inactivity = true;
  return options;
}

aurora::TransferMonitorOptions fastPolling(double max_wait_s = 10.0)
{
  aurora::TransferMonitorOptions options;
  options.poll_interval = aurora::Duration(0.02);
  options.max_wait = aurora::Duration(max_wait_s);
  return options;
}

//! Storage that finishes after a few polls, with scripted query failures.
class ScriptedStorageChannel : public aurora::FakeDeviceChannel
{
public:
  void startMapStorageSession(const std::string&, aurora::MapStorageDirection) override
  {
    active_polls = 3;
  }
  bool isMapStorageSessionActive() override
  {
    if (fail_activity_checks > 0)
    {
      --fail_activity_checks;
      throw aurora::ConnectionError("link hiccup");
    }
    return active_polls-- > 0;
  }
  aurora::MapStorageStatus queryMapStorageStatus() override
  {
    ++status_queries;
    if (active_polls < 0 && fail_final_query)
    {
      throw aurora::ConnectionError("link lost");
    }
    if (fail_running_queries > 0 && active_polls >= 0)
    {
      --fail_running_queries;
      throw aurora::ProtocolError("busy");
    }
    aurora::MapStorageStatus status;
    status.flag = active_polls >= 0 ? aurora::MapStorageStatusFlag::Working
                                    : aurora::MapStorageStatusFlag::Finished;
    status.progress = active_polls >= 0 ? 50.0f : 100.0f;
    status.message = "scripted";
    return status;
  }
  void abortMapStorageSession() override {}

  int active_polls = 0;
  int fail_activity_checks = 0;
  int fail_running_queries = 0;
  bool fail_final_query = false;
  int status_queries = 0;
};

} // unnamed namespace

namespace aurora {

TEST(TransferMonitorTest, DownloadThenUploadSucceed)
{
  const std::string path = tempPath("mon_ok");
  {
    SimulatedDeviceChannel device(threadedDevice(200000.0));
    MapTransferManager manager(device);
    TransferMonitor monitor(manager, fastPolling());
    float last_progress = -1.0f;
    bool monotonic = true;
    const TransferReport report = monitor.download(
          path, nullptr, [&](const TransferStatus& status, double) {
            monotonic = monotonic && status.progress >= last_progress;
            last_progress = status.progress;
          });
    EXPECT_EQ(report.outcome, TransferOutcome::Succeeded) << report.message;
    EXPECT_TRUE(report.final_status.finished);
    EXPECT_TRUE(monotonic);
    EXPECT_FLOAT_EQ(last_progress, 100.0f);
  }

  SimulatedDeviceOptions empty = threadedDevice(0.0);
  empty.initial_keyframes = 0u;
  SimulatedDeviceChannel target(empty);
  EXPECT_TRUE(uploadMap(target, path, nullptr, fastPolling()));
  EXPECT_EQ(target.getGlobalMappingInfo().total_keyframe_count, 30u);
  std::remove(path.c_str());
}

TEST(TransferMonitorTest, StartFailureNeedsNoPolling)
{
  SimulatedDeviceChannel device(threadedDevice(0.0));
  MapTransferManager manager(device);
  TransferMonitor monitor(manager, fastPolling());
  const TransferReport report = monitor.upload(tempPath("mon_missing"));
  EXPECT_EQ(report.outcome, TransferOutcome::StartFailed);
  EXPECT_EQ(report.polls, 0u);
  EXPECT_FALSE(report.message.empty());
  EXPECT_EQ(device.stats().storage_status_queries, 0u);
}

TEST(TransferMonitorTest, CancellationAbortsSession)
{
  const std::string path = tempPath("mon_cancel");
  SimulatedDeviceChannel device(threadedDevice(2000.0));
  MapTransferManager manager(device);
  TransferMonitor monitor(manager, fastPolling());
  CancellationToken token;
  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.requestCancel();
  });
  const TransferReport report = monitor.download(path, &token);
  canceller.join();

  EXPECT_EQ(report.outcome, TransferOutcome::Aborted);
  EXPECT_EQ(report.final_status.state, TransferState::Aborted);
  EXPECT_FALSE(report.final_status.finished);
  EXPECT_LT(report.elapsed_s, 1.0);
  EXPECT_FALSE(manager.isSessionActive());

  for (int i = 0; i < 100 && device.isMapStorageSessionActive(); ++i)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_FALSE(device.isMapStorageSessionActive());
  std::remove(path.c_str());
}

TEST(TransferMonitorTest, MaxWaitAbortsAndTimesOut)
{
  const std::string path = tempPath("mon_timeout");
  SimulatedDeviceChannel device(threadedDevice(100.0));
  MapTransferManager manager(device);
  TransferMonitor monitor(manager, fastPolling(0.2));
  const TransferReport report = monitor.download(path);
  EXPECT_EQ(report.outcome, TransferOutcome::TimedOut);
  EXPECT_GE(report.elapsed_s, 0.2);
  EXPECT_LT(report.elapsed_s, 0.2 + 0.5);
  EXPECT_EQ(report.final_status.state, TransferState::Aborted);
  std::remove(path.c_str());
}

TEST(TransferMonitorTest, DeviceFailureReportsFailed)
{
  SimulatedDeviceOptions options = threadedDevice(20000.0);
  options.storage_fail_at_progress = 30.0;
  SimulatedDeviceChannel device(options);
  MapTransferManager manager(device);
  TransferMonitor monitor(manager, fastPolling());
  const TransferReport report = monitor.download(tempPath("mon_fail"));
  EXPECT_EQ(report.outcome, TransferOutcome::Failed);
  EXPECT_FALSE(report.final_status.finished);
  EXPECT_FALSE(report.message.empty());
}

TEST(TransferMonitorTest, QueryFailuresWhileRunningAreNotFatal)
{
  ScriptedStorageChannel channel;
  channel.fail_activity_checks = 1;
  channel.fail_running_queries = 2;
  MapTransferManager manager(channel);
  TransferMonitor monitor(manager, fastPolling());
  const TransferReport report = monitor.download(tempPath("mon_flaky"));
  EXPECT_EQ(report.outcome, TransferOutcome::Succeeded);
  EXPECT_EQ(report.query_failures, 3u);
}

TEST(TransferMonitorTest, FinalQueryFailureIsIndeterminate)
{
  ScriptedStorageChannel channel;
  channel.fail_final_query = true;
  MapTransferManager manager(channel);
  TransferMonitor monitor(manager, fastPolling());
  const TransferReport report = monitor.download(tempPath("mon_lost"));
  EXPECT_EQ(report.outcome, TransferOutcome::Indeterminate);
  EXPECT_NE(report.message.find("link lost"), std::string::npos);
}

} // namespace aurora

AURORA_UNITTEST_ENTRYPOINT
