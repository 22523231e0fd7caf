// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/test_entrypoint.hpp>
#include <aurora/map_sync/transfer_session.hpp>

namespace {

aurora::MapStorageStatus deviceStatus(aurora::MapStorageStatusFlag flag, float progress,
                                      const std::string& message = "")
{
  aurora::MapStorageStatus status;
  status.flag = flag;
  status.progress = progress;
  status.message = message;
  return status;
}

} // unnamed namespace

namespace aurora {

TEST(TransferSessionTest, ForwardLifecycle)
{
  TransferSession session(MapStorageDirection::Download, "/tmp/map.stcm");
  EXPECT_EQ(session.state(), TransferState::Idle);
  EXPECT_FALSE(session.isActive());

  session.markStarted();
  EXPECT_EQ(session.state(), TransferState::Started);
  EXPECT_TRUE(session.isActive());

  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Working, 30.0f, "working"));
  EXPECT_EQ(session.state(), TransferState::InProgress);
  EXPECT_FLOAT_EQ(session.progress(), 30.0f);
  EXPECT_EQ(session.statusMessage(), "working");

  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Finished, 99.0f, "done"));
  EXPECT_EQ(session.state(), TransferState::Finished);
  EXPECT_FLOAT_EQ(session.progress(), 100.0f);
  EXPECT_TRUE(session.snapshot().finished);
  EXPECT_FALSE(session.isActive());
}

TEST(TransferSessionTest, ProgressNeverDecreasesAndIsClamped)
{
  TransferSession session(MapStorageDirection::Upload, "map.stcm");
  session.markStarted();
  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Working, 60.0f));
  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Working, 40.0f));
  EXPECT_FLOAT_EQ(session.progress(), 60.0f);
  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Working, 250.0f));
  EXPECT_FLOAT_EQ(session.progress(), 100.0f);
  EXPECT_EQ(session.state(), TransferState::InProgress);
}

TEST(TransferSessionTest, TerminalStatesAreFinal)
{
  TransferSession session(MapStorageDirection::Download, "map.stcm");
  session.markStarted();
  session.markAborted("stop");
  EXPECT_EQ(session.state(), TransferState::Aborted);
  EXPECT_FALSE(session.snapshot().finished);

  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Finished, 100.0f));
  session.markFailed("late failure");
  EXPECT_EQ(session.state(), TransferState::Aborted);
  EXPECT_EQ(session.statusMessage(), "stop");
}

TEST(TransferSessionTest, DeviceFailureFlagsMapToFailed)
{
  for (MapStorageStatusFlag flag : {MapStorageStatusFlag::Failed,
                                    MapStorageStatusFlag::Rejected,
                                    MapStorageStatusFlag::Timeout})
  {
    TransferSession session(MapStorageDirection::Download, "map.stcm");
    session.markStarted();
    session.applyDeviceStatus(deviceStatus(flag, 10.0f));
    EXPECT_EQ(session.state(), TransferState::Failed);
    EXPECT_FALSE(session.statusMessage().empty());
    EXPECT_FALSE(session.snapshot().finished);
  }
}

TEST(TransferSessionTest, IdleReportKeepsStarted)
{
  TransferSession session(MapStorageDirection::Download, "map.stcm");
  session.markStarted();
  session.applyDeviceStatus(deviceStatus(MapStorageStatusFlag::Idle, 0.0f));
  EXPECT_EQ(session.state(), TransferState::Started);
}

} // namespace aurora

AURORA_UNITTEST_ENTRYPOINT
