// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/errors.hpp>
#include <aurora/common/test_entrypoint.hpp>
#include <aurora/device/map_archive.hpp>
#include <aurora/device/simulated_device_channel.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

std::string tempPath(const std::string& name)
{
  return "/tmp/aurora_" + name + "_" + std::to_string(::getpid()) + ".stcm";
}

aurora::SimulatedDeviceOptions manualOptions()
{
  aurora::SimulatedDeviceOptions options;
  options.run_background_thread = false;
  options.keyframes_per_second = 0.0;
  options.map_points_per_keyframe = 3u;
  options.loop_closure_every_n_keyframes = 5u;
  options.storage_bytes_per_second = 0.0;
  return options;
}

class CountingVisitor : public aurora::MapDataVisitor
{
public:
  void onSnapshotBegin(uint64_t revision, const aurora::MapIds& ids) override
  {
    begin_revision = revision;
    resolved = ids;
  }
  void onMapDesc(const aurora::MapDesc& desc) override { descs.push_back(desc); }
  void onKeyframe(const aurora::KeyframeDesc& kf) override { keyframes.push_back(kf); }
  void onMapPoint(const aurora::MapPointDesc& mp) override { map_points.push_back(mp); }
  void onSnapshotEnd(uint64_t revision) override { end_revision = revision; }

  uint64_t begin_revision = 0u;
  uint64_t end_revision = 0u;
  aurora::MapIds resolved;
  std::vector<aurora::MapDesc> descs;
  std::vector<aurora::KeyframeDesc> keyframes;
  std::vector<aurora::MapPointDesc> map_points;
};

} // unnamed namespace

namespace aurora {

TEST(SimulatedDeviceTest, MappingInfoTracksGrowthAndSync)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 10u;
  options.sync_keyframes_per_second = 4.0;
  SimulatedDeviceChannel device(options);

  GlobalMappingInfo info = device.getGlobalMappingInfo();
  EXPECT_EQ(info.total_keyframe_count, 10u);
  EXPECT_EQ(info.total_map_point_count, 30u);
  EXPECT_EQ(info.total_keyframe_count_fetched, 0u);
  EXPECT_EQ(info.total_map_count, 1u);

  device.step(Duration(1.0));
  info = device.getGlobalMappingInfo();
  EXPECT_EQ(info.total_keyframe_count_fetched, 4u);
  EXPECT_EQ(info.last_keyframe_count_to_fetch, 6u);

  device.step(Duration(10.0));
  info = device.getGlobalMappingInfo();
  EXPECT_EQ(info.total_keyframe_count_fetched, 10u);
  EXPECT_EQ(info.total_map_count_fetched, 1u);

  device.setMapDataSyncing(false);
  device.addKeyframes(5u);
  device.step(Duration(1.0));
  info = device.getGlobalMappingInfo();
  EXPECT_EQ(info.total_keyframe_count, 15u);
  EXPECT_EQ(info.total_keyframe_count_fetched, 10u);

  device.resyncMapData(true);
  EXPECT_EQ(device.getGlobalMappingInfo().total_keyframe_count_fetched, 0u);
}

TEST(SimulatedDeviceTest, MapResetDropsTotals)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 8u;
  SimulatedDeviceChannel device(options);
  const MapId before = device.activeMapId();
  device.requireMapReset();
  const GlobalMappingInfo info = device.getGlobalMappingInfo();
  EXPECT_EQ(info.total_keyframe_count, 0u);
  EXPECT_NE(info.active_map_id, before);
  EXPECT_EQ(device.mapIds().size(), 1u);
}

TEST(SimulatedDeviceTest, AccessMapDataResolvesSelector)
{
  SimulatedDeviceOptions options = manualOptions();
  options.inactive_maps = 2u;
  options.keyframes_per_inactive_map = 4u;
  options.initial_keyframes = 6u;
  SimulatedDeviceChannel device(options);
  ASSERT_EQ(device.mapIds().size(), 3u);

  MapDataRequest request;
  request.parts = c_map_data_part_keyframes | c_map_data_part_map_info;

  CountingVisitor active;
  device.accessMapData(request, active);
  EXPECT_EQ(active.resolved, MapIds{device.activeMapId()});
  EXPECT_EQ(active.keyframes.size(), 6u);
  EXPECT_EQ(active.descs.size(), 1u);
  EXPECT_TRUE(active.map_points.empty());
  EXPECT_EQ(active.begin_revision, active.end_revision);

  request.selector = MapSelector::allMaps();
  CountingVisitor all;
  device.accessMapData(request, all);
  EXPECT_EQ(all.resolved.size(), 3u);
  EXPECT_EQ(all.keyframes.size(), 14u);

  request.selector = MapSelector::specificIds({1u, 99u});
  CountingVisitor specific;
  device.accessMapData(request, specific);
  EXPECT_EQ(specific.resolved, MapIds{1u});
  EXPECT_EQ(specific.keyframes.size(), 4u);

  const SimulatedDeviceStats stats = device.stats();
  EXPECT_EQ(stats.map_data_calls, 3u);
  EXPECT_EQ(stats.map_point_requests, 0u);
  EXPECT_EQ(stats.map_points_delivered, 0u);
}

TEST(SimulatedDeviceTest, LoopClosuresEveryNKeyframes)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 11u;
  SimulatedDeviceChannel device(options);

  MapDataRequest request;
  request.parts = c_map_data_part_keyframes;
  CountingVisitor visitor;
  device.accessMapData(request, visitor);
  ASSERT_EQ(visitor.keyframes.size(), 11u);
  EXPECT_TRUE(visitor.keyframes[0].isFixed());
  EXPECT_EQ(visitor.keyframes[5].looped_ids,
            std::vector<uint64_t>{visitor.keyframes[0].id});
  EXPECT_EQ(visitor.keyframes[10].looped_ids,
            std::vector<uint64_t>{visitor.keyframes[5].id});

  request.keyframe_fetch_flags = 0u;
  CountingVisitor trimmed;
  device.accessMapData(request, trimmed);
  EXPECT_TRUE(trimmed.keyframes[5].looped_ids.empty());
}

TEST(SimulatedDeviceTest, InjectedFailures)
{
  SimulatedDeviceChannel device(manualOptions());
  device.failNextRequests(1u, ErrorCode::IoError);
  EXPECT_THROW(device.getGlobalMappingInfo(), ProtocolError);
  EXPECT_NO_THROW(device.getGlobalMappingInfo());

  device.setConnected(false);
  EXPECT_FALSE(device.isConnected());
  EXPECT_THROW(device.queryMapStorageStatus(), ConnectionError);
  device.setConnected(true);

  EXPECT_THROW(device.getCurrentPose(), DataNotReadyError);
  device.step(Duration(0.1));
  EXPECT_NO_THROW(device.getCurrentPose());
}

TEST(SimulatedDeviceTest, DownloadThenUploadRestoresMaps)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 7u;
  options.inactive_maps = 1u;
  options.keyframes_per_inactive_map = 3u;
  const std::string path = tempPath("sim_roundtrip");

  SimulatedDeviceChannel source(options);
  source.startMapStorageSession(path, MapStorageDirection::Download);
  EXPECT_TRUE(source.isMapStorageSessionActive());
  EXPECT_THROW(source.startMapStorageSession(path, MapStorageDirection::Download),
               ProtocolError);
  source.step(Duration(0.1));
  EXPECT_FALSE(source.isMapStorageSessionActive());
  const MapStorageStatus done = source.queryMapStorageStatus();
  EXPECT_EQ(done.flag, MapStorageStatusFlag::Finished);
  EXPECT_FLOAT_EQ(done.progress, 100.0f);

  SimulatedDeviceOptions empty = manualOptions();
  SimulatedDeviceChannel target(empty);
  target.startMapStorageSession(path, MapStorageDirection::Upload);
  target.step(Duration(0.1));
  EXPECT_EQ(target.queryMapStorageStatus().flag, MapStorageStatusFlag::Finished);
  EXPECT_EQ(target.mapIds(), source.mapIds());
  EXPECT_EQ(target.getGlobalMappingInfo().total_keyframe_count, 10u);
  std::remove(path.c_str());
}

TEST(SimulatedDeviceTest, UploadOfCorruptFileFails)
{
  const std::string path = tempPath("sim_corrupt");
  {
    std::ofstream out(path.c_str(), std::ios::binary);
    out << "definitely not a map";
  }
  SimulatedDeviceChannel device(manualOptions());
  device.startMapStorageSession(path, MapStorageDirection::Upload);
  device.step(Duration(0.1));
  const MapStorageStatus status = device.queryMapStorageStatus();
  EXPECT_EQ(status.flag, MapStorageStatusFlag::Failed);
  EXPECT_FALSE(status.message.empty());
  std::remove(path.c_str());

  EXPECT_THROW(device.startMapStorageSession("/nonexistent/dir/map.stcm",
                                             MapStorageDirection::Upload),
               ProtocolError);
}

TEST(SimulatedDeviceTest, UploadWithForgedRecordCountFails)
{
  MapArchive archive;
  archive.active_map_id = 1u;
  MapDesc map;
  map.map_id = 1u;
  archive.maps = {map};
  std::vector<uint8_t> bytes = encodeMapArchive(archive);
  for (size_t i = 16u; i < 20u; ++i)
  {
    bytes[i] = 0xFF;
  }
  uint8_t checksum = 0u;
  for (size_t i = 0u; i + 2u < bytes.size(); ++i)
  {
    checksum ^= bytes[i];
  }
  bytes[bytes.size() - 2u] = checksum;

  const std::string path = tempPath("sim_forged");
  {
    std::ofstream out(path.c_str(), std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }
  SimulatedDeviceChannel device(manualOptions());
  device.startMapStorageSession(path, MapStorageDirection::Upload);
  device.step(Duration(0.1));
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Failed);
  EXPECT_FALSE(device.isMapStorageSessionActive());
  std::remove(path.c_str());
}

TEST(SimulatedDeviceTest, StatusLagsBehindInactivity)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 2u;
  options.status_lags_inactivity = true;
  const std::string path = tempPath("sim_lag");
  SimulatedDeviceChannel device(options);
  device.startMapStorageSession(path, MapStorageDirection::Download);
  device.step(Duration(0.1));
  // Read in the same round that observes inactivity: still stale.
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Working);
  EXPECT_FALSE(device.isMapStorageSessionActive());
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Finished);
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Finished);
  std::remove(path.c_str());
}

TEST(SimulatedDeviceTest, AbortObservedOnNextTick)
{
  SimulatedDeviceOptions options = manualOptions();
  options.initial_keyframes = 50u;
  options.storage_bytes_per_second = 100.0;
  const std::string path = tempPath("sim_abort");
  SimulatedDeviceChannel device(options);
  device.startMapStorageSession(path, MapStorageDirection::Download);
  device.step(Duration(1.0));
  EXPECT_TRUE(device.isMapStorageSessionActive());
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Working);

  device.abortMapStorageSession();
  EXPECT_TRUE(device.isMapStorageSessionActive());
  device.step(Duration(0.1));
  EXPECT_FALSE(device.isMapStorageSessionActive());
  EXPECT_EQ(device.queryMapStorageStatus().flag, MapStorageStatusFlag::Aborted);
  EXPECT_FALSE(std::ifstream(path.c_str()).good());
}

TEST(SimulatedDeviceTest, BackgroundThreadAdvancesTime)
{
  SimulatedDeviceOptions options;
  options.tick_interval = Duration(0.005);
  options.keyframes_per_second = 200.0;
  SimulatedDeviceChannel device(options);
  for (int i = 0; i < 200 && device.getGlobalMappingInfo().total_keyframe_count == 0u; ++i)
  {
    usleep(5000);
  }
  EXPECT_GT(device.getGlobalMappingInfo().total_keyframe_count, 0u);
}

} // namespace aurora

AURORA_UNITTEST_ENTRYPOINT
