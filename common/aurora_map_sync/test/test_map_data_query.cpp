// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/test_entrypoint.hpp>
#include <aurora/device/simulated_device_channel.hpp>
#include <aurora/map_sync/map_data_query.hpp>

#include "fake_device_channel.hpp"

#include <functional>

namespace {

aurora::SimulatedDeviceOptions steppedDevice()
{
  aurora::SimulatedDeviceOptions options;
  options.run_background_thread = false;
  options.initial_keyframes = 30u;
  options.map_points_per_keyframe = 4u;
  options.inactive_maps = 1u;
  options.keyframes_per_inactive_map = 10u;
  options.loop_closure_every_n_keyframes = 25u;
  return options;
}

//! Replays a hand-written response through the visitor.
class ScriptedMapDataChannel : public aurora::FakeDeviceChannel
{
public:
  using Script = std::function<void(const aurora::MapDataRequest&,
                                    aurora::MapDataVisitor&)>;

  explicit ScriptedMapDataChannel(Script script)
    : script_(std::move(script))
  {}

  void accessMapData(const aurora::MapDataRequest& request,
                     aurora::MapDataVisitor& visitor) override
  {
    ++calls;
    script_(request, visitor);
  }

  int calls = 0;

private:
  Script script_;
};

aurora::KeyframeDesc keyframe(uint64_t id, aurora::MapId map_id)
{
  aurora::KeyframeDesc kf;
  kf.id = id;
  kf.map_id = map_id;
  return kf;
}

} // unnamed namespace

namespace aurora {

TEST(MapDataQueryTest, FetchesActiveMapByDefault)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  const MapDataResult result = query.getMapData();

  ASSERT_EQ(result.map_ids.size(), 1u);
  EXPECT_EQ(result.map_ids[0], device.activeMapId());
  EXPECT_EQ(result.keyframes.size(), 30u);
  EXPECT_EQ(result.map_points.size(), 120u);
  ASSERT_EQ(result.map_info.count(device.activeMapId()), 1u);
  EXPECT_EQ(result.map_info.at(device.activeMapId()).keyframe_count, 30u);
  EXPECT_EQ(result.revision, device.revision());

  for (size_t i = 1u; i < result.keyframes.size(); ++i)
  {
    EXPECT_LT(result.keyframes[i - 1u].id, result.keyframes[i].id);
  }
  EXPECT_EQ(result.loop_closures.size(), 1u);
}

TEST(MapDataQueryTest, SkipsUnrequestedCategories)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  const MapDataResult result = query.getMapData(MapSelector::activeOnly(), false, true, false);

  EXPECT_TRUE(result.keyframes.empty());
  EXPECT_TRUE(result.loop_closures.empty());
  EXPECT_TRUE(result.map_info.empty());
  EXPECT_FALSE(result.map_points.empty());

  const SimulatedDeviceStats stats = device.stats();
  EXPECT_EQ(stats.keyframe_requests, 0u);
  EXPECT_EQ(stats.map_info_requests, 0u);
  EXPECT_EQ(stats.map_point_requests, 1u);
  EXPECT_EQ(stats.keyframes_delivered, 0u);
}

TEST(MapDataQueryTest, NothingRequestedMakesNoDeviceCall)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  const MapDataResult result = query.getMapData(MapSelector::allMaps(), false, false, false);
  EXPECT_TRUE(result.map_ids.empty());
  EXPECT_EQ(device.stats().map_data_calls, 0u);
  EXPECT_EQ(query.stats().skipped_requests, 1u);
}

TEST(MapDataQueryTest, SelectorResolution)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);

  const MapIds empty_ids;
  const MapDataResult active =
      query.getMapData(MapSelector::fromOptionalIds(nullptr), true, false, false);
  EXPECT_EQ(active.map_ids.size(), 1u);

  const MapDataResult all =
      query.getMapData(MapSelector::fromOptionalIds(&empty_ids), true, false, false);
  EXPECT_EQ(all.map_ids, device.mapIds());
  EXPECT_EQ(all.keyframes.size(), 40u);

  const MapId inactive = device.mapIds().front();
  const MapDataResult specific =
      query.getMapData(MapSelector::specificIds({inactive, 999u}), true, false, true);
  ASSERT_EQ(specific.map_ids.size(), 1u);
  EXPECT_EQ(specific.map_ids[0], inactive);
  EXPECT_EQ(specific.keyframes.size(), 10u);
  for (const KeyframeDesc& kf : specific.keyframes)
  {
    EXPECT_EQ(kf.map_id, inactive);
  }
}

TEST(MapDataQueryTest, KeyframeFetchFlagsTrimAdjacency)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  query.setKeyframeFetchFlags(c_keyframe_fetch_flag_connected_ids);
  const MapDataResult result = query.getMapData(MapSelector::activeOnly(), true, false, false);
  EXPECT_TRUE(result.loop_closures.empty());
  for (const KeyframeDesc& kf : result.keyframes)
  {
    EXPECT_TRUE(kf.looped_ids.empty());
  }
}

TEST(MapDataQueryTest, MapPointFetchFlagsReachTheDevice)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  EXPECT_EQ(query.mapPointFetchFlags(), c_map_point_fetch_flag_all);

  const MapDataResult stamped = query.getMapData(MapSelector::activeOnly(), false, true, false);
  ASSERT_FALSE(stamped.map_points.empty());
  EXPECT_GT(stamped.map_points.front().timestamp, 0.0);

  query.setMapPointFetchFlags(0u);
  EXPECT_EQ(query.mapPointFetchFlags(), 0u);
  const MapDataResult bare = query.getMapData(MapSelector::activeOnly(), false, true, false);
  ASSERT_EQ(bare.map_points.size(), stamped.map_points.size());
  for (const MapPointDesc& mp : bare.map_points)
  {
    EXPECT_EQ(mp.timestamp, 0.0);
  }
  EXPECT_EQ(bare.map_points.front().position, stamped.map_points.front().position);
}

TEST(MapDataQueryTest, ConnectionDropIsAllOrNothing)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataCache cache;
  MapDataQuery query(device, &cache);
  device.failNextMapDataAfter(5u);

  try
  {
    query.getMapData();
    FAIL() << "expected MapDataFetchError";
  }
  catch (const MapDataFetchError& e)
  {
    EXPECT_EQ(e.code(), ErrorCode::ConnectionLost);
  }
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.version(), 0u);
  EXPECT_EQ(query.stats().failures, 1u);

  EXPECT_NO_THROW(query.getMapData());
  EXPECT_EQ(cache.size(), 1u);
}

TEST(MapDataQueryTest, DataNotReadyPassesThrough)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataQuery query(device);
  device.failNextRequests(1u, ErrorCode::NotReady);
  EXPECT_THROW(query.getMapData(), DataNotReadyError);
}

TEST(MapDataQueryTest, MixedRevisionsAreRejected)
{
  ScriptedMapDataChannel channel([](const MapDataRequest&, MapDataVisitor& visitor) {
    visitor.onSnapshotBegin(7u, {1u});
    visitor.onKeyframe(keyframe(1u, 1u));
    visitor.onSnapshotEnd(8u);
  });
  MapDataQuery query(channel);
  EXPECT_THROW(query.getMapData(), MapDataFetchError);
}

TEST(MapDataQueryTest, RecordsForUnresolvedMapsAreRejected)
{
  ScriptedMapDataChannel channel([](const MapDataRequest&, MapDataVisitor& visitor) {
    visitor.onSnapshotBegin(3u, {1u});
    visitor.onKeyframe(keyframe(1u, 2u));
    visitor.onSnapshotEnd(3u);
  });
  MapDataQuery query(channel);
  EXPECT_THROW(query.getMapData(), MapDataFetchError);
}

TEST(MapDataQueryTest, IncompleteResponseIsRejected)
{
  ScriptedMapDataChannel channel([](const MapDataRequest&, MapDataVisitor& visitor) {
    visitor.onSnapshotBegin(3u, {1u});
  });
  MapDataQuery query(channel);
  EXPECT_THROW(query.getMapData(), MapDataFetchError);
}

TEST(MapDataQueryTest, NormalizesOrderAndDropsUnrequestedRecords)
{
  ScriptedMapDataChannel channel([](const MapDataRequest&, MapDataVisitor& visitor) {
    visitor.onSnapshotBegin(4u, {1u});
    MapPointDesc mp;
    mp.map_id = 1u;
    for (uint64_t id : {5u, 2u, 5u, 1u})
    {
      mp.id = id;
      visitor.onMapPoint(mp);
    }
    KeyframeDesc kf = keyframe(9u, 1u);
    visitor.onKeyframe(kf);
    visitor.onSnapshotEnd(4u);
  });
  MapDataQuery query(channel);
  const MapDataResult result = query.getMapData(MapSelector::activeOnly(), false, true, false);
  ASSERT_EQ(result.map_points.size(), 3u);
  EXPECT_EQ(result.map_points[0].id, 1u);
  EXPECT_EQ(result.map_points[1].id, 2u);
  EXPECT_EQ(result.map_points[2].id, 5u);
  EXPECT_TRUE(result.keyframes.empty());
}

TEST(MapDataQueryTest, PublishesPerMapEntries)
{
  SimulatedDeviceChannel device(steppedDevice());
  MapDataCache cache;
  MapDataQuery query(device, &cache);

  query.getMapData(MapSelector::allMaps(), true, false, true);
  MapDataCache::SnapshotPtr first = cache.snapshot();
  ASSERT_EQ(first->maps.size(), 2u);
  const MapData& active = first->maps.at(device.activeMapId());
  EXPECT_TRUE(active.has_keyframes);
  EXPECT_FALSE(active.has_map_points);
  EXPECT_TRUE(active.has_map_info);
  EXPECT_EQ(active.keyframes.size(), 30u);
  EXPECT_EQ(active.loop_closures.size(), 1u);

  device.addKeyframes(5u);
  query.getMapData(MapSelector::activeOnly(), false, true, false);
  MapDataCache::SnapshotPtr second = cache.snapshot();
  const MapData& replaced = second->maps.at(device.activeMapId());
  EXPECT_FALSE(replaced.has_keyframes);
  EXPECT_TRUE(replaced.has_map_points);
  EXPECT_EQ(replaced.map_points.size(), 140u);
  EXPECT_GT(replaced.revision, active.revision);

  // Untouched map and the earlier snapshot stay as they were.
  const MapId inactive = device.mapIds().front();
  EXPECT_EQ(second->maps.at(inactive).keyframes.size(), 10u);
  EXPECT_EQ(first->maps.at(device.activeMapId()).keyframes.size(), 30u);
}

} // namespace aurora

AURORA_UNITTEST_ENTRYPOINT
