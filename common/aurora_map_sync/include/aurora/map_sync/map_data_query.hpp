// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <aurora/device/device_channel.hpp>
#include <aurora/map_sync/map_data_cache.hpp>

namespace aurora {

//! Answer of one getMapData() call; everything comes from one device-side
//! revision. Categories that were not requested are empty.
struct MapDataResult
{
  uint64_t revision = 0u;
  MapIds map_ids;                          // maps the device resolved
  std::vector<KeyframeDesc> keyframes;     // ascending id
  std::vector<MapPointDesc> map_points;    // ascending id, unique
  std::vector<LoopClosure> loop_closures;
  std::map<MapId, MapDesc> map_info;
};

struct MapDataQueryStats
{
  uint64_t queries = 0u;
  uint64_t device_requests = 0u;
  uint64_t skipped_requests = 0u;
  uint64_t failures = 0u;
};

//! Selective fetch of keyframes, map points and map info.
//!
//! All requested categories travel in one accessMapData() round trip, so the
//! result is a single point-in-time view. A category whose flag is false is
//! left out of the request entirely. The call is all-or-nothing.
class MapDataQuery
{
public:
  explicit MapDataQuery(DeviceChannel& channel, MapDataCache* cache = nullptr);

  //! Throws MapDataFetchError if the fetch fails or the response is
  //! inconsistent. DataNotReadyError passes through unchanged.
  MapDataResult getMapData(const MapSelector& selector = MapSelector::activeOnly(),
                           bool fetch_keyframes = true,
                           bool fetch_map_points = true,
                           bool fetch_map_info = true);

  void setKeyframeFetchFlags(uint32_t flags) { keyframe_fetch_flags_ = flags; }
  uint32_t keyframeFetchFlags() const { return keyframe_fetch_flags_; }

  void setMapPointFetchFlags(uint32_t flags) { map_point_fetch_flags_ = flags; }
  uint32_t mapPointFetchFlags() const { return map_point_fetch_flags_; }

  const MapDataQueryStats& stats() const { return stats_; }

private:
  void publishToCache(const MapDataResult& result, const MapDataRequest& request) const;

  DeviceChannel& channel_;
  MapDataCache* cache_;
  uint32_t keyframe_fetch_flags_ = c_keyframe_fetch_flag_all;
  uint32_t map_point_fetch_flags_ = c_map_point_fetch_flag_all;
  MapDataQueryStats stats_;
};

} // namespace aurora
