// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <aurora/device/device_types.hpp>

namespace aurora {

//! Content of one map from a single device-side revision. Categories that
//! were not fetched are absent (has_* false), not empty.
struct MapData
{
  uint64_t revision = 0u;
  bool has_keyframes = false;
  bool has_map_points = false;
  bool has_map_info = false;
  std::vector<KeyframeDesc> keyframes;      // ascending id
  std::vector<MapPointDesc> map_points;     // ascending id, unique
  std::vector<LoopClosure> loop_closures;   // ordered by keyframe id
  MapDesc map_info;
};

struct MapDataSnapshot
{
  Clock::time_point updated_at;
  std::map<MapId, MapData> maps;
};

//! Latest consistent map content per map id.
//!
//! The table is immutable once published. publish() builds a new table and
//! swaps the pointer, so a reader holding a snapshot never sees a partial
//! update.
class MapDataCache
{
public:
  using SnapshotPtr = std::shared_ptr<const MapDataSnapshot>;

  MapDataCache();

  //! Never null.
  SnapshotPtr snapshot() const;

  //! Replaces the entries of the maps in @p maps as a whole; other entries
  //! are kept.
  void publish(const std::map<MapId, MapData>& maps);

  void clear();

  bool contains(MapId map_id) const;
  size_t size() const;
  //! Number of publish()/clear() calls so far.
  uint64_t version() const;

private:
  mutable std::mutex mutex_;
  SnapshotPtr current_;
  uint64_t version_ = 0u;
};

} // namespace aurora
