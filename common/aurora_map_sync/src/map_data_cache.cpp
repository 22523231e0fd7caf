// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/map_data_cache.hpp>

#include <aurora/common/logging.hpp>

namespace aurora {

MapDataCache::MapDataCache()
  : current_(std::make_shared<const MapDataSnapshot>())
{}

MapDataCache::SnapshotPtr MapDataCache::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void MapDataCache::publish(const std::map<MapId, MapData>& maps)
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::shared_ptr<MapDataSnapshot> next = std::make_shared<MapDataSnapshot>(*current_);
  for (const auto& entry : maps)
  {
    next->maps[entry.first] = entry.second;
  }
  next->updated_at = Clock::now();
  current_ = next;
  ++version_;
  VLOG(1) << "[MapCache] Published " << maps.size() << " map(s), "
          << current_->maps.size() << " cached";
}

void MapDataCache::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::make_shared<const MapDataSnapshot>();
  ++version_;
}

bool MapDataCache::contains(MapId map_id) const
{
  return snapshot()->maps.count(map_id) > 0u;
}

size_t MapDataCache::size() const
{
  return snapshot()->maps.size();
}

uint64_t MapDataCache::version() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

} // namespace aurora
