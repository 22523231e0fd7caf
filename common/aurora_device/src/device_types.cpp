// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/device_types.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

#include <aurora/common/errors.hpp>

namespace aurora {

const char* mapStorageDirectionName(MapStorageDirection direction)
{
  switch (direction)
  {
  case MapStorageDirection::Upload: return "upload";
  case MapStorageDirection::Download: return "download";
  }
  return "unknown";
}

std::string mapStorageStatusName(MapStorageStatusFlag flag)
{
  switch (flag)
  {
  case MapStorageStatusFlag::Idle: return "Idle";
  case MapStorageStatusFlag::Working: return "Working";
  case MapStorageStatusFlag::Finished: return "Finished";
  case MapStorageStatusFlag::Failed: return "Failed";
  case MapStorageStatusFlag::Aborted: return "Aborted";
  case MapStorageStatusFlag::Rejected: return "Rejected";
  case MapStorageStatusFlag::Timeout: return "Timeout";
  }
  return "Unknown(" + std::to_string(static_cast<int>(flag)) + ")";
}

bool isTerminalStorageFlag(MapStorageStatusFlag flag)
{
  return flag != MapStorageStatusFlag::Idle
      && flag != MapStorageStatusFlag::Working;
}

MapSelector::MapSelector(Kind kind, MapIds ids)
  : kind_(kind)
  , ids_(std::move(ids))
{
  std::sort(ids_.begin(), ids_.end());
  ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());
}

MapSelector MapSelector::activeOnly()
{
  return MapSelector(Kind::ActiveOnly, MapIds());
}

MapSelector MapSelector::allMaps()
{
  return MapSelector(Kind::AllMaps, MapIds());
}

MapSelector MapSelector::specificIds(MapIds ids)
{
  if (ids.empty())
  {
    throw InvalidArgumentError(
          "MapSelector::specificIds needs at least one map id; use allMaps()");
  }
  return MapSelector(Kind::SpecificIds, std::move(ids));
}

MapSelector MapSelector::fromOptionalIds(const MapIds* ids)
{
  if (ids == nullptr)
  {
    return activeOnly();
  }
  if (ids->empty())
  {
    return allMaps();
  }
  return specificIds(*ids);
}

std::string MapSelector::toString() const
{
  switch (kind_)
  {
  case Kind::ActiveOnly: return "active";
  case Kind::AllMaps: return "all";
  case Kind::SpecificIds: break;
  }
  std::ostringstream ss;
  for (size_t i = 0u; i < ids_.size(); ++i)
  {
    ss << (i == 0u ? "" : ",") << ids_[i];
  }
  return ss.str();
}

} // namespace aurora
