// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/map_data_query.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

//! Collects one response and checks that it is a single, closed snapshot.
class CollectingVisitor : public MapDataVisitor
{
public:
  explicit CollectingVisitor(const MapDataRequest& request)
    : request_(request)
  {}

  void onSnapshotBegin(uint64_t revision, const MapIds& resolved_map_ids) override
  {
    if (began_)
    {
      fail("second snapshot begin in one response");
    }
    began_ = true;
    result.revision = revision;
    result.map_ids = resolved_map_ids;
    std::sort(result.map_ids.begin(), result.map_ids.end());
  }

  void onMapDesc(const MapDesc& desc) override
  {
    if (accept(desc.map_id, c_map_data_part_map_info, "map info"))
    {
      result.map_info[desc.map_id] = desc;
    }
  }

  void onKeyframe(const KeyframeDesc& keyframe) override
  {
    if (accept(keyframe.map_id, c_map_data_part_keyframes, "keyframe"))
    {
      result.keyframes.push_back(keyframe);
    }
  }

  void onMapPoint(const MapPointDesc& map_point) override
  {
    if (accept(map_point.map_id, c_map_data_part_map_points, "map point"))
    {
      result.map_points.push_back(map_point);
    }
  }

  void onSnapshotEnd(uint64_t revision) override
  {
    if (!began_ || ended_)
    {
      fail("unbalanced snapshot end");
    }
    if (revision != result.revision)
    {
      std::ostringstream ss;
      ss << "response mixes revisions " << result.revision << " and " << revision;
      fail(ss.str());
    }
    ended_ = true;
  }

  void checkComplete() const
  {
    if (!began_ || !ended_)
    {
      throw ProtocolError("Map data response is incomplete");
    }
  }

  MapDataResult result;
  uint64_t unrequested_records = 0u;

private:
  bool accept(MapId map_id, MapDataPart part, const char* what)
  {
    if (!began_ || ended_)
    {
      fail(std::string(what) + " outside of a snapshot");
    }
    if (!request_.wants(part))
    {
      ++unrequested_records;
      return false;
    }
    if (!std::binary_search(result.map_ids.begin(), result.map_ids.end(), map_id))
    {
      fail(std::string(what) + " for unrequested map " + std::to_string(map_id));
    }
    return true;
  }

  [[noreturn]] void fail(const std::string& message) const
  {
    throw ProtocolError("Inconsistent map data response: " + message);
  }

  const MapDataRequest& request_;
  bool began_ = false;
  bool ended_ = false;
};

void normalize(MapDataResult* result)
{
  auto by_id = [](const auto& a, const auto& b) { return a.id < b.id; };
  auto same_id = [](const auto& a, const auto& b) { return a.id == b.id; };

  DEBUG_CHECK(std::is_sorted(result->map_ids.begin(), result->map_ids.end()));
  std::stable_sort(result->keyframes.begin(), result->keyframes.end(), by_id);
  std::sort(result->map_points.begin(), result->map_points.end(), by_id);
  result->map_points.erase(std::unique(result->map_points.begin(),
                                       result->map_points.end(), same_id),
                           result->map_points.end());

  for (const KeyframeDesc& kf : result->keyframes)
  {
    for (uint64_t looped : kf.looped_ids)
    {
      result->loop_closures.push_back(LoopClosure{kf.id, looped});
    }
  }
}

} // unnamed namespace

MapDataQuery::MapDataQuery(DeviceChannel& channel, MapDataCache* cache)
  : channel_(channel)
  , cache_(cache)
{}

MapDataResult MapDataQuery::getMapData(const MapSelector& selector,
                                       bool fetch_keyframes,
                                       bool fetch_map_points,
                                       bool fetch_map_info)
{
  ++stats_.queries;

  MapDataRequest request;
  request.selector = selector;
  request.keyframe_fetch_flags = keyframe_fetch_flags_;
  request.map_point_fetch_flags = map_point_fetch_flags_;
  if (fetch_keyframes)
  {
    request.parts |= c_map_data_part_keyframes;
  }
  if (fetch_map_points)
  {
    request.parts |= c_map_data_part_map_points;
  }
  if (fetch_map_info)
  {
    request.parts |= c_map_data_part_map_info;
  }
  if (request.parts == c_map_data_part_none)
  {
    ++stats_.skipped_requests;
    VLOG(1) << "[MapQuery] Nothing requested for maps " << selector.toString();
    return MapDataResult();
  }

  CollectingVisitor visitor(request);
  try
  {
    ++stats_.device_requests;
    channel_.accessMapData(request, visitor);
    visitor.checkComplete();
  }
  catch (const DataNotReadyError&)
  {
    ++stats_.failures;
    throw;
  }
  catch (const AuroraError& e)
  {
    ++stats_.failures;
    LOG(WARNING) << "[MapQuery] Fetch for maps " << selector.toString()
                 << " failed: " << e.what();
    throw MapDataFetchError("Map data fetch for maps " + selector.toString()
                            + " failed: " + e.what(), e.code());
  }

  if (visitor.unrequested_records > 0u)
  {
    LOG(WARNING) << "[MapQuery] Dropped " << visitor.unrequested_records
                 << " records of unrequested categories";
  }

  MapDataResult result = std::move(visitor.result);
  normalize(&result);
  VLOG(1) << "[MapQuery] Revision " << result.revision << ", maps "
          << selector.toString() << ": " << result.keyframes.size() << " KF, "
          << result.map_points.size() << " MP, " << result.loop_closures.size()
          << " loops";

  if (cache_)
  {
    publishToCache(result, request);
  }
  return result;
}

void MapDataQuery::publishToCache(const MapDataResult& result,
                                  const MapDataRequest& request) const
{
  std::map<MapId, MapData> entries;
  for (MapId id : result.map_ids)
  {
    MapData& entry = entries[id];
    entry.revision = result.revision;
    entry.has_keyframes = request.wants(c_map_data_part_keyframes);
    entry.has_map_points = request.wants(c_map_data_part_map_points);
    entry.has_map_info = request.wants(c_map_data_part_map_info);
  }
  for (const KeyframeDesc& kf : result.keyframes)
  {
    MapData& entry = entries[kf.map_id];
    entry.keyframes.push_back(kf);
    for (uint64_t looped : kf.looped_ids)
    {
      entry.loop_closures.push_back(LoopClosure{kf.id, looped});
    }
  }
  for (const MapPointDesc& mp : result.map_points)
  {
    entries[mp.map_id].map_points.push_back(mp);
  }
  for (const auto& info : result.map_info)
  {
    entries[info.first].map_info = info.second;
  }
  cache_->publish(entries);
}

} // namespace aurora
