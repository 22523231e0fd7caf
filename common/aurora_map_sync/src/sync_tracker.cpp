// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/sync_tracker.hpp>

#include <algorithm>
#include <cstdio>
#include <sstream>

#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>

namespace aurora {

double computeSyncRatio(uint64_t fetched, uint64_t total)
{
  if (total == 0u)
  {
    return 0.0;
  }
  const double ratio = static_cast<double>(fetched) / static_cast<double>(total);
  return std::min(1.0, std::max(0.0, ratio));
}

bool meetsSyncTarget(const MapSyncStatus& status, uint64_t min_keyframes,
                     double min_sync_ratio)
{
  return status.total_keyframe_count > 0u
      && status.fetched_keyframe_count >= min_keyframes
      && status.sync_ratio >= min_sync_ratio;
}

std::string formatMapSyncStatus(const MapSyncStatus& status, bool verbose)
{
  char percent[32];
  std::snprintf(percent, sizeof(percent), "%.1f%%", status.sync_ratio * 100.0);
  std::ostringstream ss;
  ss << percent << " synced (" << status.fetched_keyframe_count << "/"
     << status.total_keyframe_count << " KF";
  if (verbose)
  {
    ss << ", " << status.fetched_map_point_count << "/" << status.total_map_point_count
       << " MP, " << status.fetched_map_count << "/" << status.total_map_count
       << " maps, active map " << status.active_map_id;
  }
  ss << ")";
  if (verbose)
  {
    if (status.is_synced)
    {
      ss << " [synced]";
    }
    else if (status.is_sufficient)
    {
      ss << " [sufficient]";
    }
    if (status.reset_detected)
    {
      ss << " [reset]";
    }
  }
  return ss.str();
}

SyncTracker::SyncTracker(DeviceChannel& channel, const SyncTrackerOptions& options)
  : channel_(channel)
  , options_(options)
{
  CHECK_GT(options_.poll_interval.count(), 0.0);
}

MapSyncStatus SyncTracker::poll()
{
  const GlobalMappingInfo info = channel_.getGlobalMappingInfo();

  MapSyncStatus status;
  status.total_keyframe_count = info.total_keyframe_count;
  status.total_map_point_count = info.total_map_point_count;
  status.total_map_count = info.total_map_count;
  status.active_map_id = info.active_map_id;
  status.fetched_keyframe_count =
      std::min(info.total_keyframe_count_fetched, info.total_keyframe_count);
  status.fetched_map_point_count =
      std::min(info.total_map_point_count_fetched, info.total_map_point_count);
  status.fetched_map_count = std::min(info.total_map_count_fetched, info.total_map_count);

  if (has_status_)
  {
    if (status.total_keyframe_count < last_.total_keyframe_count
        || status.total_map_point_count < last_.total_map_point_count)
    {
      status.reset_detected = true;
      ++resets_;
      LOG(WARNING) << "[Sync] Device totals dropped from "
                   << last_.total_keyframe_count << " to "
                   << status.total_keyframe_count
                   << " keyframes; treating as map reset, progress restarts at "
                   << status.fetched_keyframe_count;
    }
    else
    {
      if (status.fetched_keyframe_count < last_.fetched_keyframe_count
          || status.fetched_map_point_count < last_.fetched_map_point_count)
      {
        if (regressions_++ < 3u)
        {
          LOG(WARNING) << "[Sync] Fetched counts went backwards ("
                       << last_.fetched_keyframe_count << " -> "
                       << status.fetched_keyframe_count << " KF); keeping previous";
        }
      }
      status.fetched_keyframe_count =
          std::max(status.fetched_keyframe_count, last_.fetched_keyframe_count);
      status.fetched_map_point_count =
          std::max(status.fetched_map_point_count, last_.fetched_map_point_count);
      status.fetched_map_count = std::max(status.fetched_map_count, last_.fetched_map_count);
    }
  }

  DEBUG_CHECK_LE(status.fetched_keyframe_count, status.total_keyframe_count);
  DEBUG_CHECK_LE(status.fetched_map_point_count, status.total_map_point_count);
  status.sync_ratio = computeSyncRatio(status.fetched_keyframe_count,
                                       status.total_keyframe_count);
  status.is_synced = status.total_keyframe_count > 0u && status.sync_ratio >= c_synced_ratio;
  status.is_sufficient = status.total_keyframe_count >= c_sufficient_keyframes
      && status.sync_ratio >= c_sufficient_ratio;

  last_ = status;
  has_status_ = true;
  VLOG(2) << "[Sync] " << formatMapSyncStatus(status, true);
  return status;
}

MapSyncStatus SyncTracker::waitForMapData(uint64_t min_keyframes,
                                          double min_sync_ratio,
                                          Duration max_wait,
                                          const SyncProgressCallback& callback,
                                          const CancellationToken* token)
{
  if (min_sync_ratio < 0.0 || min_sync_ratio > 1.0)
  {
    throw InvalidArgumentError("min_sync_ratio must be in [0, 1], got "
                               + std::to_string(min_sync_ratio));
  }
  if (max_wait.count() <= 0.0)
  {
    throw InvalidArgumentError("max_wait must be positive");
  }

  CancellationToken never_cancelled;
  const CancellationToken& cancel = token ? *token : never_cancelled;
  const Clock::time_point start = Clock::now();
  size_t failures = 0u;

  LOG(INFO) << "[Sync] Waiting for map data: >= " << min_keyframes
            << " keyframes at >= " << min_sync_ratio * 100.0 << "% (max "
            << max_wait.count() << " s)";
  while (true)
  {
    try
    {
      const MapSyncStatus status = poll();
      const double elapsed_s = toSeconds(Clock::now() - start);
      if (callback)
      {
        callback(elapsed_s, status);
      }
      if (meetsSyncTarget(status, min_keyframes, min_sync_ratio))
      {
        LOG(INFO) << "[Sync] Map data ready after " << elapsed_s << " s: "
                  << formatMapSyncStatus(status);
        return status;
      }
    }
    catch (const AuroraError& e)
    {
      ++failures;
      if (failures <= 3u || failures % 10u == 0u)
      {
        LOG(WARNING) << "[Sync] Poll failed (" << failures << " so far): " << e.what();
      }
    }

    const double elapsed_s = toSeconds(Clock::now() - start);
    if (elapsed_s >= max_wait.count())
    {
      std::ostringstream ss;
      ss << "Map data not ready after " << elapsed_s << " s: "
         << (has_status_ ? formatMapSyncStatus(last_) : std::string("no status"))
         << ", need " << min_keyframes << " keyframes at "
         << min_sync_ratio * 100.0 << "%";
      throw TimeoutError(ss.str());
    }
    const double remaining = max_wait.count() - elapsed_s;
    if (cancel.waitFor(Duration(std::min(options_.poll_interval.count(), remaining))))
    {
      LOG(INFO) << "[Sync] Wait for map data cancelled";
      return last_;
    }
  }
}

MapSyncStatus SyncTracker::waitForMapData(const SyncProgressCallback& callback,
                                          const CancellationToken* token)
{
  return waitForMapData(options_.min_keyframes, options_.min_sync_ratio,
                        options_.max_wait, callback, token);
}

void SyncTracker::enableMapDataSyncing(bool enable)
{
  channel_.setMapDataSyncing(enable);
  LOG(INFO) << "[Sync] Map data syncing " << (enable ? "enabled" : "disabled");
}

void SyncTracker::resync(bool invalidate_cache)
{
  channel_.resyncMapData(invalidate_cache);
  if (invalidate_cache)
  {
    has_status_ = false;
    last_ = MapSyncStatus();
  }
  LOG(INFO) << "[Sync] Requested resync" << (invalidate_cache ? " with cache invalidation" : "");
}

} // namespace aurora
