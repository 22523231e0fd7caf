// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <aurora/common/cancellation_token.hpp>
#include <aurora/device/device_channel.hpp>

namespace aurora {

constexpr double c_synced_ratio = 0.95;
constexpr uint64_t c_sufficient_keyframes = 10u;
constexpr double c_sufficient_ratio = 0.8;

struct MapSyncStatus
{
  uint64_t total_keyframe_count = 0u;
  uint64_t fetched_keyframe_count = 0u;
  uint64_t total_map_point_count = 0u;
  uint64_t fetched_map_point_count = 0u;
  uint64_t total_map_count = 0u;
  uint64_t fetched_map_count = 0u;
  MapId active_map_id = 0u;

  //! fetched / total keyframes in [0, 1]; 0 while the map is empty.
  double sync_ratio = 0.0;
  bool is_synced = false;
  bool is_sufficient = false;
  //! Totals dropped since the previous poll (map reset on the device).
  bool reset_detected = false;
};

//! fetched / total clamped to [0, 1]; 0 for total == 0.
double computeSyncRatio(uint64_t fetched, uint64_t total);

//! True if a non-empty map has at least @p min_keyframes fetched keyframes
//! and a sync ratio of at least @p min_sync_ratio.
bool meetsSyncTarget(const MapSyncStatus& status, uint64_t min_keyframes,
                     double min_sync_ratio);

//! "81.0% synced (81/100 KF)", or a longer line with @p verbose.
std::string formatMapSyncStatus(const MapSyncStatus& status, bool verbose = false);

struct SyncTrackerOptions
{
  Duration poll_interval{0.5};
  uint64_t min_keyframes = c_sufficient_keyframes;
  double min_sync_ratio = c_sufficient_ratio;
  Duration max_wait{30.0};
};

using SyncProgressCallback =
    std::function<void(double elapsed_s, const MapSyncStatus& status)>;

//! Follows how far the device has mirrored its live map into the client
//! cache.
//!
//! Totals may grow between polls, so the ratio can stall or drop while real
//! progress happens. Fetched counts reported by the tracker never decrease,
//! except after a detected map reset or a resync with cache invalidation,
//! which restart the baseline.
class SyncTracker
{
public:
  explicit SyncTracker(DeviceChannel& channel,
                       const SyncTrackerOptions& options = SyncTrackerOptions());

  //! One query of the device counters. Channel errors propagate.
  MapSyncStatus poll();

  bool hasStatus() const { return has_status_; }
  const MapSyncStatus& lastStatus() const { return last_; }
  uint64_t resetCount() const { return resets_; }

  //! Polls until meetsSyncTarget() holds and returns that status. Throws
  //! TimeoutError once @p max_wait has passed. Poll failures are logged and
  //! retried. Cancellation returns the last status, which then does not meet
  //! the target.
  MapSyncStatus waitForMapData(uint64_t min_keyframes,
                               double min_sync_ratio,
                               Duration max_wait,
                               const SyncProgressCallback& callback = SyncProgressCallback(),
                               const CancellationToken* token = nullptr);

  //! waitForMapData() with the thresholds from the options.
  MapSyncStatus waitForMapData(const SyncProgressCallback& callback = SyncProgressCallback(),
                               const CancellationToken* token = nullptr);

  void enableMapDataSyncing(bool enable);
  void resync(bool invalidate_cache);

private:
  DeviceChannel& channel_;
  SyncTrackerOptions options_;
  MapSyncStatus last_;
  bool has_status_ = false;
  uint64_t resets_ = 0u;
  uint64_t regressions_ = 0u;
};

} // namespace aurora
