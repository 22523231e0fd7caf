// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <aurora/common/errors.hpp>
#include <aurora/device/device_channel.hpp>
#include <aurora/device/map_archive.hpp>

namespace aurora {

struct SimulatedDeviceOptions
{
  std::string device_name = "Aurora-Sim";
  std::string serial_number = "SIM-000001";
  std::string firmware_version = "1.2.0-sim";

  //! Without the background thread the device only moves on step().
  bool run_background_thread = true;
  Duration tick_interval{0.02};

  //! @name Mapping
  //! @{
  double keyframes_per_second = 5.0;
  size_t map_points_per_keyframe = 20u;
  size_t loop_closure_every_n_keyframes = 25u;  // 0 disables
  size_t initial_keyframes = 0u;                // preloaded into the active map
  size_t inactive_maps = 0u;
  size_t keyframes_per_inactive_map = 20u;
  //! @}

  //! @name Map-data syncing (device to client cache)
  //! @{
  bool map_data_syncing = true;
  double sync_keyframes_per_second = 20.0;
  //! @}

  //! @name Map storage
  //! @{
  double storage_bytes_per_second = 1024.0 * 1024.0;  // <= 0: one tick
  //! After a session ends, status queries keep reporting the last Working
  //! status until the client has observed the session as inactive.
  bool status_lags_inactivity = false;
  double storage_fail_at_progress = -1.0;  // < 0 disables
  //! @}

  //! @name Streams
  //! @{
  double imu_rate_hz = 200.0;
  size_t imu_ring_capacity = 256u;
  double lidar_rate_hz = 10.0;
  size_t lidar_ring_capacity = 4u;
  size_t lidar_points_per_scan = 360u;
  //! @}
};

struct SimulatedDeviceStats
{
  uint64_t requests = 0u;
  uint64_t failed_requests = 0u;
  uint64_t mapping_info_queries = 0u;
  uint64_t map_data_calls = 0u;
  uint64_t keyframe_requests = 0u;
  uint64_t map_point_requests = 0u;
  uint64_t map_info_requests = 0u;
  uint64_t keyframes_delivered = 0u;
  uint64_t map_points_delivered = 0u;
  uint64_t map_descs_delivered = 0u;
  uint64_t storage_sessions_started = 0u;
  uint64_t storage_status_queries = 0u;
  uint64_t imu_peeks = 0u;
  uint64_t lidar_peeks = 0u;
};

DeviceLocator defaultSimulatedLocator();

//! In-process model of the SLAM appliance.
//!
//! The device grows its active map, syncs map data to the (virtual) client
//! cache, runs map storage sessions against local files and fills IMU/LiDAR
//! ring buffers. All state sits behind one mutex, so every request observes a
//! single revision of the map.
class SimulatedDeviceChannel : public DeviceChannel
{
public:
  explicit SimulatedDeviceChannel(
      const SimulatedDeviceOptions& options = SimulatedDeviceOptions(),
      const DeviceLocator& locator = defaultSimulatedLocator());
  ~SimulatedDeviceChannel() override;

  SimulatedDeviceChannel(const SimulatedDeviceChannel&) = delete;
  SimulatedDeviceChannel& operator=(const SimulatedDeviceChannel&) = delete;

  bool isConnected() const override;
  const DeviceLocator& locator() const override { return locator_; }

  DeviceBasicInfo getDeviceBasicInfo() override;

  void startMapStorageSession(const std::string& path,
                              MapStorageDirection direction) override;
  bool isMapStorageSessionActive() override;
  MapStorageStatus queryMapStorageStatus() override;
  void abortMapStorageSession() override;

  GlobalMappingInfo getGlobalMappingInfo() override;
  void setMapDataSyncing(bool enable) override;
  void resyncMapData(bool invalidate_cache) override;
  void requireMapReset() override;

  void accessMapData(const MapDataRequest& request,
                     MapDataVisitor& visitor) override;

  std::vector<ImuSample> peekImuData(size_t max_count) override;
  std::vector<LidarScan> peekLidarScans(size_t max_count) override;
  PoseSample getCurrentPose() override;

  //! Advances the simulation clock by @p dt.
  void step(Duration dt);

  //! @name Simulation control (not requests; never fail)
  //! @{
  void setConnected(bool connected);
  //! The next @p count requests throw the exception matching @p code.
  void failNextRequests(size_t count, ErrorCode code = ErrorCode::OpFailed);
  //! The next accessMapData() call drops the connection after delivering
  //! @p records records to the visitor.
  void failNextMapDataAfter(size_t records);
  void setKeyframeGrowth(double keyframes_per_second);
  void setSyncRate(double keyframes_per_second);
  void setStorageFailAtProgress(double progress);
  void addKeyframes(size_t count);
  //! Starts a new active map; the previous one stays as an inactive map.
  MapId createMap();
  uint64_t revision() const;
  MapIds mapIds() const;
  MapId activeMapId() const;
  SimulatedDeviceStats stats() const;
  void resetStats();
  //! @}

private:
  struct SimMap
  {
    MapId id = 0u;
    uint32_t flags = 0u;
    std::vector<KeyframeDesc> keyframes;
    std::vector<MapPointDesc> map_points;
  };
  struct StorageJob;

  void tickerLoop();
  void stepLocked(double dt_s);
  void growLocked(double dt_s);
  void syncLocked(double dt_s);
  void storageLocked(double dt_s);
  void streamsLocked();

  void beginRequestLocked(const char* what);
  SimMap& createMapLocked();
  void appendKeyframeLocked(SimMap& map);
  MapDesc describeLocked(const SimMap& map) const;
  uint64_t totalKeyframesLocked() const;
  uint64_t totalMapPointsLocked() const;
  Vector3 trajectoryPosition(double t_s) const;

  MapArchive snapshotArchiveLocked() const;
  void loadArchiveLocked(MapArchive& archive);
  void finishStorageLocked(MapStorageStatusFlag flag, const std::string& message);

  SimulatedDeviceOptions options_;
  DeviceLocator locator_;

  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  std::thread ticker_thread_;
  bool running_ = false;

  bool connected_ = true;
  size_t fail_next_requests_ = 0u;
  ErrorCode fail_code_ = ErrorCode::OpFailed;
  bool fail_map_data_armed_ = false;
  size_t fail_map_data_after_ = 0u;
  SimulatedDeviceStats stats_;

  DeviceStampNs sim_time_ns_;
  uint64_t revision_ = 1u;

  std::map<MapId, SimMap> maps_;
  MapId active_map_id_ = 0u;
  MapId next_map_id_ = 1u;
  uint64_t next_keyframe_id_ = 1u;
  uint64_t next_map_point_id_ = 1u;
  double keyframe_accum_ = 0.0;

  bool syncing_ = true;
  double fetched_keyframes_ = 0.0;
  double fetched_map_points_ = 0.0;
  uint64_t last_keyframes_retrieved_ = 0u;
  uint64_t last_map_points_retrieved_ = 0u;

  std::unique_ptr<StorageJob> storage_job_;
  MapStorageStatus storage_status_;
  MapStorageStatus lagged_status_;
  bool status_lag_pending_ = false;

  std::deque<ImuSample> imu_ring_;
  std::deque<LidarScan> lidar_ring_;
  DeviceStampNs next_imu_stamp_ns_ = 0u;
  DeviceStampNs next_lidar_stamp_ns_ = 0u;
  bool pose_valid_ = false;
  PoseSample pose_;
};

} // namespace aurora
