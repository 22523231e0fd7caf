// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/simulated_device_channel.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

constexpr DeviceStampNs kSimEpochNs = 1000000000ull;  // device clock starts at 1 s
constexpr double kPi = 3.14159265358979323846;
constexpr double kTrajectoryRadius = 5.0;
constexpr double kTrajectoryAngularRate = 0.2;  // rad/s
constexpr size_t kSlidingWindowKeyframes = 20u;
constexpr uint32_t kMappingFlagLocalMapping = 1u << 0;
constexpr uint32_t kMappingFlagSyncing = 1u << 1;

DeviceStampNs to_ns(double seconds)
{
  return static_cast<DeviceStampNs>(std::llround(seconds * 1e9));
}

DeviceStampNs period_ns(double rate_hz)
{
  return rate_hz > 0.0 ? std::max<DeviceStampNs>(1u, to_ns(1.0 / rate_hz)) : 0u;
}

} // unnamed namespace

DeviceLocator defaultSimulatedLocator()
{
  DeviceLocator locator;
  locator.protocol = "sim";
  locator.address = "localhost";
  return locator;
}

struct SimulatedDeviceChannel::StorageJob
{
  MapStorageDirection direction = MapStorageDirection::Download;
  std::string path;
  std::vector<uint8_t> bytes;
  size_t total_bytes = 0u;
  size_t done_bytes = 0u;
  double byte_accum = 0.0;
  bool abort_requested = false;
  std::ofstream out;
  std::ifstream in;
};

SimulatedDeviceChannel::SimulatedDeviceChannel(const SimulatedDeviceOptions& options,
                                               const DeviceLocator& locator)
  : options_(options)
  , locator_(locator)
  , sim_time_ns_(kSimEpochNs)
  , syncing_(options.map_data_syncing)
{
  options_.imu_ring_capacity = std::max<size_t>(1u, options_.imu_ring_capacity);
  options_.lidar_ring_capacity = std::max<size_t>(1u, options_.lidar_ring_capacity);
  next_imu_stamp_ns_ = sim_time_ns_ + period_ns(options_.imu_rate_hz);
  next_lidar_stamp_ns_ = sim_time_ns_ + period_ns(options_.lidar_rate_hz);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t m = 0u; m < options_.inactive_maps; ++m)
    {
      SimMap& map = createMapLocked();
      for (size_t i = 0u; i < options_.keyframes_per_inactive_map; ++i)
      {
        appendKeyframeLocked(map);
      }
    }
    SimMap& active = createMapLocked();
    for (size_t i = 0u; i < options_.initial_keyframes; ++i)
    {
      appendKeyframeLocked(active);
    }
  }

  VLOG(1) << "[SimDevice] " << options_.device_name << " at " << locator_.toString()
          << " with " << maps_.size() << " map(s)";

  if (options_.run_background_thread)
  {
    running_ = true;
    ticker_thread_ = std::thread(&SimulatedDeviceChannel::tickerLoop, this);
  }
}

SimulatedDeviceChannel::~SimulatedDeviceChannel()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  stop_cv_.notify_all();
  if (ticker_thread_.joinable())
  {
    ticker_thread_.join();
  }
  if (storage_job_ && storage_job_->direction == MapStorageDirection::Download)
  {
    storage_job_->out.close();
    std::remove(storage_job_->path.c_str());
  }
}

void SimulatedDeviceChannel::tickerLoop()
{
  const Clock::duration interval =
      std::chrono::duration_cast<Clock::duration>(options_.tick_interval);
  Clock::time_point last = Clock::now();
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_)
  {
    stop_cv_.wait_for(lock, interval);
    if (!running_)
    {
      break;
    }
    const Clock::time_point now = Clock::now();
    stepLocked(toSeconds(now - last));
    last = now;
  }
}

void SimulatedDeviceChannel::step(Duration dt)
{
  std::lock_guard<std::mutex> lock(mutex_);
  stepLocked(dt.count());
}

void SimulatedDeviceChannel::stepLocked(double dt_s)
{
  if (dt_s <= 0.0)
  {
    return;
  }
  sim_time_ns_ += to_ns(dt_s);
  growLocked(dt_s);
  syncLocked(dt_s);
  storageLocked(dt_s);
  streamsLocked();
}

// ---------------------------------------------------------------------------
// Mapping

SimulatedDeviceChannel::SimMap& SimulatedDeviceChannel::createMapLocked()
{
  SimMap map;
  map.id = next_map_id_++;
  active_map_id_ = map.id;
  ++revision_;
  return maps_[map.id] = map;
}

void SimulatedDeviceChannel::appendKeyframeLocked(SimMap& map)
{
  const double t_s = static_cast<double>(sim_time_ns_) * 1e-9;

  KeyframeDesc kf;
  kf.id = next_keyframe_id_++;
  kf.map_id = map.id;
  kf.timestamp = t_s;
  kf.position = trajectoryPosition(t_s + 0.01 * static_cast<double>(kf.id));
  kf.orientation = Quaternion(Eigen::AngleAxis<real_t>(
      kTrajectoryAngularRate * t_s, Vector3::UnitZ()));
  if (map.keyframes.empty())
  {
    kf.flags |= c_keyframe_flag_fixed;
  }
  else
  {
    kf.parent_id = map.keyframes.back().id;
    kf.connected_ids.push_back(kf.parent_id);
  }

  const size_t n = options_.loop_closure_every_n_keyframes;
  const size_t index = map.keyframes.size();
  if (n > 0u && index >= n && index % n == 0u)
  {
    kf.looped_ids.push_back(map.keyframes[index - n].id);
  }
  map.keyframes.push_back(kf);

  for (size_t i = 0u; i < options_.map_points_per_keyframe; ++i)
  {
    MapPointDesc mp;
    mp.id = next_map_point_id_++;
    mp.map_id = map.id;
    mp.timestamp = t_s;
    const double a = 0.7 * static_cast<double>(mp.id);
    mp.position = kf.position + Vector3(2.0 * std::cos(a), 2.0 * std::sin(a),
                                        0.5 * std::sin(0.3 * a));
    map.map_points.push_back(mp);
  }
  ++revision_;
}

Vector3 SimulatedDeviceChannel::trajectoryPosition(double t_s) const
{
  const double a = kTrajectoryAngularRate * t_s;
  return Vector3(kTrajectoryRadius * std::cos(a), kTrajectoryRadius * std::sin(a), 0.0);
}

void SimulatedDeviceChannel::growLocked(double dt_s)
{
  if (options_.keyframes_per_second <= 0.0)
  {
    return;
  }
  keyframe_accum_ += options_.keyframes_per_second * dt_s;
  SimMap& active = maps_.at(active_map_id_);
  while (keyframe_accum_ >= 1.0)
  {
    appendKeyframeLocked(active);
    keyframe_accum_ -= 1.0;
  }
}

void SimulatedDeviceChannel::syncLocked(double dt_s)
{
  const double total_kf = static_cast<double>(totalKeyframesLocked());
  const double total_mp = static_cast<double>(totalMapPointsLocked());
  const uint64_t kf_before = static_cast<uint64_t>(fetched_keyframes_);
  const uint64_t mp_before = static_cast<uint64_t>(fetched_map_points_);
  if (syncing_ && options_.sync_keyframes_per_second > 0.0)
  {
    const double kf_rate = options_.sync_keyframes_per_second;
    const double mp_rate =
        kf_rate * static_cast<double>(std::max<size_t>(1u, options_.map_points_per_keyframe));
    fetched_keyframes_ = std::min(total_kf, fetched_keyframes_ + kf_rate * dt_s);
    fetched_map_points_ = std::min(total_mp, fetched_map_points_ + mp_rate * dt_s);
  }
  last_keyframes_retrieved_ = static_cast<uint64_t>(fetched_keyframes_) - kf_before;
  last_map_points_retrieved_ = static_cast<uint64_t>(fetched_map_points_) - mp_before;
}

uint64_t SimulatedDeviceChannel::totalKeyframesLocked() const
{
  uint64_t n = 0u;
  for (const auto& entry : maps_)
  {
    n += entry.second.keyframes.size();
  }
  return n;
}

uint64_t SimulatedDeviceChannel::totalMapPointsLocked() const
{
  uint64_t n = 0u;
  for (const auto& entry : maps_)
  {
    n += entry.second.map_points.size();
  }
  return n;
}

MapDesc SimulatedDeviceChannel::describeLocked(const SimMap& map) const
{
  MapDesc desc;
  desc.map_id = map.id;
  desc.map_flags = map.flags;
  desc.keyframe_count = map.keyframes.size();
  desc.map_point_count = map.map_points.size();
  if (!map.keyframes.empty())
  {
    desc.keyframe_id_start = map.keyframes.front().id;
    desc.keyframe_id_end = map.keyframes.back().id;
  }
  if (!map.map_points.empty())
  {
    desc.map_point_id_start = map.map_points.front().id;
    desc.map_point_id_end = map.map_points.back().id;
  }
  return desc;
}

// ---------------------------------------------------------------------------
// Streams

void SimulatedDeviceChannel::streamsLocked()
{
  const double t_s = static_cast<double>(sim_time_ns_) * 1e-9;
  pose_.timestamp_ns = sim_time_ns_;
  pose_.position = trajectoryPosition(t_s);
  pose_.orientation = Quaternion(Eigen::AngleAxis<real_t>(
      kTrajectoryAngularRate * t_s, Vector3::UnitZ()));
  pose_valid_ = true;

  const DeviceStampNs imu_period = period_ns(options_.imu_rate_hz);
  while (imu_period > 0u && next_imu_stamp_ns_ <= sim_time_ns_)
  {
    const double ts = static_cast<double>(next_imu_stamp_ns_) * 1e-9;
    ImuSample sample;
    sample.timestamp_ns = next_imu_stamp_ns_;
    sample.acc = Vector3(0.01 * std::sin(3.0 * ts), 0.01 * std::cos(3.0 * ts), 1.0);
    sample.gyro = Vector3(0.0, 0.0, kTrajectoryAngularRate * 180.0 / kPi);
    imu_ring_.push_back(sample);
    if (imu_ring_.size() > options_.imu_ring_capacity)
    {
      imu_ring_.pop_front();
    }
    next_imu_stamp_ns_ += imu_period;
  }

  const DeviceStampNs lidar_period = period_ns(options_.lidar_rate_hz);
  while (lidar_period > 0u && next_lidar_stamp_ns_ <= sim_time_ns_)
  {
    LidarScan scan;
    scan.timestamp_ns = next_lidar_stamp_ns_;
    scan.points.resize(options_.lidar_points_per_scan);
    for (size_t i = 0u; i < scan.points.size(); ++i)
    {
      const double angle = 2.0 * kPi * static_cast<double>(i)
          / static_cast<double>(scan.points.size());
      scan.points[i].angle = static_cast<float>(angle);
      scan.points[i].dist = static_cast<float>(4.0 + std::sin(4.0 * angle));
      scan.points[i].quality = 200u;
    }
    lidar_ring_.push_back(std::move(scan));
    if (lidar_ring_.size() > options_.lidar_ring_capacity)
    {
      lidar_ring_.pop_front();
    }
    next_lidar_stamp_ns_ += lidar_period;
  }
}

// ---------------------------------------------------------------------------
// Requests

void SimulatedDeviceChannel::beginRequestLocked(const char* what)
{
  ++stats_.requests;
  if (!connected_)
  {
    ++stats_.failed_requests;
    throw ConnectionError(std::string("Simulated device disconnected during ") + what);
  }
  if (fail_next_requests_ > 0u)
  {
    --fail_next_requests_;
    ++stats_.failed_requests;
    throwOnError(fail_code_, std::string("Injected failure of ") + what);
  }
}

bool SimulatedDeviceChannel::isConnected() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

DeviceBasicInfo SimulatedDeviceChannel::getDeviceBasicInfo()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("getDeviceBasicInfo");
  DeviceBasicInfo info;
  info.device_name = options_.device_name;
  info.model_string = "A1M1-SIM";
  info.firmware_version = options_.firmware_version;
  info.hardware_version = "sim";
  info.serial_number = options_.serial_number;
  info.hw_features = c_hw_feature_imu | c_hw_feature_stereo_camera;
  if (options_.lidar_rate_hz > 0.0)
  {
    info.hw_features |= c_hw_feature_lidar;
  }
  info.sensing_features = c_sensing_feature_vslam | c_sensing_feature_comap;
  info.timestamp_ns = sim_time_ns_;
  return info;
}

GlobalMappingInfo SimulatedDeviceChannel::getGlobalMappingInfo()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("getGlobalMappingInfo");
  ++stats_.mapping_info_queries;

  GlobalMappingInfo info;
  info.total_keyframe_count = totalKeyframesLocked();
  info.total_map_point_count = totalMapPointsLocked();
  info.total_map_count = maps_.size();
  info.total_keyframe_count_fetched = static_cast<uint64_t>(fetched_keyframes_);
  info.total_map_point_count_fetched = static_cast<uint64_t>(fetched_map_points_);

  // A map counts as fetched once all of its keyframes are, in id order.
  uint64_t cumulative = 0u;
  for (const auto& entry : maps_)
  {
    cumulative += entry.second.keyframes.size();
    if (cumulative <= info.total_keyframe_count_fetched)
    {
      ++info.total_map_count_fetched;
    }
  }

  info.last_keyframe_count_to_fetch =
      info.total_keyframe_count - info.total_keyframe_count_fetched;
  info.last_map_point_count_to_fetch =
      info.total_map_point_count - info.total_map_point_count_fetched;
  info.last_map_count_to_fetch = info.total_map_count - info.total_map_count_fetched;
  info.last_keyframe_retrieved = last_keyframes_retrieved_;
  info.last_map_point_retrieved = last_map_points_retrieved_;

  const SimMap& active = maps_.at(active_map_id_);
  info.active_map_id = active_map_id_;
  info.current_active_keyframe_count = active.keyframes.size();
  info.current_active_map_point_count = active.map_points.size();
  if (!active.keyframes.empty())
  {
    const size_t start = active.keyframes.size() > kSlidingWindowKeyframes
        ? active.keyframes.size() - kSlidingWindowKeyframes : 0u;
    info.sliding_window_start_keyframe_id = active.keyframes[start].id;
  }
  if (options_.keyframes_per_second > 0.0)
  {
    info.mapping_flags |= kMappingFlagLocalMapping;
  }
  if (syncing_)
  {
    info.mapping_flags |= kMappingFlagSyncing;
  }
  return info;
}

void SimulatedDeviceChannel::setMapDataSyncing(bool enable)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("setMapDataSyncing");
  syncing_ = enable;
}

void SimulatedDeviceChannel::resyncMapData(bool invalidate_cache)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("resyncMapData");
  if (invalidate_cache)
  {
    fetched_keyframes_ = 0.0;
    fetched_map_points_ = 0.0;
  }
}

void SimulatedDeviceChannel::requireMapReset()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("requireMapReset");
  maps_.clear();
  createMapLocked();
  keyframe_accum_ = 0.0;
  fetched_keyframes_ = 0.0;
  fetched_map_points_ = 0.0;
  LOG(INFO) << "[SimDevice] Map reset; new active map " << active_map_id_;
}

void SimulatedDeviceChannel::accessMapData(const MapDataRequest& request,
                                           MapDataVisitor& visitor)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("accessMapData");
  ++stats_.map_data_calls;

  const bool want_kf = request.wants(c_map_data_part_keyframes);
  const bool want_mp = request.wants(c_map_data_part_map_points);
  const bool want_info = request.wants(c_map_data_part_map_info);
  stats_.keyframe_requests += want_kf ? 1u : 0u;
  stats_.map_point_requests += want_mp ? 1u : 0u;
  stats_.map_info_requests += want_info ? 1u : 0u;

  MapIds resolved;
  switch (request.selector.kind())
  {
  case MapSelector::Kind::ActiveOnly:
    resolved.push_back(active_map_id_);
    break;
  case MapSelector::Kind::AllMaps:
    for (const auto& entry : maps_)
    {
      resolved.push_back(entry.first);
    }
    break;
  case MapSelector::Kind::SpecificIds:
    for (MapId id : request.selector.ids())
    {
      if (maps_.count(id) > 0u)
      {
        resolved.push_back(id);
      }
    }
    break;
  }

  const bool armed = fail_map_data_armed_;
  size_t budget = fail_map_data_after_;
  fail_map_data_armed_ = false;
  auto deliver = [&]() {
    if (armed && budget-- == 0u)
    {
      throw ConnectionError("Simulated connection drop during map data transfer");
    }
  };

  visitor.onSnapshotBegin(revision_, resolved);
  if (want_info)
  {
    for (MapId id : resolved)
    {
      deliver();
      visitor.onMapDesc(describeLocked(maps_.at(id)));
      ++stats_.map_descs_delivered;
    }
  }
  if (want_kf)
  {
    const bool looped = (request.keyframe_fetch_flags & c_keyframe_fetch_flag_looped_ids) != 0u;
    const bool connected =
        (request.keyframe_fetch_flags & c_keyframe_fetch_flag_connected_ids) != 0u;
    for (MapId id : resolved)
    {
      for (const KeyframeDesc& kf : maps_.at(id).keyframes)
      {
        deliver();
        if (looped && connected)
        {
          visitor.onKeyframe(kf);
        }
        else
        {
          KeyframeDesc trimmed = kf;
          if (!looped)
          {
            trimmed.looped_ids.clear();
          }
          if (!connected)
          {
            trimmed.connected_ids.clear();
          }
          visitor.onKeyframe(trimmed);
        }
        ++stats_.keyframes_delivered;
      }
    }
  }
  if (want_mp)
  {
    const bool stamped =
        (request.map_point_fetch_flags & c_map_point_fetch_flag_timestamp) != 0u;
    for (MapId id : resolved)
    {
      for (const MapPointDesc& mp : maps_.at(id).map_points)
      {
        deliver();
        if (stamped)
        {
          visitor.onMapPoint(mp);
        }
        else
        {
          MapPointDesc trimmed = mp;
          trimmed.timestamp = 0.0;
          visitor.onMapPoint(trimmed);
        }
        ++stats_.map_points_delivered;
      }
    }
  }
  visitor.onSnapshotEnd(revision_);
}

std::vector<ImuSample> SimulatedDeviceChannel::peekImuData(size_t max_count)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("peekImuData");
  ++stats_.imu_peeks;
  const size_t n = std::min(max_count, imu_ring_.size());
  return std::vector<ImuSample>(imu_ring_.end() - static_cast<std::ptrdiff_t>(n),
                                imu_ring_.end());
}

std::vector<LidarScan> SimulatedDeviceChannel::peekLidarScans(size_t max_count)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("peekLidarScans");
  ++stats_.lidar_peeks;
  const size_t n = std::min(max_count, lidar_ring_.size());
  return std::vector<LidarScan>(lidar_ring_.end() - static_cast<std::ptrdiff_t>(n),
                                lidar_ring_.end());
}

PoseSample SimulatedDeviceChannel::getCurrentPose()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("getCurrentPose");
  if (!pose_valid_)
  {
    throw DataNotReadyError("Pose not available yet");
  }
  return pose_;
}

// ---------------------------------------------------------------------------
// Map storage

void SimulatedDeviceChannel::startMapStorageSession(const std::string& path,
                                                    MapStorageDirection direction)
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("startMapStorageSession");
  if (storage_job_)
  {
    throw ProtocolError("Map storage session already active", ErrorCode::OpFailed);
  }

  std::unique_ptr<StorageJob> job(new StorageJob);
  job->direction = direction;
  job->path = path;
  if (direction == MapStorageDirection::Download)
  {
    job->bytes = encodeMapArchive(snapshotArchiveLocked());
    job->total_bytes = job->bytes.size();
    job->out.open(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!job->out.is_open())
    {
      throw ProtocolError("Cannot open " + path + " for writing", ErrorCode::IoError);
    }
  }
  else
  {
    job->in.open(path.c_str(), std::ios::in | std::ios::binary | std::ios::ate);
    if (!job->in.is_open())
    {
      throw ProtocolError("Cannot open " + path + " for reading", ErrorCode::IoError);
    }
    const std::streamoff size = job->in.tellg();
    job->total_bytes = size > 0 ? static_cast<size_t>(size) : 0u;
    job->in.seekg(0, std::ios::beg);
    job->bytes.reserve(job->total_bytes);
  }

  storage_job_ = std::move(job);
  storage_status_.flag = MapStorageStatusFlag::Working;
  storage_status_.progress = 0.0f;
  storage_status_.message = std::string(mapStorageDirectionName(direction)) + " in progress";
  status_lag_pending_ = false;
  ++stats_.storage_sessions_started;
  LOG(INFO) << "[SimDevice] Started map " << mapStorageDirectionName(direction)
            << " session for " << path << " (" << storage_job_->total_bytes << " bytes)";
}

bool SimulatedDeviceChannel::isMapStorageSessionActive()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("isMapStorageSessionActive");
  if (!storage_job_)
  {
    status_lag_pending_ = false;
    return false;
  }
  return true;
}

MapStorageStatus SimulatedDeviceChannel::queryMapStorageStatus()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("queryMapStorageStatus");
  ++stats_.storage_status_queries;
  if (status_lag_pending_)
  {
    return lagged_status_;
  }
  return storage_status_;
}

void SimulatedDeviceChannel::abortMapStorageSession()
{
  std::lock_guard<std::mutex> lock(mutex_);
  beginRequestLocked("abortMapStorageSession");
  if (storage_job_)
  {
    storage_job_->abort_requested = true;
  }
}

void SimulatedDeviceChannel::storageLocked(double dt_s)
{
  if (!storage_job_)
  {
    return;
  }
  StorageJob& job = *storage_job_;
  const bool download = job.direction == MapStorageDirection::Download;

  if (job.abort_requested)
  {
    if (download)
    {
      job.out.close();
      std::remove(job.path.c_str());
    }
    finishStorageLocked(MapStorageStatusFlag::Aborted, "Aborted by request");
    return;
  }

  size_t chunk = job.total_bytes - job.done_bytes;
  if (options_.storage_bytes_per_second > 0.0)
  {
    job.byte_accum += options_.storage_bytes_per_second * dt_s;
    chunk = std::min(chunk, static_cast<size_t>(job.byte_accum));
    job.byte_accum -= static_cast<double>(chunk);
  }

  if (chunk > 0u)
  {
    if (download)
    {
      job.out.write(reinterpret_cast<const char*>(job.bytes.data() + job.done_bytes),
                    static_cast<std::streamsize>(chunk));
      if (!job.out)
      {
        job.out.close();
        std::remove(job.path.c_str());
        finishStorageLocked(MapStorageStatusFlag::Failed, "Write error on " + job.path);
        return;
      }
    }
    else
    {
      const size_t offset = job.bytes.size();
      job.bytes.resize(offset + chunk);
      job.in.read(reinterpret_cast<char*>(job.bytes.data() + offset),
                  static_cast<std::streamsize>(chunk));
      if (static_cast<size_t>(job.in.gcount()) != chunk)
      {
        finishStorageLocked(MapStorageStatusFlag::Failed, "Read error on " + job.path);
        return;
      }
    }
    job.done_bytes += chunk;
  }

  const float progress = job.total_bytes > 0u
      ? static_cast<float>(100.0 * static_cast<double>(job.done_bytes)
                           / static_cast<double>(job.total_bytes))
      : 100.0f;
  storage_status_.progress = std::max(storage_status_.progress, progress);

  if (options_.storage_fail_at_progress >= 0.0
      && storage_status_.progress >= options_.storage_fail_at_progress)
  {
    std::ostringstream ss;
    ss << "Simulated storage failure at " << storage_status_.progress << "%";
    if (download)
    {
      job.out.close();
      std::remove(job.path.c_str());
    }
    finishStorageLocked(MapStorageStatusFlag::Failed, ss.str());
    return;
  }

  if (job.done_bytes < job.total_bytes)
  {
    return;
  }

  if (download)
  {
    job.out.close();
    finishStorageLocked(MapStorageStatusFlag::Finished, "Map saved to " + job.path);
    return;
  }

  MapArchive archive;
  MapArchiveStats parse_stats;
  if (tryParseMapArchive(job.bytes, &archive, &parse_stats) != MapArchiveParseResult::Parsed)
  {
    std::ostringstream ss;
    ss << "Corrupt map archive " << job.path
       << " (checksum_failures=" << parse_stats.checksum_failures
       << ", malformed=" << parse_stats.malformed_payloads << ")";
    finishStorageLocked(MapStorageStatusFlag::Failed, ss.str());
    return;
  }
  loadArchiveLocked(archive);
  finishStorageLocked(MapStorageStatusFlag::Finished, "Map loaded from " + job.path);
}

void SimulatedDeviceChannel::finishStorageLocked(MapStorageStatusFlag flag,
                                                 const std::string& message)
{
  if (options_.status_lags_inactivity)
  {
    lagged_status_ = storage_status_;
    status_lag_pending_ = true;
  }
  if (flag == MapStorageStatusFlag::Finished)
  {
    storage_status_.progress = 100.0f;
  }
  storage_status_.flag = flag;
  storage_status_.message = message;
  storage_job_.reset();
  LOG(INFO) << "[SimDevice] Map storage session ended: "
            << mapStorageStatusName(flag) << " (" << message << ")";
}

MapArchive SimulatedDeviceChannel::snapshotArchiveLocked() const
{
  MapArchive archive;
  archive.active_map_id = active_map_id_;
  for (const auto& entry : maps_)
  {
    const SimMap& map = entry.second;
    MapDesc desc;
    desc.map_id = map.id;
    desc.map_flags = map.flags;
    archive.maps.push_back(desc);
    archive.keyframes.insert(archive.keyframes.end(),
                             map.keyframes.begin(), map.keyframes.end());
    archive.map_points.insert(archive.map_points.end(),
                              map.map_points.begin(), map.map_points.end());
  }
  return archive;
}

void SimulatedDeviceChannel::loadArchiveLocked(MapArchive& archive)
{
  maps_.clear();
  next_map_id_ = 1u;
  for (const MapDesc& desc : archive.maps)
  {
    SimMap& map = maps_[desc.map_id];
    map.id = desc.map_id;
    map.flags = desc.map_flags;
    next_map_id_ = std::max<MapId>(next_map_id_, desc.map_id + 1u);
  }
  for (KeyframeDesc& kf : archive.keyframes)
  {
    next_keyframe_id_ = std::max(next_keyframe_id_, kf.id + 1u);
    SimMap& map = maps_[kf.map_id];
    map.id = kf.map_id;
    map.keyframes.push_back(std::move(kf));
  }
  for (MapPointDesc& mp : archive.map_points)
  {
    next_map_point_id_ = std::max(next_map_point_id_, mp.id + 1u);
    SimMap& map = maps_[mp.map_id];
    map.id = mp.map_id;
    map.map_points.push_back(std::move(mp));
  }

  if (maps_.count(archive.active_map_id) > 0u)
  {
    active_map_id_ = archive.active_map_id;
    ++revision_;
  }
  else if (!maps_.empty())
  {
    active_map_id_ = maps_.begin()->first;
    ++revision_;
  }
  else
  {
    createMapLocked();
  }
  keyframe_accum_ = 0.0;
  fetched_keyframes_ = 0.0;
  fetched_map_points_ = 0.0;
}

// ---------------------------------------------------------------------------
// Simulation control

void SimulatedDeviceChannel::setConnected(bool connected)
{
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = connected;
}

void SimulatedDeviceChannel::failNextRequests(size_t count, ErrorCode code)
{
  std::lock_guard<std::mutex> lock(mutex_);
  fail_next_requests_ = count;
  fail_code_ = code;
}

void SimulatedDeviceChannel::failNextMapDataAfter(size_t records)
{
  std::lock_guard<std::mutex> lock(mutex_);
  fail_map_data_armed_ = true;
  fail_map_data_after_ = records;
}

void SimulatedDeviceChannel::setKeyframeGrowth(double keyframes_per_second)
{
  std::lock_guard<std::mutex> lock(mutex_);
  options_.keyframes_per_second = keyframes_per_second;
}

void SimulatedDeviceChannel::setSyncRate(double keyframes_per_second)
{
  std::lock_guard<std::mutex> lock(mutex_);
  options_.sync_keyframes_per_second = keyframes_per_second;
}

void SimulatedDeviceChannel::setStorageFailAtProgress(double progress)
{
  std::lock_guard<std::mutex> lock(mutex_);
  options_.storage_fail_at_progress = progress;
}

void SimulatedDeviceChannel::addKeyframes(size_t count)
{
  std::lock_guard<std::mutex> lock(mutex_);
  SimMap& active = maps_.at(active_map_id_);
  for (size_t i = 0u; i < count; ++i)
  {
    appendKeyframeLocked(active);
  }
}

MapId SimulatedDeviceChannel::createMap()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return createMapLocked().id;
}

uint64_t SimulatedDeviceChannel::revision() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return revision_;
}

MapIds SimulatedDeviceChannel::mapIds() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  MapIds ids;
  for (const auto& entry : maps_)
  {
    ids.push_back(entry.first);
  }
  return ids;
}

MapId SimulatedDeviceChannel::activeMapId() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return active_map_id_;
}

SimulatedDeviceStats SimulatedDeviceChannel::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void SimulatedDeviceChannel::resetStats()
{
  std::lock_guard<std::mutex> lock(mutex_);
  stats_ = SimulatedDeviceStats();
}

} // namespace aurora
