// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstddef>
#include <vector>

#include <aurora/device/device_channel.hpp>
#include <aurora/device/stream_deduplicator.hpp>

namespace aurora {

constexpr size_t c_default_imu_peek_count = 4096u;
constexpr size_t c_default_lidar_peek_count = 8u;

//! Polls the device IMU ring buffer and yields each sample once.
class ImuStreamReader
{
public:
  explicit ImuStreamReader(DeviceChannel& channel,
                           size_t max_count = c_default_imu_peek_count);

  //! One peek. Appends the new samples to @p fresh and returns their number.
  //! Channel errors propagate.
  size_t poll(std::vector<ImuSample>* fresh);

  const StreamDedupStats& stats() const { return dedup_.stats(); }
  DeviceStampNs watermark() const { return dedup_.watermark(); }

private:
  DeviceChannel& channel_;
  size_t max_count_;
  StreamDeduplicator<ImuSample> dedup_;
  uint64_t reported_overruns_ = 0u;
};

class LidarScanReader
{
public:
  explicit LidarScanReader(DeviceChannel& channel,
                           size_t max_count = c_default_lidar_peek_count);

  size_t poll(std::vector<LidarScan>* fresh);

  const StreamDedupStats& stats() const { return dedup_.stats(); }

private:
  DeviceChannel& channel_;
  size_t max_count_;
  StreamDeduplicator<LidarScan> dedup_;
  uint64_t reported_overruns_ = 0u;
};

} // namespace aurora
