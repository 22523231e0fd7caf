// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/device_channel_factory.hpp>

#include <algorithm>

#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>

DEFINE_string(device, "sim://localhost",
              "Device locator: address, address:port or protocol://address:port.");

DEFINE_bool(sim_background_thread, true,
            "Simulated device advances on its own thread.");
DEFINE_int32(sim_tick_ms, 20, "Simulated device tick interval in ms.");
DEFINE_double(sim_keyframes_per_second, 5.0,
              "Simulated device keyframe creation rate.");
DEFINE_int32(sim_map_points_per_keyframe, 20,
             "Map points created with each simulated keyframe.");
DEFINE_int32(sim_loop_closure_every, 25,
             "Close a loop every N keyframes (0 disables).");
DEFINE_int32(sim_initial_keyframes, 30,
             "Keyframes preloaded into the simulated active map.");
DEFINE_int32(sim_inactive_maps, 1,
             "Additional preloaded inactive maps.");
DEFINE_double(sim_sync_keyframes_per_second, 40.0,
              "Rate at which the simulated device syncs keyframes to the client.");
DEFINE_double(sim_storage_bytes_per_second, 256.0 * 1024.0,
              "Simulated map storage throughput (<=0 completes in one tick).");
DEFINE_bool(sim_status_lag, true,
            "Simulated device reports a stale status until inactivity is observed.");
DEFINE_double(sim_imu_rate_hz, 200.0, "Simulated IMU rate.");
DEFINE_int32(sim_imu_ring_depth, 256, "Simulated IMU ring buffer depth.");
DEFINE_double(sim_lidar_rate_hz, 10.0, "Simulated LiDAR scan rate (0 disables).");

namespace aurora {

SimulatedDeviceOptions simulatedDeviceOptionsFromGflags()
{
  CHECK_GT(FLAGS_sim_tick_ms, 0);
  CHECK_GE(FLAGS_sim_map_points_per_keyframe, 0);
  CHECK_GE(FLAGS_sim_initial_keyframes, 0);
  CHECK_GE(FLAGS_sim_inactive_maps, 0);
  CHECK_GT(FLAGS_sim_imu_ring_depth, 0);

  SimulatedDeviceOptions options;
  options.run_background_thread = FLAGS_sim_background_thread;
  options.tick_interval = Duration(static_cast<double>(FLAGS_sim_tick_ms) * 1e-3);
  options.keyframes_per_second = FLAGS_sim_keyframes_per_second;
  options.map_points_per_keyframe = static_cast<size_t>(FLAGS_sim_map_points_per_keyframe);
  options.loop_closure_every_n_keyframes =
      static_cast<size_t>(std::max(0, FLAGS_sim_loop_closure_every));
  options.initial_keyframes = static_cast<size_t>(FLAGS_sim_initial_keyframes);
  options.inactive_maps = static_cast<size_t>(FLAGS_sim_inactive_maps);
  options.sync_keyframes_per_second = FLAGS_sim_sync_keyframes_per_second;
  options.storage_bytes_per_second = FLAGS_sim_storage_bytes_per_second;
  options.status_lags_inactivity = FLAGS_sim_status_lag;
  options.imu_rate_hz = FLAGS_sim_imu_rate_hz;
  options.imu_ring_capacity = static_cast<size_t>(FLAGS_sim_imu_ring_depth);
  options.lidar_rate_hz = FLAGS_sim_lidar_rate_hz;
  return options;
}

std::unique_ptr<DeviceChannel> createDeviceChannel(const DeviceLocator& locator)
{
  LOG(INFO) << "[Device] Opening " << locator.toString();
  if (locator.protocol == "sim")
  {
    return std::unique_ptr<DeviceChannel>(
          new SimulatedDeviceChannel(simulatedDeviceOptionsFromGflags(), locator));
  }
  throw NotSupportedError("No transport for protocol '" + locator.protocol
                          + "' in this build (available: sim)");
}

std::unique_ptr<DeviceChannel> createDeviceChannelFromGflags()
{
  return createDeviceChannel(parseDeviceLocator(FLAGS_device));
}

} // namespace aurora
