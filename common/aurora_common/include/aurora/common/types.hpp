// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace aurora {

using real_t = double;

using Vector3 = Eigen::Matrix<real_t, 3, 1>;
using Quaternion = Eigen::Quaternion<real_t>;

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::duration<double>;  // seconds

//! Device-side timestamps are nanoseconds on the device clock.
using DeviceStampNs = uint64_t;

using MapId = uint32_t;
using MapIds = std::vector<MapId>;

inline double toSeconds(const Clock::duration d)
{
  return std::chrono::duration_cast<Duration>(d).count();
}

} // namespace aurora
