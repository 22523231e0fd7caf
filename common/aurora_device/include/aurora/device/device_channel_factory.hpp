// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>

#include <gflags/gflags.h>

#include <aurora/device/device_channel.hpp>
#include <aurora/device/simulated_device_channel.hpp>

DECLARE_string(device);

namespace aurora {

//! Simulated device options from the --sim_* flags.
SimulatedDeviceOptions simulatedDeviceOptionsFromGflags();

//! Opens a channel for @p locator. Only the "sim" protocol is built in;
//! others throw NotSupportedError.
std::unique_ptr<DeviceChannel> createDeviceChannel(const DeviceLocator& locator);

//! createDeviceChannel(parseDeviceLocator(FLAGS_device)).
std::unique_ptr<DeviceChannel> createDeviceChannelFromGflags();

} // namespace aurora
