// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <string>

namespace aurora {

constexpr uint16_t c_default_device_port = 7447u;

struct DeviceLocator
{
  std::string protocol = "tcp";
  std::string address;
  uint16_t port = c_default_device_port;

  //! protocol://address:port
  std::string toString() const;
};

//! Accepts "address", "address:port" and "protocol://address[:port]".
//! Throws InvalidArgumentError for malformed text.
DeviceLocator parseDeviceLocator(const std::string& text);

} // namespace aurora
