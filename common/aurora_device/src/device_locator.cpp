// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/device_locator.hpp>

#include <algorithm>
#include <cctype>

#include <aurora/common/errors.hpp>

namespace aurora {

namespace {

std::string trim(const std::string& s)
{
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(s.begin(), s.end(), not_space);
  auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

uint16_t parse_port(const std::string& text, const std::string& full)
{
  if (text.empty() || text.size() > 5u
      || !std::all_of(text.begin(), text.end(),
                      [](unsigned char c) { return std::isdigit(c) != 0; }))
  {
    throw InvalidArgumentError("Invalid port in device locator '" + full + "'");
  }
  const unsigned long value = std::stoul(text);
  if (value == 0u || value > 65535u)
  {
    throw InvalidArgumentError("Port out of range in device locator '" + full + "'");
  }
  return static_cast<uint16_t>(value);
}

} // unnamed namespace

std::string DeviceLocator::toString() const
{
  return protocol + "://" + address + ":" + std::to_string(port);
}

DeviceLocator parseDeviceLocator(const std::string& text)
{
  const std::string full = trim(text);
  if (full.empty())
  {
    throw InvalidArgumentError("Empty device locator");
  }

  DeviceLocator locator;
  std::string rest = full;
  const size_t scheme = rest.find("://");
  if (scheme != std::string::npos)
  {
    locator.protocol = rest.substr(0, scheme);
    rest = rest.substr(scheme + 3u);
    if (locator.protocol.empty())
    {
      throw InvalidArgumentError("Missing protocol in device locator '" + full + "'");
    }
    std::transform(locator.protocol.begin(), locator.protocol.end(),
                   locator.protocol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }

  const size_t colon = rest.rfind(':');
  if (colon != std::string::npos)
  {
    locator.port = parse_port(rest.substr(colon + 1u), full);
    rest = rest.substr(0, colon);
  }
  if (rest.empty())
  {
    throw InvalidArgumentError("Missing address in device locator '" + full + "'");
  }
  locator.address = rest;
  return locator;
}

} // namespace aurora
