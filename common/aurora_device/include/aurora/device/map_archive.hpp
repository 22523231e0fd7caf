// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <vector>

#include <aurora/device/device_types.hpp>

namespace aurora {

//! Device-side content of a .stcm map file. Clients move the file as opaque
//! bytes; only the simulated device looks inside.
struct MapArchive
{
  uint8_t version = 1u;
  MapId active_map_id = 0u;
  std::vector<MapDesc> maps;  // map_id and map_flags are stored
  std::vector<KeyframeDesc> keyframes;
  std::vector<MapPointDesc> map_points;
};

struct MapArchiveStats
{
  uint64_t archives_parsed = 0u;
  uint64_t checksum_failures = 0u;
  uint64_t malformed_payloads = 0u;
  uint64_t resyncs = 0u;
};

enum class MapArchiveParseResult
{
  NeedMore,
  Parsed,
  Resync
};

std::vector<uint8_t> encodeMapArchive(const MapArchive& archive);

//! Consumes one archive from the front of @p buffer. Garbage before the magic
//! is dropped. On Resync the first byte was discarded; call again.
MapArchiveParseResult tryParseMapArchive(std::vector<uint8_t>& buffer,
                                         MapArchive* out,
                                         MapArchiveStats* stats);

} // namespace aurora
