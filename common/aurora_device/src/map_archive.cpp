// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/map_archive.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <utility>

#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

constexpr uint8_t kMagicBytes[4] = {'S', 'T', 'C', 'M'};
constexpr size_t kMagicSize = 4;
// version u8, flags u8, map_count u16, active_map_id u32, payload_len u32,
// keyframe_count u32, map_point_count u32
constexpr size_t kHeaderSize = 20;
constexpr size_t kTailSize = 2;
constexpr size_t kMapRecordSize = 8;
constexpr size_t kKeyframeFixedSize = 8 + 8 + 4 + 4 + 8 + 3 * 8 + 4 * 8 + 2 + 2;
constexpr size_t kMapPointRecordSize = 8 + 4 + 4 + 8 + 3 * 8;
constexpr size_t kMaxMaps = 4096;
constexpr size_t kMaxLinkedIds = 1024;
constexpr size_t kMaxArchiveBytes = 256u * 1024u * 1024u;
constexpr uint8_t kVersion = 1;

uint16_t read_le_u16(const uint8_t* data)
{
  return static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8);
}

uint32_t read_le_u32(const uint8_t* data)
{
  return static_cast<uint32_t>(data[0]) |
         (static_cast<uint32_t>(data[1]) << 8) |
         (static_cast<uint32_t>(data[2]) << 16) |
         (static_cast<uint32_t>(data[3]) << 24);
}

uint64_t read_le_u64(const uint8_t* data)
{
  return static_cast<uint64_t>(read_le_u32(data)) |
         (static_cast<uint64_t>(read_le_u32(data + 4)) << 32);
}

double read_le_f64(const uint8_t* data)
{
  const uint64_t bits = read_le_u64(data);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void write_le_u16(std::vector<uint8_t>& out, uint16_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void write_le_u32(std::vector<uint8_t>& out, uint32_t v)
{
  for (int i = 0; i < 4; ++i)
  {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void write_le_u64(std::vector<uint8_t>& out, uint64_t v)
{
  write_le_u32(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
  write_le_u32(out, static_cast<uint32_t>(v >> 32));
}

void write_le_f64(std::vector<uint8_t>& out, double v)
{
  uint64_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  write_le_u64(out, bits);
}

uint8_t xor_checksum(const uint8_t* data, size_t len)
{
  uint8_t c = 0;
  for (size_t i = 0; i < len; ++i)
  {
    c ^= data[i];
  }
  return c;
}

//! Bounds-checked reader over the payload.
class PayloadCursor
{
public:
  PayloadCursor(const uint8_t* data, size_t size)
    : data_(data), size_(size)
  {}

  bool has(size_t n) const { return size_ - pos_ >= n; }
  const uint8_t* take(size_t n) { const uint8_t* p = data_ + pos_; pos_ += n; return p; }
  size_t remaining() const { return size_ - pos_; }
  bool atEnd() const { return pos_ == size_; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
};

bool decode_payload(const uint8_t* payload, size_t payload_len,
                    size_t map_count, size_t keyframe_count,
                    size_t map_point_count, MapArchive* out)
{
  PayloadCursor cur(payload, payload_len);

  if (!cur.has(map_count * kMapRecordSize))
  {
    return false;
  }
  out->maps.resize(map_count);
  for (MapDesc& map : out->maps)
  {
    const uint8_t* p = cur.take(kMapRecordSize);
    map = MapDesc();
    map.map_id = read_le_u32(p);
    map.map_flags = read_le_u32(p + 4);
  }

  if (keyframe_count > cur.remaining() / kKeyframeFixedSize)
  {
    return false;
  }
  out->keyframes.resize(keyframe_count);
  for (KeyframeDesc& kf : out->keyframes)
  {
    if (!cur.has(kKeyframeFixedSize))
    {
      return false;
    }
    const uint8_t* p = cur.take(kKeyframeFixedSize);
    kf.id = read_le_u64(p);
    kf.parent_id = read_le_u64(p + 8);
    kf.map_id = read_le_u32(p + 16);
    kf.flags = read_le_u32(p + 20);
    kf.timestamp = read_le_f64(p + 24);
    kf.position = Vector3(read_le_f64(p + 32), read_le_f64(p + 40), read_le_f64(p + 48));
    kf.orientation = Quaternion(read_le_f64(p + 56), read_le_f64(p + 64),
                                read_le_f64(p + 72), read_le_f64(p + 80));
    const size_t n_looped = read_le_u16(p + 88);
    const size_t n_connected = read_le_u16(p + 90);
    if (n_looped > kMaxLinkedIds || n_connected > kMaxLinkedIds
        || !cur.has(8u * (n_looped + n_connected)))
    {
      return false;
    }
    kf.looped_ids.resize(n_looped);
    for (uint64_t& id : kf.looped_ids)
    {
      id = read_le_u64(cur.take(8));
    }
    kf.connected_ids.resize(n_connected);
    for (uint64_t& id : kf.connected_ids)
    {
      id = read_le_u64(cur.take(8));
    }
  }

  if (!cur.has(map_point_count * kMapPointRecordSize))
  {
    return false;
  }
  out->map_points.resize(map_point_count);
  for (MapPointDesc& mp : out->map_points)
  {
    const uint8_t* p = cur.take(kMapPointRecordSize);
    mp.id = read_le_u64(p);
    mp.map_id = read_le_u32(p + 8);
    mp.flags = read_le_u32(p + 12);
    mp.timestamp = read_le_f64(p + 16);
    mp.position = Vector3(read_le_f64(p + 24), read_le_f64(p + 32), read_le_f64(p + 40));
  }
  return cur.atEnd();
}

MapArchiveParseResult drop_first_byte(std::vector<uint8_t>& buffer,
                                      MapArchiveStats* stats)
{
  buffer.erase(buffer.begin());
  if (stats)
  {
    stats->resyncs++;
  }
  return MapArchiveParseResult::Resync;
}

} // unnamed namespace

std::vector<uint8_t> encodeMapArchive(const MapArchive& archive)
{
  std::vector<uint8_t> payload;
  payload.reserve(archive.maps.size() * kMapRecordSize
                  + archive.keyframes.size() * kKeyframeFixedSize
                  + archive.map_points.size() * kMapPointRecordSize);
  for (const MapDesc& map : archive.maps)
  {
    write_le_u32(payload, map.map_id);
    write_le_u32(payload, map.map_flags);
  }
  for (const KeyframeDesc& kf : archive.keyframes)
  {
    CHECK_LE(kf.looped_ids.size(), kMaxLinkedIds);
    CHECK_LE(kf.connected_ids.size(), kMaxLinkedIds);
    write_le_u64(payload, kf.id);
    write_le_u64(payload, kf.parent_id);
    write_le_u32(payload, kf.map_id);
    write_le_u32(payload, kf.flags);
    write_le_f64(payload, kf.timestamp);
    for (int i = 0; i < 3; ++i)
    {
      write_le_f64(payload, kf.position(i));
    }
    write_le_f64(payload, kf.orientation.w());
    write_le_f64(payload, kf.orientation.x());
    write_le_f64(payload, kf.orientation.y());
    write_le_f64(payload, kf.orientation.z());
    write_le_u16(payload, static_cast<uint16_t>(kf.looped_ids.size()));
    write_le_u16(payload, static_cast<uint16_t>(kf.connected_ids.size()));
    for (uint64_t id : kf.looped_ids)
    {
      write_le_u64(payload, id);
    }
    for (uint64_t id : kf.connected_ids)
    {
      write_le_u64(payload, id);
    }
  }
  for (const MapPointDesc& mp : archive.map_points)
  {
    write_le_u64(payload, mp.id);
    write_le_u32(payload, mp.map_id);
    write_le_u32(payload, mp.flags);
    write_le_f64(payload, mp.timestamp);
    for (int i = 0; i < 3; ++i)
    {
      write_le_f64(payload, mp.position(i));
    }
  }

  CHECK_LE(archive.maps.size(), kMaxMaps);
  std::vector<uint8_t> out(std::begin(kMagicBytes), std::end(kMagicBytes));
  out.reserve(kMagicSize + kHeaderSize + payload.size() + kTailSize);
  out.push_back(kVersion);
  out.push_back(0u);
  write_le_u16(out, static_cast<uint16_t>(archive.maps.size()));
  write_le_u32(out, archive.active_map_id);
  write_le_u32(out, static_cast<uint32_t>(payload.size()));
  write_le_u32(out, static_cast<uint32_t>(archive.keyframes.size()));
  write_le_u32(out, static_cast<uint32_t>(archive.map_points.size()));
  out.insert(out.end(), payload.begin(), payload.end());
  out.push_back(xor_checksum(out.data(), out.size()));
  out.push_back(0u);
  return out;
}

MapArchiveParseResult tryParseMapArchive(std::vector<uint8_t>& buffer,
                                         MapArchive* out,
                                         MapArchiveStats* stats)
{
  if (buffer.size() < kMagicSize)
  {
    return MapArchiveParseResult::NeedMore;
  }

  auto it = std::search(buffer.begin(), buffer.end(),
                        std::begin(kMagicBytes), std::end(kMagicBytes));
  if (it == buffer.end())
  {
    // Keep a tail that could still grow into the magic.
    const size_t keep = std::min(buffer.size(), kMagicSize - 1);
    buffer.erase(buffer.begin(), buffer.end() - keep);
    return MapArchiveParseResult::NeedMore;
  }

  if (it != buffer.begin())
  {
    buffer.erase(buffer.begin(), it);
    if (stats)
    {
      stats->resyncs++;
    }
  }

  if (buffer.size() < (kMagicSize + kHeaderSize))
  {
    return MapArchiveParseResult::NeedMore;
  }

  const uint8_t* hdr = buffer.data() + kMagicSize;
  const uint8_t version = hdr[0];
  const size_t map_count = read_le_u16(hdr + 2);
  const MapId active_map_id = read_le_u32(hdr + 4);
  const size_t payload_len = read_le_u32(hdr + 8);
  const size_t keyframe_count = read_le_u32(hdr + 12);
  const size_t map_point_count = read_le_u32(hdr + 16);

  if (version != kVersion || map_count > kMaxMaps)
  {
    return drop_first_byte(buffer, stats);
  }

  const size_t packet_len = kMagicSize + kHeaderSize + payload_len + kTailSize;
  if (packet_len > kMaxArchiveBytes)
  {
    return drop_first_byte(buffer, stats);
  }

  if (buffer.size() < packet_len)
  {
    return MapArchiveParseResult::NeedMore;
  }

  const size_t checksum_offset = kMagicSize + kHeaderSize + payload_len;
  const uint8_t expected_checksum = buffer[checksum_offset];
  const uint8_t computed_checksum = xor_checksum(buffer.data(), checksum_offset);
  if (expected_checksum != computed_checksum)
  {
    if (stats)
    {
      stats->checksum_failures++;
    }
    return drop_first_byte(buffer, stats);
  }

  MapArchive decoded;
  decoded.version = version;
  decoded.active_map_id = active_map_id;
  if (!decode_payload(buffer.data() + kMagicSize + kHeaderSize, payload_len,
                      map_count, keyframe_count, map_point_count, &decoded))
  {
    if (stats)
    {
      stats->malformed_payloads++;
    }
    return drop_first_byte(buffer, stats);
  }

  buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(packet_len));
  if (stats)
  {
    stats->archives_parsed++;
  }
  if (out)
  {
    *out = std::move(decoded);
  }
  return MapArchiveParseResult::Parsed;
}

} // namespace aurora
