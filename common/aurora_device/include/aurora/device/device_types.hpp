// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <aurora/common/types.hpp>

namespace aurora {

// ---------------------------------------------------------------------------
// Map storage (bulk .stcm transfer)

enum class MapStorageDirection : int32_t
{
  Upload = 0,
  Download = 1
};

enum class MapStorageStatusFlag : int8_t
{
  Idle = 0,
  Working = 1,
  Finished = 2,
  Failed = -1,
  Aborted = -2,
  Rejected = -3,
  Timeout = -4
};

struct MapStorageStatus
{
  float progress = 0.0f;  // [0, 100]
  MapStorageStatusFlag flag = MapStorageStatusFlag::Idle;
  std::string message;
};

const char* mapStorageDirectionName(MapStorageDirection direction);

//! "Finished", "Working", ... or "Unknown(<n>)" for values outside the enum.
std::string mapStorageStatusName(MapStorageStatusFlag flag);

bool isTerminalStorageFlag(MapStorageStatusFlag flag);

// ---------------------------------------------------------------------------
// Map data

struct GlobalMappingInfo
{
  uint64_t last_map_point_count_to_fetch = 0u;
  uint64_t last_keyframe_count_to_fetch = 0u;
  uint64_t last_map_count_to_fetch = 0u;
  uint64_t last_map_point_retrieved = 0u;
  uint64_t last_keyframe_retrieved = 0u;
  uint64_t total_map_point_count = 0u;
  uint64_t total_keyframe_count = 0u;
  uint64_t total_map_count = 0u;
  uint64_t total_map_point_count_fetched = 0u;
  uint64_t total_keyframe_count_fetched = 0u;
  uint64_t total_map_count_fetched = 0u;
  uint64_t current_active_map_point_count = 0u;
  uint64_t current_active_keyframe_count = 0u;
  MapId active_map_id = 0u;
  uint32_t mapping_flags = 0u;
  uint64_t sliding_window_start_keyframe_id = 0u;
};

constexpr uint32_t c_keyframe_flag_none = 0u;
constexpr uint32_t c_keyframe_flag_bad = 1u << 0;
constexpr uint32_t c_keyframe_flag_fixed = 1u << 1;

struct KeyframeDesc
{
  uint64_t id = 0u;
  uint64_t parent_id = 0u;
  MapId map_id = 0u;
  double timestamp = 0.0;  // seconds, device clock
  Vector3 position = Vector3::Zero();
  Quaternion orientation = Quaternion::Identity();
  uint32_t flags = c_keyframe_flag_none;
  std::vector<uint64_t> looped_ids;
  std::vector<uint64_t> connected_ids;

  bool isFixed() const { return (flags & c_keyframe_flag_fixed) != 0u; }
  bool isBad() const { return (flags & c_keyframe_flag_bad) != 0u; }
};

struct MapPointDesc
{
  uint64_t id = 0u;
  MapId map_id = 0u;
  double timestamp = 0.0;
  Vector3 position = Vector3::Zero();
  uint32_t flags = 0u;
};

//! Per-map summary record.
struct MapDesc
{
  MapId map_id = 0u;
  uint32_t map_flags = 0u;
  uint64_t keyframe_count = 0u;
  uint64_t map_point_count = 0u;
  uint64_t keyframe_id_start = 0u;
  uint64_t keyframe_id_end = 0u;
  uint64_t map_point_id_start = 0u;
  uint64_t map_point_id_end = 0u;
};

struct LoopClosure
{
  uint64_t from_keyframe_id = 0u;
  uint64_t to_keyframe_id = 0u;
};

inline bool operator==(const LoopClosure& lhs, const LoopClosure& rhs)
{
  return lhs.from_keyframe_id == rhs.from_keyframe_id
      && lhs.to_keyframe_id == rhs.to_keyframe_id;
}

//! Which maps a map-data request covers.
//!
//! "Active map only" and "all maps" are distinct requests. The selector keeps
//! them apart explicitly instead of inferring intent from an empty id list.
class MapSelector
{
public:
  enum class Kind
  {
    ActiveOnly,
    AllMaps,
    SpecificIds
  };

  MapSelector() = default;

  static MapSelector activeOnly();
  static MapSelector allMaps();
  //! Throws InvalidArgumentError for an empty list; use allMaps() instead.
  static MapSelector specificIds(MapIds ids);

  //! Selector for an optional id list: nullptr selects the active map, an
  //! empty list selects all maps, otherwise the listed maps.
  static MapSelector fromOptionalIds(const MapIds* ids);

  Kind kind() const { return kind_; }
  const MapIds& ids() const { return ids_; }

  std::string toString() const;

private:
  MapSelector(Kind kind, MapIds ids);

  Kind kind_ = Kind::ActiveOnly;
  MapIds ids_;  // sorted, unique; only used for SpecificIds
};

//! Categories of a map-data request.
enum MapDataPart : uint32_t
{
  c_map_data_part_none = 0u,
  c_map_data_part_keyframes = 1u << 0,
  c_map_data_part_map_points = 1u << 1,
  c_map_data_part_map_info = 1u << 2
};

constexpr uint32_t c_keyframe_fetch_flag_looped_ids = 1u << 0;
constexpr uint32_t c_keyframe_fetch_flag_connected_ids = 1u << 1;
constexpr uint32_t c_keyframe_fetch_flag_all = 0xFFFFFFFFu;

//! Without this bit map points arrive with a zero timestamp.
constexpr uint32_t c_map_point_fetch_flag_timestamp = 1u << 0;
constexpr uint32_t c_map_point_fetch_flag_all = 0xFFFFFFFFu;

struct MapDataRequest
{
  MapSelector selector;
  uint32_t parts = c_map_data_part_none;
  uint32_t keyframe_fetch_flags = c_keyframe_fetch_flag_all;
  uint32_t map_point_fetch_flags = c_map_point_fetch_flag_all;

  bool wants(MapDataPart part) const { return (parts & part) != 0u; }
};

//! Receives the records of one map-data response. All callbacks of one
//! accessMapData() call belong to the same device-side revision, which is
//! reported by onSnapshotBegin() and repeated by onSnapshotEnd(). Callbacks
//! must not call back into the channel.
class MapDataVisitor
{
public:
  virtual ~MapDataVisitor() = default;

  virtual void onSnapshotBegin(uint64_t revision, const MapIds& resolved_map_ids) = 0;
  virtual void onMapDesc(const MapDesc& desc) = 0;
  virtual void onKeyframe(const KeyframeDesc& keyframe) = 0;
  virtual void onMapPoint(const MapPointDesc& map_point) = 0;
  virtual void onSnapshotEnd(uint64_t revision) = 0;
};

// ---------------------------------------------------------------------------
// Streams

struct ImuSample
{
  DeviceStampNs timestamp_ns = 0u;
  uint32_t imu_id = 0u;
  Vector3 acc = Vector3::Zero();   // g
  Vector3 gyro = Vector3::Zero();  // deg/s
};

struct LidarScanPoint
{
  float dist = 0.0f;   // m
  float angle = 0.0f;  // rad
  uint8_t quality = 0u;
};

struct LidarScan
{
  DeviceStampNs timestamp_ns = 0u;
  uint32_t layer_id = 0u;
  std::vector<LidarScanPoint> points;
};

struct PoseSample
{
  DeviceStampNs timestamp_ns = 0u;
  Vector3 position = Vector3::Zero();
  Quaternion orientation = Quaternion::Identity();
};

// ---------------------------------------------------------------------------
// Device info

constexpr uint32_t c_hw_feature_lidar = 1u << 0;
constexpr uint32_t c_hw_feature_imu = 1u << 1;
constexpr uint32_t c_hw_feature_stereo_camera = 1u << 2;

constexpr uint32_t c_sensing_feature_vslam = 1u << 0;
constexpr uint32_t c_sensing_feature_comap = 1u << 1;

struct DeviceBasicInfo
{
  std::string device_name;
  std::string model_string;
  std::string firmware_version;
  std::string hardware_version;
  std::string serial_number;
  uint32_t hw_features = 0u;
  uint32_t sensing_features = 0u;
  DeviceStampNs timestamp_ns = 0u;

  bool hasLidar() const { return (hw_features & c_hw_feature_lidar) != 0u; }
  bool hasImu() const { return (hw_features & c_hw_feature_imu) != 0u; }
  bool supportsVslam() const { return (sensing_features & c_sensing_feature_vslam) != 0u; }
};

} // namespace aurora
