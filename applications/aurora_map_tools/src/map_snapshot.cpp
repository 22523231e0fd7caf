// This code is released only for internal evaluation.
// No commercial use, editing or copying is allowed.

#include <gflags/gflags.h>
#include <aurora/common/cancellation_token.hpp>
#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>
#include <aurora/device/device_channel_factory.hpp>
#include <aurora/map_sync/map_data_cache.hpp>
#include <aurora/map_sync/map_data_query.hpp>
#include <aurora/map_sync/sync_tracker.hpp>

#include <signal.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

DEFINE_string(map_ids, "active",
              "Maps to fetch: active, all, or a comma separated list of map ids.");
DEFINE_bool(fetch_keyframes, true, "Fetch keyframes.");
DEFINE_bool(fetch_map_points, true, "Fetch map points.");
DEFINE_bool(fetch_map_info, true, "Fetch map descriptors.");
DEFINE_bool(fetch_looped_ids, true, "Include looped keyframe ids (loop closures).");
DEFINE_bool(fetch_connected_ids, true, "Include connected keyframe ids.");
DEFINE_bool(fetch_map_point_timestamps, true, "Include map point timestamps.");
DEFINE_bool(wait_for_map_data, true, "Wait until enough map data is synced before fetching.");
DEFINE_int32(sync_min_keyframes, 10, "Keyframes required before fetching.");
DEFINE_double(sync_min_ratio, 0.8, "Sync ratio required before fetching.");
DEFINE_double(sync_max_wait_s, 30.0, "Give up waiting for map data after this many seconds.");
DEFINE_int32(sync_poll_interval_ms, 500, "Milliseconds between sync status polls.");
DEFINE_int32(print_keyframes, 5, "Number of keyframes to print per map.");

namespace {

aurora::CancellationToken g_cancel;

void handle_signal(int)
{
  g_cancel.requestCancel();
}

aurora::MapSelector parse_map_ids(const std::string& value)
{
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "active")
  {
    return aurora::MapSelector::activeOnly();
  }
  if (lowered == "all")
  {
    return aurora::MapSelector::allMaps();
  }

  aurora::MapIds ids;
  std::stringstream ss(lowered);
  std::string token;
  while (std::getline(ss, token, ','))
  {
    token.erase(std::remove_if(token.begin(), token.end(),
                               [](unsigned char c) { return std::isspace(c) != 0; }),
                token.end());
    if (token.empty() || !std::all_of(token.begin(), token.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
      throw aurora::InvalidArgumentError("Invalid --map_ids entry '" + token + "' in '"
                                         + value + "'");
    }
    ids.push_back(static_cast<aurora::MapId>(std::stoul(token)));
  }
  return aurora::MapSelector::specificIds(ids);
}

void print_map(aurora::MapId map_id, const aurora::MapData& data)
{
  std::cout << "Map " << map_id << " (revision " << data.revision << ")\n";
  if (data.has_map_info)
  {
    std::cout << "  flags=0x" << std::hex << data.map_info.map_flags << std::dec
              << " keyframes=" << data.map_info.keyframe_count
              << " map_points=" << data.map_info.map_point_count << "\n";
  }
  if (data.has_keyframes)
  {
    std::cout << "  " << data.keyframes.size() << " keyframes, "
              << data.loop_closures.size() << " loop closures\n";
    const size_t shown = std::min(data.keyframes.size(),
                                  static_cast<size_t>(std::max(0, FLAGS_print_keyframes)));
    for (size_t i = 0u; i < shown; ++i)
    {
      const aurora::KeyframeDesc& kf = data.keyframes[i];
      std::cout << "    kf " << kf.id << " t=" << std::fixed << std::setprecision(3)
                << kf.timestamp << " p=[" << kf.position.transpose() << "]"
                << (kf.isFixed() ? " fixed" : "") << "\n";
      std::cout.unsetf(std::ios::floatfield);
    }
    for (const aurora::LoopClosure& loop : data.loop_closures)
    {
      std::cout << "    loop " << loop.from_keyframe_id << " -> " << loop.to_keyframe_id << "\n";
    }
  }
  if (data.has_map_points)
  {
    std::cout << "  " << data.map_points.size() << " map points\n";
  }
}

int run()
{
  const aurora::MapSelector selector = parse_map_ids(FLAGS_map_ids);
  std::unique_ptr<aurora::DeviceChannel> channel = aurora::createDeviceChannelFromGflags();
  LOG(INFO) << "[MapSnapshot] Connected to " << channel->locator().toString();

  if (FLAGS_wait_for_map_data)
  {
    aurora::SyncTrackerOptions options;
    options.poll_interval = aurora::Duration(1e-3 * std::max(1, FLAGS_sync_poll_interval_ms));
    aurora::SyncTracker tracker(*channel, options);
    const aurora::MapSyncStatus status = tracker.waitForMapData(
          static_cast<uint64_t>(std::max(0, FLAGS_sync_min_keyframes)),
          FLAGS_sync_min_ratio,
          aurora::Duration(FLAGS_sync_max_wait_s),
          [](double elapsed_s, const aurora::MapSyncStatus& s) {
            std::cout << "[MapSnapshot] " << std::setprecision(2) << elapsed_s << " s: "
                      << aurora::formatMapSyncStatus(s) << "\n";
          },
          &g_cancel);
    if (g_cancel.isCancelled())
    {
      LOG(WARNING) << "[MapSnapshot] Interrupted while waiting for map data";
      return 1;
    }
    std::cout << "[MapSnapshot] " << aurora::formatMapSyncStatus(status, true) << "\n";
  }

  aurora::MapDataCache cache;
  aurora::MapDataQuery query(*channel, &cache);
  uint32_t keyframe_flags = 0u;
  if (FLAGS_fetch_looped_ids)
  {
    keyframe_flags |= aurora::c_keyframe_fetch_flag_looped_ids;
  }
  if (FLAGS_fetch_connected_ids)
  {
    keyframe_flags |= aurora::c_keyframe_fetch_flag_connected_ids;
  }
  query.setKeyframeFetchFlags(keyframe_flags);
  uint32_t map_point_flags = aurora::c_map_point_fetch_flag_all;
  if (!FLAGS_fetch_map_point_timestamps)
  {
    map_point_flags &= ~aurora::c_map_point_fetch_flag_timestamp;
  }
  query.setMapPointFetchFlags(map_point_flags);

  const aurora::MapDataResult result = query.getMapData(
        selector, FLAGS_fetch_keyframes, FLAGS_fetch_map_points, FLAGS_fetch_map_info);

  std::cout << "[MapSnapshot] Maps " << selector.toString() << " at revision "
            << result.revision << ": " << result.map_ids.size() << " map(s), "
            << result.keyframes.size() << " keyframes, " << result.map_points.size()
            << " map points, " << result.loop_closures.size() << " loop closures\n";

  const aurora::MapDataCache::SnapshotPtr snapshot = cache.snapshot();
  for (const auto& entry : snapshot->maps)
  {
    print_map(entry.first, entry.second);
  }
  return 0;
}

} // unnamed namespace

int main(int argc, char** argv)
{
  google::InitGoogleLogging(argv[0]);
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InstallFailureSignalHandler();
  FLAGS_alsologtostderr = true;
  FLAGS_colorlogtostderr = true;

  struct sigaction sa{};
  sa.sa_handler = handle_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  try
  {
    return run();
  }
  catch (const std::exception& e)
  {
    LOG(ERROR) << "[MapSnapshot] " << e.what();
    return 1;
  }
}
