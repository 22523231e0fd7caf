// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/device/stream_readers.hpp>

#include <algorithm>

#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

void report_overruns(const char* tag, const StreamDedupStats& stats,
                     uint64_t* reported)
{
  if (stats.suspected_overruns == *reported)
  {
    return;
  }
  *reported = stats.suspected_overruns;
  if (*reported <= 3u || *reported % 100u == 0u)
  {
    LOG(WARNING) << "[" << tag << "] Peek did not overlap the previous one; "
                 << "samples were probably lost (overruns=" << *reported
                 << "). Poll faster or peek more samples.";
  }
}

} // unnamed namespace

ImuStreamReader::ImuStreamReader(DeviceChannel& channel, size_t max_count)
  : channel_(channel)
  , max_count_(std::max<size_t>(1u, max_count))
{}

size_t ImuStreamReader::poll(std::vector<ImuSample>* fresh)
{
  const std::vector<ImuSample> peeked = channel_.peekImuData(max_count_);
  const size_t n = dedup_.filter(peeked, max_count_, fresh);
  report_overruns("ImuReader", dedup_.stats(), &reported_overruns_);
  return n;
}

LidarScanReader::LidarScanReader(DeviceChannel& channel, size_t max_count)
  : channel_(channel)
  , max_count_(std::max<size_t>(1u, max_count))
{}

size_t LidarScanReader::poll(std::vector<LidarScan>* fresh)
{
  const std::vector<LidarScan> peeked = channel_.peekLidarScans(max_count_);
  const size_t n = dedup_.filter(peeked, max_count_, fresh);
  report_overruns("LidarReader", dedup_.stats(), &reported_overruns_);
  return n;
}

} // namespace aurora
