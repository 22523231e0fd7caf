// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <vector>

#include <aurora/common/types.hpp>

namespace aurora {

struct StreamDedupStats
{
  uint64_t peeks = 0u;
  uint64_t emitted = 0u;
  uint64_t duplicates = 0u;
  uint64_t suspected_overruns = 0u;
};

//! Turns overlapping ring-buffer peeks into a gap-free, duplicate-free stream
//! using a strictly increasing timestamp watermark.
//!
//! Samples older than the ring depth are gone by the time of the next peek:
//! if the poll interval times the production rate exceeds the depth, samples
//! are lost between peeks. This is not an error; it shows up only in
//! suspected_overruns (a full peek with no overlap with the previous one).
template <typename Sample>
class StreamDeduplicator
{
public:
  explicit StreamDeduplicator(DeviceStampNs watermark = 0u)
    : watermark_(watermark)
  {}

  //! Appends the samples of @p peeked newer than the watermark to @p out.
  //! @p peek_limit is the number of samples the peek could have returned at
  //! most (requested count or ring depth, whichever is smaller).
  size_t filter(const std::vector<Sample>& peeked, size_t peek_limit,
                std::vector<Sample>* out)
  {
    ++stats_.peeks;
    if (peeked.empty())
    {
      return 0u;
    }
    if (has_seen_ && peek_limit > 0u && peeked.size() >= peek_limit
        && peeked.front().timestamp_ns > watermark_)
    {
      ++stats_.suspected_overruns;
    }

    size_t appended = 0u;
    for (const Sample& sample : peeked)
    {
      if (sample.timestamp_ns <= watermark_)
      {
        ++stats_.duplicates;
        continue;
      }
      watermark_ = sample.timestamp_ns;
      has_seen_ = true;
      if (out)
      {
        out->push_back(sample);
      }
      ++appended;
    }
    stats_.emitted += appended;
    return appended;
  }

  DeviceStampNs watermark() const { return watermark_; }
  const StreamDedupStats& stats() const { return stats_; }

  void reset(DeviceStampNs watermark = 0u)
  {
    watermark_ = watermark;
    has_seen_ = false;
    stats_ = StreamDedupStats();
  }

private:
  DeviceStampNs watermark_ = 0u;
  bool has_seen_ = false;
  StreamDedupStats stats_;
};

} // namespace aurora
