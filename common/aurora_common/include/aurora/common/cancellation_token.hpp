// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <chrono>

#include <aurora/common/types.hpp>

namespace aurora {

//! Cooperative cancellation flag handed to polling loops.
//!
//! requestCancel() is a single lock-free atomic store and may be called from a
//! signal handler. waitFor() sleeps in short slices so a pending cancellation
//! is observed within one slice, never mid-request.
class CancellationToken
{
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void requestCancel() { cancelled_.store(true); }
  bool isCancelled() const { return cancelled_.load(); }
  void reset() { cancelled_.store(false); }

  //! Sleeps for up to @p timeout. Returns true if cancellation was requested
  //! before or during the wait.
  bool waitFor(Duration timeout) const;

  static constexpr std::chrono::milliseconds c_wait_slice_{10};

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace aurora
