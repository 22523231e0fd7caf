// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/cancellation_token.hpp>

#include <algorithm>
#include <thread>

namespace aurora {

bool CancellationToken::waitFor(Duration timeout) const
{
  const Clock::time_point deadline =
      Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);
  while (!isCancelled())
  {
    const Clock::time_point now = Clock::now();
    if (now >= deadline)
    {
      return false;
    }
    const Clock::duration remaining = deadline - now;
    std::this_thread::sleep_for(
        std::min<Clock::duration>(remaining, c_wait_slice_));
  }
  return true;
}

} // namespace aurora
