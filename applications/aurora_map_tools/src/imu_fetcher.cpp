// This code is released only for internal evaluation.
// No commercial use, editing or copying is allowed.

#include <gflags/gflags.h>
#include <aurora/common/cancellation_token.hpp>
#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>
#include <aurora/device/device_channel_factory.hpp>
#include <aurora/device/stream_readers.hpp>

#include <signal.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

DEFINE_int32(imu_poll_interval_ms, 20, "Milliseconds between IMU buffer peeks.");
DEFINE_int32(imu_peek_count, 4096, "Maximum samples requested per peek.");
DEFINE_int32(imu_max_samples, 0,
             "Stop after printing this many samples (0 = run until interrupted).");
DEFINE_int32(imu_print_every, 1, "Print every Nth sample.");

namespace {

aurora::CancellationToken g_cancel;

void handle_signal(int)
{
  g_cancel.requestCancel();
}

int run()
{
  std::unique_ptr<aurora::DeviceChannel> channel = aurora::createDeviceChannelFromGflags();
  LOG(INFO) << "[ImuFetcher] Connected to " << channel->locator().toString();

  aurora::ImuStreamReader reader(
        *channel, static_cast<size_t>(std::max(1, FLAGS_imu_peek_count)));
  const aurora::Duration interval(1e-3 * std::max(1, FLAGS_imu_poll_interval_ms));
  const uint64_t print_every = static_cast<uint64_t>(std::max(1, FLAGS_imu_print_every));

  uint64_t printed = 0u;
  uint64_t received = 0u;
  uint64_t poll_failures = 0u;
  std::vector<aurora::ImuSample> fresh;
  while (!g_cancel.isCancelled())
  {
    fresh.clear();
    try
    {
      reader.poll(&fresh);
    }
    catch (const aurora::AuroraError& e)
    {
      ++poll_failures;
      if (poll_failures <= 3u || poll_failures % 10u == 0u)
      {
        LOG(WARNING) << "[ImuFetcher] Peek failed (" << poll_failures << " so far): "
                     << e.what();
      }
    }

    for (const aurora::ImuSample& s : fresh)
    {
      if (received++ % print_every != 0u)
      {
        continue;
      }
      std::printf("%llu imu=%u acc=[%+.4f %+.4f %+.4f] gyro=[%+.3f %+.3f %+.3f]\n",
                  static_cast<unsigned long long>(s.timestamp_ns), s.imu_id,
                  s.acc.x(), s.acc.y(), s.acc.z(),
                  s.gyro.x(), s.gyro.y(), s.gyro.z());
      ++printed;
      if (FLAGS_imu_max_samples > 0
          && printed >= static_cast<uint64_t>(FLAGS_imu_max_samples))
      {
        g_cancel.requestCancel();
        break;
      }
    }

    if (g_cancel.waitFor(interval))
    {
      break;
    }
  }

  const aurora::StreamDedupStats& stats = reader.stats();
  std::cout << "[ImuFetcher] Done. peeks=" << stats.peeks
            << " samples=" << stats.emitted
            << " duplicates=" << stats.duplicates
            << " overruns=" << stats.suspected_overruns
            << " failed_peeks=" << poll_failures << "\n";
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
    LOG(ERROR) << "[ImuFetcher] " << e.what();
    return 1;
  }
}
