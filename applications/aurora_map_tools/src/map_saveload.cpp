// This code is released only for internal evaluation.
// No commercial use, editing or copying is allowed.

#include <gflags/gflags.h>
#include <aurora/common/cancellation_token.hpp>
#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>
#include <aurora/device/device_channel_factory.hpp>
#include <aurora/map_sync/map_transfer_manager.hpp>
#include <aurora/map_sync/transfer_monitor.hpp>

#include <signal.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

DEFINE_bool(download, false, "Download the device map set into --map_file.");
DEFINE_bool(upload, false, "Upload --map_file to the device.");
DEFINE_string(map_file, "auroramap.stcm", "Local map file.");
DEFINE_double(transfer_poll_interval_s, 1.0,
              "Seconds between status queries while a transfer runs.");
DEFINE_double(transfer_max_wait_s, 3600.0,
              "Abort the transfer after this many seconds.");

namespace {

aurora::CancellationToken g_cancel;

void handle_signal(int)
{
  g_cancel.requestCancel();
}

void print_progress(const aurora::TransferStatus& status, double elapsed_s)
{
  std::printf("\r[MapSaveLoad] %5.1f%%  %-40s (%.1f s)", status.progress,
              status.status_message.c_str(), elapsed_s);
  std::fflush(stdout);
}

int run()
{
  if (FLAGS_download == FLAGS_upload)
  {
    LOG(ERROR) << "[MapSaveLoad] Pass exactly one of --download or --upload.";
    return 2;
  }
  const aurora::MapStorageDirection direction = FLAGS_download
      ? aurora::MapStorageDirection::Download
      : aurora::MapStorageDirection::Upload;

  std::unique_ptr<aurora::DeviceChannel> channel = aurora::createDeviceChannelFromGflags();
  LOG(INFO) << "[MapSaveLoad] Connected to " << channel->locator().toString();

  aurora::TransferMonitorOptions options;
  options.poll_interval = aurora::Duration(FLAGS_transfer_poll_interval_s);
  options.max_wait = aurora::Duration(FLAGS_transfer_max_wait_s);

  aurora::MapTransferManager manager(*channel);
  aurora::TransferMonitor monitor(manager, options);
  const aurora::TransferReport report =
      monitor.run(direction, FLAGS_map_file, &g_cancel, print_progress);
  std::printf("\n");

  std::cout << "[MapSaveLoad] " << aurora::mapStorageDirectionName(direction)
            << " of " << FLAGS_map_file << ": "
            << aurora::transferOutcomeName(report.outcome)
            << " (" << report.message << ", " << report.polls << " polls, "
            << report.query_failures << " failed queries, "
            << report.elapsed_s << " s)\n";
  return report.succeeded() ? 0 : 1;
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
    LOG(ERROR) << "[MapSaveLoad] " << e.what();
    return 1;
  }
}
