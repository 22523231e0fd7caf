// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <functional>
#include <string>

#include <aurora/common/cancellation_token.hpp>
#include <aurora/device/device_channel.hpp>
#include <aurora/map_sync/map_transfer_manager.hpp>

namespace aurora {

enum class TransferOutcome
{
  Succeeded,
  Failed,
  Aborted,
  StartFailed,
  TimedOut,
  //! The final status query failed; the device-side result is unknown.
  Indeterminate
};

const char* transferOutcomeName(TransferOutcome outcome);

struct TransferMonitorOptions
{
  Duration poll_interval{1.0};
  Duration max_wait{3600.0};
};

struct TransferReport
{
  TransferOutcome outcome = TransferOutcome::StartFailed;
  TransferStatus final_status;
  std::string message;
  size_t polls = 0u;
  size_t query_failures = 0u;
  double elapsed_s = 0.0;

  bool succeeded() const { return outcome == TransferOutcome::Succeeded; }
};

using TransferProgressCallback =
    std::function<void(const TransferStatus& status, double elapsed_s)>;

//! Drives one transfer from start to a terminal outcome by polling.
//!
//! Query failures while the session is live are counted and logged but do
//! not end the loop. After the device reports inactivity exactly one more
//! status query decides the outcome.
class TransferMonitor
{
public:
  explicit TransferMonitor(MapTransferManager& manager,
                           const TransferMonitorOptions& options = TransferMonitorOptions());

  TransferReport run(MapStorageDirection direction,
                     const std::string& path,
                     const CancellationToken* token = nullptr,
                     const TransferProgressCallback& callback = TransferProgressCallback());

  TransferReport download(const std::string& path,
                          const CancellationToken* token = nullptr,
                          const TransferProgressCallback& callback = TransferProgressCallback())
  {
    return run(MapStorageDirection::Download, path, token, callback);
  }

  TransferReport upload(const std::string& path,
                        const CancellationToken* token = nullptr,
                        const TransferProgressCallback& callback = TransferProgressCallback())
  {
    return run(MapStorageDirection::Upload, path, token, callback);
  }

private:
  TransferReport finishAborted(TransferReport report, TransferOutcome outcome,
                               const std::string& reason);

  MapTransferManager& manager_;
  TransferMonitorOptions options_;
};

//! True iff the download ran to a finished status.
bool downloadMap(DeviceChannel& channel, const std::string& path,
                 const CancellationToken* token = nullptr,
                 const TransferMonitorOptions& options = TransferMonitorOptions());

bool uploadMap(DeviceChannel& channel, const std::string& path,
               const CancellationToken* token = nullptr,
               const TransferMonitorOptions& options = TransferMonitorOptions());

} // namespace aurora
