// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/transfer_monitor.hpp>

#include <algorithm>
#include <utility>

#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>

namespace aurora {

const char* transferOutcomeName(TransferOutcome outcome)
{
  switch (outcome)
  {
  case TransferOutcome::Succeeded: return "Succeeded";
  case TransferOutcome::Failed: return "Failed";
  case TransferOutcome::Aborted: return "Aborted";
  case TransferOutcome::StartFailed: return "StartFailed";
  case TransferOutcome::TimedOut: return "TimedOut";
  case TransferOutcome::Indeterminate: return "Indeterminate";
  }
  return "Unknown";
}

TransferMonitor::TransferMonitor(MapTransferManager& manager,
                                 const TransferMonitorOptions& options)
  : manager_(manager)
  , options_(options)
{
  CHECK_GT(options_.poll_interval.count(), 0.0);
  CHECK_GT(options_.max_wait.count(), 0.0);
}

TransferReport TransferMonitor::finishAborted(TransferReport report,
                                              TransferOutcome outcome,
                                              const std::string& reason)
{
  try
  {
    manager_.abortSession();
    report.outcome = outcome;
    report.message = reason;
  }
  catch (const AuroraError& e)
  {
    report.outcome = TransferOutcome::Indeterminate;
    report.message = reason + "; abort request failed: " + e.what();
    LOG(ERROR) << "[Transfer] " << report.message;
  }
  if (manager_.session())
  {
    report.final_status = manager_.session()->snapshot();
  }
  return report;
}

TransferReport TransferMonitor::run(MapStorageDirection direction,
                                    const std::string& path,
                                    const CancellationToken* token,
                                    const TransferProgressCallback& callback)
{
  const Clock::time_point start = Clock::now();
  CancellationToken never_cancelled;
  const CancellationToken& cancel = token ? *token : never_cancelled;

  TransferReport report;
  const bool started = (direction == MapStorageDirection::Download)
      ? manager_.startDownloadSession(path)
      : manager_.startUploadSession(path);
  if (!started)
  {
    report.outcome = TransferOutcome::StartFailed;
    report.message = manager_.lastError();
    return report;
  }

  while (true)
  {
    report.elapsed_s = toSeconds(Clock::now() - start);
    if (cancel.isCancelled())
    {
      LOG(INFO) << "[Transfer] Cancellation requested; aborting " << path;
      return finishAborted(std::move(report), TransferOutcome::Aborted,
                           "Cancelled by caller");
    }
    if (report.elapsed_s >= options_.max_wait.count())
    {
      LOG(WARNING) << "[Transfer] No result after " << report.elapsed_s
                   << " s; aborting " << path;
      return finishAborted(std::move(report), TransferOutcome::TimedOut,
                           "Transfer did not finish within "
                           + std::to_string(options_.max_wait.count()) + " s");
    }

    bool active = false;
    bool checked = false;
    try
    {
      active = manager_.isSessionActive();
      checked = true;
    }
    catch (const AuroraError& e)
    {
      ++report.query_failures;
      if (report.query_failures <= 3u || report.query_failures % 10u == 0u)
      {
        LOG(WARNING) << "[Transfer] Activity check failed (" << report.query_failures
                     << " so far): " << e.what();
      }
    }

    if (checked && !active)
    {
      try
      {
        report.final_status = manager_.querySessionStatus();
      }
      catch (const AuroraError& e)
      {
        report.outcome = TransferOutcome::Indeterminate;
        report.message = std::string("Final status query failed: ") + e.what();
        LOG(ERROR) << "[Transfer] " << report.message;
        return report;
      }
      report.elapsed_s = toSeconds(Clock::now() - start);
      if (report.final_status.finished)
      {
        report.outcome = TransferOutcome::Succeeded;
      }
      else if (report.final_status.state == TransferState::Aborted)
      {
        report.outcome = TransferOutcome::Aborted;
      }
      else
      {
        report.outcome = TransferOutcome::Failed;
      }
      report.message = report.final_status.status_message;
      if (callback)
      {
        callback(report.final_status, report.elapsed_s);
      }
      return report;
    }

    if (checked)
    {
      try
      {
        const TransferStatus status = manager_.querySessionStatus();
        ++report.polls;
        if (callback)
        {
          callback(status, toSeconds(Clock::now() - start));
        }
      }
      catch (const AuroraError& e)
      {
        ++report.query_failures;
        if (report.query_failures <= 3u || report.query_failures % 10u == 0u)
        {
          LOG(WARNING) << "[Transfer] Status query failed (" << report.query_failures
                       << " so far): " << e.what();
        }
      }
    }

    const double remaining =
        options_.max_wait.count() - toSeconds(Clock::now() - start);
    cancel.waitFor(Duration(std::max(0.0, std::min(options_.poll_interval.count(),
                                                    remaining))));
  }
}

namespace {

bool run_transfer(DeviceChannel& channel, MapStorageDirection direction,
                  const std::string& path, const CancellationToken* token,
                  const TransferMonitorOptions& options)
{
  MapTransferManager manager(channel);
  TransferMonitor monitor(manager, options);
  const TransferReport report = monitor.run(
        direction, path, token,
        [](const TransferStatus& status, double elapsed_s) {
          VLOG(1) << "[Transfer] " << status.progress << "% after " << elapsed_s
                  << " s: " << status.status_message;
        });
  LOG(INFO) << "[Transfer] Map " << mapStorageDirectionName(direction) << " of " << path
            << ": " << transferOutcomeName(report.outcome)
            << (report.message.empty() ? "" : " (" + report.message + ")");
  return report.succeeded();
}

} // unnamed namespace

bool downloadMap(DeviceChannel& channel, const std::string& path,
                 const CancellationToken* token, const TransferMonitorOptions& options)
{
  return run_transfer(channel, MapStorageDirection::Download, path, token, options);
}

bool uploadMap(DeviceChannel& channel, const std::string& path,
               const CancellationToken* token, const TransferMonitorOptions& options)
{
  return run_transfer(channel, MapStorageDirection::Upload, path, token, options);
}

} // namespace aurora
