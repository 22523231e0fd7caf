// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/map_transfer_manager.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <aurora/common/errors.hpp>
#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

std::string parent_directory(const std::string& path)
{
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos)
  {
    return ".";
  }
  return slash == 0u ? "/" : path.substr(0, slash);
}

bool is_writable_target(const std::string& path, std::string* reason)
{
  struct stat st;
  if (::stat(path.c_str(), &st) == 0)
  {
    if (S_ISDIR(st.st_mode))
    {
      *reason = path + " is a directory";
      return false;
    }
    if (::access(path.c_str(), W_OK) != 0)
    {
      *reason = path + " is not writable";
      return false;
    }
    return true;
  }
  const std::string dir = parent_directory(path);
  if (::access(dir.c_str(), W_OK) != 0)
  {
    *reason = "Directory " + dir + " does not exist or is not writable";
    return false;
  }
  return true;
}

bool is_readable_file(const std::string& path, std::string* reason)
{
  struct stat st;
  if (::stat(path.c_str(), &st) != 0)
  {
    *reason = path + " does not exist";
    return false;
  }
  if (!S_ISREG(st.st_mode))
  {
    *reason = path + " is not a regular file";
    return false;
  }
  if (::access(path.c_str(), R_OK) != 0)
  {
    *reason = path + " is not readable";
    return false;
  }
  return true;
}

} // unnamed namespace

MapTransferManager::MapTransferManager(DeviceChannel& channel)
  : channel_(channel)
{}

bool MapTransferManager::startDownloadSession(const std::string& path)
{
  return startSession(MapStorageDirection::Download, path);
}

bool MapTransferManager::startUploadSession(const std::string& path)
{
  return startSession(MapStorageDirection::Upload, path);
}

bool MapTransferManager::startSession(MapStorageDirection direction,
                                      const std::string& path)
{
  const char* what = mapStorageDirectionName(direction);
  if (session_ && !session_->isTerminal())
  {
    last_error_ = std::string("A map transfer session is already active (")
        + session_->filePath() + ")";
    LOG(WARNING) << "[Transfer] Refusing " << what << " of " << path << ": " << last_error_;
    return false;
  }

  std::string reason;
  const bool path_ok = (direction == MapStorageDirection::Download)
      ? is_writable_target(path, &reason)
      : is_readable_file(path, &reason);
  if (!path_ok)
  {
    last_error_ = reason;
    LOG(WARNING) << "[Transfer] Refusing " << what << ": " << reason;
    return false;
  }

  try
  {
    channel_.startMapStorageSession(path, direction);
  }
  catch (const AuroraError& e)
  {
    last_error_ = e.what();
    LOG(WARNING) << "[Transfer] Device refused " << what << " of " << path
                 << ": " << e.what();
    return false;
  }

  session_.reset(new TransferSession(direction, path));
  session_->markStarted();
  device_inactive_ = false;
  last_error_.clear();
  LOG(INFO) << "[Transfer] Started map " << what << " session for " << path;
  return true;
}

bool MapTransferManager::isSessionActive()
{
  if (!session_ || session_->isTerminal() || device_inactive_)
  {
    return false;
  }
  if (!channel_.isMapStorageSessionActive())
  {
    device_inactive_ = true;
    VLOG(1) << "[Transfer] Device reports session inactive; awaiting final status";
    return false;
  }
  return true;
}

TransferStatus MapTransferManager::querySessionStatus()
{
  if (!session_)
  {
    TransferStatus status;
    status.status_message = "No transfer session";
    return status;
  }
  if (session_->isTerminal())
  {
    return session_->snapshot();
  }

  const MapStorageStatus device_status = channel_.queryMapStorageStatus();
  session_->applyDeviceStatus(device_status);

  if (device_inactive_ && !session_->isTerminal())
  {
    session_->markFailed("Session ended without a terminal status (device reported "
                         + mapStorageStatusName(device_status.flag) + ")");
  }
  if (session_->isTerminal())
  {
    const TransferStatus status = session_->snapshot();
    LOG(INFO) << "[Transfer] Map " << mapStorageDirectionName(session_->direction())
              << " of " << session_->filePath() << " ended: "
              << transferStateName(status.state) << " at " << status.progress
              << "% (" << status.status_message << ")";
    return status;
  }
  return session_->snapshot();
}

void MapTransferManager::abortSession()
{
  if (!session_ || session_->isTerminal())
  {
    return;
  }
  channel_.abortMapStorageSession();
  session_->markAborted("Aborted by request");
  LOG(INFO) << "[Transfer] Aborted map " << mapStorageDirectionName(session_->direction())
            << " of " << session_->filePath() << " at " << session_->progress() << "%";
}

} // namespace aurora
