// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/map_sync/transfer_session.hpp>

#include <algorithm>

#include <aurora/common/logging.hpp>

namespace aurora {

namespace {

int state_rank(TransferState state)
{
  switch (state)
  {
  case TransferState::Idle: return 0;
  case TransferState::Started: return 1;
  case TransferState::InProgress: return 2;
  case TransferState::Finished:
  case TransferState::Failed:
  case TransferState::Aborted: return 3;
  }
  return 3;
}

} // unnamed namespace

const char* transferStateName(TransferState state)
{
  switch (state)
  {
  case TransferState::Idle: return "Idle";
  case TransferState::Started: return "Started";
  case TransferState::InProgress: return "InProgress";
  case TransferState::Finished: return "Finished";
  case TransferState::Failed: return "Failed";
  case TransferState::Aborted: return "Aborted";
  }
  return "Unknown";
}

TransferSession::TransferSession(MapStorageDirection direction,
                                 const std::string& file_path)
  : direction_(direction)
  , file_path_(file_path)
{}

bool TransferSession::isActive() const
{
  return state_ == TransferState::Started || state_ == TransferState::InProgress;
}

bool TransferSession::isTerminal() const
{
  return state_rank(state_) == 3;
}

void TransferSession::transitionTo(TransferState next)
{
  if (next == state_)
  {
    return;
  }
  CHECK_LT(state_rank(state_), state_rank(next))
      << "Illegal transfer transition " << transferStateName(state_)
      << " -> " << transferStateName(next);
  VLOG(1) << "[Transfer] " << file_path_ << ": " << transferStateName(state_)
          << " -> " << transferStateName(next);
  state_ = next;
}

void TransferSession::markStarted()
{
  progress_ = 0.0f;
  status_message_.clear();
  transitionTo(TransferState::Started);
}

void TransferSession::applyDeviceStatus(const MapStorageStatus& status)
{
  if (isTerminal())
  {
    return;
  }
  device_flag_ = status.flag;
  if (!status.message.empty())
  {
    status_message_ = status.message;
  }
  const float reported = std::min(100.0f, std::max(0.0f, status.progress));
  progress_ = std::max(progress_, reported);

  switch (status.flag)
  {
  case MapStorageStatusFlag::Idle:
    break;
  case MapStorageStatusFlag::Working:
    transitionTo(TransferState::InProgress);
    break;
  case MapStorageStatusFlag::Finished:
    progress_ = 100.0f;
    transitionTo(TransferState::Finished);
    break;
  case MapStorageStatusFlag::Aborted:
    transitionTo(TransferState::Aborted);
    break;
  case MapStorageStatusFlag::Failed:
  case MapStorageStatusFlag::Rejected:
  case MapStorageStatusFlag::Timeout:
  default:
    if (status_message_.empty())
    {
      status_message_ = "Device reported " + mapStorageStatusName(status.flag);
    }
    transitionTo(TransferState::Failed);
    break;
  }
}

void TransferSession::markAborted(const std::string& message)
{
  if (isTerminal())
  {
    return;
  }
  status_message_ = message;
  transitionTo(TransferState::Aborted);
}

void TransferSession::markFailed(const std::string& message)
{
  if (isTerminal())
  {
    return;
  }
  status_message_ = message;
  transitionTo(TransferState::Failed);
}

TransferStatus TransferSession::snapshot() const
{
  TransferStatus status;
  status.progress = progress_;
  status.status_message = status_message_;
  status.finished = state_ == TransferState::Finished;
  status.state = state_;
  status.device_flag = device_flag_;
  return status;
}

} // namespace aurora
