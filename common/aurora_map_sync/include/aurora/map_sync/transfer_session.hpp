// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>

#include <aurora/device/device_types.hpp>

namespace aurora {

enum class TransferState
{
  Idle,
  Started,
  InProgress,
  Finished,
  Failed,
  Aborted
};

const char* transferStateName(TransferState state);

//! Result of a session status query.
struct TransferStatus
{
  float progress = 0.0f;
  std::string status_message;
  //! True only if the device reported the transfer as finished.
  bool finished = false;
  TransferState state = TransferState::Idle;
  MapStorageStatusFlag device_flag = MapStorageStatusFlag::Idle;
};

//! Client-side record of one bulk map upload or download.
//!
//! States only move forward: Idle -> Started -> InProgress -> one of
//! {Finished, Failed, Aborted}. Terminal states are final; another transfer
//! needs a new session. Progress never decreases.
class TransferSession
{
public:
  TransferSession(MapStorageDirection direction, const std::string& file_path);

  MapStorageDirection direction() const { return direction_; }
  const std::string& filePath() const { return file_path_; }
  TransferState state() const { return state_; }
  float progress() const { return progress_; }
  const std::string& statusMessage() const { return status_message_; }

  bool isActive() const;
  bool isTerminal() const;

  void markStarted();

  //! Folds a device status report into the session. Ignored once terminal.
  void applyDeviceStatus(const MapStorageStatus& status);

  void markAborted(const std::string& message);
  void markFailed(const std::string& message);

  TransferStatus snapshot() const;

private:
  void transitionTo(TransferState next);

  MapStorageDirection direction_;
  std::string file_path_;
  TransferState state_ = TransferState::Idle;
  float progress_ = 0.0f;
  std::string status_message_;
  MapStorageStatusFlag device_flag_ = MapStorageStatusFlag::Idle;
};

} // namespace aurora
