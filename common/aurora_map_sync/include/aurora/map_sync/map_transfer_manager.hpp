// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>

#include <aurora/device/device_channel.hpp>
#include <aurora/map_sync/transfer_session.hpp>

namespace aurora {

//! Map upload/download surface of one DeviceChannel.
//!
//! At most one session is live at a time. Every accepted start creates a new
//! TransferSession; the previous (terminal) one is discarded.
class MapTransferManager
{
public:
  explicit MapTransferManager(DeviceChannel& channel);

  //! Returns false (and sets lastError()) if a session is live, @p path is
  //! not writable, or the device refuses. Never throws.
  bool startDownloadSession(const std::string& path);

  //! Returns false if @p path is not a readable file, a session is live, or
  //! the device refuses. Never throws.
  bool startUploadSession(const std::string& path);

  //! False without a live session or once the device reports the session as
  //! inactive. The outcome is then only known after one more
  //! querySessionStatus(). Channel errors propagate.
  bool isSessionActive();

  //! Non-blocking status snapshot. Once the session is terminal the cached
  //! terminal status is returned without contacting the device. Channel
  //! errors propagate while the session is live.
  TransferStatus querySessionStatus();

  //! Asks the device to stop and marks the session Aborted. No-op without a
  //! live session. Channel errors propagate and leave the session untouched.
  void abortSession();

  bool hasSession() const { return session_ != nullptr; }
  //! Current or last session, nullptr before the first accepted start.
  const TransferSession* session() const { return session_.get(); }
  const std::string& lastError() const { return last_error_; }

private:
  bool startSession(MapStorageDirection direction, const std::string& path);

  DeviceChannel& channel_;
  std::unique_ptr<TransferSession> session_;
  bool device_inactive_ = false;
  std::string last_error_;
};

} // namespace aurora
