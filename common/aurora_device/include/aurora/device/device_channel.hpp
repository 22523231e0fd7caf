// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>
#include <vector>

#include <aurora/device/device_locator.hpp>
#include <aurora/device/device_types.hpp>

namespace aurora {

//! Request/response link to one connected device.
//!
//! All calls are synchronous and throw AuroraError subclasses on failure
//! (ConnectionError, ProtocolError, DataNotReadyError, ...). Implementations
//! serialize their own requests, so one channel may be shared by several
//! callers.
class DeviceChannel
{
public:
  virtual ~DeviceChannel() = default;

  virtual bool isConnected() const = 0;
  virtual const DeviceLocator& locator() const = 0;

  virtual DeviceBasicInfo getDeviceBasicInfo() = 0;

  //! @name Map storage
  //! @{
  //! Throws ProtocolError if the device refuses the session (for example
  //! because another one is running) or cannot open the file.
  virtual void startMapStorageSession(const std::string& path,
                                      MapStorageDirection direction) = 0;
  virtual bool isMapStorageSessionActive() = 0;
  virtual MapStorageStatus queryMapStorageStatus() = 0;
  //! Cooperative; the device stops on its next processing step.
  virtual void abortMapStorageSession() = 0;
  //! @}

  //! @name Map sync
  //! @{
  virtual GlobalMappingInfo getGlobalMappingInfo() = 0;
  virtual void setMapDataSyncing(bool enable) = 0;
  virtual void resyncMapData(bool invalidate_cache) = 0;
  virtual void requireMapReset() = 0;
  //! @}

  //! Delivers all requested parts from one device-side revision.
  virtual void accessMapData(const MapDataRequest& request,
                             MapDataVisitor& visitor) = 0;

  //! @name Streams
  //! @{
  //! Non-consuming peeks of the device ring buffers, oldest first. Empty if
  //! nothing has been produced yet.
  virtual std::vector<ImuSample> peekImuData(size_t max_count) = 0;
  virtual std::vector<LidarScan> peekLidarScans(size_t max_count) = 0;
  //! Throws DataNotReadyError until the first pose exists.
  virtual PoseSample getCurrentPose() = 0;
  //! @}
};

} // namespace aurora
