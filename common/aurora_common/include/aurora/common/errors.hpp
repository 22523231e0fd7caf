// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aurora {

//! Error codes as reported by the device.
enum class ErrorCode : int32_t
{
  Ok = 0,
  OpFailed = -1,
  InvalidArgument = -2,
  NotSupported = -3,
  NotImplemented = -4,
  Timeout = -5,
  IoError = -6,
  NotReady = -7,
  ConnectionLost = -8
};

const char* errorCodeName(ErrorCode code);

class AuroraError : public std::runtime_error
{
public:
  AuroraError(const std::string& message, ErrorCode code = ErrorCode::OpFailed)
    : std::runtime_error(message)
    , code_(code)
  {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

//! Transport unreachable or dropped. Fatal to the current operation only.
class ConnectionError : public AuroraError
{
public:
  explicit ConnectionError(const std::string& message,
                           ErrorCode code = ErrorCode::ConnectionLost)
    : AuroraError(message, code)
  {}
};

//! The device rejected a request or returned an inconsistent response.
class ProtocolError : public AuroraError
{
public:
  explicit ProtocolError(const std::string& message,
                         ErrorCode code = ErrorCode::OpFailed)
    : AuroraError(message, code)
  {}
};

//! Transient "not yet available"; retry after a short delay.
class DataNotReadyError : public AuroraError
{
public:
  explicit DataNotReadyError(const std::string& message)
    : AuroraError(message, ErrorCode::NotReady)
  {}
};

class TimeoutError : public AuroraError
{
public:
  explicit TimeoutError(const std::string& message)
    : AuroraError(message, ErrorCode::Timeout)
  {}
};

class InvalidArgumentError : public AuroraError
{
public:
  explicit InvalidArgumentError(const std::string& message)
    : AuroraError(message, ErrorCode::InvalidArgument)
  {}
};

class NotSupportedError : public AuroraError
{
public:
  explicit NotSupportedError(const std::string& message)
    : AuroraError(message, ErrorCode::NotSupported)
  {}
};

//! A selective map-data fetch failed as a whole. code() is the code of the
//! underlying failure.
class MapDataFetchError : public AuroraError
{
public:
  MapDataFetchError(const std::string& message, ErrorCode cause)
    : AuroraError(message, cause)
  {}
};

//! Throws the exception matching a device error code. Does nothing for Ok.
void throwOnError(ErrorCode code, const std::string& message);

} // namespace aurora
