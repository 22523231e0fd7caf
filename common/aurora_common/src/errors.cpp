// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <aurora/common/errors.hpp>

namespace aurora {

const char* errorCodeName(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::Ok: return "OK";
  case ErrorCode::OpFailed: return "OP_FAILED";
  case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
  case ErrorCode::NotSupported: return "NOT_SUPPORTED";
  case ErrorCode::NotImplemented: return "NOT_IMPLEMENTED";
  case ErrorCode::Timeout: return "TIMEOUT";
  case ErrorCode::IoError: return "IO_ERROR";
  case ErrorCode::NotReady: return "NOT_READY";
  case ErrorCode::ConnectionLost: return "CONNECTION_LOST";
  }
  return "UNKNOWN";
}

void throwOnError(ErrorCode code, const std::string& message)
{
  const std::string what =
      message + " (error code: " + std::to_string(static_cast<int>(code)) + " "
      + errorCodeName(code) + ")";
  switch (code)
  {
  case ErrorCode::Ok:
    return;
  case ErrorCode::NotReady:
    throw DataNotReadyError(what);
  case ErrorCode::InvalidArgument:
    throw InvalidArgumentError(what);
  case ErrorCode::Timeout:
    throw TimeoutError(what);
  case ErrorCode::NotSupported:
  case ErrorCode::NotImplemented:
    throw NotSupportedError(what);
  case ErrorCode::ConnectionLost:
    throw ConnectionError(what, code);
  case ErrorCode::IoError:
  case ErrorCode::OpFailed:
    throw ProtocolError(what, code);
  }
  throw AuroraError(what, code);
}

} // namespace aurora
