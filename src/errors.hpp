#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
  Configuration,
  Network,
  ProtocolViolation,
  PeerNotFound,
  AmbiguousPeer,
  ChecksumMismatch,
  Timeout,
  TransportUnsupported,
  AlreadyRunning,
  PeerNotConnected,
  NotRunning,
  TransferFailed
};

inline const char* to_string(ErrorCode code) {
  switch(code) {
    case ErrorCode::Configuration:        return "configuration error";
    case ErrorCode::Network:              return "network error";
    case ErrorCode::ProtocolViolation:    return "protocol violation";
    case ErrorCode::PeerNotFound:         return "peer not found";
    case ErrorCode::AmbiguousPeer:        return "ambiguous peer";
    case ErrorCode::ChecksumMismatch:     return "checksum mismatch";
    case ErrorCode::Timeout:              return "timeout";
    case ErrorCode::TransportUnsupported: return "transport unsupported";
    case ErrorCode::AlreadyRunning:       return "already running";
    case ErrorCode::PeerNotConnected:     return "peer not connected";
    case ErrorCode::NotRunning:           return "not running";
    case ErrorCode::TransferFailed:       return "transfer failed";
  }
  return "unknown error";
}

class MeshError : public std::runtime_error {
public:
  MeshError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message),
      code_(code),
      detail_(message) {}

  ErrorCode code() const { return code_; }
  // Message without the category prefix.
  const std::string& detail() const { return detail_; }

private:
  ErrorCode code_;
  std::string detail_;
};
