#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace bolt::util {

/*
  Central error types.

  Controller-side errors get translated to gRPC status codes at the
  presentation boundary (internal/grpc/grpc_error). Node-side gRPC statuses
  get translated into the ConnectError family (internal/rpc/rpc_error).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No transition is defined for (current state, trigger).
class InvalidTransition : public InvalidState {
 public:
  explicit InvalidTransition(const std::string& msg) : InvalidState(msg) {
  }
};

// Malformed connection profile. Raised before any connect attempt.
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& msg, std::vector<std::string> missing_keys, std::vector<std::string> extra_keys)
      : std::runtime_error(msg), missing_keys_(std::move(missing_keys)), extra_keys_(std::move(extra_keys)) {
  }

  explicit ConfigValidationError(const std::string& msg) : std::runtime_error(msg) {
  }

  const std::vector<std::string>& MissingKeys() const {
    return missing_keys_;
  }

  const std::vector<std::string>& ExtraKeys() const {
    return extra_keys_;
  }

 private:
  std::vector<std::string> missing_keys_;
  std::vector<std::string> extra_keys_;
};

// The local node process could not be started.
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Connect-time failures
// ------------------------------------------------------------

class ConnectError : public std::runtime_error {
 public:
  explicit ConnectError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HostUnreachableError : public ConnectError {
 public:
  explicit HostUnreachableError(const std::string& msg) : ConnectError(msg) {
  }
};

class CertificateError : public ConnectError {
 public:
  explicit CertificateError(const std::string& msg) : ConnectError(msg) {
  }
};

class MacaroonError : public ConnectError {
 public:
  explicit MacaroonError(const std::string& msg) : ConnectError(msg) {
  }
};

// The requested interface does not exist on the remote node.
class UnimplementedError : public ConnectError {
 public:
  explicit UnimplementedError(const std::string& msg) : ConnectError(msg) {
  }
};

class UnavailableError : public ConnectError {
 public:
  explicit UnavailableError(const std::string& msg) : ConnectError(msg) {
  }
};

} // namespace bolt::util
