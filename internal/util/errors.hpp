#pragma once

#include <stdexcept>
#include <string>

namespace vaultsync::util {

/*
  Central error types.

  These get translated later to gRPC status codes, and classified for the
  coordinator's retry policy.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Tampered ciphertext, bad envelope signature or wrong key.
class AuthenticationFailure : public std::runtime_error {
 public:
  explicit AuthenticationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Sender or record origin is not in the registry, or has been revoked.
class UnknownOrRevokedSender : public std::runtime_error {
 public:
  explicit UnknownOrRevokedSender(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Pending buffer overflowed while waiting for causal dependencies.
class MissingCausalDependency : public std::runtime_error {
 public:
  explicit MissingCausalDependency(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportUnreachable : public std::runtime_error {
 public:
  explicit TransportUnreachable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RelayRejected : public std::runtime_error {
 public:
  explicit RelayRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A device reported or reused a logical clock below what was already seen.
class ClockRegression : public std::runtime_error {
 public:
  explicit ClockRegression(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class RetryClass {
  kRetryable,
  kPermanent,
  kReauthRequired,
};

RetryClass Classify(const std::exception& e);

const char* RetryClassName(RetryClass retry_class);

} // namespace vaultsync::util
