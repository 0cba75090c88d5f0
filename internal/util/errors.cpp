#include "errors.hpp"

namespace vaultsync::util {

RetryClass Classify(const std::exception& e) {
  if (dynamic_cast<const TransportUnreachable*>(&e) || dynamic_cast<const RelayRejected*>(&e)) {
    return RetryClass::kRetryable;
  }
  // A fresh session renegotiates; the failed message itself is never reused.
  if (dynamic_cast<const AuthenticationFailure*>(&e) || dynamic_cast<const MissingCausalDependency*>(&e)) {
    return RetryClass::kRetryable;
  }
  if (dynamic_cast<const UnknownOrRevokedSender*>(&e) || dynamic_cast<const ClockRegression*>(&e)) {
    return RetryClass::kReauthRequired;
  }
  return RetryClass::kPermanent;
}

const char* RetryClassName(RetryClass retry_class) {
  switch (retry_class) {
    case RetryClass::kRetryable:
      return "retryable";
    case RetryClass::kPermanent:
      return "permanent";
    case RetryClass::kReauthRequired:
      return "reauth_required";
  }
  return "unknown";
}

} // namespace vaultsync::util
