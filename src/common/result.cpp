#include "hooktunnel/common/result.hpp"

namespace hooktunnel::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::ConfigValidation:
    return "config_validation";
  case ErrorKind::EnvironmentRestriction:
    return "environment_restriction";
  case ErrorKind::RegistrationFailed:
    return "registration_failed";
  case ErrorKind::DeletionFailed:
    return "deletion_failed";
  case ErrorKind::TransientNetwork:
    return "transient_network";
  case ErrorKind::InvalidResponse:
    return "invalid_response";
  case ErrorKind::Process:
    return "process";
  case ErrorKind::Internal:
    return "internal";
  }
  return "unknown";
}

} // namespace hooktunnel::common
