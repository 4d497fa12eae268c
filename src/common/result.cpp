#include "opgate/common/result.hpp"

namespace opgate::common {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::PermissionDenied:
    return "permission_denied";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "io";
}

} // namespace opgate::common
