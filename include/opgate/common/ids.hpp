#pragma once

#include <string>

namespace opgate::common {

/// Random RFC 4122 version 4 identifier, lowercase hex with dashes.
[[nodiscard]] std::string generate_uuid();

} // namespace opgate::common
