#pragma once

#include <string>

namespace convlog::common {

/// RFC 4122 version 4 UUID in canonical lowercase form.
[[nodiscard]] std::string generate_uuid();

[[nodiscard]] bool is_uuid(const std::string &value);

} // namespace convlog::common
