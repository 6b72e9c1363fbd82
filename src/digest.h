#pragma once

#include <string>

namespace confrun {

// Lowercase hex SHA-256 of `data`. Used to identify staged programs in logs
// without writing their content.
std::string sha256_hex(const std::string& data);

} // namespace confrun
