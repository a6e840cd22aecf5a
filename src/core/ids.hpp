#pragma once
#include <string>

namespace conclave::core {

// Process-unique identifier of the form "<prefix>_<12 hex digits>".
std::string make_id(const std::string& prefix);

} // namespace conclave::core
