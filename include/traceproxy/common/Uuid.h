#pragma once

#include <string>

namespace traceproxy {
namespace common {

// Random (version 4) UUID in canonical 8-4-4-4-12 form. Throws std::runtime_error
// when the random source fails.
std::string GenerateUuidV4();

} // namespace common
} // namespace traceproxy
