// ============================================================================
// SafetyLimits.h - Hard Safety Limits
// ============================================================================
#pragma once

#include <climits>
#include <cstdint>


namespace FSV {
namespace Limits {

// Hard safety limits (compile-time)
constexpr uint32_t MAX_RECURSION_DEPTH = 256;
constexpr uint64_t MAX_DIRECTORY_BYTES = 64ULL * 1024 * 1024;   // 2M records max

// Memory constraints
constexpr uint64_t MAX_SINGLE_READ = 256 * 1024 * 1024;  // 256MB

} // namespace Limits
} // namespace FSV
