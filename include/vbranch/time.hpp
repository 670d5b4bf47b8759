#pragma once
#include <cstdint>

namespace vbranch::timeutil {

// Wall-clock milliseconds since the Unix epoch.
auto now_ms() -> std::uint64_t;

} // namespace vbranch::timeutil
