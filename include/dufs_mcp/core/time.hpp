#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace dufs_mcp {

using Timestamp = std::chrono::system_clock::time_point;

// Source of "now". Injected wherever a wall-clock reading ends up in
// observable output (job timestamps, dated upload directories).
using Clock = std::function<Timestamp()>;

/// The real wall clock.
Clock SystemClock();

/// UTC, millisecond precision: "2024-03-05T14:07:09.123Z".
std::string FormatRfc3339(Timestamp ts);

/// Local calendar date as YYYYMMDD: "20240305".
std::string FormatDateStamp(Timestamp ts);

} // namespace dufs_mcp
