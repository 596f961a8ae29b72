#pragma once
#include "core/Error.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace PV {

using Clock     = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::nanoseconds>;

auto now() -> Timestamp;

// RFC 3339 in UTC with nanosecond precision, e.g. 2024-03-01T10:15:30.000000001Z
auto formatTimestamp(Timestamp ts) -> std::string;
auto parseTimestamp(std::string_view text) -> Expected<Timestamp>;

} // namespace PV
