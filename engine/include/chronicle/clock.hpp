#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

Clock system_clock();

// "2024-01-01T00:00:00.000Z"
std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(std::string_view s);

// tp - hours, saturating at the epoch instead of overflowing.
TimePoint hours_before(TimePoint tp, int64_t hours);

// "2024-01-01"
std::string format_date(TimePoint tp);
std::optional<TimePoint> parse_date(std::string_view s);

// Prefixed random id, e.g. "audit_1700000000000_3f9c2a1b7d0e4c55".
std::string make_id(std::string_view prefix);

} // namespace chronicle
