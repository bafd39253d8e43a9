#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace hookstack::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// 64-bit FNV-1a. Stable across runs and platforms, used for payload digests
// and event sequence numbers.
uint64_t fnv1a64(std::string_view data, uint64_t seed = 14695981039346656037ULL);

// Lower-case hex, zero padded to 16 digits.
std::string to_hex(uint64_t value);

// Milliseconds since the Unix epoch.
int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

// "YYYY-MM-DD" in UTC.
std::string utc_date(TimePoint tp);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso8601(TimePoint tp);

// ASCII lower-case copy.
std::string to_lower(std::string_view s);

} // namespace hookstack::core
