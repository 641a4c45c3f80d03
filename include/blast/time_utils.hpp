#pragma once

#include "blast/common.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <utility>

namespace blast {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using Nanoseconds = std::chrono::nanoseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Convert TimePoint to Unix timestamp (seconds)
uint64_t to_timestamp(const TimePoint& tp);

// Convert Unix timestamp to TimePoint
TimePoint from_timestamp(uint64_t timestamp_seconds);

// Split a TimePoint into whole seconds and the nanosecond remainder since epoch
std::pair<uint64_t, uint32_t> to_epoch_parts(const TimePoint& tp);

// Rebuild a TimePoint from seconds and nanoseconds since epoch
TimePoint from_epoch_parts(uint64_t seconds, uint32_t nanos);

// Convert TimePoint to string (ISO 8601 format)
std::string to_string(const TimePoint& tp);

// Parse ISO 8601 string to TimePoint
TimePoint from_string(const std::string& str);

// Duration utilities
template<typename Rep, typename Period>
inline uint64_t duration_to_seconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Seconds>(duration).count();
}

template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Milliseconds>(duration).count();
}

// Sleep utilities
inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace blast
