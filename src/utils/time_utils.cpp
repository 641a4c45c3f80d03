#include "blast/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

#ifdef _WIN32
// Windows doesn't have timegm, provide a replacement
static time_t timegm_portable(struct tm* tm) {
    time_t ret;
    char* tz = getenv("TZ");
    _putenv_s("TZ", "UTC");
    _tzset();
    ret = mktime(tm);
    if (tz) {
        _putenv_s("TZ", tz);
    } else {
        _putenv_s("TZ", "");
    }
    _tzset();
    return ret;
}
#define timegm timegm_portable
#endif

namespace blast {
namespace time {

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_seconds() {
    return std::chrono::duration_cast<Seconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t to_timestamp(const TimePoint& tp) {
    return std::chrono::duration_cast<Seconds>(
        tp.time_since_epoch()
    ).count();
}

TimePoint from_timestamp(uint64_t timestamp_seconds) {
    return TimePoint(Seconds(timestamp_seconds));
}

std::pair<uint64_t, uint32_t> to_epoch_parts(const TimePoint& tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<Seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<Nanoseconds>(since_epoch - secs);
    return {static_cast<uint64_t>(secs.count()), static_cast<uint32_t>(nanos.count())};
}

TimePoint from_epoch_parts(uint64_t seconds, uint32_t nanos) {
    auto since_epoch = Seconds(seconds) + Nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<Duration>(since_epoch));
}

std::string to_string(const TimePoint& tp) {
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm_val;

#ifdef BLAST_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

TimePoint from_string(const std::string& str) {
    // Simple ISO 8601 parser (YYYY-MM-DDTHH:MM:SS.sssZ)
    std::tm tm_val = {};
    std::istringstream iss(str);

    char delimiter;
    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    // Parse milliseconds if present
    int ms = 0;
    if (iss.peek() == '.') {
        iss >> delimiter; // consume '.'
        iss >> ms;
    }

    auto time_t_val = timegm(&tm_val);
    auto tp = Clock::from_time_t(time_t_val);
    tp += Milliseconds(ms);

    return tp;
}

} // namespace time
} // namespace blast
