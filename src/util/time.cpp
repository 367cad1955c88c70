#include "workq/util/time.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace workq::util {

TimePoint now() {
    return SystemClock::now();
}

Clock system_clock() {
    return [] { return SystemClock::now(); };
}

int64_t to_unix_micros(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix_micros(int64_t micros) {
    return TimePoint{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::microseconds(micros));
}

std::string to_iso8601(TimePoint tp) {
    auto time_t_val = SystemClock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;

    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace workq::util
