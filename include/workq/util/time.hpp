#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace workq::util {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

// Injectable clock; QueueManager reads "now" only through one of these
using Clock = std::function<TimePoint()>;

TimePoint now();
Clock system_clock();

int64_t to_unix_micros(TimePoint tp);
TimePoint from_unix_micros(int64_t micros);

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string to_iso8601(TimePoint tp);

double seconds_between(TimePoint from, TimePoint to);

} // namespace workq::util
