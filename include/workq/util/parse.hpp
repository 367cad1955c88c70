#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace workq::util {

// Parses a whole base-10 integer within [min_value, max_value].
// Throws ValidationError naming `what` otherwise.
int64_t parse_int(const std::string& value,
                  const std::string& what,
                  int64_t min_value = std::numeric_limits<int64_t>::min(),
                  int64_t max_value = std::numeric_limits<int64_t>::max());

} // namespace workq::util
