#include "workq/util/parse.hpp"
#include "workq/errors.hpp"

namespace workq::util {

int64_t parse_int(const std::string& value,
                  const std::string& what,
                  int64_t min_value,
                  int64_t max_value) {
    long long parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw ValidationError("Invalid " + what + ": '" + value + "'");
        }
    } catch (const std::logic_error&) {
        // invalid_argument and out_of_range from stoll
        throw ValidationError("Invalid " + what + ": '" + value + "'");
    }

    if (parsed < min_value || parsed > max_value) {
        throw ValidationError(what + " must be between " + std::to_string(min_value) +
                              " and " + std::to_string(max_value) + ", got " + value);
    }
    return parsed;
}

} // namespace workq::util
