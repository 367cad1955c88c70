#include "workq/queue_name.hpp"
#include "workq/errors.hpp"
#include <regex>

namespace workq {

QueueName::QueueName(std::string name) : name_(std::move(name)) {
    if (!is_valid(name_)) {
        throw ValidationError("Invalid queue name '" + name_ +
                              "': expected 1-128 characters of [A-Za-z0-9_.-]");
    }
}

bool QueueName::is_valid(const std::string& name) {
    static const std::regex pattern("^[A-Za-z0-9_.-]+$");
    if (name.empty() || name.size() > MAX_LENGTH) {
        return false;
    }
    return std::regex_match(name, pattern);
}

} // namespace workq
