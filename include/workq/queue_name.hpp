#pragma once

#include <string>

namespace workq {

/**
 * Validated queue name.
 *
 * 1-128 characters from [A-Za-z0-9_.-]. Construction throws ValidationError
 * otherwise. The name is only ever bound as a query parameter.
 */
class QueueName {
public:
    static constexpr size_t MAX_LENGTH = 128;

    explicit QueueName(std::string name);

    static bool is_valid(const std::string& name);

    const std::string& str() const { return name_; }

    bool operator==(const QueueName& other) const { return name_ == other.name_; }
    bool operator!=(const QueueName& other) const { return name_ != other.name_; }
    bool operator<(const QueueName& other) const { return name_ < other.name_; }

private:
    std::string name_;
};

} // namespace workq
