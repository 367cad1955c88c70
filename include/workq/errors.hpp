#pragma once

#include <stdexcept>
#include <string>

namespace workq {

// Base of every error the library raises on purpose
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Bad caller input, rejected before anything is persisted
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

// Connection, pool or query failure in the persistence layer.
// Never retried inside the library.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message) : Error(message) {}
};

// Operation not allowed in the message's current state
// (completion of a message that is not Processing, unknown dead-letter id)
class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& message) : Error(message) {}
};

} // namespace workq
