#pragma once

#include <stdexcept>
#include <string>

namespace tradeflow {

// Bad session config or illegal lifecycle command; reported to the caller.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

// Capital conservation or state machine contract broken. Fatal to one session only.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {}
};

// Adapter-level connect failure; absorbed and retried, never reaches the engine.
struct ConnectionError {
    std::string message;
    bool retryable{true};
};

} // namespace tradeflow
