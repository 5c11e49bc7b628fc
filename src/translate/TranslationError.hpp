#pragma once

#include <stdexcept>
#include <string>

namespace translate
{

enum class ErrorKind
{
    Network = 0,
    Memory = 1,
    Model = 2,
    Timeout = 3,
    Validation = 4,
    Unknown = 5
};

struct TranslationError
{
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;    // raw failure text
    std::string cause;      // user-facing explanation
    std::string solution;   // user-facing remedy
    bool is_retryable = false;
    std::string diagnostic; // exception type / trace, for logs only
};

const char* toString(ErrorKind kind);

// Exceptions thrown by backends and by request validation. Each one is a tag the
// classifier recognises before it falls back to message patterns.

class ValidationError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class TimeoutError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Transport-level failure (DNS, refused, reset, TLS).
class ConnectionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace translate
