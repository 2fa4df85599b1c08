#pragma once

#include <stdexcept>
#include <string>

// User-facing abort: the current high-level operation stops and the message
// is shown verbatim.
class AbortError : public std::runtime_error {
public:
    explicit AbortError(const std::string& msg) : std::runtime_error(msg) {}
};

// A remote location that would be unsafe to hand to a subprocess.
class SecurityError : public AbortError {
public:
    explicit SecurityError(const std::string& msg) : AbortError(msg) {}
};

// Bytes that are not valid UTF-8, or text that cannot be encoded as UTF-8.
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

// A required key is missing from a lookup.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};
