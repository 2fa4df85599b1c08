#pragma once

#include <string>
#include <optional>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct SshConfig {
    std::string command = "ssh";
    std::optional<int> port;                     // forwarded as -p when set and the URL has none
};

struct BookmarkConfig {
    std::string transaction = "git_handler";     // transaction label for bookmark writes
};

struct LogConfig {
    bool enabled = true;
    std::string path;                            // empty -> <tmp>/gitbridge_debug.log
};

