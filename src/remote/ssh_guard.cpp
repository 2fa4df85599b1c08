#include "ssh_guard.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

bool is_safe_ssh_host(const std::string& host) {
    return !starts_with(percent_decode(host), "-");
}

void check_safe_ssh_host(const std::string& host) {
    std::string decoded = percent_decode(host);
    if (starts_with(decoded, "-")) {
        bridge_log(fmt::format("rejected ssh host: {}", decoded));
        throw SecurityError(fmt::format("potentially unsafe hostname: '{}'", decoded));
    }
}
