#include "endpoint.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cctype>
#include <regex>

bool has_explicit_scheme(const std::string& uri) {
    for (const char* scheme : GIT_SCHEMES) {
        if (starts_with(uri, std::string(scheme) + "://")) {
            return true;
        }
    }
    return starts_with(uri, "http:") || starts_with(uri, "https:");
}

bool is_fqdn(const std::string& host) {
    static const std::regex fqdn_re(
        R"(^(?:[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?\.)+[A-Za-z]{2,63}$)");

    if (host.size() < 4 || host.size() > 253) {
        return false;
    }
    return std::regex_match(host, fqdn_re);
}

// ASCII word characters, dots, colons and hyphens
static bool is_host_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
           c == '.' || c == ':' || c == '-';
}

// Match "[?host]?:" at `start`, where host is one or more host characters.
// The host run is greedy and gives characters back until a ':' follows, so
// the last usable colon wins. Returns the position of that colon.
static std::optional<size_t> match_host(const std::string& line, size_t start) {
    size_t first = start;
    if (first < line.size() && line[first] == '[') ++first;

    size_t run = first;
    while (run < line.size() && is_host_char(line[run])) ++run;

    for (size_t end = run; end > first; --end) {
        if (end + 1 < line.size() && line[end] == ']' && line[end + 1] == ':') {
            return end + 1;
        }
        if (end < line.size() && line[end] == ':') {
            return end;
        }
    }
    return std::nullopt;
}

std::optional<SshEndpoint> classify_endpoint(const std::string& uri) {
    if (has_explicit_scheme(uri)) {
        return std::nullopt;
    }

    // Nothing in [user@]host:path spans a newline, so only the first line
    // takes part in the match.
    std::string line = uri.substr(0, uri.find('\n'));

    // The user part is greedy: the last '@' that still leaves a valid host
    // wins, and the location without a user is tried last. Host runs stop
    // at '@', so the scan stays linear in the length of the line.
    std::optional<size_t> colon;
    size_t host_start = 0;
    for (size_t at = line.rfind('@'); at != std::string::npos && at > 0; at = line.rfind('@', at - 1)) {
        colon = match_host(line, at + 1);
        if (colon) {
            host_start = at + 1;
            break;
        }
    }
    if (!colon) {
        colon = match_host(line, 0);
    }
    if (!colon) {
        return std::nullopt;
    }

    SshEndpoint endpoint;
    endpoint.user = host_start ? line.substr(0, host_start - 1) : "";
    endpoint.host = line.substr(host_start, *colon - host_start);
    endpoint.path = line.substr(*colon + 1);

    // A .git path is conclusive
    if (ends_with(endpoint.path, ".git")) {
        return endpoint;
    }

    if (is_fqdn(endpoint.host)) {
        return endpoint;
    }
    return std::nullopt;
}
