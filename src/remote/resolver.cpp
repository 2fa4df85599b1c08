#include "resolver.hpp"
#include "endpoint.hpp"
#include "ssh_guard.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

const char* transport_name(TransportKind kind) {
    switch (kind) {
        case TransportKind::Local:     return "local";
        case TransportKind::Ssh:       return "ssh";
        case TransportKind::GitDaemon: return "git";
        case TransportKind::Http:      return "http";
    }
    return "unknown";
}

// Split "[user@]host[:port]/path" (the part after "scheme://").
static Result<RemoteTarget> parse_ssh_url(const std::string& location, const std::string& rest) {
    RemoteTarget target;
    target.kind = TransportKind::Ssh;
    target.url = location;

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    target.path = slash == std::string::npos ? "" : rest.substr(slash);

    // ssh://host/~user/repo addresses a home directory
    if (starts_with(target.path, "/~")) {
        target.path.erase(0, 1);
    }

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        target.user = authority.substr(0, at);
        authority.erase(0, at + 1);
    }

    std::string port_str;
    if (starts_with(authority, "[")) {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return Result<RemoteTarget>::Err(fmt::format("unterminated IPv6 literal in {}", location));
        }
        target.host = authority.substr(0, close + 1);
        std::string tail = authority.substr(close + 1);
        if (starts_with(tail, ":")) port_str = tail.substr(1);
    } else {
        size_t colon = authority.rfind(':');
        target.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_str = authority.substr(colon + 1);
    }

    if (!port_str.empty()) {
        if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
            return Result<RemoteTarget>::Err(fmt::format("invalid port '{}' in {}", port_str, location));
        }
        int port = std::stoi(port_str);
        if (port <= 0 || port > 65535) {
            return Result<RemoteTarget>::Err(fmt::format("port {} out of range in {}", port, location));
        }
        target.port = port;
    }

    if (target.host.empty()) {
        return Result<RemoteTarget>::Err(fmt::format("missing host in {}", location));
    }
    return Result<RemoteTarget>::Ok(target);
}

// ssh takes IPv6 literals without brackets
static std::string unbracketed(const std::string& host) {
    if (starts_with(host, "[") && ends_with(host, "]")) {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

// The guard sees the host exactly as it will reach the ssh argv.
static Result<RemoteTarget> checked(Result<RemoteTarget> result) {
    if (result.is_err()) return result;
    try {
        check_safe_ssh_host(unbracketed(result.value.host));
    } catch (const SecurityError& e) {
        return Result<RemoteTarget>::Err(e.what());
    }
    return result;
}

Result<RemoteTarget> resolve_remote(const std::string& location) {
    bridge_log(fmt::format("resolve_remote: {}", location));

    // Explicit ssh URLs first: "ssh" would otherwise pass as a shorthand host
    for (const char* scheme : {"ssh://", "git+ssh://"}) {
        if (starts_with(location, scheme)) {
            return checked(parse_ssh_url(location, location.substr(std::string(scheme).size())));
        }
    }

    if (auto endpoint = classify_endpoint(location)) {
        RemoteTarget target;
        target.kind = TransportKind::Ssh;
        target.url = location;
        target.user = endpoint->user;
        target.host = endpoint->host;
        target.path = endpoint->path;
        return checked(Result<RemoteTarget>::Ok(target));
    }

    RemoteTarget target;
    target.url = location;
    if (starts_with(location, "git://")) {
        target.kind = TransportKind::GitDaemon;
    } else if (starts_with(location, "git+http://") || starts_with(location, "git+https://")) {
        target.kind = TransportKind::Http;
        target.url = location.substr(4);
    } else if (starts_with(location, "http://") || starts_with(location, "https://")) {
        target.kind = TransportKind::Http;
    } else {
        target.kind = TransportKind::Local;
        target.path = location;
    }
    return Result<RemoteTarget>::Ok(target);
}

// Single-quote for the remote shell.
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

std::vector<std::string> build_ssh_argv(const SshConfig& config,
                                        const RemoteTarget& target,
                                        const std::string& service) {
    if (target.kind != TransportKind::Ssh) {
        throw std::invalid_argument(fmt::format("{} is not an ssh remote", target.url));
    }
    std::string host = unbracketed(target.host);
    check_safe_ssh_host(host);
    if (!target.user.empty()) {
        check_safe_ssh_host(target.user);
    }

    std::vector<std::string> argv = {config.command};
    auto port = target.port ? target.port : config.port;
    if (port) {
        argv.push_back("-p");
        argv.push_back(std::to_string(*port));
    }
    argv.push_back(target.user.empty() ? host : target.user + "@" + host);
    argv.push_back(service + " " + shell_quote(target.path));

    bridge_log(fmt::format("ssh argv: {}", fmt::join(argv, " ")));
    return argv;
}
