#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

enum class TransportKind { Local, Ssh, GitDaemon, Http };

const char* transport_name(TransportKind kind);

// Where and how to reach a remote repository.
struct RemoteTarget {
    TransportKind kind = TransportKind::Local;
    std::string url;              // normalized location (git+ prefix removed for HTTP)
    std::string user;
    std::string host;
    std::optional<int> port;
    std::string path;
};

// Choose the transport for a location. SSH targets (scp-style shorthand,
// ssh:// and git+ssh:// URLs) have their host checked for option injection;
// an unsafe host is reported as an error and no target is returned.
Result<RemoteTarget> resolve_remote(const std::string& location);

// Build the argv for running `service` on an SSH target:
//   <ssh command> [-p port] [user@]host "<service> '<path>'"
// The host is checked again; throws SecurityError if unsafe and
// std::invalid_argument for non-SSH targets.
std::vector<std::string> build_ssh_argv(const SshConfig& config,
                                        const RemoteTarget& target,
                                        const std::string& service);
