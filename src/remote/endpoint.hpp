#pragma once

#include <string>
#include <optional>

// An scp-style Git remote: [user@]host:path
struct SshEndpoint {
    std::string user;   // empty when the location has no user@ prefix
    std::string host;   // may be a bracketed IPv6 literal
    std::string path;
};

// True if the location starts with an explicit Git or HTTP(S) scheme.
bool has_explicit_scheme(const std::string& uri);

// Conservative FQDN check: dot-separated labels of 1-63 alphanumerics or
// hyphens (no leading/trailing hyphen), a 2-63 letter top-level label,
// 4-253 characters overall.
bool is_fqdn(const std::string& host);

// Classify a location as scp-style SSH shorthand. Returns the endpoint when
// the path ends in ".git" or the host is an FQDN; nullopt for explicit-scheme
// URLs and anything else, which is presumed to be a local path.
//
// A bracketed IPv6 host never passes the FQDN check, so it is only accepted
// together with a ".git" path. Host characters are ASCII letters, digits,
// '_', '.', ':' and '-'; a host with non-ASCII letters is never matched.
std::optional<SshEndpoint> classify_endpoint(const std::string& uri);

inline bool is_git_ssh_uri(const std::string& uri) {
    return classify_endpoint(uri).has_value();
}
