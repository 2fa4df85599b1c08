#pragma once

#include <string>
#include <core/types.hpp>

// Debug log file. Defaults to <tmp>/gitbridge_debug.log until configured.
std::string bridge_log_path();

// Point the debug log at the configured file (or disable it).
void configure_log(const LogConfig& cfg);

// Append a timestamped line to the debug log. Never throws.
void bridge_log(const std::string& msg);
