#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp directory when unset.
std::filesystem::path home_dir();

// Returns the system temporary directory, or /tmp when TMPDIR is unusable.
std::filesystem::path temp_dir();

} // namespace platform
