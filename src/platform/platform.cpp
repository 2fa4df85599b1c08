#include "platform.hpp"
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return tmp;
}

} // namespace platform
