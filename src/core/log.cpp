#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
bool log_enabled = true;
std::string log_path;

} // namespace

std::string bridge_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_path.empty()) {
        log_path = (platform::temp_dir() / "gitbridge_debug.log").string();
    }
    return log_path;
}

void configure_log(const LogConfig& cfg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_enabled = cfg.enabled;
    log_path = cfg.path;
}

void bridge_log(const std::string& msg) {
    std::string path = bridge_log_path();

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_enabled) return;

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}
