#include "file_lock.hpp"
#include <filesystem>
#include <system_error>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

FileLock::FileLock(const std::string& lock_path) : path_(lock_path) {
    // Lock files live next to the data they guard; create the directory on demand
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);
    if (ec) return;

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return;

    // flock locks belong to the open file description, so a second FileLock
    // on the same path fails even inside this process.
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
    }
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    // flock is released automatically when fd is closed
    close(fd_);
}
