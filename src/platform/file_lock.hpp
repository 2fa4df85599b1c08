#pragma once
#include <string>

// RAII exclusive lock on a file. Non-blocking: check held() after construction.
// Uses flock().
// The lock is released when the object is destroyed (or the process exits).
class FileLock {
public:
    explicit FileLock(const std::string& lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};
