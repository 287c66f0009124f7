#pragma once

#include <string>

namespace talkpaste {

// Exclusive flock on a lock file; released when the object is destroyed
class InstanceLock {
public:
    explicit InstanceLock(const std::string& path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // Try to take the lock without blocking; writes our pid on success
    bool acquire();
    void release();
    bool held() const { return fd_ >= 0; }

    const std::string& path() const { return path_; }

    // $TMPDIR/<app_name>.lock (or /tmp)
    static std::string default_path(const std::string& app_name);

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace talkpaste
