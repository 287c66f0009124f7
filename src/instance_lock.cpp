#include "instance_lock.hpp"
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace talkpaste {

InstanceLock::InstanceLock(const std::string& path)
    : path_(path) {
}

InstanceLock::~InstanceLock() {
    release();
}

std::string InstanceLock::default_path(const std::string& app_name) {
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = (tmp && *tmp) ? tmp : "/tmp";
    return dir + "/" + app_name + ".lock";
}

bool InstanceLock::acquire() {
    if (fd_ >= 0) return true;

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "Cannot open lock file " << path_ << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        close(fd);
        return false;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 || write(fd, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        // The lock itself is held; the pid is informational
        std::cerr << "Cannot write pid to " << path_ << std::endl;
    }

    fd_ = fd;
    return true;
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

} // namespace talkpaste
