#include "daemon/core/pid_lock.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace daemon_core {

std::string defaultPidFilePath() {
    if (const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR"); runtimeDir && *runtimeDir) {
        return std::string(runtimeDir) + "/" + DaemonConstants::PID_FILE_NAME;
    }
    return "/tmp/np_scrobbler-" + std::to_string(getuid()) + ".pid";
}

pid_t PidLock::readHolderPid(const std::string& path) {
    std::ifstream pidfile(path);
    if (!pidfile.is_open()) {
        return 0;
    }
    pid_t pid = 0;
    if (!(pidfile >> pid)) {
        return 0;
    }
    return pid;
}

std::optional<PidLock> PidLock::tryAcquire(const std::string& path, std::string& error) {
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open PID file " + path + ": " + std::strerror(errno);
        return std::nullopt;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK) {
            pid_t holder = readHolderPid(path);
            error = holder > 0 ? "np_scrobblerd already running (PID " + std::to_string(holder) + ")"
                               : std::string("np_scrobblerd already running");
        } else {
            error = std::string("cannot lock PID file: ") + std::strerror(errno);
        }
        close(fd);
        return std::nullopt;
    }

    if (ftruncate(fd, 0) < 0) {
        LOG_WARN("Cannot truncate PID file {}", path);
    }
    dprintf(fd, "%d\n", getpid());
    fsync(fd);

    LOG_DEBUG("PID lock acquired: {}", path);
    return PidLock(path, fd);
}

PidLock::PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

PidLock::PidLock(PidLock&& other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

PidLock::~PidLock() {
    release();
}

const std::string& PidLock::path() const {
    return path_;
}

void PidLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink while still holding the lock so a new instance never locks a stale inode
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

}  // namespace daemon_core
