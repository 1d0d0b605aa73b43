#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace daemon_core {

/**
 * @brief Single-instance guard: flock()ed PID file, released on destruction
 */
class PidLock {
   public:
    /**
     * @param error Set when the lock cannot be taken (names the holder PID
     *              when another scrobbler owns it)
     */
    static std::optional<PidLock> tryAcquire(const std::string& path, std::string& error);

    // PID written in the file, 0 if unreadable
    static pid_t readHolderPid(const std::string& path);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const;

   private:
    PidLock(std::string path, int fd);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

/**
 * @brief $XDG_RUNTIME_DIR/np_scrobbler.pid, or /tmp/np_scrobbler-<uid>.pid
 */
std::string defaultPidFilePath();

}  // namespace daemon_core
