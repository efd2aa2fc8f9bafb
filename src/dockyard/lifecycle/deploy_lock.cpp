#include "dockyard/lifecycle/deploy_lock.hpp"

#include <cerrno>
#include <cstdlib>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace dockyard::lifecycle {

dockyard_detail::expected<DeployLock, LockErr> DeployLock::try_acquire(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) return dockyard_detail::unexpected<LockErr>(LockErr::IoError);
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        return dockyard_detail::unexpected<LockErr>(err == EWOULDBLOCK ? LockErr::Busy : LockErr::IoError);
    }
    return DeployLock(fd);
}

std::string DeployLock::default_path(const std::string& deployment) {
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = (tmp && *tmp) ? tmp : "/tmp";
    return dir + "/dockyard-" + deployment + ".lock";
}

DeployLock& DeployLock::operator=(DeployLock&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

DeployLock::~DeployLock() {
    // Closing the descriptor releases the flock.
    if (fd_ >= 0) ::close(fd_);
}

} // namespace dockyard::lifecycle
