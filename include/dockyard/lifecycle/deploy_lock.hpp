#pragma once
/**
 * @file deploy_lock.hpp
 * @brief Cross-process single-writer guard for one deployment unit (advisory flock).
 */

#include <cstdint>
#include <string>

#include "dockyard/compat/expected.hpp"

namespace dockyard::lifecycle {

enum class LockErr : std::uint8_t {
    Busy,     ///< Another process holds the lock
    IoError   ///< Lock file could not be opened
};

/**
 * @class DeployLock
 * @brief RAII holder of an exclusive flock on a per-deployment lock file.
 */
class DeployLock final {
public:
    /// Try to take the lock without blocking.
    static dockyard_detail::expected<DeployLock, LockErr> try_acquire(const std::string& path);

    /// Default lock path for @p deployment under the system temp directory.
    static std::string default_path(const std::string& deployment);

    DeployLock(const DeployLock&)            = delete;
    DeployLock& operator=(const DeployLock&) = delete;
    DeployLock(DeployLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    DeployLock& operator=(DeployLock&& other) noexcept;
    ~DeployLock();

private:
    explicit DeployLock(int fd) noexcept : fd_(fd) {}
    int fd_{-1};
};

} // namespace dockyard::lifecycle
