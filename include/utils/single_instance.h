#pragma once

#include <memory>
#include <string>

namespace sigelnet {
namespace utils {

// Exclusive fcntl lock on <dataDir>/sigelnetd.lock, held for the lifetime
// of the object. A second daemon on the same data directory is refused.
class SingleInstanceLock {
public:
    static std::unique_ptr<SingleInstanceLock> acquire(const std::string& dataDir,
                                                       std::string* errorOut = nullptr);

    ~SingleInstanceLock();

    SingleInstanceLock(const SingleInstanceLock&) = delete;
    SingleInstanceLock& operator=(const SingleInstanceLock&) = delete;

    const std::string& path() const { return lockPath_; }

private:
    SingleInstanceLock() = default;

    std::string lockPath_;
    int fd_ = -1;
};

}
}
