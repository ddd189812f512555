#include "utils/single_instance.h"

#include <cstring>
#include <filesystem>
#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace sigelnet {
namespace utils {

namespace {

static void fillLock(struct flock& fl, short type) {
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = type;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
}

static bool tryLockFile(int fd) {
    struct flock fl;
    fillLock(fl, F_WRLCK);
    int rc;
    do {
        rc = fcntl(fd, F_SETLK, &fl);
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
}

static pid_t lockOwner(int fd) {
    struct flock fl;
    fillLock(fl, F_WRLCK);
    if (fcntl(fd, F_GETLK, &fl) != 0) return -1;
    if (fl.l_type == F_UNLCK) return -1;
    return fl.l_pid;
}

static void unlockFile(int fd) {
    struct flock fl;
    fillLock(fl, F_UNLCK);
    fcntl(fd, F_SETLK, &fl);
}

static bool writePid(int fd) {
    std::string data = std::to_string(static_cast<long>(getpid())) + "\n";
    if (ftruncate(fd, 0) != 0) return false;
    if (lseek(fd, 0, SEEK_SET) < 0) return false;

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
    return fsync(fd) == 0;
}

}

std::unique_ptr<SingleInstanceLock> SingleInstanceLock::acquire(const std::string& dataDir,
                                                                std::string* errorOut) {
    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        if (errorOut) *errorOut = "Cannot create data directory " + dataDir + ": " + ec.message();
        return nullptr;
    }

    auto lock = std::unique_ptr<SingleInstanceLock>(new SingleInstanceLock());
    lock->lockPath_ = dataDir + "/sigelnetd.lock";

    int fd = ::open(lock->lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errorOut) *errorOut = "Failed to open lock file " + lock->lockPath_ + ": " + std::strerror(errno);
        return nullptr;
    }

    if (!tryLockFile(fd)) {
        pid_t owner = lockOwner(fd);
        ::close(fd);
        if (errorOut) {
            *errorOut = "Another sigelnetd is using " + dataDir;
            if (owner > 0) *errorOut += " (pid " + std::to_string(owner) + ")";
        }
        return nullptr;
    }

    if (!writePid(fd)) {
        unlockFile(fd);
        ::close(fd);
        if (errorOut) *errorOut = "Failed to write lock file " + lock->lockPath_;
        return nullptr;
    }

    lock->fd_ = fd;
    return lock;
}

SingleInstanceLock::~SingleInstanceLock() {
    if (fd_ >= 0) {
        unlockFile(fd_);
        ::close(fd_);
        fd_ = -1;
    }
}

}
}
