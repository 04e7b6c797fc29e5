#include "adapters/parquet/WriterLock.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace tape::adapters::parquet {
namespace {

struct LockRegistry {
    std::mutex mutex;
    std::unordered_set<std::string> held;
};

LockRegistry& registry() {
    static LockRegistry instance;
    return instance;
}

std::string canonicalKey(const fs::path& seriesDir) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(seriesDir, ec);
    return ec ? seriesDir.lexically_normal().string() : canonical.string();
}

}  // namespace

WriterLease WriterLease::acquire(const domain::SeriesKey& key, const fs::path& seriesDir) {
    std::error_code ec;
    fs::create_directories(seriesDir, ec);
    if (ec) {
        throw std::runtime_error("unable to create series directory '" + seriesDir.string() + "': " + ec.message());
    }

    auto registryKey = canonicalKey(seriesDir);
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        if (!reg.held.insert(registryKey).second) {
            throw domain::ConcurrentIngestionError("Series " + key.to_string() +
                                                   " already has an active writer in this process");
        }
    }

    const auto lockPath = seriesDir / ".lock";
    const int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0 || ::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (fd >= 0) {
            ::close(fd);
        }
        {
            auto& reg = registry();
            std::lock_guard<std::mutex> lock(reg.mutex);
            reg.held.erase(registryKey);
        }
        if (fd >= 0 && err == EWOULDBLOCK) {
            throw domain::ConcurrentIngestionError("Series " + key.to_string() +
                                                   " is locked by another process");
        }
        throw std::runtime_error("unable to lock '" + lockPath.string() + "': " + std::strerror(err));
    }

    LOG_DEBUG("Writer lease acquired for " << key.to_string());
    return WriterLease(key, seriesDir, std::move(registryKey), fd);
}

WriterLease::WriterLease(domain::SeriesKey key, fs::path seriesDir, std::string registryKey, int fd)
    : key_(std::move(key)), seriesDir_(std::move(seriesDir)), registryKey_(std::move(registryKey)), fd_(fd) {}

WriterLease::WriterLease(WriterLease&& other) noexcept
    : key_(std::move(other.key_)),
      seriesDir_(std::move(other.seriesDir_)),
      registryKey_(std::move(other.registryKey_)),
      fd_(std::exchange(other.fd_, -1)) {}

WriterLease& WriterLease::operator=(WriterLease&& other) noexcept {
    if (this != &other) {
        release();
        key_ = std::move(other.key_);
        seriesDir_ = std::move(other.seriesDir_);
        registryKey_ = std::move(other.registryKey_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

WriterLease::~WriterLease() {
    release();
}

void WriterLease::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.held.erase(registryKey_);
}

}  // namespace tape::adapters::parquet
