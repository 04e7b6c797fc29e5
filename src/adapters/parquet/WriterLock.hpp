#pragma once

#include <filesystem>
#include <string>

#include "domain/Types.hpp"

namespace tape::adapters::parquet {

// Exclusive right to append to one series. Held for the lifetime of the object:
// an entry in the process-wide registry plus an flock(2) on the series' .lock
// file, so writers in other processes are excluded as well.
class WriterLease {
public:
    // Throws ConcurrentIngestionError when another writer holds the series.
    static WriterLease acquire(const domain::SeriesKey& key, const std::filesystem::path& seriesDir);

    WriterLease(WriterLease&& other) noexcept;
    WriterLease& operator=(WriterLease&& other) noexcept;
    WriterLease(const WriterLease&) = delete;
    WriterLease& operator=(const WriterLease&) = delete;
    ~WriterLease();

    const domain::SeriesKey& key() const noexcept { return key_; }
    const std::filesystem::path& seriesDir() const noexcept { return seriesDir_; }
    bool held() const noexcept { return fd_ >= 0; }

private:
    WriterLease(domain::SeriesKey key, std::filesystem::path seriesDir, std::string registryKey, int fd);
    void release() noexcept;

    domain::SeriesKey key_;
    std::filesystem::path seriesDir_;
    std::string registryKey_;
    int fd_{-1};
};

}  // namespace tape::adapters::parquet
