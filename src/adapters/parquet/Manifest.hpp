#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace tape::adapters::parquet {

struct PartitionEntry {
    std::string file;
    domain::TimestampMs first{0};
    domain::TimestampMs last{0};
    std::size_t rows{0};
    bool sealed{false};
};

// Committed state of one series. The watermark is the last open_time of the
// last partition; it is stored explicitly so the record is readable on its own.
struct Manifest {
    static constexpr int kVersion = 1;

    domain::SeriesKey key;
    std::optional<domain::TimestampMs> watermark;
    std::vector<PartitionEntry> partitions;

    std::size_t totalRows() const noexcept;
};

std::string partition_file_name(domain::TimestampMs first);

// Returns an empty manifest when the file does not exist.
// Throws CorruptPartitionError when it exists but is malformed or inconsistent.
Manifest load_manifest(const std::filesystem::path& path, const domain::SeriesKey& key);

void save_manifest(const std::filesystem::path& path, const Manifest& manifest);

std::string serialize_manifest(const Manifest& manifest);

}  // namespace tape::adapters::parquet
