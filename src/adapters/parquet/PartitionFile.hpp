#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "domain/Types.hpp"

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace tape::adapters::parquet {

// Rows of an existing partition file to carry into its rewritten version.
struct ExistingRows {
    std::filesystem::path file;
    domain::TimestampMs upTo{0};
};

// Parquet partition I/O through an in-memory DuckDB instance. One instance per
// operation or cursor; not shared across threads.
class PartitionFile {
public:
    PartitionFile();
    ~PartitionFile();

    PartitionFile(const PartitionFile&) = delete;
    PartitionFile& operator=(const PartitionFile&) = delete;

    // Stages the batch once; subsequent write() calls select slices of it.
    void stage(const std::vector<domain::Candle>& batch);

    // Writes existing rows (if any) followed by the staged rows in [from, to]
    // to `target`, ZSTD compressed, sorted by open_time.
    void write(const std::filesystem::path& target,
               const std::optional<ExistingRows>& existing,
               domain::TimestampMs from,
               domain::TimestampMs to);

    // Rows with open_time in [from, to], in file order. Throws
    // CorruptPartitionError when the file is unreadable, has the wrong schema or
    // holds NULLs.
    std::vector<domain::Candle> read(const std::filesystem::path& file,
                                     const domain::SeriesKey& key,
                                     domain::TimestampMs from,
                                     domain::TimestampMs to);

private:
    void checkSchema(const std::filesystem::path& file);

    std::unique_ptr<::duckdb::DuckDB> db_;
    std::unique_ptr<::duckdb::Connection> connection_;
    bool staged_{false};
};

}  // namespace tape::adapters::parquet
