#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "adapters/parquet/Manifest.hpp"
#include "adapters/parquet/WriterLock.hpp"
#include "domain/Types.hpp"

namespace tape::adapters::parquet {

class PartitionFile;

enum class CommitPhase {
    // Partition files renamed into place, manifest (watermark) not yet replaced.
    PartitionsVisible,
    ManifestVisible,
};

struct StoreOptions {
    std::filesystem::path root{"data/ohlcv"};
    std::size_t maxRowsPerPartition = 100'000;
    // Invoked synchronously during append(); an exception thrown here aborts the
    // commit at that phase exactly as a crash would.
    std::function<void(const domain::SeriesKey&, CommitPhase)> commitObserver;
};

// Lazy, restartable iteration over [start, end) of one series. Partitions are
// loaded one at a time, in order, and checked against their manifest entry.
class CandleCursor {
public:
    CandleCursor(domain::SeriesKey key,
                 std::filesystem::path seriesDir,
                 std::vector<PartitionEntry> partitions,
                 domain::TimestampMs start,
                 domain::TimestampMs end);
    CandleCursor(CandleCursor&&) noexcept;
    CandleCursor& operator=(CandleCursor&&) noexcept;
    ~CandleCursor();

    // Next candle, or nullopt once the range is exhausted.
    // Throws CorruptPartitionError when a partition fails validation.
    std::optional<domain::Candle> next();

    // Rewinds to the start of the range.
    void reset();

    std::size_t partitionCount() const noexcept { return partitions_.size(); }

private:
    void loadNextPartition();

    domain::SeriesKey key_;
    std::filesystem::path seriesDir_;
    std::vector<PartitionEntry> partitions_;
    domain::TimestampMs start_;
    domain::TimestampMs end_;

    std::size_t nextPartition_{0};
    std::vector<domain::Candle> buffer_;
    std::size_t position_{0};
    std::unique_ptr<PartitionFile> io_;
};

// Append-only columnar store: one directory per (symbol, timeframe) holding
// Parquet partitions and a manifest.json with the watermark. The store is the
// only writer of these files.
class ParquetCandleStore {
public:
    explicit ParquetCandleStore(StoreOptions options);

    // Exclusive writer for a series; runs crash recovery for it.
    // Throws ConcurrentIngestionError when already held.
    WriterLease open_writer(const domain::Symbol& symbol, domain::Timeframe timeframe);

    // Appends a contiguous batch that starts right after the watermark.
    // Throws StaleWriteError when any candle is at or before the watermark.
    std::optional<domain::TimestampMs> append(WriterLease& lease, const std::vector<domain::Candle>& batch);

    // Same as above with a lease held only for the duration of the call.
    std::optional<domain::TimestampMs> append(const domain::Symbol& symbol,
                                              domain::Timeframe timeframe,
                                              const std::vector<domain::Candle>& batch);

    CandleCursor read_range(const domain::Symbol& symbol,
                            domain::Timeframe timeframe,
                            domain::TimestampMs start_time,
                            domain::TimestampMs end_time) const;

    std::vector<domain::Candle> read_all(const domain::Symbol& symbol,
                                         domain::Timeframe timeframe,
                                         domain::TimestampMs start_time,
                                         domain::TimestampMs end_time) const;

    std::optional<domain::TimestampMs> watermark(const domain::Symbol& symbol, domain::Timeframe timeframe) const;

    // Last committed candle, used as the merge tail.
    std::optional<domain::Candle> tail(const domain::Symbol& symbol, domain::Timeframe timeframe) const;

    domain::SeriesCoverage coverage(const domain::Symbol& symbol, domain::Timeframe timeframe) const;

    std::vector<domain::SeriesCoverage> list_series() const;

    std::filesystem::path seriesDir(const domain::SeriesKey& key) const;

    const StoreOptions& options() const noexcept { return options_; }

private:
    domain::SeriesKey makeKey(const domain::Symbol& symbol, domain::Timeframe timeframe) const;
    Manifest loadManifest(const domain::SeriesKey& key) const;
    void recover(const domain::SeriesKey& key, const Manifest& manifest) const;
    void notify(const domain::SeriesKey& key, CommitPhase phase) const;

    StoreOptions options_;
};

// Calendar bucket a candle belongs to: UTC month below 1h, UTC year otherwise.
std::int64_t partition_period(domain::TimestampMs openTime, domain::Timeframe timeframe);

}  // namespace tape::adapters::parquet
