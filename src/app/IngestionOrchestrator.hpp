#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "domain/ICandleSource.hpp"
#include "domain/Types.hpp"

namespace tape::adapters::parquet {
class ParquetCandleStore;
class WriterLease;
}  // namespace tape::adapters::parquet

namespace tape::app {

enum class IngestState {
    Idle,
    ComputingGap,
    Fetching,
    Merging,
    Committing,
    ErrorBackoff,
    Completed,
    Failed,
    Cancelled,
};

const char* state_name(IngestState state) noexcept;

struct IngestOptions {
    std::size_t page_size = 1000;
    // Where a series without stored data starts; aligned up to the timeframe.
    domain::TimestampMs backfill_start = 0;
    std::size_t max_gap_refetch_attempts = 3;
    std::size_t max_consecutive_failures = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{60000};
    // Wall clock in epoch ms; defaults to the system clock.
    std::function<domain::TimestampMs()> now;
};

struct RunReport {
    domain::SeriesKey key;
    IngestState final_state{IngestState::Idle};
    std::optional<domain::TimestampMs> start_watermark;
    std::optional<domain::TimestampMs> end_watermark;
    std::size_t candles_committed{0};
    std::size_t pages_fetched{0};
    std::size_t gap_refetches{0};
    std::size_t rejected{0};
    std::string cause;

    bool succeeded() const noexcept { return final_state == IngestState::Completed; }
};

// Cooperative cancellation, observed between windows and during backoff.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        changed_.notify_all();
    }

    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Sleeps for up to `timeout`; returns true as soon as the token is cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [this] { return cancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
};

using StateObserver = std::function<void(const domain::SeriesKey&, IngestState from, IngestState to)>;

// Drives one series from its watermark up to a target end time, one window at
// a time: compute the gap, fetch a page, merge it against the stored tail,
// re-fetch missing ranges, commit. Resumable from the persisted watermark.
class IngestionOrchestrator {
public:
    IngestionOrchestrator(domain::ICandleSource& source,
                          adapters::parquet::ParquetCandleStore& store,
                          IngestOptions options = {});

    void setStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    // Never throws for ingestion failures; they end the run in Failed with the
    // cause recorded in the report.
    RunReport run(const domain::Symbol& symbol,
                  domain::Timeframe timeframe,
                  domain::TimestampMs target_end_time,
                  const CancellationToken* cancel = nullptr);

    const IngestOptions& options() const noexcept { return options_; }

private:
    struct Run;

    void transition(Run& run, IngestState next) const;
    void finish(Run& run, IngestState terminal, std::string cause = {}) const;
    bool ingestWindow(Run& run, adapters::parquet::WriterLease& lease);
    std::chrono::milliseconds backoffFor(std::size_t failures) const;
    domain::TimestampMs nowMs() const;

    domain::ICandleSource& source_;
    adapters::parquet::ParquetCandleStore& store_;
    IngestOptions options_;
    StateObserver observer_;
};

}  // namespace tape::app
