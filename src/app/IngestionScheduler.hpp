#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "app/IngestionOrchestrator.hpp"

namespace tape::app {

struct IngestJob {
    domain::Symbol symbol;
    domain::Timeframe timeframe{};
};

// Runs one orchestrator per series on a fixed thread pool. The source, and the
// rate limiter behind it, and the store are shared by every run.
class IngestionScheduler {
public:
    IngestionScheduler(domain::ICandleSource& source,
                       adapters::parquet::ParquetCandleStore& store,
                       IngestOptions options,
                       std::size_t threads);

    void setStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    // Blocks until every job has finished. Reports are in job order.
    std::vector<RunReport> runAll(const std::vector<IngestJob>& jobs,
                                  domain::TimestampMs target_end_time,
                                  const CancellationToken* cancel = nullptr);

private:
    domain::ICandleSource& source_;
    adapters::parquet::ParquetCandleStore& store_;
    IngestOptions options_;
    std::size_t threads_;
    StateObserver observer_;
};

}  // namespace tape::app
