#include "app/IngestionOrchestrator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "adapters/parquet/ParquetCandleStore.hpp"
#include "app/CandleMerger.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace tape::app {
namespace {

constexpr std::size_t kProgressLogInterval = 5000;

}  // namespace

const char* state_name(IngestState state) noexcept {
    switch (state) {
    case IngestState::Idle:
        return "idle";
    case IngestState::ComputingGap:
        return "computing-gap";
    case IngestState::Fetching:
        return "fetching";
    case IngestState::Merging:
        return "merging";
    case IngestState::Committing:
        return "committing";
    case IngestState::ErrorBackoff:
        return "error-backoff";
    case IngestState::Completed:
        return "completed";
    case IngestState::Failed:
        return "failed";
    case IngestState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

struct IngestionOrchestrator::Run {
    domain::SeriesKey key;
    IngestState state{IngestState::Idle};
    domain::TimestampMs end{0};
    const CancellationToken* cancel{nullptr};
    // Progress through the range before the first listed candle; never persisted.
    std::optional<domain::TimestampMs> listingCursor;
    std::size_t lastLogged{0};
    RunReport report;
};

IngestionOrchestrator::IngestionOrchestrator(domain::ICandleSource& source,
                                             adapters::parquet::ParquetCandleStore& store,
                                             IngestOptions options)
    : source_(source), store_(store), options_(std::move(options)) {
    if (options_.page_size == 0U) {
        throw std::invalid_argument("IngestOptions.page_size must be at least 1");
    }
}

domain::TimestampMs IngestionOrchestrator::nowMs() const {
    if (options_.now) {
        return options_.now();
    }
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::chrono::milliseconds IngestionOrchestrator::backoffFor(std::size_t failures) const {
    auto delay = options_.backoff_base;
    for (std::size_t i = 1; i < failures && delay < options_.backoff_max; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.backoff_max);
}

void IngestionOrchestrator::transition(Run& run, IngestState next) const {
    const auto previous = run.state;
    run.state = next;
    LOG_DEBUG("Ingestion " << run.key.to_string() << ": " << state_name(previous) << " -> " << state_name(next));
    if (observer_) {
        observer_(run.key, previous, next);
    }
}

void IngestionOrchestrator::finish(Run& run, IngestState terminal, std::string cause) const {
    transition(run, terminal);
    run.report.final_state = terminal;
    run.report.cause = std::move(cause);

    const auto watermark = run.report.end_watermark ? std::to_string(*run.report.end_watermark) : std::string{"none"};
    switch (terminal) {
    case IngestState::Completed:
        LOG_INFO("Ingestion " << run.key.to_string() << " completed: committed=" << run.report.candles_committed
                              << " pages=" << run.report.pages_fetched << " watermark=" << watermark);
        break;
    case IngestState::Cancelled:
        LOG_WARN("Ingestion " << run.key.to_string() << " cancelled at watermark=" << watermark);
        break;
    default:
        LOG_ERR("Ingestion " << run.key.to_string() << " failed at watermark=" << watermark << ": "
                             << run.report.cause);
        break;
    }
}

RunReport IngestionOrchestrator::run(const domain::Symbol& symbol,
                                     domain::Timeframe timeframe,
                                     domain::TimestampMs target_end_time,
                                     const CancellationToken* cancel) {
    Run run;
    run.key = domain::SeriesKey{domain::normalize_symbol(symbol), timeframe};
    run.report.key = run.key;
    run.cancel = cancel;

    std::optional<adapters::parquet::WriterLease> lease;
    try {
        if (domain::timeframe_label(timeframe).empty()) {
            throw std::invalid_argument("unsupported timeframe of " + std::to_string(timeframe.ms) + " ms");
        }
        lease.emplace(store_.open_writer(run.key.symbol, timeframe));
        run.report.start_watermark = store_.watermark(run.key.symbol, timeframe);
    } catch (const std::exception& ex) {
        finish(run, IngestState::Failed, ex.what());
        return run.report;
    }
    run.report.end_watermark = run.report.start_watermark;
    run.end = std::min(domain::align_down(target_end_time, timeframe), domain::align_down(nowMs(), timeframe));

    LOG_INFO("Ingestion " << run.key.to_string() << " from " << source_.name() << " up to " << run.end
                          << " (exclusive), watermark="
                          << (run.report.start_watermark ? std::to_string(*run.report.start_watermark)
                                                         : std::string{"none"}));

    std::size_t failures = 0;
    while (true) {
        try {
            if (!ingestWindow(run, *lease)) {
                break;
            }
            failures = 0;
        } catch (const domain::StaleWriteError& ex) {
            LOG_WARN("Ingestion " << run.key.to_string() << " lost a write race, recomputing gap: " << ex.what());
        } catch (const domain::TransientFetchError& ex) {
            ++failures;
            if (failures >= options_.max_consecutive_failures) {
                finish(run, IngestState::Failed,
                       "giving up after " + std::to_string(failures) + " consecutive transient failures: " +
                           ex.what());
                break;
            }
            transition(run, IngestState::ErrorBackoff);
            const auto delay = backoffFor(failures);
            LOG_WARN("Ingestion " << run.key.to_string() << " transient failure " << failures << "/"
                                  << options_.max_consecutive_failures << ", backing off " << delay.count()
                                  << " ms: " << ex.what());
            if (run.cancel != nullptr) {
                // Cancellation is acted on in ComputingGap, right after the wait.
                (void)run.cancel->wait_for(delay);
            } else {
                std::this_thread::sleep_for(delay);
            }
        } catch (const std::exception& ex) {
            finish(run, IngestState::Failed, ex.what());
            break;
        }
    }
    return run.report;
}

bool IngestionOrchestrator::ingestWindow(Run& run, adapters::parquet::WriterLease& lease) {
    transition(run, IngestState::ComputingGap);
    if (run.cancel != nullptr && run.cancel->cancelled()) {
        finish(run, IngestState::Cancelled, "cancelled");
        return false;
    }

    const auto& symbol = run.key.symbol;
    const auto timeframe = run.key.timeframe;
    const auto step = timeframe.ms;

    const auto watermark = store_.watermark(symbol, timeframe);
    run.report.end_watermark = watermark;
    if (watermark && *watermark >= run.end - step) {
        finish(run, IngestState::Completed);
        return false;
    }

    domain::TimestampMs start = 0;
    if (watermark) {
        start = *watermark + step;
    } else {
        start = domain::align_up(options_.backfill_start, timeframe);
        if (run.listingCursor) {
            start = std::max(start, *run.listingCursor);
        }
    }
    if (start >= run.end) {
        finish(run, IngestState::Completed);
        return false;
    }

    const auto pageSize = std::min(options_.page_size, source_.max_page_size());
    const auto windowEnd = std::min(start + static_cast<domain::TimestampMs>(pageSize) * step, run.end);
    const auto limit = static_cast<std::size_t>((windowEnd - start) / step);

    transition(run, IngestState::Fetching);
    auto page = source_.fetch_page(symbol, timeframe, start, limit, windowEnd);
    ++run.report.pages_fetched;

    transition(run, IngestState::Merging);
    const auto tail = watermark ? store_.tail(symbol, timeframe) : std::nullopt;
    const CandleMerger merger(run.key);
    auto merged = merger.merge(tail, page.candles);
    run.report.rejected += merged.rejected;

    if (merged.clean_batch.empty()) {
        if (!watermark) {
            LOG_INFO("Ingestion " << run.key.to_string() << ": no candles in [" << start << ", " << windowEnd
                                  << "), series not listed yet");
            run.listingCursor = windowEnd;
            transition(run, IngestState::Idle);
            return true;
        }
        merged.gaps.push_back(domain::TimeRange{start, windowEnd});
    }

    std::size_t attempts = 0;
    while (!merged.complete()) {
        if (attempts >= options_.max_gap_refetch_attempts) {
            const auto& hole = merged.gaps.front();
            finish(run, IngestState::Failed,
                   "upstream hole in " + run.key.to_string() + " at [" + std::to_string(hole.start) + ", " +
                       std::to_string(hole.end) + ") persists after " + std::to_string(attempts) + " re-fetches");
            return false;
        }
        ++attempts;

        std::vector<domain::Candle> combined = merged.clean_batch;
        for (const auto& gap : merged.gaps) {
            LOG_WARN("Ingestion " << run.key.to_string() << ": re-fetching gap [" << gap.start << ", " << gap.end
                                  << ") attempt " << attempts << "/" << options_.max_gap_refetch_attempts);
            transition(run, IngestState::Fetching);
            const auto missing = static_cast<std::size_t>((gap.end - gap.start) / step);
            const auto gapLimit = std::max<std::size_t>(1, std::min(missing, source_.max_page_size()));
            auto refill = source_.fetch_page(symbol, timeframe, gap.start, gapLimit, gap.end);
            ++run.report.pages_fetched;
            ++run.report.gap_refetches;
            combined.insert(combined.end(), refill.candles.begin(), refill.candles.end());
        }

        transition(run, IngestState::Merging);
        merged = merger.merge(tail, combined);
        run.report.rejected += merged.rejected;
        if (merged.clean_batch.empty()) {
            merged.gaps.push_back(domain::TimeRange{start, windowEnd});
        }
    }

    transition(run, IngestState::Committing);
    const auto committed = store_.append(lease, merged.clean_batch);
    run.report.candles_committed += merged.clean_batch.size();
    run.report.end_watermark = committed;

    if (run.report.candles_committed - run.lastLogged >= kProgressLogInterval) {
        LOG_INFO("Ingestion " << run.key.to_string() << " progress: committed=" << run.report.candles_committed
                              << " watermark=" << (committed ? *committed : 0));
        run.lastLogged = run.report.candles_committed;
    }

    transition(run, IngestState::Idle);
    return true;
}

}  // namespace tape::app
