#include "app/IngestionScheduler.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Log.hpp"

namespace tape::app {

IngestionScheduler::IngestionScheduler(domain::ICandleSource& source,
                                       adapters::parquet::ParquetCandleStore& store,
                                       IngestOptions options,
                                       std::size_t threads)
    : source_(source), store_(store), options_(std::move(options)), threads_(threads) {
    if (threads_ == 0U) {
        throw std::invalid_argument("IngestionScheduler requires at least one thread");
    }
}

std::vector<RunReport> IngestionScheduler::runAll(const std::vector<IngestJob>& jobs,
                                                  domain::TimestampMs target_end_time,
                                                  const CancellationToken* cancel) {
    std::vector<RunReport> reports(jobs.size());
    if (jobs.empty()) {
        return reports;
    }

    const auto workers = std::min(threads_, jobs.size());
    LOG_INFO("Scheduling " << jobs.size() << " ingestion runs on " << workers << " threads");

    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        boost::asio::post(pool, [this, &jobs, &reports, i, target_end_time, cancel]() {
            const auto& job = jobs[i];
            auto& report = reports[i];
            try {
                IngestionOrchestrator orchestrator(source_, store_, options_);
                orchestrator.setStateObserver(observer_);
                report = orchestrator.run(job.symbol, job.timeframe, target_end_time, cancel);
            } catch (const std::exception& ex) {
                report.key = domain::SeriesKey{domain::normalize_symbol(job.symbol), job.timeframe};
                report.final_state = IngestState::Failed;
                report.cause = ex.what();
                LOG_ERR("Ingestion " << report.key.to_string() << " aborted: " << ex.what());
            }
        });
    }
    pool.join();

    const auto failed = std::count_if(reports.begin(), reports.end(), [](const RunReport& report) {
        return report.final_state == IngestState::Failed;
    });
    LOG_INFO("Ingestion runs finished: total=" << reports.size() << " failed=" << failed);
    return reports;
}

}  // namespace tape::app
