#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/bybit/BybitRestClient.hpp"
#include "adapters/parquet/ParquetCandleStore.hpp"
#include "app/IngestionScheduler.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/RateLimiter.hpp"
#include "domain/Types.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

int printStatus(const tape::adapters::parquet::ParquetCandleStore& store) {
    const auto series = store.list_series();
    if (series.empty()) {
        std::cout << "No stored series under " << store.options().root.string() << '\n';
        return EXIT_SUCCESS;
    }
    std::cout << "series\tfirst\tlast\trows\tpartitions\n";
    for (const auto& coverage : series) {
        std::cout << coverage.key.to_string() << '\t'
                  << (coverage.first ? std::to_string(*coverage.first) : std::string{"-"}) << '\t'
                  << (coverage.last ? std::to_string(*coverage.last) : std::string{"-"}) << '\t' << coverage.rows
                  << '\t' << coverage.partitions << '\n';
    }
    return EXIT_SUCCESS;
}

int printInstruments(tape::domain::ICandleSource& source) {
    auto instruments = source.list_instruments();
    std::sort(instruments.begin(), instruments.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.symbol < rhs.symbol; });
    std::cout << "symbol\tbase\tquote\tstatus\n";
    for (const auto& instrument : instruments) {
        std::cout << instrument.symbol << '\t' << instrument.base << '\t' << instrument.quote << '\t'
                  << instrument.status << '\n';
    }
    return EXIT_SUCCESS;
}

std::unique_ptr<tape::domain::ICandleSource> makeSource(const tape::common::Config& config,
                                                        std::shared_ptr<tape::core::RateLimiter> limiter) {
    tape::adapters::exchange::FetchOptions fetchOptions;
    fetchOptions.maxRetries = static_cast<int>(config.maxRetries);
    fetchOptions.backoffBase = std::chrono::milliseconds(config.backoffBaseMs);
    fetchOptions.backoffMax = std::chrono::milliseconds(config.backoffMaxMs);

    auto transport = std::make_shared<tape::infra::http::TlsHttpTransport>();
    if (config.exchange == "bybit") {
        return std::make_unique<tape::adapters::bybit::BybitRestClient>(
            transport, std::move(limiter), tape::adapters::bybit::category_from_string(config.category),
            fetchOptions);
    }
    return std::make_unique<tape::adapters::binance::BinanceRestClient>(transport, std::move(limiter),
                                                                         fetchOptions);
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = tape::common::Config::fromArgs(argc, argv);
        tape::log::setLevel(config.logLevel);

        tape::adapters::parquet::StoreOptions storeOptions;
        storeOptions.root = config.storeRoot;
        storeOptions.maxRowsPerPartition = config.maxRowsPerPartition;
        tape::adapters::parquet::ParquetCandleStore store(storeOptions);

        if (config.status) {
            return printStatus(store);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Store root: " << config.storeRoot);
        LOG_INFO("  Exchange: " << config.exchange
                                << (config.exchange == "bybit" ? " category=" + config.category : std::string{}));
        LOG_INFO("  Symbols: " << joinList(config.symbols));
        LOG_INFO("  Timeframes: " << joinList(config.timeframes));
        LOG_INFO("  Range: [" << config.fromMs << ", " << config.toMs << ")");
        LOG_INFO("  Threads: " << config.threads << " page size: " << config.pageSize);
        LOG_INFO("  Rate limit: " << config.rateLimitRequests << " requests / " << config.rateLimitIntervalMs
                                  << " ms");
        LOG_INFO("  Log level: " << tape::log::levelToString(config.logLevel));

        auto limiter = std::make_shared<tape::core::RateLimiter>(
            config.rateLimitRequests, std::chrono::milliseconds(config.rateLimitIntervalMs));
        auto source = makeSource(config, limiter);

        if (config.instruments) {
            return printInstruments(*source);
        }
        if (config.verifySymbols) {
            const auto unlisted = tape::domain::unlisted_symbols(source->list_instruments(), config.symbols);
            if (!unlisted.empty()) {
                LOG_ERR("Not active on " << source->name() << ": " << joinList(unlisted));
                return EXIT_FAILURE;
            }
        }

        tape::app::IngestOptions ingestOptions;
        ingestOptions.page_size = config.pageSize;
        ingestOptions.backfill_start = config.fromMs;
        ingestOptions.max_gap_refetch_attempts = config.maxGapRefetchAttempts;
        ingestOptions.max_consecutive_failures = config.maxConsecutiveFailures;
        ingestOptions.backoff_base = std::chrono::milliseconds(config.backoffBaseMs);
        ingestOptions.backoff_max = std::chrono::milliseconds(config.backoffMaxMs);

        std::vector<tape::app::IngestJob> jobs;
        for (const auto& symbol : config.symbols) {
            for (const auto& label : config.timeframes) {
                jobs.push_back(tape::app::IngestJob{symbol, tape::domain::timeframe_from_label(label)});
            }
        }

        tape::app::CancellationToken cancel;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::atomic<bool> finished{false};
        std::thread signalWatcher([&finished, &cancel] {
            while (!finished.load()) {
                if (gSignalStatus != 0) {
                    LOG_WARN("Signal " << gSignalStatus << " received, stopping after the current windows");
                    cancel.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        tape::app::IngestionScheduler scheduler(*source, store, ingestOptions, config.threads);
        std::vector<tape::app::RunReport> reports;
        try {
            reports = scheduler.runAll(jobs, config.toMs, &cancel);
        } catch (...) {
            finished = true;
            signalWatcher.join();
            throw;
        }
        finished = true;
        signalWatcher.join();

        int exitCode = EXIT_SUCCESS;
        for (const auto& report : reports) {
            if (report.final_state == tape::app::IngestState::Failed) {
                LOG_ERR("  " << report.key.to_string() << ": failed: " << report.cause);
                exitCode = EXIT_FAILURE;
            } else {
                LOG_INFO("  " << report.key.to_string() << ": " << tape::app::state_name(report.final_state)
                              << " committed=" << report.candles_committed << " watermark="
                              << (report.end_watermark ? std::to_string(*report.end_watermark)
                                                       : std::string{"none"}));
            }
        }
        return exitCode;
    } catch (const std::exception& ex) {
        LOG_ERR("tape-ingest: " << ex.what());
        return EXIT_FAILURE;
    }
}
