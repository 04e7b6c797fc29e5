#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "adapters/parquet/ParquetCandleStore.hpp"
#include "app/IngestionOrchestrator.hpp"
#include "app/IngestionScheduler.hpp"
#include "domain/Errors.hpp"
#include "TestSupport.hpp"

using namespace tape;
namespace fs = std::filesystem;

namespace {
using namespace std::chrono_literals;

constexpr auto kTimeframe = domain::timeframes::kOneMinute;
constexpr domain::TimestampMs kStep = kTimeframe.ms;
constexpr domain::TimestampMs kT0 = testing::kJan2024;

adapters::parquet::ParquetCandleStore makeStore(const fs::path& root) {
    adapters::parquet::StoreOptions options;
    options.root = root;
    return adapters::parquet::ParquetCandleStore(options);
}

app::IngestOptions makeOptions(domain::TimestampMs backfillStart = kT0) {
    app::IngestOptions options;
    options.page_size = 100;
    options.backfill_start = backfillStart;
    options.max_gap_refetch_attempts = 2;
    options.max_consecutive_failures = 3;
    options.backoff_base = 1ms;
    options.backoff_max = 4ms;
    // Far in the future so the target end decides the range.
    options.now = [] { return kT0 + 365LL * 24 * 60 * kStep; };
    return options;
}

bool storedContiguous(const adapters::parquet::ParquetCandleStore& store,
                      domain::TimestampMs first,
                      std::size_t expected) {
    const auto rows = store.read_all("BTCUSDT", kTimeframe, first - 1000 * kStep, first + 100000 * kStep);
    if (rows.size() != expected) {
        std::cerr << "Expected " << expected << " stored rows but found " << rows.size() << "\n";
        return false;
    }
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].openTime != first + static_cast<domain::TimestampMs>(i) * kStep) {
            std::cerr << "Stored rows are not contiguous at index " << i << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    // Backfill the whole range, then a second run is a no-op.
    {
        testing::TempDir dir("orch-idempotent");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());

        std::vector<app::IngestState> states;
        orchestrator.setStateObserver([&states](const domain::SeriesKey&, app::IngestState, app::IngestState to) {
            states.push_back(to);
        });

        const auto report = orchestrator.run("BTC/USDT", kTimeframe, kT0 + 250 * kStep);
        if (!report.succeeded() || report.candles_committed != 250U || report.pages_fetched != 3U) {
            std::cerr << "Expected 250 candles in 3 pages but got " << report.candles_committed << " in "
                      << report.pages_fetched << " (" << report.cause << ")\n";
            return 1;
        }
        if (!report.end_watermark || *report.end_watermark != kT0 + 249 * kStep) {
            std::cerr << "Expected the watermark at the last closed candle before the target\n";
            return 1;
        }
        if (!storedContiguous(store, kT0, 250)) {
            return 1;
        }
        for (auto expected : {app::IngestState::ComputingGap, app::IngestState::Fetching, app::IngestState::Merging,
                              app::IngestState::Committing, app::IngestState::Completed}) {
            if (std::find(states.begin(), states.end(), expected) == states.end()) {
                std::cerr << "Expected the observer to see state " << app::state_name(expected) << "\n";
                return 1;
            }
        }

        const auto callsBefore = source.calls().size();
        const auto again = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 250 * kStep);
        if (!again.succeeded() || again.candles_committed != 0U || source.calls().size() != callsBefore) {
            std::cerr << "Expected a repeated run to be a no-op without fetching\n";
            return 1;
        }
        if (!storedContiguous(store, kT0, 250)) {
            return 1;
        }
    }

    // Only closed candles are stored: the current interval is excluded.
    {
        testing::TempDir dir("orch-now");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        auto options = makeOptions();
        options.now = [] { return kT0 + 10 * kStep + 30'000; };
        app::IngestionOrchestrator orchestrator(source, store, options);
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 500 * kStep);
        if (!report.succeeded() || !storedContiguous(store, kT0, 10)) {
            std::cerr << "Expected ingestion to stop before the open candle\n";
            return 1;
        }
    }

    // A row missing from the first response is re-fetched and the result has no gap.
    {
        testing::TempDir dir("orch-gap");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        source.missOnce(kT0 + 2 * kStep);
        source.missOnce(kT0 + 150 * kStep);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 200 * kStep);
        if (!report.succeeded() || report.gap_refetches != 2U) {
            std::cerr << "Expected 2 gap re-fetches but got " << report.gap_refetches << " (" << report.cause
                      << ")\n";
            return 1;
        }
        const auto calls = source.calls();
        if (std::find(calls.begin(), calls.end(), kT0 + 2 * kStep) == calls.end()) {
            std::cerr << "Expected a fetch bounded to the missing row\n";
            return 1;
        }
        if (!storedContiguous(store, kT0, 200)) {
            return 1;
        }
    }

    // A hole that never fills fails the run; nothing after it is committed.
    {
        testing::TempDir dir("orch-hole");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        source.addHole(kT0 + 120 * kStep);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 300 * kStep);
        if (report.final_state != app::IngestState::Failed ||
            report.cause.find("upstream hole") == std::string::npos) {
            std::cerr << "Expected the run to fail on a persistent hole but got "
                      << app::state_name(report.final_state) << "\n";
            return 1;
        }
        if (!report.end_watermark || *report.end_watermark != kT0 + 99 * kStep || !storedContiguous(store, kT0, 100)) {
            std::cerr << "Expected only the window before the hole to be committed\n";
            return 1;
        }
    }

    // Resuming extends the series from its watermark.
    {
        testing::TempDir dir("orch-resume");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        {
            app::IngestionOrchestrator first(source, store, makeOptions());
            if (!first.run("BTCUSDT", kTimeframe, kT0 + 130 * kStep).succeeded()) {
                std::cerr << "Expected the first run to complete\n";
                return 1;
            }
        }
        app::IngestionOrchestrator second(source, store, makeOptions());
        const auto report = second.run("BTCUSDT", kTimeframe, kT0 + 400 * kStep);
        if (!report.succeeded() || !report.start_watermark || *report.start_watermark != kT0 + 129 * kStep ||
            report.candles_committed != 270U) {
            std::cerr << "Expected the second run to resume at t0+130\n";
            return 1;
        }
        if (!storedContiguous(store, kT0, 400)) {
            return 1;
        }
    }

    // Before the listing date the range is skipped without committing.
    {
        testing::TempDir dir("orch-listing");
        auto store = makeStore(dir.path());
        const auto listedAt = kT0 + 250 * kStep;
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, listedAt, 100);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 330 * kStep);
        if (!report.succeeded() || report.candles_committed != 80U) {
            std::cerr << "Expected 80 candles after the listing date but got " << report.candles_committed << " ("
                      << report.cause << ")\n";
            return 1;
        }
        if (!storedContiguous(store, listedAt, 80)) {
            return 1;
        }
    }

    // A second run for the same series is refused while the first holds it.
    {
        testing::TempDir dir("orch-concurrent");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        auto lease = store.open_writer("BTCUSDT", kTimeframe);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 50 * kStep);
        if (report.final_state != app::IngestState::Failed || !source.calls().empty()) {
            std::cerr << "Expected a concurrent run to fail without fetching\n";
            return 1;
        }
    }

    // Two runs started together for one series: one commits, the other is refused,
    // and the store ends up as after a single run.
    {
        testing::TempDir dir("orch-race");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);

        std::mutex mutex;
        std::condition_variable changed;
        int started = 0;
        int refused = 0;
        // The lease holder stays inside its first fetch until the other run gave up.
        source.onFetch([&](domain::TimestampMs) {
            std::unique_lock<std::mutex> lock(mutex);
            changed.wait_for(lock, 5s, [&] { return refused > 0; });
        });

        auto runOnce = [&](app::RunReport& out) {
            app::IngestionOrchestrator orchestrator(source, store, makeOptions());
            orchestrator.setStateObserver([&](const domain::SeriesKey&, app::IngestState, app::IngestState to) {
                if (to == app::IngestState::Failed) {
                    std::lock_guard<std::mutex> lock(mutex);
                    ++refused;
                    changed.notify_all();
                }
            });
            {
                std::unique_lock<std::mutex> lock(mutex);
                ++started;
                changed.notify_all();
                changed.wait_for(lock, 5s, [&] { return started == 2; });
            }
            out = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 150 * kStep);
        };

        app::RunReport first;
        app::RunReport second;
        std::thread a(runOnce, std::ref(first));
        std::thread b(runOnce, std::ref(second));
        a.join();
        b.join();

        const auto completed = static_cast<int>(first.succeeded()) + static_cast<int>(second.succeeded());
        const auto& loser = first.succeeded() ? second : first;
        if (completed != 1 || loser.final_state != app::IngestState::Failed ||
            loser.cause.find("active writer") == std::string::npos) {
            std::cerr << "Expected exactly one of two simultaneous runs to complete but got "
                      << app::state_name(first.final_state) << " and " << app::state_name(second.final_state)
                      << " (" << loser.cause << ")\n";
            return 1;
        }
        if (loser.candles_committed != 0U || !storedContiguous(store, kT0, 150)) {
            return 1;
        }

        testing::TempDir soloDir("orch-race-solo");
        auto soloStore = makeStore(soloDir.path());
        testing::FakeCandleSource soloSource("BTCUSDT", kTimeframe, kT0, 1000);
        app::IngestionOrchestrator solo(soloSource, soloStore, makeOptions());
        (void)solo.run("BTCUSDT", kTimeframe, kT0 + 150 * kStep);
        const auto raced = store.read_all("BTCUSDT", kTimeframe, kT0, kT0 + 150 * kStep);
        const auto single = soloStore.read_all("BTCUSDT", kTimeframe, kT0, kT0 + 150 * kStep);
        if (raced.size() != single.size() ||
            !std::equal(raced.begin(), raced.end(), single.begin(), [](const auto& lhs, const auto& rhs) {
                return lhs.openTime == rhs.openTime && domain::same_values(lhs, rhs);
            })) {
            std::cerr << "Expected the raced store to match a single run\n";
            return 1;
        }
    }

    // Permanent upstream errors fail at once.
    {
        testing::TempDir dir("orch-permanent");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        source.failPermanent(true);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 50 * kStep);
        if (report.final_state != app::IngestState::Failed || source.calls().size() != 1U ||
            report.cause.find("rejected") == std::string::npos) {
            std::cerr << "Expected a single fetch and a failed run\n";
            return 1;
        }
    }

    // Transient failures back off and recover; too many in a row fail the run.
    {
        testing::TempDir dir("orch-transient");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        source.failTransient(2);
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        std::size_t backoffs = 0;
        orchestrator.setStateObserver([&backoffs](const domain::SeriesKey&, app::IngestState, app::IngestState to) {
            if (to == app::IngestState::ErrorBackoff) {
                ++backoffs;
            }
        });
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 50 * kStep);
        if (!report.succeeded() || backoffs != 2U || !storedContiguous(store, kT0, 50)) {
            std::cerr << "Expected recovery after 2 transient failures\n";
            return 1;
        }

        source.failTransient(10);
        const auto failed = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 80 * kStep);
        if (failed.final_state != app::IngestState::Failed ||
            failed.cause.find("consecutive transient failures") == std::string::npos) {
            std::cerr << "Expected the run to fail after repeated transient failures\n";
            return 1;
        }
        if (!failed.end_watermark || *failed.end_watermark != kT0 + 49 * kStep) {
            std::cerr << "Expected the watermark to be unchanged by the failed run\n";
            return 1;
        }
    }

    // Cancellation is honored between windows and keeps committed progress.
    {
        testing::TempDir dir("orch-cancel");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        app::CancellationToken cancel;
        app::IngestionOrchestrator orchestrator(source, store, makeOptions());
        orchestrator.setStateObserver(
            [&cancel](const domain::SeriesKey&, app::IngestState from, app::IngestState) {
                if (from == app::IngestState::Committing) {
                    cancel.cancel();
                }
            });
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 500 * kStep, &cancel);
        if (report.final_state != app::IngestState::Cancelled || report.candles_committed != 100U) {
            std::cerr << "Expected cancellation after the first window but got "
                      << app::state_name(report.final_state) << "\n";
            return 1;
        }
        if (!storedContiguous(store, kT0, 100)) {
            return 1;
        }
    }

    // Cancelling during a long backoff ends the run without waiting it out.
    {
        testing::TempDir dir("orch-cancel-backoff");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        source.failTransient(10);
        auto options = makeOptions();
        options.backoff_base = 60s;
        options.backoff_max = 60s;
        app::IngestionOrchestrator orchestrator(source, store, options);

        app::CancellationToken cancel;
        std::thread canceller;
        orchestrator.setStateObserver([&](const domain::SeriesKey&, app::IngestState, app::IngestState to) {
            if (to == app::IngestState::ErrorBackoff && !canceller.joinable()) {
                canceller = std::thread([&cancel] {
                    std::this_thread::sleep_for(50ms);
                    cancel.cancel();
                });
            }
        });

        const auto startedAt = std::chrono::steady_clock::now();
        const auto report = orchestrator.run("BTCUSDT", kTimeframe, kT0 + 50 * kStep, &cancel);
        const auto elapsed = std::chrono::steady_clock::now() - startedAt;
        if (canceller.joinable()) {
            canceller.join();
        }
        if (report.final_state != app::IngestState::Cancelled || elapsed > 10s || source.calls().size() != 1U) {
            std::cerr << "Expected the backoff to end on cancellation but got " << app::state_name(report.final_state)
                      << " after " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()
                      << " ms\n";
            return 1;
        }
    }

    // The scheduler runs several series on a shared pool.
    {
        testing::TempDir dir("orch-scheduler");
        auto store = makeStore(dir.path());
        testing::FakeCandleSource source("BTCUSDT", kTimeframe, kT0, 1000);
        app::IngestionScheduler scheduler(source, store, makeOptions(), 2);

        std::mutex mutex;
        std::vector<std::string> completed;
        scheduler.setStateObserver([&](const domain::SeriesKey& key, app::IngestState, app::IngestState to) {
            if (to == app::IngestState::Completed || to == app::IngestState::Failed) {
                std::lock_guard<std::mutex> lock(mutex);
                completed.push_back(key.to_string());
            }
        });

        const auto reports = scheduler.runAll({{"BTCUSDT", kTimeframe}, {"ETHUSDT", kTimeframe}}, kT0 + 120 * kStep);
        if (reports.size() != 2U || !reports[0].succeeded() || reports[0].candles_committed != 120U) {
            std::cerr << "Expected BTCUSDT to complete through the scheduler\n";
            return 1;
        }
        // The fake only serves BTCUSDT, so ETHUSDT fails with a permanent error.
        if (reports[1].final_state != app::IngestState::Failed || reports[1].key.symbol != "ETHUSDT") {
            std::cerr << "Expected ETHUSDT to fail independently\n";
            return 1;
        }
        if (completed.size() != 2U) {
            std::cerr << "Expected a terminal state for each job\n";
            return 1;
        }
    }

    return 0;
}
