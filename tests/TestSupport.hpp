#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "domain/Errors.hpp"
#include "domain/ICandleSource.hpp"
#include "domain/Types.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace tape::testing {

// 2024-01-01T00:00:00Z
constexpr domain::TimestampMs kJan2024 = 1'704'067'200'000;

inline domain::Candle makeCandle(const std::string& symbol,
                                 domain::Timeframe timeframe,
                                 domain::TimestampMs openTime,
                                 double price = 100.0) {
    domain::Candle candle;
    candle.symbol = symbol;
    candle.timeframe = timeframe;
    candle.openTime = openTime;
    candle.open = price;
    candle.high = price + 1.0;
    candle.low = price - 1.0;
    candle.close = price + 0.5;
    candle.volume = 10.0;
    return candle;
}

inline std::vector<domain::Candle> makeSeries(const std::string& symbol,
                                              domain::Timeframe timeframe,
                                              domain::TimestampMs start,
                                              std::size_t count) {
    std::vector<domain::Candle> candles;
    candles.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto openTime = start + static_cast<domain::TimestampMs>(i) * timeframe.ms;
        candles.push_back(makeCandle(symbol, timeframe, openTime, 100.0 + static_cast<double>(i % 50)));
    }
    return candles;
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("tape-" + name + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// Scripted transport: each get() consumes the next queued step.
class FakeHttpTransport : public infra::http::IHttpTransport {
public:
    void pushResponse(unsigned status, std::string body, std::map<std::string, std::string> headers = {}) {
        Step step;
        step.response.status = status;
        step.response.body = std::move(body);
        step.response.headers = std::move(headers);
        steps_.push_back(std::move(step));
    }

    void pushNetworkError(std::string message) {
        Step step;
        step.networkError = std::move(message);
        steps_.push_back(std::move(step));
    }

    infra::http::HttpResponse get(const std::string& host, const std::string& target) override {
        requests_.emplace_back(host, target);
        if (steps_.empty()) {
            throw std::logic_error("FakeHttpTransport: unexpected request " + target);
        }
        auto step = std::move(steps_.front());
        steps_.pop_front();
        if (!step.networkError.empty()) {
            throw std::runtime_error(step.networkError);
        }
        step.response.final_host = host;
        step.response.final_target = target;
        return step.response;
    }

    const std::vector<std::pair<std::string, std::string>>& requests() const noexcept { return requests_; }
    std::size_t pending() const noexcept { return steps_.size(); }

private:
    struct Step {
        infra::http::HttpResponse response;
        std::string networkError;
    };

    std::deque<Step> steps_;
    std::vector<std::pair<std::string, std::string>> requests_;
};

// In-memory exchange for one symbol/timeframe. Rows can be permanently missing
// (holes) or missing for the first N fetches that cover them.
class FakeCandleSource : public domain::ICandleSource {
public:
    FakeCandleSource(std::string symbol, domain::Timeframe timeframe, domain::TimestampMs listedAt, std::size_t count)
        : symbol_(std::move(symbol)), timeframe_(timeframe) {
        for (const auto& candle : makeSeries(symbol_, timeframe_, listedAt, count)) {
            rows_.emplace(candle.openTime, candle);
        }
    }

    void addHole(domain::TimestampMs openTime) {
        std::lock_guard<std::mutex> lock(mutex_);
        holes_.insert(openTime);
    }

    void missOnce(domain::TimestampMs openTime, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        flaky_[openTime] = times;
    }

    void failTransient(int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        transientFailures_ = times;
    }

    void failPermanent(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        permanent_ = enabled;
    }

    void onFetch(std::function<void(domain::TimestampMs start)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    domain::KlinePage fetch_page(const domain::Symbol& symbol,
                                 domain::Timeframe timeframe,
                                 domain::TimestampMs start_time,
                                 std::size_t limit,
                                 std::optional<domain::TimestampMs> end_time) override {
        std::function<void(domain::TimestampMs)> hook;
        domain::KlinePage page;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(start_time);
            hook = hook_;
            if (permanent_) {
                throw domain::PermanentFetchError("fake: symbol rejected", 400U, -1121);
            }
            if (transientFailures_ > 0) {
                --transientFailures_;
                throw domain::TransientFetchError("fake: upstream unavailable");
            }
            if (symbol != symbol_ || timeframe != timeframe_) {
                throw domain::PermanentFetchError("fake: unknown series " + symbol);
            }
            if (limit == 0 || limit > max_page_size() || !domain::is_aligned(start_time, timeframe)) {
                throw std::invalid_argument("fake: bad request");
            }

            auto windowEnd = start_time + static_cast<domain::TimestampMs>(limit) * timeframe.ms;
            if (end_time) {
                windowEnd = std::min(windowEnd, *end_time);
            }
            for (auto it = rows_.lower_bound(start_time); it != rows_.end() && it->first < windowEnd; ++it) {
                if (holes_.count(it->first) != 0U) {
                    continue;
                }
                auto flaky = flaky_.find(it->first);
                if (flaky != flaky_.end() && flaky->second > 0) {
                    --flaky->second;
                    continue;
                }
                page.candles.push_back(it->second);
            }
            if (!page.candles.empty() && page.candles.back().openTime + timeframe.ms < windowEnd) {
                page.next_cursor = page.candles.back().openTime + timeframe.ms;
            }
        }
        if (hook) {
            hook(start_time);
        }
        return page;
    }

    std::size_t max_page_size() const noexcept override { return 1000; }

    std::vector<domain::Instrument> list_instruments() override {
        domain::Instrument instrument;
        instrument.symbol = symbol_;
        instrument.status = "TRADING";
        instrument.active = true;
        return {instrument};
    }

    std::string name() const override { return "fake"; }

    std::vector<domain::TimestampMs> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::string symbol_;
    domain::Timeframe timeframe_;
    std::map<domain::TimestampMs, domain::Candle> rows_;
    std::set<domain::TimestampMs> holes_;
    std::map<domain::TimestampMs, int> flaky_;
    int transientFailures_{0};
    bool permanent_{false};
    std::function<void(domain::TimestampMs)> hook_;
    std::vector<domain::TimestampMs> calls_;
    mutable std::mutex mutex_;
};

}  // namespace tape::testing
