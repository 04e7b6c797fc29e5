#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "adapters/binance/IntervalMap.hpp"
#include "adapters/bybit/BybitRestClient.hpp"
#include "adapters/parquet/ParquetCandleStore.hpp"
#include "domain/Errors.hpp"
#include "domain/Types.hpp"
#include "TestSupport.hpp"

using namespace tape;

namespace {

bool rejects(const domain::Candle& candle) {
    try {
        domain::validate_candle(candle);
    } catch (const domain::ValidationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    namespace tf = domain::timeframes;

    // Labels round-trip and aliases resolve to the canonical timeframe.
    for (const auto& timeframe : domain::supported_timeframes()) {
        const auto label = domain::timeframe_label(timeframe);
        if (label.empty() || domain::timeframe_from_label(label) != timeframe) {
            std::cerr << "Timeframe of " << timeframe.ms << " ms does not round-trip through '" << label << "'\n";
            return 1;
        }
    }
    if (domain::timeframe_from_label("60m") != tf::kOneHour || domain::timeframe_from_label(" 1MIN ") != tf::kOneMinute ||
        domain::timeframe_from_label("24h") != tf::kOneDay) {
        std::cerr << "Expected timeframe aliases to resolve\n";
        return 1;
    }
    try {
        (void)domain::timeframe_from_label("7m");
        std::cerr << "Expected '7m' to be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }
    if (!domain::timeframe_label(domain::Timeframe{42}).empty()) {
        std::cerr << "Expected unsupported duration to have no label\n";
        return 1;
    }

    // Alignment, including times before the epoch.
    if (domain::align_down(testing::kJan2024 + 59'999, tf::kOneMinute) != testing::kJan2024 ||
        domain::align_up(testing::kJan2024 + 1, tf::kOneMinute) != testing::kJan2024 + 60'000 ||
        domain::align_up(testing::kJan2024, tf::kOneMinute) != testing::kJan2024) {
        std::cerr << "Unexpected alignment of positive timestamps\n";
        return 1;
    }
    if (domain::align_down(-1, tf::kOneMinute) != -60'000) {
        std::cerr << "Expected align_down(-1) to be -60000 but got " << domain::align_down(-1, tf::kOneMinute)
                  << "\n";
        return 1;
    }

    // Weekly candles open on Monday 00:00 UTC.
    const domain::TimestampMs monday = 1'502'668'800'000;    // 2017-08-14T00:00:00Z
    const domain::TimestampMs thursday = 1'502'323'200'000;  // 2017-08-10T00:00:00Z
    if (!domain::is_aligned(monday, tf::kOneWeek) || !domain::is_aligned(testing::kJan2024, tf::kOneWeek) ||
        domain::is_aligned(thursday, tf::kOneWeek) || domain::is_aligned(0, tf::kOneWeek)) {
        std::cerr << "Expected weekly alignment to follow Mondays\n";
        return 1;
    }
    if (domain::align_down(monday + 3 * tf::kOneDay.ms + 1, tf::kOneWeek) != monday ||
        domain::align_down(monday - 1, tf::kOneWeek) != monday - tf::kOneWeek.ms ||
        domain::align_up(thursday, tf::kOneWeek) != monday) {
        std::cerr << "Expected weekly alignment to snap to Mondays but align_down(monday)="
                  << domain::align_down(monday, tf::kOneWeek) << "\n";
        return 1;
    }
    if (domain::align_down(-1, tf::kOneWeek) != -3 * tf::kOneDay.ms) {
        std::cerr << "Expected the Monday before the epoch but got " << domain::align_down(-1, tf::kOneWeek) << "\n";
        return 1;
    }
    if (rejects(testing::makeCandle("BTCUSDT", tf::kOneWeek, monday))) {
        std::cerr << "Expected a Monday weekly candle to validate\n";
        return 1;
    }

    // Candle validity.
    const auto good = testing::makeCandle("BTCUSDT", tf::kOneMinute, testing::kJan2024);
    if (rejects(good)) {
        std::cerr << "Expected a well-formed candle to validate\n";
        return 1;
    }
    auto misaligned = good;
    misaligned.openTime += 1;
    auto inverted = good;
    inverted.high = inverted.low - 1.0;
    auto negativeVolume = good;
    negativeVolume.volume = -1.0;
    auto notFinite = good;
    notFinite.close = std::numeric_limits<double>::quiet_NaN();
    auto closeAboveHigh = good;
    closeAboveHigh.close = closeAboveHigh.high + 0.01;
    if (!rejects(misaligned) || !rejects(inverted) || !rejects(negativeVolume) || !rejects(notFinite) ||
        !rejects(closeAboveHigh)) {
        std::cerr << "Expected malformed candles to be rejected\n";
        return 1;
    }

    // Symbol normalization.
    if (domain::normalize_symbol("btc/usdt") != "BTCUSDT" || domain::normalize_symbol("ETH-USDT") != "ETHUSDT" ||
        domain::normalize_symbol("BTC/USDT:USDT") != "BTCUSDTUSDT") {
        std::cerr << "Unexpected symbol normalization\n";
        return 1;
    }

    // Partition periods: calendar month below 1h, calendar year from 1h.
    const domain::TimestampMs lastMinuteOfJan = 1'706'745'540'000;  // 2024-01-31T23:59:00Z
    const domain::TimestampMs firstMinuteOfFeb = 1'706'745'600'000;  // 2024-02-01T00:00:00Z
    if (adapters::parquet::partition_period(lastMinuteOfJan, tf::kOneMinute) ==
        adapters::parquet::partition_period(firstMinuteOfFeb, tf::kOneMinute)) {
        std::cerr << "Expected minute candles in January and February to use different partitions\n";
        return 1;
    }
    if (adapters::parquet::partition_period(lastMinuteOfJan - 59 * 60'000, tf::kOneHour) !=
        adapters::parquet::partition_period(firstMinuteOfFeb, tf::kOneHour)) {
        std::cerr << "Expected hourly candles of the same year to share a partition period\n";
        return 1;
    }

    // Exchange interval codes.
    if (adapters::binance::binance_interval(tf::kOneMinute) != "1m" ||
        adapters::binance::binance_interval(tf::kOneWeek) != "1w") {
        std::cerr << "Unexpected Binance interval codes\n";
        return 1;
    }
    if (adapters::bybit::bybit_interval(tf::kFourHours) != "240" || adapters::bybit::bybit_interval(tf::kOneDay) != "D" ||
        adapters::bybit::bybit_interval(tf::kOneWeek) != "W") {
        std::cerr << "Unexpected Bybit interval codes\n";
        return 1;
    }

    return 0;
}
