#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tape::domain {

using TimestampMs = std::int64_t;
using Symbol = std::string;

struct Timeframe {
    TimestampMs ms{0};

    constexpr bool valid() const noexcept { return ms > 0; }
    constexpr bool operator==(const Timeframe& other) const noexcept { return ms == other.ms; }
    constexpr bool operator!=(const Timeframe& other) const noexcept { return ms != other.ms; }
};

namespace timeframes {
constexpr Timeframe kOneMinute{60'000};
constexpr Timeframe kThreeMinutes{3 * 60'000};
constexpr Timeframe kFiveMinutes{5 * 60'000};
constexpr Timeframe kFifteenMinutes{15 * 60'000};
constexpr Timeframe kThirtyMinutes{30 * 60'000};
constexpr Timeframe kOneHour{60 * 60'000};
constexpr Timeframe kTwoHours{2 * 60 * 60'000};
constexpr Timeframe kFourHours{4 * 60 * 60'000};
constexpr Timeframe kSixHours{6 * 60 * 60'000};
constexpr Timeframe kTwelveHours{12 * 60 * 60'000};
constexpr Timeframe kOneDay{24 * 60 * 60'000};
constexpr Timeframe kOneWeek{7 * 24 * 60 * 60'000LL};
}  // namespace timeframes

// Canonical label ("1m", "4h", "1w"); empty for unsupported durations.
std::string timeframe_label(Timeframe timeframe);

// Accepts canonical labels and common aliases ("1min", "60m", "24h").
// Throws std::invalid_argument for anything that is not a supported timeframe.
Timeframe timeframe_from_label(std::string_view label);

const std::vector<Timeframe>& supported_timeframes();

// Candle boundaries are multiples of the step counted from the anchor. The
// epoch fell on a Thursday, so weekly candles are anchored on Monday
// 1970-01-05 00:00 UTC like the exchanges open them.
constexpr TimestampMs kWeekAnchorMs = 4 * 24 * 60 * 60'000LL;

constexpr TimestampMs timeframe_anchor(Timeframe timeframe) noexcept {
    return timeframe == timeframes::kOneWeek ? kWeekAnchorMs : 0;
}

inline TimestampMs align_down(TimestampMs t, Timeframe timeframe) {
    if (!timeframe.valid()) {
        return t;
    }
    const auto step = timeframe.ms;
    const auto anchor = timeframe_anchor(timeframe);
    const auto offset = t - anchor;
    auto q = offset / step;
    if (offset % step != 0 && offset < 0) {
        --q;
    }
    return anchor + q * step;
}

inline TimestampMs align_up(TimestampMs t, Timeframe timeframe) {
    const auto down = align_down(t, timeframe);
    return down == t ? t : down + timeframe.ms;
}

inline bool is_aligned(TimestampMs t, Timeframe timeframe) {
    return timeframe.valid() && align_down(t, timeframe) == t;
}

// Half-open [start, end).
struct TimeRange {
    TimestampMs start{0};
    TimestampMs end{0};

    bool empty() const noexcept { return end <= start; }
    bool operator==(const TimeRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

struct Candle {
    Symbol symbol;
    Timeframe timeframe{};
    TimestampMs openTime{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

bool same_values(const Candle& lhs, const Candle& rhs) noexcept;

// Throws ValidationError describing the first violated rule.
void validate_candle(const Candle& candle);

// "BTC/USDT", "btc-usdt" and "BTCUSDT" all map to "BTCUSDT".
Symbol normalize_symbol(std::string_view symbol);

struct SeriesKey {
    Symbol symbol;
    Timeframe timeframe{};

    std::string to_string() const { return symbol + "/" + timeframe_label(timeframe); }
    bool operator==(const SeriesKey& other) const noexcept {
        return symbol == other.symbol && timeframe == other.timeframe;
    }
    bool operator<(const SeriesKey& other) const noexcept {
        if (symbol != other.symbol) {
            return symbol < other.symbol;
        }
        return timeframe.ms < other.timeframe.ms;
    }
};

// A market listed by an exchange. Only active instruments serve new candles.
struct Instrument {
    Symbol symbol;
    std::string base;
    std::string quote;
    std::string status;
    bool active{false};
};

// Requested symbols (normalized, in request order) with no active listing.
std::vector<Symbol> unlisted_symbols(const std::vector<Instrument>& listed, const std::vector<Symbol>& requested);

struct SeriesCoverage {
    SeriesKey key;
    std::optional<TimestampMs> first;
    std::optional<TimestampMs> last;
    std::size_t rows{0};
    std::size_t partitions{0};
};

}  // namespace tape::domain
