#include "domain/Types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "domain/Errors.hpp"

namespace tape::domain {

std::string timeframe_label(Timeframe timeframe) {
    switch (timeframe.ms) {
    case timeframes::kOneMinute.ms:
        return "1m";
    case timeframes::kThreeMinutes.ms:
        return "3m";
    case timeframes::kFiveMinutes.ms:
        return "5m";
    case timeframes::kFifteenMinutes.ms:
        return "15m";
    case timeframes::kThirtyMinutes.ms:
        return "30m";
    case timeframes::kOneHour.ms:
        return "1h";
    case timeframes::kTwoHours.ms:
        return "2h";
    case timeframes::kFourHours.ms:
        return "4h";
    case timeframes::kSixHours.ms:
        return "6h";
    case timeframes::kTwelveHours.ms:
        return "12h";
    case timeframes::kOneDay.ms:
        return "1d";
    case timeframes::kOneWeek.ms:
        return "1w";
    default:
        break;
    }
    return "";
}

Timeframe timeframe_from_label(std::string_view label) {
    std::string normalized;
    normalized.reserve(label.size());
    for (char ch : label) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized == "1m" || normalized == "1min" || normalized == "1minute") {
        return timeframes::kOneMinute;
    }
    if (normalized == "3m" || normalized == "3min") {
        return timeframes::kThreeMinutes;
    }
    if (normalized == "5m" || normalized == "5min") {
        return timeframes::kFiveMinutes;
    }
    if (normalized == "15m" || normalized == "15min") {
        return timeframes::kFifteenMinutes;
    }
    if (normalized == "30m" || normalized == "30min") {
        return timeframes::kThirtyMinutes;
    }
    if (normalized == "1h" || normalized == "60m") {
        return timeframes::kOneHour;
    }
    if (normalized == "2h" || normalized == "120m") {
        return timeframes::kTwoHours;
    }
    if (normalized == "4h" || normalized == "240m") {
        return timeframes::kFourHours;
    }
    if (normalized == "6h" || normalized == "360m") {
        return timeframes::kSixHours;
    }
    if (normalized == "12h" || normalized == "720m") {
        return timeframes::kTwelveHours;
    }
    if (normalized == "1d" || normalized == "1day" || normalized == "24h") {
        return timeframes::kOneDay;
    }
    if (normalized == "1w" || normalized == "1week" || normalized == "7d") {
        return timeframes::kOneWeek;
    }
    throw std::invalid_argument("Unsupported timeframe: " + std::string{label});
}

const std::vector<Timeframe>& supported_timeframes() {
    static const std::vector<Timeframe> all{
        timeframes::kOneMinute,    timeframes::kThreeMinutes, timeframes::kFiveMinutes,
        timeframes::kFifteenMinutes, timeframes::kThirtyMinutes, timeframes::kOneHour,
        timeframes::kTwoHours,     timeframes::kFourHours,    timeframes::kSixHours,
        timeframes::kTwelveHours,  timeframes::kOneDay,       timeframes::kOneWeek,
    };
    return all;
}

bool same_values(const Candle& lhs, const Candle& rhs) noexcept {
    return lhs.openTime == rhs.openTime && lhs.open == rhs.open && lhs.high == rhs.high &&
           lhs.low == rhs.low && lhs.close == rhs.close && lhs.volume == rhs.volume;
}

void validate_candle(const Candle& candle) {
    std::ostringstream problem;
    if (!candle.timeframe.valid()) {
        problem << "invalid timeframe";
    } else if (!is_aligned(candle.openTime, candle.timeframe)) {
        problem << "open_time " << candle.openTime << " not aligned to " << timeframe_label(candle.timeframe);
    } else if (!std::isfinite(candle.open) || !std::isfinite(candle.high) || !std::isfinite(candle.low) ||
               !std::isfinite(candle.close) || !std::isfinite(candle.volume)) {
        problem << "non-finite value";
    } else if (candle.high < candle.low) {
        problem << "high " << candle.high << " below low " << candle.low;
    } else if (candle.volume < 0.0) {
        problem << "negative volume " << candle.volume;
    } else if (std::min(candle.open, candle.close) < candle.low || std::max(candle.open, candle.close) > candle.high) {
        problem << "open/close outside [low, high]";
    }

    const auto text = problem.str();
    if (!text.empty()) {
        throw ValidationError("Invalid candle " + candle.symbol + " @" + std::to_string(candle.openTime) + ": " +
                              text);
    }
}

Symbol normalize_symbol(std::string_view symbol) {
    Symbol normalized;
    normalized.reserve(symbol.size());
    for (char ch : symbol) {
        if (ch == '/' || ch == '-' || ch == ':' || ch == '_' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

std::vector<Symbol> unlisted_symbols(const std::vector<Instrument>& listed, const std::vector<Symbol>& requested) {
    std::set<Symbol> active;
    for (const auto& instrument : listed) {
        if (instrument.active) {
            active.insert(normalize_symbol(instrument.symbol));
        }
    }
    std::vector<Symbol> missing;
    for (const auto& symbol : requested) {
        auto normalized = normalize_symbol(symbol);
        if (active.count(normalized) == 0U &&
            std::find(missing.begin(), missing.end(), normalized) == missing.end()) {
            missing.push_back(std::move(normalized));
        }
    }
    return missing;
}

}  // namespace tape::domain
