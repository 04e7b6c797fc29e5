#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.hpp"

namespace tape::adapters::binance {

std::string binance_interval(domain::Timeframe timeframe);

namespace detail {

constexpr std::string_view binance_interval_literal(domain::Timeframe timeframe) {
    switch (timeframe.ms) {
    case 60'000:
        return "1m";
    case 3 * 60'000:
        return "3m";
    case 5 * 60'000:
        return "5m";
    case 15 * 60'000:
        return "15m";
    case 30 * 60'000:
        return "30m";
    case 60 * 60'000:
        return "1h";
    case 2 * 60 * 60'000:
        return "2h";
    case 4 * 60 * 60'000:
        return "4h";
    case 6 * 60 * 60'000:
        return "6h";
    case 12 * 60 * 60'000:
        return "12h";
    case 24 * 60 * 60'000:
        return "1d";
    case 7 * 24 * 60 * 60'000LL:
        return "1w";
    }
    throw std::invalid_argument("Unsupported Binance interval");
}

}  // namespace detail

static_assert(detail::binance_interval_literal(domain::timeframes::kOneMinute) == std::string_view{"1m"});
static_assert(detail::binance_interval_literal(domain::timeframes::kFourHours) == std::string_view{"4h"});
static_assert(detail::binance_interval_literal(domain::timeframes::kOneWeek) == std::string_view{"1w"});

}  // namespace tape::adapters::binance
