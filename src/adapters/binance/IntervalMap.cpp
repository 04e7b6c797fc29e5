#include "adapters/binance/IntervalMap.hpp"

namespace tape::adapters::binance {

std::string binance_interval(domain::Timeframe timeframe) {
    return std::string(detail::binance_interval_literal(timeframe));
}

}  // namespace tape::adapters::binance
