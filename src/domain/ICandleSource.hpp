#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace tape::domain {

struct KlinePage {
    std::vector<Candle> candles;
    std::optional<TimestampMs> next_cursor;
};

// Paginated upstream candle endpoint.
class ICandleSource {
public:
    virtual ~ICandleSource() = default;

    // start_time must be aligned to the timeframe and limit within
    // [1, max_page_size()]. end_time, when given, is exclusive.
    // Throws TransientFetchError once retries are exhausted and
    // PermanentFetchError for requests the exchange will never accept.
    virtual KlinePage fetch_page(const Symbol& symbol,
                                 Timeframe timeframe,
                                 TimestampMs start_time,
                                 std::size_t limit,
                                 std::optional<TimestampMs> end_time = std::nullopt) = 0;

    virtual std::size_t max_page_size() const noexcept = 0;

    // Every instrument the exchange lists, active or not. Same error contract
    // as fetch_page.
    virtual std::vector<Instrument> list_instruments() = 0;

    virtual std::string name() const = 0;
};

}  // namespace tape::domain
