#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "adapters/exchange/RestFetch.hpp"
#include "core/RateLimiter.hpp"
#include "domain/ICandleSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace tape::adapters::binance {

// Request weight Binance charges for GET /api/v3/klines with the given limit.
std::int64_t klines_request_weight(std::size_t limit) noexcept;

class BinanceRestClient : public domain::ICandleSource {
public:
    static constexpr const char* kDefaultHost = "api.binance.com";
    static constexpr std::size_t kMaxLimit = 1000;
    // Request weight budget per minute on the spot API.
    static constexpr std::int64_t kDefaultWeightLimit = 6000;

    BinanceRestClient(std::shared_ptr<infra::http::IHttpTransport> transport,
                      std::shared_ptr<core::RateLimiter> limiter,
                      exchange::FetchOptions options = {},
                      std::string host = kDefaultHost,
                      std::int64_t weightLimit = kDefaultWeightLimit);
    ~BinanceRestClient() override = default;

    domain::KlinePage fetch_page(const domain::Symbol& symbol,
                                 domain::Timeframe timeframe,
                                 domain::TimestampMs start_time,
                                 std::size_t limit,
                                 std::optional<domain::TimestampMs> end_time = std::nullopt) override;

    std::size_t max_page_size() const noexcept override { return kMaxLimit; }

    // GET /api/v3/exchangeInfo; TRADING symbols are active.
    std::vector<domain::Instrument> list_instruments() override;

    std::string name() const override { return "binance"; }

private:
    std::shared_ptr<infra::http::IHttpTransport> transport_;
    std::shared_ptr<core::RateLimiter> limiter_;
    exchange::FetchOptions options_;
    exchange::RestExchange exchange_;
    exchange::RestExchange infoExchange_;
};

}  // namespace tape::adapters::binance
