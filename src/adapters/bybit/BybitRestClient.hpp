#pragma once

#include <memory>
#include <string>
#include <vector>

#include "adapters/exchange/RestFetch.hpp"
#include "core/RateLimiter.hpp"
#include "domain/ICandleSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace tape::adapters::bybit {

enum class Category {
    Spot,
    Linear,
    Inverse,
};

std::string category_name(Category category);
// Case-insensitive; throws std::invalid_argument for unknown categories.
Category category_from_string(const std::string& value);

std::string bybit_interval(domain::Timeframe timeframe);

class BybitRestClient : public domain::ICandleSource {
public:
    static constexpr const char* kDefaultHost = "api.bybit.com";
    static constexpr std::size_t kMaxLimit = 1000;

    BybitRestClient(std::shared_ptr<infra::http::IHttpTransport> transport,
                    std::shared_ptr<core::RateLimiter> limiter,
                    Category category = Category::Spot,
                    exchange::FetchOptions options = {},
                    std::string host = kDefaultHost);

    domain::KlinePage fetch_page(const domain::Symbol& symbol,
                                 domain::Timeframe timeframe,
                                 domain::TimestampMs start_time,
                                 std::size_t limit,
                                 std::optional<domain::TimestampMs> end_time = std::nullopt) override;

    std::size_t max_page_size() const noexcept override { return kMaxLimit; }

    // GET /v5/market/instruments-info for the configured category, following
    // nextPageCursor. Status "Trading" is active.
    std::vector<domain::Instrument> list_instruments() override;

    std::string name() const override { return "bybit"; }

private:
    std::shared_ptr<infra::http::IHttpTransport> transport_;
    std::shared_ptr<core::RateLimiter> limiter_;
    Category category_;
    exchange::FetchOptions options_;
    exchange::RestExchange exchange_;
};

}  // namespace tape::adapters::bybit
