#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace tape::adapters::binance {
namespace {

using exchange::ResponseKind;
using exchange::ResponseVerdict;

std::int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::optional<std::chrono::milliseconds> retryAfter(const infra::http::HttpResponse& response) {
    const auto header = response.header("retry-after");
    if (!header) {
        return std::nullopt;
    }
    try {
        return std::chrono::milliseconds(std::stoll(*header) * 1000);
    } catch (const std::exception&) {
        LOG_DEBUG("Binance Retry-After header not numeric: " << *header);
        return std::nullopt;
    }
}

ResponseVerdict classify(const infra::http::HttpResponse& response, boost::json::kind expected) {
    ResponseVerdict verdict;
    const unsigned status = response.status;

    if (status == 429U || status == 418U) {
        verdict.kind = ResponseKind::Transient;
        verdict.reason = "HTTP " + std::to_string(status) + " rate limited";
        verdict.retryAfter = retryAfter(response);
        return verdict;
    }
    if (status >= 500U) {
        verdict.kind = ResponseKind::Transient;
        verdict.reason = "HTTP " + std::to_string(status);
        return verdict;
    }

    auto json = exchange::try_parse_json(response.body);
    if (status != 200U) {
        verdict.kind = ResponseKind::Permanent;
        std::ostringstream reason;
        reason << "HTTP " << status;
        if (json.is_object()) {
            const auto& obj = json.as_object();
            if (const auto* code = obj.if_contains("code")) {
                try {
                    verdict.exchangeCode = exchange::json_to_int64(*code);
                    reason << " code=" << *verdict.exchangeCode;
                } catch (const std::exception&) {
                    reason << " code=?";
                }
            }
            if (const auto* msg = obj.if_contains("msg"); msg != nullptr && msg->is_string()) {
                reason << " msg=" << msg->as_string().c_str();
            }
        }
        verdict.reason = reason.str();
        return verdict;
    }

    if (json.kind() != expected) {
        verdict.kind = ResponseKind::Permanent;
        verdict.reason = std::string{"unexpected Binance response type (expected "} +
                         (expected == boost::json::kind::array ? "array" : "object") + ")";
        return verdict;
    }

    verdict.payload = std::move(json);
    return verdict;
}

// The weight header counts weight, the limiter counts requests: convert with
// the weight of the klines call that produced the response.
core::RateLimitHint rateHintFor(const infra::http::HttpResponse& response, std::int64_t weightLimit) {
    core::RateLimitHint hint;
    const auto used = response.header("x-mbx-used-weight-1m");
    if (!used) {
        return hint;
    }
    std::size_t limit = 500;
    if (const auto pos = response.final_target.find("limit="); pos != std::string::npos) {
        limit = static_cast<std::size_t>(std::strtoull(response.final_target.c_str() + pos + 6, nullptr, 10));
    }
    try {
        const auto remainingWeight = std::max<std::int64_t>(0, weightLimit - std::stoll(*used));
        hint.remaining = remainingWeight / klines_request_weight(limit);
    } catch (const std::exception&) {
        // Malformed header values leave the local budget untouched.
        return hint;
    }
    constexpr std::int64_t kMinuteMs = 60'000;
    hint.resetAtMs = (wallClockMs() / kMinuteMs + 1) * kMinuteMs;
    return hint;
}

}  // namespace

std::int64_t klines_request_weight(std::size_t limit) noexcept {
    if (limit < 100) {
        return 1;
    }
    if (limit < 500) {
        return 2;
    }
    if (limit <= 1000) {
        return 5;
    }
    return 10;
}

BinanceRestClient::BinanceRestClient(std::shared_ptr<infra::http::IHttpTransport> transport,
                                     std::shared_ptr<core::RateLimiter> limiter,
                                     exchange::FetchOptions options,
                                     std::string host,
                                     std::int64_t weightLimit)
    : transport_(std::move(transport)), limiter_(std::move(limiter)), options_(options) {
    if (!transport_ || !limiter_) {
        throw std::invalid_argument("BinanceRestClient requires a transport and a rate limiter");
    }
    exchange_.name = "Binance";
    exchange_.host = std::move(host);
    exchange_.classify = [](const infra::http::HttpResponse& response) {
        return classify(response, boost::json::kind::array);
    };
    exchange_.rateHint = [weightLimit](const infra::http::HttpResponse& response) {
        return rateHintFor(response, weightLimit);
    };
    infoExchange_ = exchange_;
    infoExchange_.classify = [](const infra::http::HttpResponse& response) {
        return classify(response, boost::json::kind::object);
    };
}

std::vector<domain::Instrument> BinanceRestClient::list_instruments() {
    const std::string requestTarget = "/api/v3/exchangeInfo";
    const auto verdict = exchange::get_with_retry(*transport_, *limiter_, options_, infoExchange_, requestTarget);

    std::vector<domain::Instrument> instruments;
    try {
        const auto& symbols = verdict.payload.as_object().at("symbols").as_array();
        instruments.reserve(symbols.size());
        for (const auto& entry : symbols) {
            const auto& obj = entry.as_object();
            domain::Instrument instrument;
            instrument.symbol = obj.at("symbol").as_string().c_str();
            instrument.base = obj.at("baseAsset").as_string().c_str();
            instrument.quote = obj.at("quoteAsset").as_string().c_str();
            instrument.status = obj.at("status").as_string().c_str();
            instrument.active = instrument.status == "TRADING";
            instruments.push_back(std::move(instrument));
        }
    } catch (const std::exception& ex) {
        throw domain::PermanentFetchError(std::string{"Malformed Binance exchangeInfo payload: "} + ex.what());
    }

    LOG_INFO("Binance lists " << instruments.size() << " instruments");
    return instruments;
}

domain::KlinePage BinanceRestClient::fetch_page(const domain::Symbol& symbol,
                                                domain::Timeframe timeframe,
                                                domain::TimestampMs start_time,
                                                std::size_t limit,
                                                std::optional<domain::TimestampMs> end_time) {
    const auto normalized = domain::normalize_symbol(symbol);
    if (normalized.empty()) {
        throw std::invalid_argument("fetch_page requires a symbol");
    }
    if (!domain::is_aligned(start_time, timeframe)) {
        throw std::invalid_argument("fetch_page start_time " + std::to_string(start_time) +
                                    " is not aligned to the timeframe");
    }
    if (limit == 0 || limit > kMaxLimit) {
        throw std::invalid_argument("fetch_page limit must be within [1, " + std::to_string(kMaxLimit) + "]");
    }

    domain::KlinePage page;
    if (end_time && *end_time <= start_time) {
        return page;
    }

    std::ostringstream target;
    target << "/api/v3/klines?symbol=" << normalized << "&interval=" << binance_interval(timeframe)
           << "&startTime=" << start_time << "&limit=" << limit;
    if (end_time) {
        // endTime is inclusive on Binance.
        target << "&endTime=" << (*end_time - 1);
    }
    const std::string requestTarget = target.str();
    LOG_DEBUG("Binance REST " << requestTarget);

    const auto verdict = exchange::get_with_retry(*transport_, *limiter_, options_, exchange_, requestTarget);
    const auto& rows = verdict.payload.as_array();

    std::size_t rawCount = 0;
    page.candles.reserve(rows.size());
    try {
        for (const auto& rowValue : rows) {
            if (!rowValue.is_array()) {
                throw std::runtime_error("Unexpected Binance kline row type");
            }
            const auto& row = rowValue.as_array();
            if (row.size() < 6) {
                throw std::runtime_error("Incomplete Binance kline row");
            }
            ++rawCount;

            domain::Candle candle{};
            candle.symbol = normalized;
            candle.timeframe = timeframe;
            candle.openTime = exchange::json_to_int64(row.at(0));
            candle.open = exchange::json_to_double(row.at(1));
            candle.high = exchange::json_to_double(row.at(2));
            candle.low = exchange::json_to_double(row.at(3));
            candle.close = exchange::json_to_double(row.at(4));
            candle.volume = exchange::json_to_double(row.at(5));

            if (candle.openTime < start_time || (end_time && candle.openTime >= *end_time)) {
                continue;
            }
            page.candles.push_back(std::move(candle));
        }
    } catch (const std::exception& ex) {
        throw domain::PermanentFetchError(std::string{"Malformed Binance klines payload for "} + requestTarget +
                                          ": " + ex.what());
    }

    if (rawCount >= limit && !page.candles.empty()) {
        const auto next = page.candles.back().openTime + timeframe.ms;
        if (!end_time || next < *end_time) {
            page.next_cursor = next;
        }
    }

    LOG_DEBUG("Binance returned " << page.candles.size() << " klines for " << normalized << " from " << start_time);
    return page;
}

}  // namespace tape::adapters::binance
