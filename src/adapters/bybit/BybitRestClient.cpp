#include "adapters/bybit/BybitRestClient.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace tape::adapters::bybit {
namespace {

using exchange::ResponseKind;
using exchange::ResponseVerdict;

// retCodes that mean "slow down" or a server-side hiccup rather than a bad request.
bool isTransientRetCode(long long code) {
    switch (code) {
    case 10000:  // server timeout
    case 10006:  // too many visits
    case 10016:  // internal server error
    case 10018:  // IP rate limit
        return true;
    default:
        return false;
    }
}

ResponseVerdict classify(const infra::http::HttpResponse& response) {
    ResponseVerdict verdict;
    const unsigned status = response.status;

    // Bybit answers 403 when the IP hit its request ceiling.
    if (status == 403U || status == 429U || status >= 500U) {
        verdict.kind = ResponseKind::Transient;
        verdict.reason = "HTTP " + std::to_string(status);
        return verdict;
    }
    if (status != 200U) {
        verdict.kind = ResponseKind::Permanent;
        verdict.reason = "HTTP " + std::to_string(status);
        return verdict;
    }

    auto json = exchange::try_parse_json(response.body);
    if (!json.is_object()) {
        verdict.kind = ResponseKind::Permanent;
        verdict.reason = "unexpected Bybit response type (expected object)";
        return verdict;
    }

    const auto& obj = json.as_object();
    long long retCode = 0;
    if (const auto* code = obj.if_contains("retCode")) {
        try {
            retCode = exchange::json_to_int64(*code);
        } catch (const std::exception& ex) {
            verdict.kind = ResponseKind::Permanent;
            verdict.reason = std::string{"unreadable retCode: "} + ex.what();
            return verdict;
        }
    }
    if (retCode != 0) {
        std::ostringstream reason;
        reason << "retCode=" << retCode;
        if (const auto* msg = obj.if_contains("retMsg"); msg != nullptr && msg->is_string()) {
            reason << " retMsg=" << msg->as_string().c_str();
        }
        verdict.kind = isTransientRetCode(retCode) ? ResponseKind::Transient : ResponseKind::Permanent;
        verdict.exchangeCode = retCode;
        verdict.reason = reason.str();
        return verdict;
    }

    verdict.payload = std::move(json);
    return verdict;
}

core::RateLimitHint rateHint(const infra::http::HttpResponse& response) {
    core::RateLimitHint hint;
    try {
        if (const auto remaining = response.header("x-bapi-limit-status")) {
            hint.remaining = std::stoll(*remaining);
        }
        if (const auto reset = response.header("x-bapi-limit-reset-timestamp")) {
            hint.resetAtMs = std::stoll(*reset);
        }
    } catch (const std::exception&) {
        return {};
    }
    return hint;
}

}  // namespace

std::string category_name(Category category) {
    switch (category) {
    case Category::Spot:
        return "spot";
    case Category::Linear:
        return "linear";
    case Category::Inverse:
        return "inverse";
    }
    return "spot";
}

Category category_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower.empty() || lower == "spot") {
        return Category::Spot;
    }
    if (lower == "linear") {
        return Category::Linear;
    }
    if (lower == "inverse") {
        return Category::Inverse;
    }
    throw std::invalid_argument("Unsupported Bybit category: " + value);
}

std::string bybit_interval(domain::Timeframe timeframe) {
    namespace tf = domain::timeframes;
    if (timeframe == tf::kOneDay) {
        return "D";
    }
    if (timeframe == tf::kOneWeek) {
        return "W";
    }
    if (timeframe.valid() && timeframe.ms % tf::kOneMinute.ms == 0 && timeframe.ms <= tf::kTwelveHours.ms &&
        !domain::timeframe_label(timeframe).empty()) {
        return std::to_string(timeframe.ms / tf::kOneMinute.ms);
    }
    throw std::invalid_argument("Unsupported Bybit interval: " + std::to_string(timeframe.ms) + " ms");
}

BybitRestClient::BybitRestClient(std::shared_ptr<infra::http::IHttpTransport> transport,
                                 std::shared_ptr<core::RateLimiter> limiter,
                                 Category category,
                                 exchange::FetchOptions options,
                                 std::string host)
    : transport_(std::move(transport)), limiter_(std::move(limiter)), category_(category), options_(options) {
    if (!transport_ || !limiter_) {
        throw std::invalid_argument("BybitRestClient requires a transport and a rate limiter");
    }
    exchange_.name = "Bybit";
    exchange_.host = std::move(host);
    exchange_.classify = classify;
    exchange_.rateHint = rateHint;
}

domain::KlinePage BybitRestClient::fetch_page(const domain::Symbol& symbol,
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

    // Bybit serves the newest rows of a range first, so the request is always
    // bounded to exactly `limit` steps to page forward deterministically.
    auto windowEnd = start_time + static_cast<domain::TimestampMs>(limit) * timeframe.ms;
    if (end_time) {
        windowEnd = std::min(windowEnd, *end_time);
    }

    domain::KlinePage page;
    if (windowEnd <= start_time) {
        return page;
    }

    std::ostringstream target;
    target << "/v5/market/kline?category=" << category_name(category_) << "&symbol=" << normalized
           << "&interval=" << bybit_interval(timeframe) << "&start=" << start_time << "&end=" << (windowEnd - 1)
           << "&limit=" << limit;
    const std::string requestTarget = target.str();

    const auto verdict = exchange::get_with_retry(*transport_, *limiter_, options_, exchange_, requestTarget);

    try {
        const auto& result = verdict.payload.as_object().at("result").as_object();
        const auto& rows = result.at("list").as_array();
        page.candles.reserve(rows.size());
        for (const auto& rowValue : rows) {
            const auto& row = rowValue.as_array();
            if (row.size() < 6) {
                throw std::runtime_error("Incomplete Bybit kline row");
            }
            domain::Candle candle{};
            candle.symbol = normalized;
            candle.timeframe = timeframe;
            candle.openTime = exchange::json_to_int64(row.at(0));
            candle.open = exchange::json_to_double(row.at(1));
            candle.high = exchange::json_to_double(row.at(2));
            candle.low = exchange::json_to_double(row.at(3));
            candle.close = exchange::json_to_double(row.at(4));
            candle.volume = exchange::json_to_double(row.at(5));
            if (candle.openTime < start_time || candle.openTime >= windowEnd) {
                continue;
            }
            page.candles.push_back(std::move(candle));
        }
    } catch (const std::exception& ex) {
        throw domain::PermanentFetchError(std::string{"Malformed Bybit kline payload for "} + requestTarget + ": " +
                                          ex.what());
    }

    std::sort(page.candles.begin(), page.candles.end(), [](const domain::Candle& lhs, const domain::Candle& rhs) {
        return lhs.openTime < rhs.openTime;
    });

    if (windowEnd < (end_time ? *end_time : windowEnd + 1) && !page.candles.empty()) {
        page.next_cursor = windowEnd;
    }

    LOG_DEBUG("Bybit returned " << page.candles.size() << " klines for " << normalized << " from " << start_time);
    return page;
}

std::vector<domain::Instrument> BybitRestClient::list_instruments() {
    // Derivative categories page with a cursor; spot answers in one page.
    constexpr int kMaxPages = 50;
    std::vector<domain::Instrument> instruments;
    std::string cursor;
    for (int pageIndex = 0; pageIndex < kMaxPages; ++pageIndex) {
        std::string requestTarget = "/v5/market/instruments-info?category=" + category_name(category_) + "&limit=1000";
        if (!cursor.empty()) {
            // nextPageCursor comes back already URL-encoded.
            requestTarget += "&cursor=" + cursor;
        }
        const auto verdict = exchange::get_with_retry(*transport_, *limiter_, options_, exchange_, requestTarget);

        std::string next;
        try {
            const auto& result = verdict.payload.as_object().at("result").as_object();
            for (const auto& entry : result.at("list").as_array()) {
                const auto& obj = entry.as_object();
                domain::Instrument instrument;
                instrument.symbol = obj.at("symbol").as_string().c_str();
                instrument.base = obj.at("baseCoin").as_string().c_str();
                instrument.quote = obj.at("quoteCoin").as_string().c_str();
                if (const auto* status = obj.if_contains("status"); status != nullptr && status->is_string()) {
                    instrument.status = status->as_string().c_str();
                }
                instrument.active = instrument.status == "Trading";
                instruments.push_back(std::move(instrument));
            }
            if (const auto* nextCursor = result.if_contains("nextPageCursor");
                nextCursor != nullptr && nextCursor->is_string()) {
                next = nextCursor->as_string().c_str();
            }
        } catch (const std::exception& ex) {
            throw domain::PermanentFetchError(std::string{"Malformed Bybit instruments payload for "} +
                                              requestTarget + ": " + ex.what());
        }

        if (next.empty() || next == cursor) {
            LOG_INFO("Bybit lists " << instruments.size() << " " << category_name(category_) << " instruments");
            return instruments;
        }
        cursor = std::move(next);
    }
    throw domain::PermanentFetchError("Bybit instruments listing did not end after " + std::to_string(kMaxPages) +
                                      " pages");
}

}  // namespace tape::adapters::bybit
