#include "adapters/exchange/RestFetch.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace tape::adapters::exchange {

namespace {

// Exchanges quote prices and sometimes times as JSON strings.
std::string numeric_text(const boost::json::value& value, const char* wanted) {
    if (!value.is_string()) {
        throw std::runtime_error(std::string{"expected a "} + wanted + " but got " +
                                 boost::json::serialize(value));
    }
    return std::string{value.as_string().c_str()};
}

}  // namespace

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_number()) {
        return value.is_double() ? static_cast<std::int64_t>(std::llround(value.as_double()))
                                 : value.to_number<std::int64_t>();
    }
    const auto text = numeric_text(value, "integer");
    std::int64_t parsed = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, parsed);
    if (ec != std::errc{} || ptr != last) {
        throw std::runtime_error("not an integer: \"" + text + "\"");
    }
    return parsed;
}

double json_to_double(const boost::json::value& value) {
    if (value.is_number()) {
        return value.to_number<double>();
    }
    const auto text = numeric_text(value, "number");
    char* last = nullptr;
    const double parsed = std::strtod(text.c_str(), &last);
    if (text.empty() || last != text.c_str() + text.size()) {
        throw std::runtime_error("not a number: \"" + text + "\"");
    }
    return parsed;
}

boost::json::value try_parse_json(const std::string& body) {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(body, ec);
    if (ec) {
        return nullptr;
    }
    return parsed;
}

std::chrono::milliseconds backoff_delay(const FetchOptions& options, int attempt) {
    const int shift = std::clamp(attempt - 1, 0, 30);
    const auto raw = options.backoffBase.count() * (1LL << shift);
    return std::chrono::milliseconds(std::min<long long>(raw, options.backoffMax.count()));
}

ResponseVerdict get_with_retry(infra::http::IHttpTransport& transport,
                               core::RateLimiter& limiter,
                               const FetchOptions& options,
                               const RestExchange& exchange,
                               const std::string& target) {
    const int attempts = std::max(1, options.maxRetries);
    std::string lastFailure;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        limiter.acquire();
        LOG_DEBUG(exchange.name << " REST " << target << " attempt=" << attempt);

        ResponseVerdict verdict;
        unsigned status = 0U;
        try {
            const auto response = transport.get(exchange.host, target);
            status = response.status;
            if (exchange.rateHint) {
                limiter.observe(exchange.rateHint(response));
            }
            verdict = exchange.classify(response);
        } catch (const domain::TapeError&) {
            throw;
        } catch (const std::exception& ex) {
            verdict.kind = ResponseKind::Transient;
            verdict.reason = ex.what();
        }

        if (verdict.kind == ResponseKind::Ok) {
            return verdict;
        }

        if (verdict.kind == ResponseKind::Permanent) {
            std::ostringstream oss;
            oss << exchange.name << " rejected " << target << ": " << verdict.reason;
            LOG_ERR(oss.str());
            throw domain::PermanentFetchError(oss.str(), status, verdict.exchangeCode);
        }

        lastFailure = verdict.reason;
        if (attempt == attempts) {
            break;
        }

        auto delay = backoff_delay(options, attempt);
        if (verdict.retryAfter && *verdict.retryAfter > delay) {
            delay = *verdict.retryAfter;
            limiter.pauseFor(delay);
        }
        LOG_WARN(exchange.name << " REST backoff attempt " << attempt << " due to " << verdict.reason
                               << ", sleeping " << delay.count() << " ms");
        std::this_thread::sleep_for(delay);
    }

    std::ostringstream oss;
    oss << exchange.name << " request " << target << " failed after " << attempts
        << " attempts: " << lastFailure;
    throw domain::TransientFetchError(oss.str());
}

}  // namespace tape::adapters::exchange
