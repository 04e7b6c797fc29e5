#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include "core/RateLimiter.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace tape::adapters::exchange {

struct FetchOptions {
    int maxRetries = 5;
    std::chrono::milliseconds backoffBase{500};
    std::chrono::milliseconds backoffMax{30'000};
};

enum class ResponseKind {
    Ok,
    Transient,
    Permanent,
};

struct ResponseVerdict {
    ResponseKind kind = ResponseKind::Ok;
    std::string reason;
    std::optional<long long> exchangeCode;
    std::optional<std::chrono::milliseconds> retryAfter;
    // Parsed payload when kind == Ok, so adapters do not parse twice.
    boost::json::value payload;
};

struct RestExchange {
    std::string name;
    std::string host;
    // Decides how a response is handled; must not throw for error payloads.
    std::function<ResponseVerdict(const infra::http::HttpResponse&)> classify;
    std::function<core::RateLimitHint(const infra::http::HttpResponse&)> rateHint;
};

// Issues one logical GET: waits for the shared rate budget before every attempt,
// retries transport failures and transient verdicts with exponential backoff, and
// returns the verdict of the first successful attempt.
// Throws TransientFetchError after maxRetries attempts and PermanentFetchError at once.
ResponseVerdict get_with_retry(infra::http::IHttpTransport& transport,
                               core::RateLimiter& limiter,
                               const FetchOptions& options,
                               const RestExchange& exchange,
                               const std::string& target);

std::chrono::milliseconds backoff_delay(const FetchOptions& options, int attempt);

std::int64_t json_to_int64(const boost::json::value& value);
double json_to_double(const boost::json::value& value);

// Parses a JSON body, returning a null value when the body is not JSON.
boost::json::value try_parse_json(const std::string& body);

}  // namespace tape::adapters::exchange
