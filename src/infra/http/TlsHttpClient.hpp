#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace tape::infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::string final_host;
    std::string final_target;

    std::optional<std::string> header(const std::string& lowerName) const;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Throws std::runtime_error on DNS, connect, TLS, read/write failures and timeouts.
    // HTTP error statuses are returned, not thrown.
    virtual HttpResponse get(const std::string& host, const std::string& target) = 0;
};

class TlsHttpTransport : public IHttpTransport {
public:
    explicit TlsHttpTransport(std::chrono::seconds timeout = std::chrono::seconds(20));

    HttpResponse get(const std::string& host, const std::string& target) override;

private:
    std::chrono::seconds timeout_;
};

}  // namespace tape::infra::http
