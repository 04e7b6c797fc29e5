#include "infra/http/TlsHttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"

namespace tape::infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

using RawResponse = bhttp::response<bhttp::string_body>;

constexpr int kRedirectLimit = 5;
constexpr const char* kUserAgent = "tape/0.1";

struct Endpoint {
    std::string host;
    std::string target;

    std::string url() const { return "https://" + host + target; }
};

std::runtime_error requestFailure(const Endpoint& endpoint, const std::string& what) {
    return std::runtime_error("GET " + endpoint.url() + ": " + what);
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 307U || status == 308U;
}

// Absolute https URLs move to another host (port 443 only); anything else is a
// path on the current host. Plain http is refused.
Endpoint resolveLocation(const Endpoint& from, const std::string& location) {
    static const std::string kHttps = "https://";
    if (location.empty()) {
        throw std::runtime_error("redirect without a Location header");
    }
    if (location.compare(0, 7, "http://") == 0) {
        throw std::runtime_error("redirect downgrades to plain http");
    }
    if (location.compare(0, kHttps.size(), kHttps) != 0) {
        return {from.host, location.front() == '/' ? location : '/' + location};
    }

    const std::string rest = location.substr(kHttps.size());
    const auto pathStart = rest.find('/');
    std::string authority = rest.substr(0, pathStart);
    if (const auto colon = authority.find(':'); colon != std::string::npos) {
        if (authority.substr(colon + 1) != "443") {
            throw std::runtime_error("redirect to non-default port in " + location);
        }
        authority.erase(colon);
    }
    if (authority.empty()) {
        throw std::runtime_error("redirect without a host: " + location);
    }
    return {authority, pathStart == std::string::npos ? std::string{"/"} : rest.substr(pathStart)};
}

ssl::context makeTlsContext() {
    ssl::context context(ssl::context::tls_client);
    context.set_default_verify_paths();
    context.set_verify_mode(ssl::verify_peer);
    return context;
}

// One connection per request: resolve, connect, handshake, write, read, close.
class Exchange {
public:
    Exchange(Endpoint endpoint, std::chrono::seconds timeout)
        : endpoint_(std::move(endpoint)),
          timeout_(timeout),
          tls_(makeTlsContext()),
          stream_(io_, tls_) {}

    RawResponse perform() {
        setServerName();
        connect();
        step("TLS handshake", [this](beast::error_code& ec) { stream_.handshake(ssl::stream_base::client, ec); });

        bhttp::request<bhttp::empty_body> request{bhttp::verb::get, endpoint_.target, 11};
        request.set(bhttp::field::host, endpoint_.host);
        request.set(bhttp::field::user_agent, kUserAgent);
        request.set(bhttp::field::accept, "application/json");
        request.set(bhttp::field::connection, "close");
        step("write", [this, &request](beast::error_code& ec) { bhttp::write(stream_, request, ec); });

        beast::flat_buffer buffer;
        RawResponse response;
        step("read", [this, &buffer, &response](beast::error_code& ec) { bhttp::read(stream_, buffer, response, ec); });

        close();
        return response;
    }

private:
    void setServerName() {
        if (SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str())) {
            return;
        }
        std::string detail = "cannot set SNI host name";
        if (const unsigned long code = ::ERR_get_error(); code != 0) {
            if (const char* reason = ::ERR_reason_error_string(code)) {
                detail += std::string{": "} + reason;
            }
        }
        throw requestFailure(endpoint_, detail);
    }

    void connect() {
        net::ip::tcp::resolver resolver(io_);
        beast::error_code ec;
        const auto addresses = resolver.resolve(endpoint_.host, "443", ec);
        if (ec) {
            throw requestFailure(endpoint_, "resolve: " + ec.message());
        }
        step("connect", [this, &addresses](beast::error_code& stepEc) {
            beast::get_lowest_layer(stream_).connect(addresses, stepEc);
        });
    }

    template <typename Op>
    void step(const char* name, Op&& op) {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::error_code ec;
        op(ec);
        if (ec) {
            throw requestFailure(endpoint_, std::string{name} + ": " + ec.message());
        }
    }

    void close() {
        beast::error_code ec;
        stream_.shutdown(ec);
        // Peers often drop the socket without close_notify.
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            LOG_DEBUG("TLS shutdown with " << endpoint_.host << ": " << ec.message());
        }
    }

    Endpoint endpoint_;
    std::chrono::seconds timeout_;
    net::io_context io_;
    ssl::context tls_;
    ssl::stream<beast::tcp_stream> stream_;
};

HttpResponse toResponse(RawResponse&& raw, const Endpoint& endpoint) {
    HttpResponse result{};
    result.status = static_cast<unsigned>(raw.result_int());
    result.final_host = endpoint.host;
    result.final_target = endpoint.target;
    for (const auto& field : raw.base()) {
        std::string name{field.name_string()};
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        result.headers[std::move(name)] = std::string{field.value()};
    }
    result.body = std::move(raw.body());
    return result;
}

}  // namespace

std::optional<std::string> HttpResponse::header(const std::string& lowerName) const {
    const auto it = headers.find(lowerName);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

TlsHttpTransport::TlsHttpTransport(std::chrono::seconds timeout) : timeout_(timeout) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("TlsHttpTransport timeout must be positive");
    }
}

HttpResponse TlsHttpTransport::get(const std::string& host, const std::string& target) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a host");
    }

    Endpoint endpoint{host, target.empty() || target.front() != '/' ? '/' + target : target};
    for (int hop = 0; hop <= kRedirectLimit; ++hop) {
        auto raw = Exchange(endpoint, timeout_).perform();
        const auto status = static_cast<unsigned>(raw.result_int());
        if (!isRedirect(status)) {
            return toResponse(std::move(raw), endpoint);
        }

        Endpoint next;
        try {
            next = resolveLocation(endpoint, std::string{raw.base()[bhttp::field::location]});
        } catch (const std::runtime_error& e) {
            throw requestFailure(endpoint, e.what());
        }
        LOG_DEBUG("Following " << status << " from " << endpoint.url() << " to " << next.url());
        endpoint = std::move(next);
    }

    throw requestFailure(endpoint, "more than " + std::to_string(kRedirectLimit) + " redirects");
}

}  // namespace tape::infra::http
