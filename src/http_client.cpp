#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef PARTITION_QUERY_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace partition_query {

namespace {

http::request<http::string_body>
buildRequest(const std::string& method, const std::string& target,
             const std::string& host, const std::string& authToken,
             const std::map<std::string, std::string>& headers,
             const std::string& body)
{
    const http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "partition_query/1.0");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/query+json");
    }
    if (!authToken.empty()) {
        req.set(http::field::authorization, authToken);
    }
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

HttpClient::Response toResponse(http::response<http::string_body>& res) {
    HttpClient::Response response;
    response.httpStatus = res.result_int();
    for (const auto& field : res) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        response.headers[name] = std::string(field.value());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& endpoint,
                       const std::string& authToken,
                       int timeoutMs)
    : mAuthToken(authToken)
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(endpoint);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef PARTITION_QUERY_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::request(const std::string& method,
                    const std::string& path,
                    const std::map<std::string, std::string>& headers,
                    const std::string& body)
{
    const std::string target = resolveTarget(path);

    if (mVerbose) {
        std::cerr << "[HttpClient] " << method << " " << mHost << ":" << mPort
                  << target << "\n";
        if (!body.empty()) {
            if (body.size() <= 300) {
                std::cerr << "[HttpClient] Body: " << body << "\n";
            } else {
                std::cerr << "[HttpClient] Body: " << body.substr(0, 300)
                          << " ...(truncated)\n";
            }
        }
    }

    return mUseSsl ? doHttpsRequest(method, target, headers, body)
                   : doHttpRequest(method, target, headers, body);
}

std::string HttpClient::resolveTarget(const std::string& path) const {
    std::string base = mBasePath;
    if (base.empty() || base.back() != '/') base += '/';
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());
    return base + rel;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpRequest(const std::string& method, const std::string& target,
                          const std::map<std::string, std::string>& headers,
                          const std::string& body)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(method, target, mHost, mAuthToken, headers, body);

    // Send.
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    // Receive.
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpsRequest(const std::string& method, const std::string& target,
                           const std::map<std::string, std::string>& headers,
                           const std::string& body)
{
#ifdef PARTITION_QUERY_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(method, target, mHost, mAuthToken, headers, body);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)method;
    (void)target;
    (void)headers;
    (void)body;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace partition_query
