#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef COMBINED_API_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace combined_api {

namespace {

constexpr const char* kUserAgent = "combined_api/1.0";

// Start one asynchronous operation and drive the io_context until it
// completes. Running the async form lets tcp_stream's expiry apply.
template <class Initiate>
void runOperation(net::io_context& ioc, const char* what, Initiate&& initiate) {
    beast::error_code ec;
    initiate([&ec](beast::error_code e, auto&&...) { ec = e; });
    ioc.restart();
    ioc.run();
    if (ec) {
        throw std::runtime_error(std::string(what) + " failed: " + ec.message());
    }
}

http::request<http::empty_body> makeRequest(const std::string& host,
                                            const std::string& target) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, kUserAgent);
    req.keep_alive(false);
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    if (timeoutMs <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }

    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    const std::string defaultPort = mUseSsl ? "443" : "80";
    mHostHeader = (mPort == defaultPort) ? mHost : mHost + ":" + mPort;

    if (mUseSsl) {
#ifdef COMBINED_API_HAS_SSL
        mSslContext = std::make_unique<net::ssl::context>(
            net::ssl::context::tlsv12_client);
        mSslContext->set_default_verify_paths();
        mSslContext->set_verify_mode(net::ssl::verify_peer);
#else
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::string HttpClient::targetFor(const std::string& path) const {
    return joinPath(mBasePath, path);
}

HttpClient::Response HttpClient::get(const std::string& path) const {
    const std::string target = targetFor(path);

    if (mVerbose) {
        std::cerr << "[HttpClient] GET " << mHost << ":" << mPort
                  << target << "\n";
    }

    return mUseSsl ? doHttpsRequest(target) : doHttpRequest(target);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpRequest(const std::string& target) const {
    const auto timeout = std::chrono::milliseconds(mTimeoutMs);

    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolution is not covered by the timeout; the system resolver bounds it.
    auto const results = resolver.resolve(mHost, mPort);

    stream.expires_after(timeout);
    runOperation(ioc, "connect", [&](auto handler) {
        stream.async_connect(results, std::move(handler));
    });

    auto req = makeRequest(mHostHeader, target);
    stream.expires_after(timeout);
    runOperation(ioc, "write", [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(timeout);
    runOperation(ioc, "read", [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpsRequest(const std::string& target) const {
#ifdef COMBINED_API_HAS_SSL
    const auto timeout = std::chrono::milliseconds(mTimeoutMs);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, *mSslContext);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);

    beast::get_lowest_layer(stream).expires_after(timeout);
    runOperation(ioc, "connect", [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(results, std::move(handler));
    });

    beast::get_lowest_layer(stream).expires_after(timeout);
    runOperation(ioc, "TLS handshake", [&](auto handler) {
        stream.async_handshake(net::ssl::stream_base::client, std::move(handler));
    });

    auto req = makeRequest(mHostHeader, target);
    beast::get_lowest_layer(stream).expires_after(timeout);
    runOperation(ioc, "write", [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    runOperation(ioc, "read", [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    // Peers commonly drop the connection without a close_notify; the
    // response is already complete, so shutdown errors are not reported.
    beast::get_lowest_layer(stream).expires_after(timeout);
    try {
        runOperation(ioc, "TLS shutdown", [&](auto handler) {
            stream.async_shutdown(std::move(handler));
        });
    } catch (const std::runtime_error& e) {
        if (mVerbose) {
            std::cerr << "[HttpClient] " << e.what() << "\n";
        }
    }

    return response;
#else
    (void)target;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace combined_api
