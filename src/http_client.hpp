#pragma once

#include <memory>
#include <string>

#ifdef COMBINED_API_HAS_SSL
#include <boost/asio/ssl/context.hpp>
#endif

namespace combined_api {

/// Outbound HTTP(S) GET client built on Boost.Beast.
///
/// One instance is meant to be constructed at startup and shared by every
/// request. After construction the object is immutable: each get() runs on
/// its own io_context and stream, so concurrent calls need no locking.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    /// @param baseUrl    Scheme, host, optional port and base path,
    ///                   e.g. "https://jsonplaceholder.typicode.com"
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit HttpClient(const std::string& baseUrl, int timeoutMs = 5000);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// GET {base}/{path}.
    /// @throws std::runtime_error on resolve / connect / timeout / I/O errors.
    Response get(const std::string& path) const;

    /// Request target get() would send for @p path.
    std::string targetFor(const std::string& path) const;

    const std::string& host() const { return mHost; }
    const std::string& port() const { return mPort; }

    /// Value sent in the Host header: "host" on the scheme's default port,
    /// "host:port" otherwise.
    const std::string& hostHeader() const { return mHostHeader; }
    int timeoutMs() const { return mTimeoutMs; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mHostHeader;
    std::string mBasePath;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

#ifdef COMBINED_API_HAS_SSL
    std::unique_ptr<boost::asio::ssl::context> mSslContext;
#endif

    Response doHttpRequest(const std::string& target) const;
    Response doHttpsRequest(const std::string& target) const;
};

} // namespace combined_api
