#pragma once

#include "http_message.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace combined_api {

/// Minimal HTTP/1.1 server on Boost.Beast.
///
/// One request per connection. Requests are dispatched on a fixed pool of
/// worker threads sharing one io_context; a handler that blocks occupies
/// its worker until it returns.
class HttpServer {
public:
    using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

    /// Binds and listens immediately (port 0 picks an ephemeral port).
    /// @throws boost::system::system_error if the endpoint cannot be bound.
    HttpServer(const std::string& address,
               unsigned short port,
               RequestHandler handler,
               int threads = 4,
               bool verbose = false);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Port actually bound.
    unsigned short port() const;

    /// Start accepting on the worker threads; returns immediately.
    void start();

    /// Stop accepting, abandon idle connections and join the workers.
    /// Must not be called from inside a request handler.
    void stop();

private:
    RequestHandler                 mHandler;
    int                            mThreads;
    bool                           mVerbose;
    boost::asio::io_context        mIoc;
    boost::asio::ip::tcp::acceptor mAcceptor;
    std::mutex                     mWorkersMutex;
    std::vector<std::thread>       mWorkers;

    void doAccept();
    void onAccept(boost::beast::error_code ec,
                  boost::asio::ip::tcp::socket socket);
    void runWorker();
};

} // namespace combined_api
