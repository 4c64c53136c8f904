#include "http_server.hpp"
#include "mapping.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace combined_api {

namespace {

constexpr auto kReadTimeout  = std::chrono::seconds(30);
constexpr auto kWriteTimeout = std::chrono::seconds(30);

// ---------------------------------------------------------------------------
// Session: read one request, answer it, close.
// ---------------------------------------------------------------------------

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket,
            const HttpServer::RequestHandler& handler,
            bool verbose)
        : mStream(std::move(socket))
        , mHandler(handler)
        , mVerbose(verbose) {}

    void run() {
        net::dispatch(mStream.get_executor(),
                      beast::bind_front_handler(&Session::doRead,
                                                shared_from_this()));
    }

private:
    beast::tcp_stream                   mStream;
    beast::flat_buffer                  mBuffer;
    HttpRequest                         mReq;
    HttpResponse                        mRes;
    const HttpServer::RequestHandler&   mHandler;
    bool                                mVerbose;

    void doRead() {
        mStream.expires_after(kReadTimeout);
        http::async_read(mStream, mBuffer, mReq,
                         beast::bind_front_handler(&Session::onRead,
                                                   shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return doClose();
        }
        if (ec) {
            std::cerr << "[Server] Read failed: " << ec.message() << "\n";
            return doClose();
        }

        if (mVerbose) {
            std::cerr << "[Server] " << mReq.method_string() << " "
                      << mReq.target() << "\n";
        }

        try {
            mRes = mHandler(mReq);
        } catch (const std::exception& e) {
            std::cerr << "[Server] Handler error: " << e.what() << "\n";
            mRes = makeJsonResponse(mReq, 500,
                                    errorBody("Internal server error").dump());
        }
        mRes.keep_alive(false);

        mStream.expires_after(kWriteTimeout);
        http::async_write(mStream, mRes,
                          beast::bind_front_handler(&Session::onWrite,
                                                    shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[Server] Write failed: " << ec.message() << "\n";
        }
        doClose();
    }

    void doClose() {
        // The peer may already be gone; nothing left to report.
        beast::error_code ec;
        mStream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpServer::HttpServer(const std::string& address,
                       unsigned short port,
                       RequestHandler handler,
                       int threads,
                       bool verbose)
    : mHandler(std::move(handler))
    , mThreads(threads)
    , mVerbose(verbose)
    , mIoc(threads > 0 ? threads : 1)
    , mAcceptor(net::make_strand(mIoc))
{
    if (!mHandler) {
        throw std::invalid_argument("HttpServer requires a request handler");
    }
    if (threads <= 0) {
        throw std::invalid_argument("HttpServer needs at least one thread");
    }

    const tcp::endpoint endpoint{net::ip::make_address(address), port};
    mAcceptor.open(endpoint.protocol());
    mAcceptor.set_option(net::socket_base::reuse_address(true));
    mAcceptor.bind(endpoint);
    mAcceptor.listen(net::socket_base::max_listen_connections);

    if (mVerbose) {
        std::cerr << "[Server] Listening on " << address << ":"
                  << this->port() << "\n";
    }
}

HttpServer::~HttpServer() {
    stop();
}

unsigned short HttpServer::port() const {
    return mAcceptor.local_endpoint().port();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void HttpServer::start() {
    std::lock_guard<std::mutex> lock(mWorkersMutex);
    if (!mWorkers.empty()) {
        throw std::logic_error("HttpServer already started");
    }

    doAccept();

    mWorkers.reserve(mThreads);
    for (int i = 0; i < mThreads; ++i) {
        mWorkers.emplace_back([this] { runWorker(); });
    }
}

void HttpServer::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mWorkersMutex);
        workers.swap(mWorkers);
    }

    mIoc.stop();
    for (auto& worker : workers) {
        worker.join();
    }
}

void HttpServer::runWorker() {
    for (;;) {
        try {
            mIoc.run();
            return;
        } catch (const std::exception& e) {
            std::cerr << "[Server] Worker error: " << e.what() << "\n";
        }
    }
}

// ---------------------------------------------------------------------------
// Accept loop
// ---------------------------------------------------------------------------

void HttpServer::doAccept() {
    mAcceptor.async_accept(
        net::make_strand(mIoc),
        beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        std::cerr << "[Server] Accept failed: " << ec.message() << "\n";
    } else {
        std::make_shared<Session>(std::move(socket), mHandler, mVerbose)->run();
    }
    doAccept();
}

} // namespace combined_api
