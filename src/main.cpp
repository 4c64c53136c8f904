#include "combined_handler.hpp"
#include "data_provider.hpp"
#include "http_client.hpp"
#include "http_server.hpp"
#include "product_service.hpp"
#include "remote_fetcher.hpp"
#include "router.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

struct Config {
    std::string host       = "0.0.0.0";
    int         port       = 8080;
    std::string remoteBase = "https://jsonplaceholder.typicode.com";
    int         timeoutMs  = 5000;
    int         dbDelayMs  = 500;
    int         threads    = 4;
    bool        verbose    = false;
};

static void printUsage() {
    std::cout
        << "Usage: combined_api_server [options]\n\n"
        << "Options:\n"
        << "  --host ADDR         Listen address             (default: 0.0.0.0)\n"
        << "  --port N            Listen port                (default: 8080)\n"
        << "  --remote-base URL   Remote todo API base URL   "
           "(default: https://jsonplaceholder.typicode.com)\n"
        << "  --timeout-ms N      Outbound timeout in ms     (default: 5000)\n"
        << "  --db-delay-ms N     Simulated store latency    (default: 500)\n"
        << "  --threads N         Server worker threads      (default: 4)\n"
        << "  --verbose           Enable verbose diagnostics\n"
        << "  --help, -h          Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--host") && i + 1 < argc) {
            cfg.host = argv[++i];
        } else if ((arg == "--port") && i + 1 < argc) {
            cfg.port = std::stoi(argv[++i]);
        } else if ((arg == "--remote-base") && i + 1 < argc) {
            cfg.remoteBase = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--db-delay-ms") && i + 1 < argc) {
            cfg.dbDelayMs = std::stoi(argv[++i]);
        } else if ((arg == "--threads") && i + 1 < argc) {
            cfg.threads = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.port < 0 || cfg.port > 65535) {
        throw std::invalid_argument("Port out of range: " +
                                    std::to_string(cfg.port));
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        std::cout
            << "=== combined_api ===\n"
            << "Listen:      " << cfg.host << ":" << cfg.port << "\n"
            << "Remote base: " << cfg.remoteBase << "\n"
            << "Timeout:     " << cfg.timeoutMs << " ms\n"
            << "DB delay:    " << cfg.dbDelayMs << " ms\n"
            << "Threads:     " << cfg.threads << "\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "====================\n\n";

        // One client for the whole process, shared by every request.
        auto client = std::make_shared<combined_api::HttpClient>(
            cfg.remoteBase, cfg.timeoutMs);
        client->setVerbose(cfg.verbose);

        combined_api::DefaultProductService service(
            combined_api::DataProvider(std::chrono::milliseconds(cfg.dbDelayMs)),
            combined_api::RemoteFetcher(client, cfg.verbose));
        combined_api::CombinedHandler handler(service, cfg.verbose);
        combined_api::Router router(handler, cfg.verbose);

        combined_api::HttpServer server(
            cfg.host, static_cast<unsigned short>(cfg.port),
            [&router](const combined_api::HttpRequest& req) {
                return router.route(req);
            },
            cfg.threads, cfg.verbose);

        boost::asio::io_context signalIoc;
        boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                std::cerr << "[Server] Signal " << sig << ", shutting down\n";
            }
            server.stop();
        });

        server.start();
        std::cout << "Serving GET /combined/{id} on port " << server.port()
                  << "\n";
        signalIoc.run();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
