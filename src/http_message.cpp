#include "http_message.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

namespace http = boost::beast::http;

namespace combined_api {

HttpResponse makeJsonResponse(const HttpRequest& req,
                              unsigned int status,
                              const std::string& body) {
    HttpResponse res{static_cast<http::status>(status), req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();
    return res;
}

} // namespace combined_api
