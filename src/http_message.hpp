#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <string>

namespace combined_api {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/// Server identification sent with every response.
inline const std::string kServerName = "combined_api/1.0";

/// JSON response for @p req with Server / Content-Type set and the
/// connection marked for closing.
HttpResponse makeJsonResponse(const HttpRequest& req,
                              unsigned int status,
                              const std::string& body);

} // namespace combined_api
