#pragma once

#include "Request.h"
#include "Response.h"
#include <boost/beast/http/verb.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

// Exact-path dispatch for the proxy. Paths come from the calendar table plus
// the service endpoints; the query string never takes part in matching.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;

    // Re-registering a (verb, path) pair replaces its handler.
    void add_route(boost::beast::http::verb method, const std::string& path, Handler h);

    // 404 for unknown paths, 405 with an Allow header for a known path
    // registered under other methods.
    Response route(const Request& req) const;

    bool has_path(const std::string& path) const { return routes_.count(path) != 0; }
    std::size_t path_count() const { return routes_.size(); }

private:
    using MethodTable = std::map<boost::beast::http::verb, Handler>;
    std::unordered_map<std::string, MethodTable> routes_;
};

std::string_view strip_query(std::string_view target);

// Request target without its query string.
std::string request_path(const Request& req);

Response make_response(const Request& req, boost::beast::http::status st, std::string body, const char* content_type = "text/plain; charset=utf-8");
