#include "Router.h"
#include <boost/beast/http.hpp>

std::string_view strip_query(std::string_view target) {
    auto q = target.find('?');
    if (q != std::string_view::npos) target = target.substr(0, q);
    return target;
}

std::string request_path(const Request& req) {
    auto t = req.target();
    return std::string(strip_query(std::string_view(t.data(), t.size())));
}

Response make_response(const Request& req, boost::beast::http::status st, std::string body, const char* content_type) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

void Router::add_route(boost::beast::http::verb method, const std::string& path, Handler h) {
    routes_[path][method] = std::move(h);
}

Response Router::route(const Request& req) const {
    namespace http = boost::beast::http;
    std::string path = request_path(req);
    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return make_response(req, http::status::not_found, "Path " + path.substr(path.empty() ? 0 : 1) + " is not configured\n");
    }
    auto h = it->second.find(req.method());
    if (h != it->second.end()) return h->second(req);

    std::string allow;
    for (const auto& m : it->second) {
        if (!allow.empty()) allow += ", ";
        allow += std::string(http::to_string(m.first));
    }
    Response res = make_response(req, http::status::method_not_allowed, "Method " + std::string(req.method_string()) + " is not allowed on " + path + "\n");
    res.set(http::field::allow, allow);
    return res;
}
