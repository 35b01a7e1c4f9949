#include "HttpFetcher.h"
#include "observability/Logging.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <cctype>
#include <memory>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

static bool starts_with_nocase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

std::optional<Url> parse_url(std::string_view s) {
    Url u;
    std::string_view rest;
    if (starts_with_nocase(s, "http://")) {
        rest = s.substr(7);
    } else if (starts_with_nocase(s, "https://")) {
        u.https = true;
        u.port = 443;
        rest = s.substr(8);
    } else {
        return std::nullopt;
    }

    size_t end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, end);
    std::string_view path = end == std::string_view::npos ? std::string_view() : rest.substr(end);
    size_t hash = path.find('#');
    if (hash != std::string_view::npos) path = path.substr(0, hash);
    if (path.empty()) u.target = "/";
    else if (path[0] == '?') u.target = "/" + std::string(path);
    else u.target = std::string(path);

    if (authority.empty() || authority.find('@') != std::string_view::npos) return std::nullopt;

    std::string_view port_s;
    bool has_port = false;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        u.host = std::string(authority.substr(1, close - 1));
        u.ipv6 = true;
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') return std::nullopt;
            port_s = after.substr(1);
            has_port = true;
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon == std::string_view::npos) {
            u.host = std::string(authority);
        } else {
            u.host = std::string(authority.substr(0, colon));
            port_s = authority.substr(colon + 1);
            has_port = true;
        }
    }
    if (u.host.empty()) return std::nullopt;

    if (has_port) {
        if (port_s.empty() || port_s.size() > 5) return std::nullopt;
        unsigned v = 0;
        for (char c : port_s) {
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + unsigned(c - '0');
        }
        if (v == 0 || v > 65535) return std::nullopt;
        u.port = static_cast<uint16_t>(v);
    }
    return u;
}

std::string Url::host_header() const {
    std::string h = ipv6 ? "[" + host + "]" : host;
    bool default_port = https ? port == 443 : port == 80;
    if (!default_port) h += ":" + std::to_string(port);
    return h;
}

std::string Url::origin() const {
    return std::string(https ? "https://" : "http://") + host_header();
}

std::string resolve_location(const Url& base, const std::string& location) {
    if (starts_with_nocase(location, "http://") || starts_with_nocase(location, "https://")) return location;
    if (location.rfind("//", 0) == 0) return std::string(base.https ? "https:" : "http:") + location;
    if (!location.empty() && location[0] == '/') return base.origin() + location;
    std::string dir(base.target.substr(0, base.target.find('?')));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return base.origin() + dir + location;
}

namespace {

using UpstreamResponse = http::response<http::string_body>;

struct Outcome {
    boost::system::error_code ec;
    std::string stage;
    UpstreamResponse res;
    bool done = false;
};

// One request/response exchange over a plain or TLS stream.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
    static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;
public:
    template <class... StreamArgs>
    Exchange(net::io_context& ioc, const Url& url, const FetchOptions& opt, Outcome& out, StreamArgs&&... args)
        : stream_(std::forward<StreamArgs>(args)...), resolver_(ioc), url_(url), opt_(opt), out_(out) {}

    void run() {
        if constexpr (kTls) {
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                return fail(boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()), "sni");
            }
            if (opt_.verify_tls) stream_.set_verify_callback(ssl::host_name_verification(url_.host));
        }
        req_.method(http::verb::get);
        req_.target(url_.target);
        req_.version(11);
        req_.set(http::field::host, url_.host_header());
        req_.set(http::field::user_agent, opt_.user_agent);
        req_.set(http::field::accept, "text/calendar, */*;q=0.5");
        parser_.header_limit(64 * 1024);
        parser_.body_limit(opt_.max_bytes);
        resolver_.async_resolve(url_.host, std::to_string(url_.port), beast::bind_front_handler(&Exchange::on_resolve, this->shared_from_this()));
    }

private:
    beast::tcp_stream& lowest() { return beast::get_lowest_layer(stream_); }

    void fail(boost::system::error_code ec, const char* stage) {
        out_.ec = ec;
        out_.stage = stage;
        out_.done = true;
    }

    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        lowest().expires_after(opt_.timeout);
        lowest().async_connect(results, beast::bind_front_handler(&Exchange::on_connect, this->shared_from_this()));
    }

    void on_connect(boost::system::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec, "connect");
        if constexpr (kTls) {
            lowest().expires_after(opt_.timeout);
            stream_.async_handshake(ssl::stream_base::client, beast::bind_front_handler(&Exchange::on_handshake, this->shared_from_this()));
        } else {
            send();
        }
    }

    void on_handshake(boost::system::error_code ec) {
        if (ec) return fail(ec, "handshake");
        send();
    }

    void send() {
        lowest().expires_after(opt_.timeout);
        http::async_write(stream_, req_, beast::bind_front_handler(&Exchange::on_write, this->shared_from_this()));
    }

    void on_write(boost::system::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");
        lowest().expires_after(opt_.timeout);
        http::async_read(stream_, buffer_, parser_, beast::bind_front_handler(&Exchange::on_read, this->shared_from_this()));
    }

    void on_read(boost::system::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read");
        out_.res = parser_.release();
        out_.done = true;
        boost::system::error_code ignored;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
        lowest().socket().close(ignored);
    }

    Stream stream_;
    tcp::resolver resolver_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    http::response_parser<http::string_body> parser_;
    Url url_;
    FetchOptions opt_;
    Outcome& out_;
};

Outcome fetch_once(const Url& url, const FetchOptions& opt) {
    Outcome out;
    ssl::context ctx(ssl::context::tls_client);
    net::io_context ioc;
    if (url.https) {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(opt.verify_tls ? ssl::verify_peer : ssl::verify_none);
        std::make_shared<Exchange<beast::ssl_stream<beast::tcp_stream>>>(ioc, url, opt, out, ioc, ctx)->run();
    } else {
        std::make_shared<Exchange<beast::tcp_stream>>(ioc, url, opt, out, ioc)->run();
    }
    // hard cap for the whole exchange, DNS included
    ioc.run_for(opt.timeout + std::chrono::milliseconds(500));
    if (!out.done) {
        out.ec = beast::error::timeout;
        out.stage = "deadline";
    }
    return out;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

}

FetchResult fetch_url(const std::string& url, const FetchOptions& opt) {
    FetchResult r;
    std::string current = url;
    for (int hop = 0;; ++hop) {
        auto u = parse_url(current);
        if (!u) {
            r.error = "Invalid URL " + current;
            return r;
        }
        r.final_url = current;
        Outcome out;
        try {
            out = fetch_once(*u, opt);
        } catch (const std::exception& e) {
            r.error = "Fetching remote URL " + current + ": " + e.what();
            return r;
        }
        if (out.ec) {
            r.error = "Fetching remote URL " + current + " failed at " + out.stage + ": " + out.ec.message();
            return r;
        }
        r.status = static_cast<int>(out.res.result_int());
        if (is_redirect(r.status)) {
            auto loc = out.res.find(http::field::location);
            if (loc == out.res.end() || loc->value().empty()) {
                r.error = "Remote URL " + current + " redirected without a Location";
                return r;
            }
            if (hop >= opt.max_redirects) {
                r.error = "Remote URL " + url + " redirected more than " + std::to_string(opt.max_redirects) + " times";
                return r;
            }
            std::string next = resolve_location(*u, std::string(loc->value()));
            observability::log_debug("upstream_redirect", {{"from", current}, {"to", next}, {"status", int64_t(r.status)}});
            current = std::move(next);
            continue;
        }
        if (r.status < 200 || r.status >= 300) {
            r.error = "Remote URL " + url + " did not reply with a successful code: " + std::to_string(r.status);
            return r;
        }
        r.body = std::move(out.res.body());
        r.ok = true;
        return r;
    }
}
