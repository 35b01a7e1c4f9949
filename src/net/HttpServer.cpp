#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <chrono>
#include <exception>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

constexpr std::size_t kHeaderLimit = 8 * 1024;
constexpr std::size_t kBodyLimit = 64 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<boost::asio::thread_pool> cpu_pool;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::shared_ptr<boost::asio::thread_pool> pool)
        : socket(std::move(s)), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al), cpu_pool(std::move(pool)) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            if (ec) {
                self->read_timer.cancel();
                if (ec == http::error::header_limit) {
                    self->reply_error(http::status::request_header_fields_too_large, "Request header too large\n", "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version || ec == http::error::bad_field) {
                    self->reply_error(http::status::bad_request, "Bad request\n", "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }
            self->http_version = parser->get().version();
            auto len = parser->content_length();
            if (len && *len > kBodyLimit) {
                self->read_timer.cancel();
                self->reply_error(http::status::payload_too_large, "Request body too large\n", "(body)");
                return;
            }

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_error(http::status::payload_too_large, "Request body too large\n", "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    std::shared_ptr<Response> dispatch() const {
        try {
            return std::make_shared<Response>(router.route(req));
        } catch (const std::exception& e) {
            observability::log_error("handler_exception", {{"path", request_path(req)}, {"error", std::string(e.what())}});
            return std::make_shared<Response>(make_response(req, http::status::internal_server_error, "Internal error\n"));
        }
    }

    void handle_request() {
        std::string cleaned_target = request_path(req);
        auto self = shared_from_this();
        if (!cpu_pool) {
            send_response(dispatch(), cleaned_target);
            return;
        }
        // Upstream fetches and transforms block; keep them off the io thread.
        net::post(*cpu_pool, [self, cleaned_target]() {
            auto res = self->dispatch();
            net::post(self->socket.get_executor(), [self, res, cleaned_target]() {
                self->send_response(res, cleaned_target);
            });
        });
    }

    void record(const std::string& cleaned_target, int code) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            std::string label = router.has_path(cleaned_target) ? cleaned_target : "(unmatched)";
            observability::Metrics::instance().inc_request(label, code);
            observability::Metrics::instance().observe_latency(label, ms);
        }
        if (access_log) {
            observability::log_info("access", {{"method", std::string(req.method_string())}, {"path", cleaned_target}, {"code", int64_t(code)}, {"ms", ms}});
        }
    }

    void send_response(std::shared_ptr<Response> res, const std::string& cleaned_target) {
        auto self = shared_from_this();
        record(cleaned_target, static_cast<int>(res->result_int()));
        http::async_write(socket, *res, [self, res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", ec.message()}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->close_socket();
        });
    }

    void reply_error(http::status st, const std::string& body, const std::string& label) {
        auto self = shared_from_this();
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "text/plain; charset=utf-8");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        observability::log_info("request_rejected", {{"path", label}, {"code", int64_t(res->result_int())}});
        http::async_write(socket, *res, [self, res](boost::system::error_code, std::size_t) {
            self->close_socket();
        });
    }

    void close_socket() {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }
};

}

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::shared_ptr<boost::asio::thread_pool> cpu_pool)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::make_address(address), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log), cpu_pool_(std::move(cpu_pool)) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

unsigned short HttpServer::local_port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, cpu_pool_)->run();
        } else {
            observability::log_warn("accept_error", {{"err", ec.message()}});
        }
        do_accept();
    });
}
