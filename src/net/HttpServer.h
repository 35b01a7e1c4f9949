#pragma once

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <memory>
#include <string>

class HttpServer {
public:
    // Handlers run on cpu_pool when one is given, otherwise on the io thread.
    HttpServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::shared_ptr<boost::asio::thread_pool> cpu_pool = nullptr);
    void run();
    void stop();
    unsigned short local_port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<boost::asio::thread_pool> cpu_pool_;
};
