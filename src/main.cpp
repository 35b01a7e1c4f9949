#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/HttpFetcher.h"
#include "net/CalendarRoutes.h"
#include "observability/Logging.h"
#include "config/Config.h"

using config::Config;
using observability::log_info;
using observability::set_log_level;

int main(int argc, char** argv) {
    Config cfg;
    config::ProxyConfig pc;
    try {
        cfg = Config::from_env(argc, argv);
        set_log_level(cfg.log_level);
        if (cfg.config_file.empty()) {
            std::cerr << "fatal: no calendar file, pass --config-file or set CONFIG_FILE\n";
            return 2;
        }
        pc = config::load_proxy_config(cfg.config_file);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 2;
    }

    try {
        boost::asio::io_context io;
        Router router;
        register_service_routes(router, cfg.metrics_enabled);

        FetchOptions fetch;
        fetch.timeout = std::chrono::milliseconds(cfg.fetch_timeout_ms);
        fetch.max_bytes = cfg.fetch_max_bytes;
        fetch.max_redirects = cfg.fetch_max_redirects;
        register_calendar_routes(router, pc, fetch);

        auto cpu_pool = std::make_shared<boost::asio::thread_pool>(cfg.workers);
        HttpServer server(io, cfg.address, cfg.port, router, cfg.metrics_enabled, cfg.access_log, cpu_pool);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int sig) {
            log_info("server_stop", {{"signal", int64_t(sig)}});
            server.stop();
            io.stop();
        });

        log_info("server_start", {
            {"address", cfg.address},
            {"port", int64_t(server.local_port())},
            {"mode", std::string(config::mode_name(pc.mode))},
            {"calendars", int64_t(pc.calendars.size())},
            {"routes", int64_t(router.path_count())},
            {"workers", int64_t(cfg.workers)}
        });
        server.run();
        io.run();
        cpu_pool->join();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
