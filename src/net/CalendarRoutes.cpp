#include "CalendarRoutes.h"
#include "core/Pipeline.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include <boost/beast/http.hpp>
#include <memory>

namespace http = boost::beast::http;

Response render_calendar(const Request& req, const std::string& path, const config::ProxyConfig& pc, const std::string& raw) {
    core::CoreResult r = pc.mode == config::Mode::Anonymize ? core::anonymize(raw, pc.anonymize) : core::filter(raw, pc.filter);
    if (!r.ok) {
        std::string kind = r.error ? ical::error_kind_name(r.error->kind) : "unknown";
        observability::log_warn("core_error", {
            {"path", path},
            {"mode", std::string(config::mode_name(pc.mode))},
            {"kind", kind},
            {"line", int64_t(r.error ? r.error->line : 0)},
            {"error", r.error ? r.error->message : std::string()}
        });
        observability::Metrics::instance().inc_core_error(kind);
        return make_response(req, http::status::internal_server_error, "Error generating local ICS, see the logs for details\n");
    }
    return make_response(req, http::status::ok, std::move(r.body), "text/calendar; charset=utf-8");
}

void register_calendar_routes(Router& router, const config::ProxyConfig& pc, const FetchOptions& fetch) {
    auto shared = std::make_shared<const config::ProxyConfig>(pc);
    for (const auto& entry : pc.calendars) {
        std::string path = entry.first;
        std::string url = entry.second;
        router.add_route(http::verb::get, "/" + path, [shared, fetch, path, url](const Request& req) {
            FetchResult fr = fetch_url(url, fetch);
            if (!fr.ok) {
                observability::log_warn("upstream_failed", {{"path", path}, {"url", url}, {"status", int64_t(fr.status)}, {"error", fr.error}});
                observability::Metrics::instance().inc_upstream_failure("/" + path);
                return make_response(req, http::status::internal_server_error, "Error fetching remote ICS, see the logs for details\n");
            }
            observability::log_debug("upstream_fetched", {{"path", path}, {"bytes", int64_t(fr.body.size())}});
            return render_calendar(req, path, *shared, fr.body);
        });
    }
}

void register_service_routes(Router& router, bool metrics_enabled) {
    router.add_route(http::verb::get, "/health", [](const Request& req) {
        return make_response(req, http::status::ok, "{\"status\":\"ok\"}", "application/json; charset=utf-8");
    });
    if (metrics_enabled) {
        router.add_route(http::verb::get, "/metrics", [](const Request& req) {
            return make_response(req, http::status::ok, observability::Metrics::instance().scrape(), "text/plain; version=0.0.4");
        });
    }
}
