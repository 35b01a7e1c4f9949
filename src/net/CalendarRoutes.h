#pragma once

#include "Router.h"
#include "HttpFetcher.h"
#include "config/Config.h"

// GET /<path> for every configured calendar.
void register_calendar_routes(Router& router, const config::ProxyConfig& pc, const FetchOptions& fetch);

// GET /health, and GET /metrics when metrics are enabled.
void register_service_routes(Router& router, bool metrics_enabled);

// Runs the configured core entry point over a fetched feed.
Response render_calendar(const Request& req, const std::string& path, const config::ProxyConfig& pc, const std::string& raw);
