#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Url {
    bool https = false;
    std::string host;  // without IPv6 brackets
    uint16_t port = 80;
    std::string target = "/";
    bool ipv6 = false;
    std::string host_header() const;
    std::string origin() const;
};

// http and https only; no userinfo. Fragment is dropped.
std::optional<Url> parse_url(std::string_view s);

// Resolves a Location header against the URL that produced it.
std::string resolve_location(const Url& base, const std::string& location);

struct FetchOptions {
    std::chrono::milliseconds timeout{10000};
    std::size_t max_bytes = 16 * 1024 * 1024;
    int max_redirects = 5;
    bool verify_tls = true;
    std::string user_agent = "ics_shield/0.1";
};

struct FetchResult {
    bool ok = false;
    int status = 0;
    std::string body;
    std::string error;
    std::string final_url;
};

// Blocking GET on a private io_context; safe to call from any thread.
FetchResult fetch_url(const std::string& url, const FetchOptions& opt = FetchOptions());
