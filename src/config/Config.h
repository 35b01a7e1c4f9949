#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include "observability/Logging.h"
#include "transform/Anonymize.h"
#include "transform/Filter.h"

namespace config {

struct Config {
    uint16_t port = 8000;
    std::string address = "127.0.0.1";
    observability::LogLevel log_level = observability::LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string config_file;
    int fetch_timeout_ms = 10000;
    std::size_t fetch_max_bytes = 16 * 1024 * 1024;
    int fetch_max_redirects = 5;
    int workers = 0;  // 0: hardware concurrency
    static Config from_env(int argc, char** argv);
};

enum class Mode { Anonymize, Filter };

// Contents of the calendar file: the policy and the path -> upstream URL map.
struct ProxyConfig {
    Mode mode = Mode::Anonymize;
    transform::AnonymizeConfig anonymize;
    transform::FilterConfig filter;
    std::map<std::string, std::string> calendars;
};

// Throws std::runtime_error naming the offending line.
ProxyConfig parse_proxy_config(const std::string& text);
ProxyConfig load_proxy_config(const std::string& path);

const char* mode_name(Mode m);

}
