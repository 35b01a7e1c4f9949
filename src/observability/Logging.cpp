#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_mu;
static std::ostream* g_sink = nullptr;

void set_log_level(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

LogLevel parse_log_level(const std::string& name) {
    std::string u = name;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return LogLevel::DEBUG;
    if (u == "WARN" || u == "WARNING") return LogLevel::WARN;
    if (u == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void set_log_sink(std::ostream* sink) {
    std::lock_guard lock(g_mu);
    g_sink = sink;
}

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

static void log_generic(LogLevel level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << now_ms() << ',';
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        if (std::holds_alternative<std::string>(p.second)) {
            ss << '\"' << escape_json(std::get<std::string>(p.second)) << '\"';
        } else if (std::holds_alternative<int64_t>(p.second)) {
            ss << std::get<int64_t>(p.second);
        } else {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(p.second);
            ss << tmp.str();
        }
    }
    ss << "}\n";
    std::lock_guard lock(g_mu);
    std::ostream& out = g_sink ? *g_sink : std::cout;
    out << ss.str();
    out.flush();
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(LogLevel::DEBUG, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(LogLevel::INFO, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(LogLevel::WARN, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(LogLevel::ERROR, "ERROR", msg, fields); }

}
