#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static int parse_int_or(const std::string& s, int def, const char* what) {
    if (s.empty()) return def;
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::exception&) {
        observability::log_warn("config_invalid_value", {{"key", std::string(what)}, {"value", s}});
        return def;
    }
}

static uint16_t parse_port_or(const std::string& s, uint16_t def, const char* what) {
    int p = parse_int_or(s, def, what);
    if (p < 1 || p > 65535) {
        observability::log_warn("config_invalid_port", {{"key", std::string(what)}, {"value", s}});
        return def;
    }
    return static_cast<uint16_t>(p);
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    c.port = parse_port_or(getenv_or("PORT", "8000"), c.port, "PORT");
    c.address = getenv_or("ADDRESS", "127.0.0.1");
    c.log_level = observability::parse_log_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.config_file = getenv_or("CONFIG_FILE", "");
    c.fetch_timeout_ms = std::max(100, parse_int_or(getenv_or("FETCH_TIMEOUT_MS", "10000"), 10000, "FETCH_TIMEOUT_MS"));
    c.fetch_max_bytes = static_cast<std::size_t>(std::max(1024, parse_int_or(getenv_or("FETCH_MAX_BYTES", "16777216"), 16 * 1024 * 1024, "FETCH_MAX_BYTES")));
    c.fetch_max_redirects = std::clamp(parse_int_or(getenv_or("FETCH_MAX_REDIRECTS", "5"), 5, "FETCH_MAX_REDIRECTS"), 0, 20);
    int hw = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    c.workers = std::clamp(parse_int_or(getenv_or("WORKERS", ""), hw, "WORKERS"), 1, 256);

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("missing value for " + a);
            return std::string(argv[++i]);
        };
        if (a == "--config-file" || a == "-c") c.config_file = value();
        else if (a == "--address" || a == "-a") c.address = value();
        else if (a == "--port" || a == "-p") {
            std::string v = value();
            int p = parse_int_or(v, -1, "--port");
            if (p < 1 || p > 65535) throw std::runtime_error("invalid port: " + v);
            c.port = static_cast<uint16_t>(p);
        }
        else throw std::runtime_error("unknown argument: " + a);
    }
    return c;
}

const char* mode_name(Mode m) {
    switch (m) {
        case Mode::Anonymize: return "anonymize";
        case Mode::Filter: return "filter";
    }
    return "unknown";
}

namespace {

struct Value {
    bool quoted = false;
    std::string text;
};

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

[[noreturn]] void fail(size_t line_no, const std::string& what) {
    throw std::runtime_error("config line " + std::to_string(line_no) + ": " + what);
}

// Reads a basic string starting at s[pos] == '"'; pos ends past the closing quote.
std::string read_quoted(const std::string& s, size_t& pos, size_t line_no) {
    std::string out;
    for (++pos; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c == '"') { ++pos; return out; }
        if (c != '\\') { out.push_back(c); continue; }
        if (++pos >= s.size()) break;
        switch (s[pos]) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            default: fail(line_no, std::string("unsupported escape \\") + s[pos]);
        }
    }
    fail(line_no, "unterminated string");
}

void expect_line_end(const std::string& s, size_t pos, size_t line_no) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    if (pos < s.size() && s[pos] != '#') fail(line_no, "unexpected trailing text");
}

bool as_bool(const Value& v, size_t line_no) {
    if (!v.quoted && v.text == "true") return true;
    if (!v.quoted && v.text == "false") return false;
    fail(line_no, "expected true or false");
}

const std::string& as_string(const Value& v, size_t line_no) {
    if (!v.quoted) fail(line_no, "expected a quoted string");
    return v.text;
}

}

ProxyConfig parse_proxy_config(const std::string& text) {
    ProxyConfig pc;
    bool have_match = false;
    std::string section;
    std::istringstream in(text);
    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) fail(line_no, "unterminated section header");
            expect_line_end(line, close + 1, line_no);
            section = trim(line.substr(1, close - 1));
            if (section != "config" && section != "calendars") fail(line_no, "unknown section [" + section + "]");
            continue;
        }

        size_t pos = 0;
        std::string key;
        if (line[0] == '"') {
            key = read_quoted(line, pos, line_no);
            while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
            if (pos >= line.size() || line[pos] != '=') fail(line_no, "expected '='");
        } else {
            pos = line.find('=');
            if (pos == std::string::npos) fail(line_no, "expected key = value");
            key = trim(line.substr(0, pos));
        }
        if (key.empty()) fail(line_no, "empty key");
        ++pos;
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;

        Value v;
        if (pos < line.size() && line[pos] == '"') {
            v.quoted = true;
            v.text = read_quoted(line, pos, line_no);
            expect_line_end(line, pos, line_no);
        } else {
            size_t end = line.find('#', pos);
            v.text = trim(line.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
            if (v.text.empty()) fail(line_no, "missing value for " + key);
        }

        if (section == "config") {
            if (key == "mode") {
                const auto& m = as_string(v, line_no);
                if (m == "anonymize") pc.mode = Mode::Anonymize;
                else if (m == "filter") pc.mode = Mode::Filter;
                else fail(line_no, "mode must be \"anonymize\" or \"filter\"");
            }
            else if (key == "calendar_name") pc.anonymize.calendar_name = as_string(v, line_no);
            else if (key == "redaction_message") pc.anonymize.redaction_message = as_string(v, line_no);
            else if (key == "seed") pc.anonymize.seed = as_string(v, line_no);
            else if (key == "ignore_unknown_properties") pc.anonymize.ignore_unknown_properties = as_bool(v, line_no);
            else if (key == "ignore_if_summary_is") { pc.filter.match_value = as_string(v, line_no); have_match = true; }
            else fail(line_no, "unknown key " + key);
        } else if (section == "calendars") {
            const auto& url = as_string(v, line_no);
            if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) fail(line_no, "calendar " + key + " must be an http(s) URL");
            if (key.find('/') != std::string::npos) fail(line_no, "calendar path must not contain '/'");
            if (key == "health" || key == "metrics") fail(line_no, "calendar path " + key + " is reserved for the service");
            if (!pc.calendars.emplace(key, url).second) fail(line_no, "duplicate calendar " + key);
        } else {
            fail(line_no, "key outside of a section");
        }
    }

    if (pc.calendars.empty()) throw std::runtime_error("config: no calendars configured");
    if (pc.mode == Mode::Anonymize && pc.anonymize.seed.empty()) throw std::runtime_error("config: anonymize mode requires a seed");
    if (pc.mode == Mode::Filter && !have_match) throw std::runtime_error("config: filter mode requires ignore_if_summary_is");
    return pc;
}

ProxyConfig load_proxy_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("cannot open config file " + path);
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse_proxy_config(text);
}

}
