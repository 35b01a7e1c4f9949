#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <regex>
#include <unordered_map>
#include <limits>
#include <cmath>
#include "observability/Metrics.h"
#include "test_util.h"

using namespace observability;

static uint64_t parse_counter(const std::string& scrape, const std::string& path, int code) {
    std::regex re("ics_requests_total\\{path=\"" + path + "\",code=\"" + std::to_string(code) + "\"\\}\\s+([0-9]+)");
    std::smatch m;
    if (std::regex_search(scrape, m, re)) return std::stoull(m[1].str());
    return 0;
}

static uint64_t parse_labelled(const std::string& scrape, const std::string& metric, const std::string& label, const std::string& value) {
    std::regex re(metric + "\\{" + label + "=\"" + value + "\"\\}\\s+([0-9]+)");
    std::smatch m;
    if (std::regex_search(scrape, m, re)) return std::stoull(m[1].str());
    return 0;
}

static std::unordered_map<double, uint64_t> parse_buckets(const std::string& scrape, const std::string& path) {
    std::unordered_map<double, uint64_t> out;
    std::regex re("ics_request_duration_ms_bucket\\{path=\"" + path + "\",le=\"([0-9+.Inf]+)\"\\}\\s+([0-9]+)");
    std::sregex_iterator it(scrape.begin(), scrape.end(), re);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        std::string b = (*it)[1].str();
        double bucket = b == "+Inf" ? std::numeric_limits<double>::infinity() : std::stod(b);
        out[bucket] = std::stoull((*it)[2].str());
    }
    return out;
}

static double parse_sum(const std::string& scrape, const std::string& path) {
    std::regex re("ics_request_duration_ms_sum\\{path=\"" + path + "\"\\}\\s+([0-9.+-eE]+)");
    std::smatch m;
    if (std::regex_search(scrape, m, re)) return std::stod(m[1].str());
    return 0.0;
}

int main() {
    auto& m = Metrics::instance();

    m.inc_request("/test", 200);
    m.inc_request("/test", 200);
    m.inc_request("/test", 200);
    m.inc_request("/test", 500);

    std::string s = m.scrape();
    if (parse_counter(s, "/test", 200) != 3) return fail("counter expected 3 got " + std::to_string(parse_counter(s, "/test", 200)));
    if (parse_counter(s, "/test", 500) != 1) return fail("500 counter expected 1");

    m.observe_latency("/lat", 10.0);
    m.observe_latency("/lat", 20.0);
    m.observe_latency("/lat", 30.0);
    m.observe_latency("/lat", 100.0);
    m.observe_latency("/lat", 1000.0);

    s = m.scrape();
    auto buckets = parse_buckets(s, "/lat");
    std::vector<double> order = {5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};
    std::unordered_map<double, uint64_t> expected = {
        {5, 0}, {10, 1}, {25, 2}, {50, 3}, {100, 4}, {250, 4}, {500, 4}, {1000, 5}, {2500, 5}, {5000, 5}, {10000, 5}
    };
    for (double b : order) {
        auto it = buckets.find(b);
        uint64_t have = it == buckets.end() ? 0 : it->second;
        if (have != expected[b]) return fail("bucket " + std::to_string(b) + " expected " + std::to_string(expected[b]) + " got " + std::to_string(have));
    }
    if (buckets[std::numeric_limits<double>::infinity()] != 5) return fail("+Inf bucket expected 5");
    if (std::abs(parse_sum(s, "/lat") - 1160.0) > 1e-6) return fail("sum expected 1160");

    m.inc_core_error("unknown_property");
    m.inc_core_error("unknown_property");
    m.inc_core_error("unterminated_block");
    m.inc_upstream_failure("/work");
    s = m.scrape();
    if (parse_labelled(s, "ics_core_errors_total", "kind", "unknown_property") != 2) return fail("core error counter");
    if (parse_labelled(s, "ics_core_errors_total", "kind", "unterminated_block") != 1) return fail("second core error counter");
    if (parse_labelled(s, "ics_upstream_failures_total", "path", "/work") != 1) return fail("upstream failure counter");
    if (!contains(s, "# TYPE ics_request_duration_ms histogram")) return fail("histogram TYPE line missing");

    m.inc_upstream_failure("/a\"b");
    s = m.scrape();
    if (!contains(s, "ics_upstream_failures_total{path=\"/a\\\"b\"} 1")) return fail("label value not escaped");
    // series come out sorted by label
    if (s.find("path=\"/a\\\"b\"} 1") > s.find("path=\"/work\"} 1")) return fail("upstream series not ordered");
    if (s.find("code=\"200\"") > s.find("code=\"500\"")) return fail("request series not ordered");

    const int threads = 4;
    const int iters = 10000;
    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([&]() {
            for (int i = 0; i < iters; ++i) m.inc_request("/par", 200);
        });
    }
    for (auto& t : th) t.join();
    s = m.scrape();
    uint64_t par = parse_counter(s, "/par", 200);
    if (par != uint64_t(threads) * uint64_t(iters)) return fail("parallel counter expected " + std::to_string(threads * iters) + " got " + std::to_string(par));

    std::cout << "metrics_unit ok\n";
    return 0;
}
