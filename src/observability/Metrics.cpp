#include "Metrics.h"
#include <sstream>

namespace observability {

static const std::vector<double>& latency_buckets() {
    static const std::vector<double> buckets = {5,10,25,50,100,250,500,1000,2500,5000,10000};
    return buckets;
}

// Prometheus text format label escaping.
static std::string label_value(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\' || c == '"') out += '\\';
        if (c == '\n') { out += "\\n"; continue; }
        out += c;
    }
    return out;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

void Metrics::inc_request(const std::string& path, int code) {
    std::lock_guard lock(mu_);
    requests_[{path, code}] += 1;
}

void Metrics::observe_latency(const std::string& path, double latency_ms) {
    const auto& buckets = latency_buckets();
    std::lock_guard lock(mu_);
    auto& h = hist_[path];
    if (h.buckets.empty()) h.buckets.assign(buckets.size(), 0);
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::inc_core_error(const std::string& kind) {
    std::lock_guard lock(mu_);
    core_errors_[kind] += 1;
}

void Metrics::inc_upstream_failure(const std::string& path) {
    std::lock_guard lock(mu_);
    upstream_failures_[path] += 1;
}

std::string Metrics::scrape() const {
    const auto& buckets = latency_buckets();
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    ss << "# HELP ics_requests_total Total HTTP requests\n";
    ss << "# TYPE ics_requests_total counter\n";
    for (const auto& p : requests_) {
        ss << "ics_requests_total{path=\"" << label_value(p.first.first) << "\",code=\"" << p.first.second << "\"} " << p.second << "\n";
    }
    ss << "# HELP ics_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE ics_request_duration_ms histogram\n";
    for (const auto& p : hist_) {
        const auto& h = p.second;
        const std::string path = label_value(p.first);
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "ics_request_duration_ms_bucket{path=\"" << path << "\",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "ics_request_duration_ms_bucket{path=\"" << path << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "ics_request_duration_ms_sum{path=\"" << path << "\"} " << h.sum << "\n";
        ss << "ics_request_duration_ms_count{path=\"" << path << "\"} " << h.count << "\n";
    }
    ss << "# HELP ics_core_errors_total Calendar documents rejected by the parser or a transform\n";
    ss << "# TYPE ics_core_errors_total counter\n";
    for (const auto& p : core_errors_) {
        ss << "ics_core_errors_total{kind=\"" << label_value(p.first) << "\"} " << p.second << "\n";
    }
    ss << "# HELP ics_upstream_failures_total Failed upstream fetches\n";
    ss << "# TYPE ics_upstream_failures_total counter\n";
    for (const auto& p : upstream_failures_) {
        ss << "ics_upstream_failures_total{path=\"" << label_value(p.first) << "\"} " << p.second << "\n";
    }
    return ss.str();
}

}
