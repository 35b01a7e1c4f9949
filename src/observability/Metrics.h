#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <map>
#include <utility>
#include <mutex>

namespace observability {

// Process-wide Prometheus registry. Series are kept in ordered maps so a
// scrape lists them in a stable order.
class Metrics {
public:
    static Metrics& instance();
    void inc_request(const std::string& path, int code);
    void observe_latency(const std::string& path, double latency_ms);
    void inc_core_error(const std::string& kind);
    void inc_upstream_failure(const std::string& path);
    std::string scrape() const;
private:
    Metrics();
    std::map<std::pair<std::string, int>, uint64_t> requests_;
    struct HistData {
        std::vector<uint64_t> buckets;
        double sum = 0.0;
        uint64_t count = 0;
    };
    std::map<std::string, HistData> hist_;
    std::map<std::string, uint64_t> core_errors_;
    std::map<std::string, uint64_t> upstream_failures_;
    mutable std::mutex mu_;
};

}
