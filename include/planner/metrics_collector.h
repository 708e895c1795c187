#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "planner/metrics_source.h"

namespace kvplane {

/// Aggregate traffic observed over one adjustment interval.
struct MetricsSample {
    WallClock::time_point timestamp;
    double request_count{0.0};
    double input_len{0.0};
    double output_len{0.0};
    double ttft_ms{0.0};
    double itl_ms{0.0};
};

/// Series names queried from the metrics source.
struct MetricQueries {
    std::string request_count{"kvplane_frontend_requests"};
    std::string input_len{"kvplane_frontend_input_sequence_tokens"};
    std::string output_len{"kvplane_frontend_output_sequence_tokens"};
    std::string ttft_ms{"kvplane_frontend_time_to_first_token_ms"};
    std::string itl_ms{"kvplane_frontend_inter_token_latency_ms"};
};

struct CollectorConfig {
    std::chrono::seconds interval{180};
    size_t window_size{50};
    MetricQueries queries;
};

/// Samples the metrics source once per interval into a bounded window.
class MetricsCollector {
public:
    MetricsCollector(MetricsSource& source, CollectorConfig config = CollectorConfig());

    /// Aggregate (end - interval, end] and append it to the window. Returns
    /// nullopt and records nothing when the interval carried no traffic data.
    std::optional<MetricsSample> collect(WallClock::time_point end = WallClock::now());

    void record(const MetricsSample& sample);

    std::vector<MetricsSample> window() const;
    std::optional<MetricsSample> latest() const;
    size_t size() const;
    void clear();

    const CollectorConfig& config() const { return config_; }

private:
    MetricsSource& source_;
    CollectorConfig config_;

    mutable std::mutex mutex_;
    std::deque<MetricsSample> window_;
};

}  // namespace kvplane
