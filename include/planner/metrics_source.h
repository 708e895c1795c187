#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kvplane {

using WallClock = std::chrono::system_clock;

struct TimedValue {
    WallClock::time_point timestamp;
    double value{0.0};
};

/// Time-series backend the planner samples traffic from.
class MetricsSource {
public:
    virtual ~MetricsSource() = default;

    /// Samples of `metric` in [start, end], ordered by time. Empty on failure.
    virtual std::vector<TimedValue> queryRange(const std::string& metric, WallClock::time_point start,
                                               WallClock::time_point end) = 0;
};

/// Prometheus HTTP API client (`GET /api/v1/query_range`).
///
/// Multiple series returned for one query are summed per timestamp.
class PrometheusMetricsSource : public MetricsSource {
public:
    explicit PrometheusMetricsSource(std::string base_url,
                                     std::chrono::seconds step = std::chrono::seconds(15),
                                     std::chrono::seconds timeout = std::chrono::seconds(5));

    std::vector<TimedValue> queryRange(const std::string& metric, WallClock::time_point start,
                                       WallClock::time_point end) override;

    /// Decode a query_range response body.
    static std::vector<TimedValue> parseQueryRangeResponse(const std::string& body);

private:
    std::string base_url_;
    std::chrono::seconds step_;
    std::chrono::seconds timeout_;
};

/// Series pushed by the caller; used in tests and for offline replay.
class InMemoryMetricsSource : public MetricsSource {
public:
    void push(const std::string& metric, WallClock::time_point timestamp, double value);
    void clear();

    std::vector<TimedValue> queryRange(const std::string& metric, WallClock::time_point start,
                                       WallClock::time_point end) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::multimap<WallClock::time_point, double>> series_;
};

}  // namespace kvplane
