#include "planner/metrics_collector.h"

#include <cmath>

#include <spdlog/spdlog.h>

namespace kvplane {

namespace {

enum class Aggregation { kSum, kMean };

std::optional<double> aggregate(const std::vector<TimedValue>& values, Aggregation how) {
    if (values.empty()) {
        return std::nullopt;
    }
    double total = 0.0;
    for (const auto& v : values) {
        if (!std::isfinite(v.value)) {
            return std::nullopt;
        }
        total += v.value;
    }
    if (how == Aggregation::kMean) {
        total /= static_cast<double>(values.size());
    }
    return total;
}

}  // namespace

MetricsCollector::MetricsCollector(MetricsSource& source, CollectorConfig config)
    : source_(source)
    , config_(std::move(config)) {
    if (config_.window_size == 0) {
        spdlog::warn("Metrics window size 0 is invalid, using 50");
        config_.window_size = 50;
    }
    if (config_.interval.count() <= 0) {
        spdlog::warn("Metrics interval must be positive, using 180s");
        config_.interval = std::chrono::seconds(180);
    }
}

std::optional<MetricsSample> MetricsCollector::collect(WallClock::time_point end) {
    const auto start = end - config_.interval;
    // Half-open interval: a sample sitting exactly on `start` belongs to the previous one.
    const auto query_start = start + std::chrono::milliseconds(1);

    struct Series {
        const std::string* name;
        Aggregation how;
        double* out;
    };

    MetricsSample sample;
    sample.timestamp = end;
    const Series series[] = {
        {&config_.queries.request_count, Aggregation::kSum, &sample.request_count},
        {&config_.queries.input_len, Aggregation::kMean, &sample.input_len},
        {&config_.queries.output_len, Aggregation::kMean, &sample.output_len},
        {&config_.queries.ttft_ms, Aggregation::kMean, &sample.ttft_ms},
        {&config_.queries.itl_ms, Aggregation::kMean, &sample.itl_ms},
    };

    for (const auto& s : series) {
        auto value = aggregate(source_.queryRange(*s.name, query_start, end), s.how);
        if (!value) {
            spdlog::info("Skipping metrics interval: no usable data for '{}'", *s.name);
            return std::nullopt;
        }
        *s.out = *value;
    }

    record(sample);
    spdlog::debug("Collected metrics: requests={:.1f} isl={:.1f} osl={:.1f} ttft={:.1f}ms itl={:.2f}ms",
                  sample.request_count, sample.input_len, sample.output_len, sample.ttft_ms, sample.itl_ms);
    return sample;
}

void MetricsCollector::record(const MetricsSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.push_back(sample);
    while (window_.size() > config_.window_size) {
        window_.pop_front();
    }
}

std::vector<MetricsSample> MetricsCollector::window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<MetricsSample>(window_.begin(), window_.end());
}

std::optional<MetricsSample> MetricsCollector::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (window_.empty()) {
        return std::nullopt;
    }
    return window_.back();
}

size_t MetricsCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

void MetricsCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
}

}  // namespace kvplane
