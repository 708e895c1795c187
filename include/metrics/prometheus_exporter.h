// prometheus_exporter.h - Prometheus text exposition for router and planner state
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kvplane::metrics {

using Labels = std::vector<std::pair<std::string, std::string>>;

enum class MetricType { Gauge, Counter };

/// One metric family: a name, a type and any number of labelled samples.
struct MetricFamily {
    std::string name;
    std::string help;
    MetricType type{MetricType::Gauge};
    std::vector<std::pair<Labels, double>> samples;
};

/// Thread-safe registry rendered in the text exposition format (0.0.4).
/// Families render in first-use order; samples within a family likewise.
class PrometheusExporter {
  public:
    void set_gauge(const std::string& name, double value, const std::string& help = "");
    void set_gauge(const std::string& name, const Labels& labels, double value,
                   const std::string& help = "");
    void set_counter(const std::string& name, double value, const std::string& help = "");
    void inc_counter(const std::string& name, double delta = 1.0, const std::string& help = "");
    void inc_counter(const std::string& name, const Labels& labels, double delta,
                     const std::string& help = "");

    /// Drop every sample of a family (e.g. per-worker gauges before a refresh).
    void clear(const std::string& name);

    std::optional<double> gauge_value(const std::string& name, const Labels& labels = {}) const;
    std::optional<double> counter_value(const std::string& name, const Labels& labels = {}) const;

    std::string render() const;

  private:
    MetricFamily& family(const std::string& name, MetricType type, const std::string& help);
    std::optional<double> value_of(const std::string& name, MetricType type, const Labels& labels) const;

    mutable std::mutex mu_;
    std::vector<MetricFamily> families_;
};

}  // namespace kvplane::metrics
