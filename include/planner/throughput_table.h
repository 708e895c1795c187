#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kvplane {

struct PrefillProfilePoint {
    double isl{0.0};
    double ttft_ms{0.0};
    double throughput_per_gpu{0.0};
};

struct DecodeProfilePoint {
    double context_length{0.0};
    double itl_ms{0.0};
    double throughput_per_gpu{0.0};
};

/// Prefill throughput (tokens/s/GPU), piecewise-linear in input length.
class PrefillThroughputTable {
public:
    PrefillThroughputTable() = default;
    explicit PrefillThroughputTable(std::vector<PrefillProfilePoint> points);

    /// Clamped to the profiled ISL range. 0 when the table is empty.
    double throughputPerGpu(double isl) const;
    double ttftMs(double isl) const;

    bool empty() const { return points_.empty(); }
    const std::vector<PrefillProfilePoint>& points() const { return points_; }

private:
    std::vector<PrefillProfilePoint> points_;
};

/// Decode throughput (tokens/s/GPU) as a function of target ITL and context
/// length: interpolated on ITL within each profiled context length, then
/// across context lengths.
class DecodeThroughputTable {
public:
    DecodeThroughputTable() = default;
    explicit DecodeThroughputTable(std::vector<DecodeProfilePoint> points);

    double throughputPerGpu(double itl_ms, double context_length) const;

    bool empty() const { return curves_.empty(); }

private:
    struct Curve {
        double context_length;
        std::vector<double> itl_ms;
        std::vector<double> throughput;
    };

    std::vector<Curve> curves_;
};

struct ThroughputProfile {
    PrefillThroughputTable prefill;
    DecodeThroughputTable decode;
};

/// Linear interpolation over sorted `xs`, clamped at both ends.
double interpolateClamped(const std::vector<double>& xs, const std::vector<double>& ys, double x);

std::optional<ThroughputProfile> parseThroughputProfile(const nlohmann::json& j);
std::optional<ThroughputProfile> loadThroughputProfile(const std::string& path);

}  // namespace kvplane
