#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "planner/metrics_collector.h"

namespace kvplane {

/// Predicted traffic for the next adjustment interval.
struct LoadForecast {
    double request_count{0.0};
    double input_len{0.0};
    double output_len{0.0};
};

struct PredictorOptions {
    size_t ar_order{2};
    size_t season_length{12};
    double level_smoothing{0.5};
    double trend_smoothing{0.1};
    double season_smoothing{0.3};
};

/// Forecasting strategy over the metrics window.
///
/// fitPredict() returns the constant forecast while the window holds fewer
/// than minimumSamples() entries, and never returns negative values.
class LoadPredictor {
public:
    virtual ~LoadPredictor() = default;

    LoadForecast fitPredict(const std::vector<MetricsSample>& window) const;

    virtual size_t minimumSamples() const = 0;
    virtual std::string name() const = 0;

protected:
    /// Called only with window.size() >= minimumSamples().
    virtual double forecastSeries(const std::vector<double>& series) const = 0;
};

/// Carry the last observation forward.
class ConstantPredictor : public LoadPredictor {
public:
    size_t minimumSamples() const override { return 1; }
    std::string name() const override { return "constant"; }

protected:
    double forecastSeries(const std::vector<double>& series) const override;
};

/// AR(p) with intercept, fit by least squares.
class AutoregressivePredictor : public LoadPredictor {
public:
    explicit AutoregressivePredictor(size_t order = 2);

    size_t minimumSamples() const override { return 2 * order_ + 2; }
    std::string name() const override { return "autoregressive"; }
    size_t order() const { return order_; }

protected:
    double forecastSeries(const std::vector<double>& series) const override;

private:
    size_t order_;
};

/// Additive Holt-Winters.
class SeasonalPredictor : public LoadPredictor {
public:
    explicit SeasonalPredictor(size_t season_length = 12, double alpha = 0.5, double beta = 0.1,
                               double gamma = 0.3);

    size_t minimumSamples() const override { return 2 * season_length_; }
    std::string name() const override { return "seasonal"; }

protected:
    double forecastSeries(const std::vector<double>& series) const override;

private:
    size_t season_length_;
    double alpha_;
    double beta_;
    double gamma_;
};

/// "constant", "autoregressive" (alias "ar"), "seasonal" (alias
/// "holt-winters"). Unknown names log a warning and yield constant.
std::unique_ptr<LoadPredictor> makeLoadPredictor(const std::string& name,
                                                 const PredictorOptions& options = PredictorOptions());

}  // namespace kvplane
