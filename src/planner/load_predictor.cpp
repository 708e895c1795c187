#include "planner/load_predictor.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <spdlog/spdlog.h>

namespace kvplane {

namespace {

// Pivots below this fraction of the largest entry count as zero.
constexpr double kSingularPivot = 1e-10;

double clampForecast(double value) {
    if (!std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

// Solve A x = b in place (Gaussian elimination, partial pivoting).
bool solveLinearSystem(std::vector<std::vector<double>>& a, std::vector<double>& b, std::vector<double>& x) {
    const size_t n = b.size();
    double scale = 0.0;
    for (const auto& r : a) {
        for (double v : r) {
            scale = std::max(scale, std::fabs(v));
        }
    }
    if (scale == 0.0) {
        return false;
    }
    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t row = col + 1; row < n; ++row) {
            if (std::fabs(a[row][col]) > std::fabs(a[pivot][col])) {
                pivot = row;
            }
        }
        if (std::fabs(a[pivot][col]) < kSingularPivot * scale) {
            return false;
        }
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);
        for (size_t row = col + 1; row < n; ++row) {
            const double factor = a[row][col] / a[col][col];
            for (size_t k = col; k < n; ++k) {
                a[row][k] -= factor * a[col][k];
            }
            b[row] -= factor * b[col];
        }
    }
    x.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double sum = b[i];
        for (size_t k = i + 1; k < n; ++k) {
            sum -= a[i][k] * x[k];
        }
        x[i] = sum / a[i][i];
    }
    return true;
}

}  // namespace

LoadForecast LoadPredictor::fitPredict(const std::vector<MetricsSample>& window) const {
    if (window.empty()) {
        return LoadForecast{};
    }

    std::vector<double> requests, isl, osl;
    requests.reserve(window.size());
    isl.reserve(window.size());
    osl.reserve(window.size());
    for (const auto& s : window) {
        requests.push_back(s.request_count);
        isl.push_back(s.input_len);
        osl.push_back(s.output_len);
    }

    LoadForecast forecast;
    if (window.size() < minimumSamples()) {
        spdlog::debug("{} predictor has {} of {} samples, using constant forecast", name(), window.size(),
                      minimumSamples());
        forecast.request_count = requests.back();
        forecast.input_len = isl.back();
        forecast.output_len = osl.back();
    } else {
        forecast.request_count = forecastSeries(requests);
        forecast.input_len = forecastSeries(isl);
        forecast.output_len = forecastSeries(osl);
    }

    forecast.request_count = clampForecast(forecast.request_count);
    forecast.input_len = clampForecast(forecast.input_len);
    forecast.output_len = clampForecast(forecast.output_len);
    return forecast;
}

double ConstantPredictor::forecastSeries(const std::vector<double>& series) const {
    return series.back();
}

AutoregressivePredictor::AutoregressivePredictor(size_t order) : order_(std::max<size_t>(order, 1)) {}

double AutoregressivePredictor::forecastSeries(const std::vector<double>& series) const {
    const size_t p = order_;
    const size_t n = series.size();
    const size_t dim = p + 1;

    // Normal equations for y_t = c + sum_i a_i * y_{t-i}.
    std::vector<std::vector<double>> xtx(dim, std::vector<double>(dim, 0.0));
    std::vector<double> xty(dim, 0.0);
    std::vector<double> row(dim);
    for (size_t t = p; t < n; ++t) {
        row[0] = 1.0;
        for (size_t i = 1; i <= p; ++i) {
            row[i] = series[t - i];
        }
        for (size_t r = 0; r < dim; ++r) {
            for (size_t c = 0; c < dim; ++c) {
                xtx[r][c] += row[r] * row[c];
            }
            xty[r] += row[r] * series[t];
        }
    }

    std::vector<double> coef;
    if (!solveLinearSystem(xtx, xty, coef)) {
        // Flat or collinear history; nothing to extrapolate.
        return series.back();
    }

    double next = coef[0];
    for (size_t i = 1; i <= p; ++i) {
        next += coef[i] * series[n - i];
    }
    return next;
}

SeasonalPredictor::SeasonalPredictor(size_t season_length, double alpha, double beta, double gamma)
    : season_length_(std::max<size_t>(season_length, 1))
    , alpha_(alpha)
    , beta_(beta)
    , gamma_(gamma) {}

double SeasonalPredictor::forecastSeries(const std::vector<double>& series) const {
    const size_t m = season_length_;
    const size_t n = series.size();

    double first_mean = 0.0;
    double second_mean = 0.0;
    for (size_t i = 0; i < m; ++i) {
        first_mean += series[i];
        second_mean += series[m + i];
    }
    first_mean /= static_cast<double>(m);
    second_mean /= static_cast<double>(m);

    double level = first_mean;
    double trend = (second_mean - first_mean) / static_cast<double>(m);
    std::vector<double> seasonal(n, 0.0);
    for (size_t i = 0; i < m; ++i) {
        seasonal[i] = series[i] - first_mean;
    }

    for (size_t t = m; t < n; ++t) {
        const double prev_level = level;
        level = alpha_ * (series[t] - seasonal[t - m]) + (1.0 - alpha_) * (level + trend);
        trend = beta_ * (level - prev_level) + (1.0 - beta_) * trend;
        seasonal[t] = gamma_ * (series[t] - level) + (1.0 - gamma_) * seasonal[t - m];
    }

    return level + trend + seasonal[n - m];
}

std::unique_ptr<LoadPredictor> makeLoadPredictor(const std::string& name, const PredictorOptions& options) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });

    if (key == "constant") {
        return std::make_unique<ConstantPredictor>();
    }
    if (key == "autoregressive" || key == "ar") {
        return std::make_unique<AutoregressivePredictor>(options.ar_order);
    }
    if (key == "seasonal" || key == "holt-winters") {
        return std::make_unique<SeasonalPredictor>(options.season_length, options.level_smoothing,
                                                   options.trend_smoothing, options.season_smoothing);
    }
    spdlog::warn("Unknown load predictor '{}', using constant", name);
    return std::make_unique<ConstantPredictor>();
}

}  // namespace kvplane
