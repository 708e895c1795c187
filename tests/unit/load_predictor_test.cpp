#include <gtest/gtest.h>

#include <vector>

#include "planner/load_predictor.h"

namespace kvplane {
namespace {

std::vector<MetricsSample> windowOf(const std::vector<double>& requests) {
    std::vector<MetricsSample> window;
    for (double r : requests) {
        MetricsSample s;
        s.request_count = r;
        s.input_len = 1000;
        s.output_len = 200;
        window.push_back(s);
    }
    return window;
}

TEST(LoadPredictorTest, EmptyWindowForecastsNothing) {
    auto forecast = ConstantPredictor().fitPredict({});
    EXPECT_DOUBLE_EQ(forecast.request_count, 0);
    EXPECT_DOUBLE_EQ(forecast.input_len, 0);
    EXPECT_DOUBLE_EQ(forecast.output_len, 0);
}

TEST(LoadPredictorTest, ConstantCarriesLastSampleForward) {
    auto forecast = ConstantPredictor().fitPredict(windowOf({5, 7, 11}));
    EXPECT_DOUBLE_EQ(forecast.request_count, 11);
    EXPECT_DOUBLE_EQ(forecast.input_len, 1000);
    EXPECT_DOUBLE_EQ(forecast.output_len, 200);
}

TEST(LoadPredictorTest, ColdStartFallsBackToConstant) {
    AutoregressivePredictor ar(2);
    ASSERT_EQ(ar.minimumSamples(), 6u);
    auto forecast = ar.fitPredict(windowOf({10, 20, 40, 80, 160}));
    EXPECT_DOUBLE_EQ(forecast.request_count, 160);

    SeasonalPredictor seasonal(4);
    EXPECT_DOUBLE_EQ(seasonal.fitPredict(windowOf({1, 2, 3})).request_count, 3);
}

TEST(LoadPredictorTest, AutoregressiveExtendsLinearTrend) {
    AutoregressivePredictor ar(1);
    std::vector<double> series;
    for (int t = 0; t < 10; ++t) series.push_back(10 + 5 * t);
    auto forecast = ar.fitPredict(windowOf(series));
    EXPECT_NEAR(forecast.request_count, 60, 1e-6);
}

TEST(LoadPredictorTest, AutoregressiveRecoversSecondOrderDynamics) {
    std::vector<double> series{10, 20};
    for (int t = 2; t < 16; ++t) {
        series.push_back(2 + 0.5 * series[t - 1] + 0.3 * series[t - 2]);
    }
    const double expected = 2 + 0.5 * series[15] + 0.3 * series[14];

    auto forecast = AutoregressivePredictor(2).fitPredict(windowOf(series));
    EXPECT_NEAR(forecast.request_count, expected, 1e-4);
}

TEST(LoadPredictorTest, AutoregressiveOnFlatSeriesReturnsTheLevel) {
    auto forecast = AutoregressivePredictor(2).fitPredict(windowOf(std::vector<double>(10, 42)));
    EXPECT_NEAR(forecast.request_count, 42, 1e-9);
}

TEST(LoadPredictorTest, SeasonalFollowsRepeatingPattern) {
    const std::vector<double> season{10, 20, 30, 20};
    std::vector<double> series;
    for (int cycle = 0; cycle < 3; ++cycle) {
        series.insert(series.end(), season.begin(), season.end());
    }
    SeasonalPredictor predictor(4);
    EXPECT_NEAR(predictor.fitPredict(windowOf(series)).request_count, 10, 1e-9);

    series.push_back(10);
    EXPECT_NEAR(predictor.fitPredict(windowOf(series)).request_count, 20, 1e-9);
}

TEST(LoadPredictorTest, ForecastsAreNeverNegative) {
    AutoregressivePredictor ar(1);
    std::vector<double> falling;
    for (int t = 0; t < 8; ++t) falling.push_back(70 - 10 * t);
    EXPECT_DOUBLE_EQ(ar.fitPredict(windowOf(falling)).request_count, 0);
}

TEST(LoadPredictorTest, FactoryResolvesNamesAndAliases) {
    PredictorOptions options;
    options.ar_order = 3;
    EXPECT_EQ(makeLoadPredictor("constant")->name(), "constant");
    EXPECT_EQ(makeLoadPredictor("AR", options)->name(), "autoregressive");
    EXPECT_EQ(makeLoadPredictor("ar", options)->minimumSamples(), 8u);
    EXPECT_EQ(makeLoadPredictor("holt-winters")->name(), "seasonal");
    EXPECT_EQ(makeLoadPredictor("prophet")->name(), "constant");
}

}  // namespace
}  // namespace kvplane
