#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>

#include "planner/metrics_collector.h"

namespace kvplane {
namespace {

using namespace std::chrono_literals;

const WallClock::time_point kEnd = WallClock::time_point(std::chrono::seconds(1'700'000'000));

void pushInterval(InMemoryMetricsSource& source, const MetricQueries& q, WallClock::time_point end,
                  double requests, double isl, double osl, double ttft, double itl) {
    source.push(q.request_count, end - 120s, requests / 2);
    source.push(q.request_count, end - 60s, requests / 2);
    source.push(q.input_len, end - 60s, isl);
    source.push(q.output_len, end - 60s, osl);
    source.push(q.ttft_ms, end - 60s, ttft);
    source.push(q.itl_ms, end - 60s, itl);
}

TEST(MetricsCollectorTest, SumsRequestsAndAveragesTheRest) {
    InMemoryMetricsSource source;
    const MetricQueries q;
    source.push(q.request_count, kEnd - 100s, 30);
    source.push(q.request_count, kEnd - 10s, 12);
    source.push(q.input_len, kEnd - 100s, 1000);
    source.push(q.input_len, kEnd - 10s, 3000);
    source.push(q.output_len, kEnd - 10s, 200);
    source.push(q.ttft_ms, kEnd - 10s, 250);
    source.push(q.itl_ms, kEnd - 100s, 20);
    source.push(q.itl_ms, kEnd - 10s, 40);

    MetricsCollector collector(source);
    auto sample = collector.collect(kEnd);
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->request_count, 42);
    EXPECT_DOUBLE_EQ(sample->input_len, 2000);
    EXPECT_DOUBLE_EQ(sample->output_len, 200);
    EXPECT_DOUBLE_EQ(sample->ttft_ms, 250);
    EXPECT_DOUBLE_EQ(sample->itl_ms, 30);
    EXPECT_EQ(sample->timestamp, kEnd);
    EXPECT_EQ(collector.size(), 1u);
}

TEST(MetricsCollectorTest, IntervalStartIsExclusive) {
    InMemoryMetricsSource source;
    const MetricQueries q;
    pushInterval(source, q, kEnd, 10, 100, 10, 100, 10);
    // Belongs to the previous interval.
    source.push(q.request_count, kEnd - 180s, 1000);

    MetricsCollector collector(source);
    auto sample = collector.collect(kEnd);
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->request_count, 10);
}

TEST(MetricsCollectorTest, MissingSeriesSkipsTheInterval) {
    InMemoryMetricsSource source;
    const MetricQueries q;
    source.push(q.request_count, kEnd - 10s, 5);
    source.push(q.input_len, kEnd - 10s, 100);

    MetricsCollector collector(source);
    EXPECT_FALSE(collector.collect(kEnd).has_value());
    EXPECT_EQ(collector.size(), 0u);
}

TEST(MetricsCollectorTest, NonFiniteValueSkipsTheInterval) {
    InMemoryMetricsSource source;
    const MetricQueries q;
    pushInterval(source, q, kEnd, 10, 100, 10, 100, 10);
    source.push(q.ttft_ms, kEnd - 5s, std::numeric_limits<double>::quiet_NaN());

    MetricsCollector collector(source);
    EXPECT_FALSE(collector.collect(kEnd).has_value());
}

TEST(MetricsCollectorTest, WindowKeepsMostRecentSamples) {
    InMemoryMetricsSource source;
    CollectorConfig config;
    config.window_size = 3;
    MetricsCollector collector(source, config);

    for (int i = 0; i < 5; ++i) {
        MetricsSample s;
        s.request_count = i;
        collector.record(s);
    }
    auto window = collector.window();
    ASSERT_EQ(window.size(), 3u);
    EXPECT_DOUBLE_EQ(window.front().request_count, 2);
    EXPECT_DOUBLE_EQ(collector.latest()->request_count, 4);

    collector.clear();
    EXPECT_FALSE(collector.latest().has_value());
}

TEST(MetricsCollectorTest, CustomQueriesAreUsed) {
    InMemoryMetricsSource source;
    CollectorConfig config;
    config.queries.request_count = "my_requests";
    pushInterval(source, config.queries, kEnd, 8, 100, 10, 100, 10);

    MetricsCollector collector(source, config);
    auto sample = collector.collect(kEnd);
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->request_count, 8);
}

TEST(PrometheusResponseTest, SumsSeriesPerTimestamp) {
    const std::string body = R"({
        "status": "success",
        "data": {
            "resultType": "matrix",
            "result": [
                {"metric": {"instance": "a"}, "values": [[1700000000, "3"], [1700000015, "4"]]},
                {"metric": {"instance": "b"}, "values": [[1700000000, "1.5"]]}
            ]
        }
    })";

    auto values = PrometheusMetricsSource::parseQueryRangeResponse(body);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_DOUBLE_EQ(values[0].value, 4.5);
    EXPECT_DOUBLE_EQ(values[1].value, 4);
    EXPECT_EQ(values[0].timestamp, WallClock::time_point(std::chrono::seconds(1'700'000'000)));
}

TEST(PrometheusResponseTest, KeepsNonFiniteValuesForTheCollectorToReject) {
    const std::string body =
        R"({"status":"success","data":{"result":[{"values":[[1700000000,"NaN"]]}]}})";
    auto values = PrometheusMetricsSource::parseQueryRangeResponse(body);
    ASSERT_EQ(values.size(), 1u);
    EXPECT_TRUE(std::isnan(values[0].value));
}

TEST(PrometheusResponseTest, ErrorsYieldNoSamples) {
    EXPECT_TRUE(PrometheusMetricsSource::parseQueryRangeResponse("garbage").empty());
    EXPECT_TRUE(PrometheusMetricsSource::parseQueryRangeResponse(
                    R"({"status":"error","error":"bad query"})")
                    .empty());
    EXPECT_TRUE(PrometheusMetricsSource::parseQueryRangeResponse(R"({"status":"success"})").empty());
}

}  // namespace
}  // namespace kvplane
