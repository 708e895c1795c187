#include <gtest/gtest.h>

#include <cmath>

#include "metrics/prometheus_exporter.h"

using kvplane::metrics::PrometheusExporter;

TEST(PrometheusExporterTest, RendersGaugesAndCounters) {
    PrometheusExporter exporter;
    exporter.set_gauge("kvplane_planner_prefill_replicas", 3, "Desired prefill replicas");
    exporter.inc_counter("kvplane_router_decisions_total", 1, "Routing decisions made");
    exporter.inc_counter("kvplane_router_decisions_total");

    auto text = exporter.render();
    EXPECT_NE(text.find("# HELP kvplane_planner_prefill_replicas Desired prefill replicas\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE kvplane_planner_prefill_replicas gauge\nkvplane_planner_prefill_replicas 3\n"),
              std::string::npos);
    EXPECT_NE(text.find("# TYPE kvplane_router_decisions_total counter\nkvplane_router_decisions_total 2\n"),
              std::string::npos);
}

TEST(PrometheusExporterTest, SetGaugeOverwrites) {
    PrometheusExporter exporter;
    exporter.set_gauge("g", 1);
    exporter.set_gauge("g", 5);
    EXPECT_EQ(exporter.gauge_value("g").value_or(0), 5.0);
    EXPECT_FALSE(exporter.gauge_value("missing").has_value());
}

TEST(PrometheusExporterTest, SetCounterReplacesValue) {
    PrometheusExporter exporter;
    exporter.inc_counter("c", 3);
    exporter.set_counter("c", 10);
    exporter.inc_counter("c", 0.5);
    EXPECT_EQ(exporter.counter_value("c").value_or(0), 10.5);
}

TEST(PrometheusExporterTest, MetricsWithoutHelpOmitHelpLine) {
    PrometheusExporter exporter;
    exporter.set_gauge("bare", 1);
    auto text = exporter.render();
    EXPECT_EQ(text.find("# HELP"), std::string::npos);
    EXPECT_NE(text.find("# TYPE bare gauge"), std::string::npos);
}

TEST(PrometheusExporterTest, LabelledSamplesShareOneFamily) {
    PrometheusExporter exporter;
    exporter.set_gauge("kvplane_router_active_decode_blocks", {{"worker_id", "1"}, {"dp_rank", "0"}}, 4,
                       "Reserved decode blocks per worker");
    exporter.set_gauge("kvplane_router_active_decode_blocks", {{"worker_id", "2"}, {"dp_rank", "0"}}, 7);

    auto text = exporter.render();
    EXPECT_NE(text.find("kvplane_router_active_decode_blocks{worker_id=\"1\",dp_rank=\"0\"} 4\n"
                        "kvplane_router_active_decode_blocks{worker_id=\"2\",dp_rank=\"0\"} 7\n"),
              std::string::npos);
    EXPECT_EQ(text.find("# TYPE kvplane_router_active_decode_blocks"),
              text.rfind("# TYPE kvplane_router_active_decode_blocks"));
    EXPECT_EQ(exporter.gauge_value("kvplane_router_active_decode_blocks", {{"worker_id", "2"}, {"dp_rank", "0"}})
                  .value_or(0),
              7.0);
    EXPECT_FALSE(exporter.gauge_value("kvplane_router_active_decode_blocks").has_value());
}

TEST(PrometheusExporterTest, EscapesLabelValues) {
    PrometheusExporter exporter;
    exporter.inc_counter("c", {{"path", "a\"b\\c\nd"}}, 1);
    EXPECT_NE(exporter.render().find("c{path=\"a\\\"b\\\\c\\nd\"} 1\n"), std::string::npos);
}

TEST(PrometheusExporterTest, RendersNonFiniteValues) {
    PrometheusExporter exporter;
    exporter.set_gauge("nan_gauge", std::nan(""));
    exporter.set_gauge("inf_gauge", HUGE_VAL);
    auto text = exporter.render();
    EXPECT_NE(text.find("nan_gauge NaN\n"), std::string::npos);
    EXPECT_NE(text.find("inf_gauge +Inf\n"), std::string::npos);
}

TEST(PrometheusExporterTest, ClearedFamilyIsNotRendered) {
    PrometheusExporter exporter;
    exporter.set_gauge("g", {{"worker_id", "1"}}, 1);
    exporter.clear("g");
    EXPECT_EQ(exporter.render().find("# TYPE g"), std::string::npos);
    exporter.set_gauge("g", {{"worker_id", "2"}}, 2);
    EXPECT_FALSE(exporter.gauge_value("g", {{"worker_id", "1"}}).has_value());
    EXPECT_EQ(exporter.gauge_value("g", {{"worker_id", "2"}}).value_or(0), 2.0);
}

TEST(PrometheusExporterTest, GaugeAndCounterLookupsAreTyped) {
    PrometheusExporter exporter;
    exporter.inc_counter("requests", 2);
    EXPECT_FALSE(exporter.gauge_value("requests").has_value());
    EXPECT_EQ(exporter.counter_value("requests").value_or(0), 2.0);
}
