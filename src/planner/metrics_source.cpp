#include "planner/metrics_source.h"

#include <cmath>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/url_encode.h"

namespace kvplane {

namespace {

double toUnixSeconds(WallClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

WallClock::time_point fromUnixSeconds(double seconds) {
    return WallClock::time_point(
        std::chrono::duration_cast<WallClock::duration>(std::chrono::duration<double>(seconds)));
}

double parseSampleValue(const nlohmann::json& value) {
    // Prometheus encodes values as strings ("NaN", "+Inf" included).
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

}  // namespace

PrometheusMetricsSource::PrometheusMetricsSource(std::string base_url, std::chrono::seconds step,
                                                 std::chrono::seconds timeout)
    : base_url_(std::move(base_url))
    , step_(step.count() > 0 ? step : std::chrono::seconds(15))
    , timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::vector<TimedValue> PrometheusMetricsSource::queryRange(const std::string& metric,
                                                            WallClock::time_point start,
                                                            WallClock::time_point end) {
    httplib::Client client(base_url_);
    client.set_connection_timeout(static_cast<time_t>(timeout_.count()), 0);
    client.set_read_timeout(static_cast<time_t>(timeout_.count()), 0);

    const std::string path = "/api/v1/query_range" +
                             buildQueryString({{"query", metric},
                                               {"start", fmt::format("{:.3f}", toUnixSeconds(start))},
                                               {"end", fmt::format("{:.3f}", toUnixSeconds(end))},
                                               {"step", std::to_string(step_.count()) + "s"}});
    auto res = client.Get(path);
    if (!res) {
        spdlog::warn("Prometheus query '{}' failed: {}", metric, httplib::to_string(res.error()));
        return {};
    }
    if (res->status != 200) {
        spdlog::warn("Prometheus query '{}' returned HTTP {}", metric, res->status);
        return {};
    }
    return parseQueryRangeResponse(res->body);
}

std::vector<TimedValue> PrometheusMetricsSource::parseQueryRangeResponse(const std::string& body) {
    std::map<double, double> summed;
    try {
        auto j = nlohmann::json::parse(body);
        if (j.value("status", "") != "success") {
            spdlog::warn("Prometheus query_range error: {}", j.value("error", "unknown"));
            return {};
        }
        const auto& result = j.at("data").at("result");
        for (const auto& series : result) {
            if (!series.contains("values")) {
                continue;
            }
            for (const auto& pair : series["values"]) {
                if (!pair.is_array() || pair.size() != 2) {
                    continue;
                }
                summed[pair[0].get<double>()] += parseSampleValue(pair[1]);
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Malformed Prometheus query_range response: {}", e.what());
        return {};
    }

    std::vector<TimedValue> out;
    out.reserve(summed.size());
    for (const auto& [ts, value] : summed) {
        out.push_back(TimedValue{fromUnixSeconds(ts), value});
    }
    return out;
}

void InMemoryMetricsSource::push(const std::string& metric, WallClock::time_point timestamp, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_[metric].emplace(timestamp, value);
}

void InMemoryMetricsSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    series_.clear();
}

std::vector<TimedValue> InMemoryMetricsSource::queryRange(const std::string& metric,
                                                          WallClock::time_point start,
                                                          WallClock::time_point end) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TimedValue> out;
    auto it = series_.find(metric);
    if (it == series_.end()) {
        return out;
    }
    for (auto sit = it->second.lower_bound(start); sit != it->second.end() && sit->first <= end; ++sit) {
        out.push_back(TimedValue{sit->first, sit->second});
    }
    return out;
}

}  // namespace kvplane
