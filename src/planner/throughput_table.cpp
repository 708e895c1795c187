#include "planner/throughput_table.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>

#include <spdlog/spdlog.h>

namespace kvplane {

double interpolateClamped(const std::vector<double>& xs, const std::vector<double>& ys, double x) {
    if (xs.empty()) {
        return 0.0;
    }
    if (x <= xs.front()) {
        return ys.front();
    }
    if (x >= xs.back()) {
        return ys.back();
    }
    auto upper = std::upper_bound(xs.begin(), xs.end(), x);
    size_t hi = static_cast<size_t>(upper - xs.begin());
    size_t lo = hi - 1;
    const double span = xs[hi] - xs[lo];
    if (span <= 0.0) {
        return ys[lo];
    }
    const double t = (x - xs[lo]) / span;
    return ys[lo] + t * (ys[hi] - ys[lo]);
}

PrefillThroughputTable::PrefillThroughputTable(std::vector<PrefillProfilePoint> points) : points_(std::move(points)) {
    std::sort(points_.begin(), points_.end(),
              [](const PrefillProfilePoint& a, const PrefillProfilePoint& b) { return a.isl < b.isl; });
}

double PrefillThroughputTable::throughputPerGpu(double isl) const {
    std::vector<double> xs, ys;
    for (const auto& p : points_) {
        xs.push_back(p.isl);
        ys.push_back(p.throughput_per_gpu);
    }
    return interpolateClamped(xs, ys, isl);
}

double PrefillThroughputTable::ttftMs(double isl) const {
    std::vector<double> xs, ys;
    for (const auto& p : points_) {
        xs.push_back(p.isl);
        ys.push_back(p.ttft_ms);
    }
    return interpolateClamped(xs, ys, isl);
}

DecodeThroughputTable::DecodeThroughputTable(std::vector<DecodeProfilePoint> points) {
    std::map<double, std::vector<std::pair<double, double>>> grouped;
    for (const auto& p : points) {
        grouped[p.context_length].emplace_back(p.itl_ms, p.throughput_per_gpu);
    }
    for (auto& [context, samples] : grouped) {
        std::sort(samples.begin(), samples.end());
        Curve curve{context, {}, {}};
        for (const auto& [itl, tput] : samples) {
            curve.itl_ms.push_back(itl);
            curve.throughput.push_back(tput);
        }
        curves_.push_back(std::move(curve));
    }
}

double DecodeThroughputTable::throughputPerGpu(double itl_ms, double context_length) const {
    std::vector<double> contexts, tputs;
    contexts.reserve(curves_.size());
    tputs.reserve(curves_.size());
    for (const auto& curve : curves_) {
        contexts.push_back(curve.context_length);
        tputs.push_back(interpolateClamped(curve.itl_ms, curve.throughput, itl_ms));
    }
    return interpolateClamped(contexts, tputs, context_length);
}

std::optional<ThroughputProfile> parseThroughputProfile(const nlohmann::json& j) {
    try {
        std::vector<PrefillProfilePoint> prefill;
        for (const auto& p : j.at("prefill")) {
            prefill.push_back(PrefillProfilePoint{p.at("isl").get<double>(), p.value("ttft_ms", 0.0),
                                                  p.at("throughput_per_gpu").get<double>()});
        }
        std::vector<DecodeProfilePoint> decode;
        for (const auto& p : j.at("decode")) {
            decode.push_back(DecodeProfilePoint{p.at("context_length").get<double>(), p.at("itl_ms").get<double>(),
                                                p.at("throughput_per_gpu").get<double>()});
        }
        if (prefill.empty() || decode.empty()) {
            spdlog::warn("Throughput profile needs at least one prefill and one decode point");
            return std::nullopt;
        }
        return ThroughputProfile{PrefillThroughputTable(std::move(prefill)), DecodeThroughputTable(std::move(decode))};
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid throughput profile: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ThroughputProfile> loadThroughputProfile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        spdlog::error("Cannot open throughput profile {}", path);
        return std::nullopt;
    }
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse throughput profile {}: {}", path, e.what());
        return std::nullopt;
    }
    auto profile = parseThroughputProfile(j);
    if (profile) {
        spdlog::info("Loaded throughput profile {} ({} prefill points)", path, profile->prefill.points().size());
    }
    return profile;
}

}  // namespace kvplane
