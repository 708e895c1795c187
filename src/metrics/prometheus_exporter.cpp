#include "metrics/prometheus_exporter.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace kvplane::metrics {

namespace {

std::string escape_label(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default: out += c;
        }
    }
    return out;
}

void write_value(std::ostringstream& oss, double v) {
    if (std::isnan(v)) {
        oss << "NaN";
    } else if (std::isinf(v)) {
        oss << (v > 0 ? "+Inf" : "-Inf");
    } else {
        oss << v;
    }
}

double* find_sample(MetricFamily& fam, const Labels& labels) {
    for (auto& [l, v] : fam.samples) {
        if (l == labels) return &v;
    }
    return nullptr;
}

}  // namespace

MetricFamily& PrometheusExporter::family(const std::string& name, MetricType type, const std::string& help) {
    auto it = std::find_if(families_.begin(), families_.end(),
                           [&](const MetricFamily& f) { return f.name == name; });
    if (it == families_.end()) {
        families_.push_back(MetricFamily{name, help, type, {}});
        return families_.back();
    }
    // A name is bound to the type it was first used with; a later mismatch
    // re-types the family rather than emitting two TYPE lines.
    if (it->type != type) {
        it->type = type;
        it->samples.clear();
    }
    if (!help.empty()) it->help = help;
    return *it;
}

void PrometheusExporter::set_gauge(const std::string& name, double value, const std::string& help) {
    set_gauge(name, Labels{}, value, help);
}

void PrometheusExporter::set_gauge(const std::string& name, const Labels& labels, double value,
                                   const std::string& help) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = family(name, MetricType::Gauge, help);
    if (double* v = find_sample(fam, labels)) {
        *v = value;
    } else {
        fam.samples.emplace_back(labels, value);
    }
}

void PrometheusExporter::set_counter(const std::string& name, double value, const std::string& help) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = family(name, MetricType::Counter, help);
    if (double* v = find_sample(fam, {})) {
        *v = value;
    } else {
        fam.samples.emplace_back(Labels{}, value);
    }
}

void PrometheusExporter::inc_counter(const std::string& name, double delta, const std::string& help) {
    inc_counter(name, Labels{}, delta, help);
}

void PrometheusExporter::inc_counter(const std::string& name, const Labels& labels, double delta,
                                     const std::string& help) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = family(name, MetricType::Counter, help);
    if (double* v = find_sample(fam, labels)) {
        *v += delta;
    } else {
        fam.samples.emplace_back(labels, delta);
    }
}

void PrometheusExporter::clear(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& fam : families_) {
        if (fam.name == name) fam.samples.clear();
    }
}

std::optional<double> PrometheusExporter::value_of(const std::string& name, MetricType type,
                                                   const Labels& labels) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& fam : families_) {
        if (fam.name != name || fam.type != type) continue;
        for (const auto& [l, v] : fam.samples) {
            if (l == labels) return v;
        }
    }
    return std::nullopt;
}

std::optional<double> PrometheusExporter::gauge_value(const std::string& name, const Labels& labels) const {
    return value_of(name, MetricType::Gauge, labels);
}

std::optional<double> PrometheusExporter::counter_value(const std::string& name, const Labels& labels) const {
    return value_of(name, MetricType::Counter, labels);
}

std::string PrometheusExporter::render() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;
    for (const auto& fam : families_) {
        if (fam.samples.empty()) continue;
        if (!fam.help.empty()) {
            oss << "# HELP " << fam.name << " " << fam.help << "\n";
        }
        oss << "# TYPE " << fam.name << " " << (fam.type == MetricType::Gauge ? "gauge" : "counter") << "\n";
        for (const auto& [labels, value] : fam.samples) {
            oss << fam.name;
            if (!labels.empty()) {
                oss << "{";
                for (size_t i = 0; i < labels.size(); ++i) {
                    if (i > 0) oss << ",";
                    oss << labels[i].first << "=\"" << escape_label(labels[i].second) << "\"";
                }
                oss << "}";
            }
            oss << " ";
            write_value(oss, value);
            oss << "\n";
        }
    }
    return oss.str();
}

}  // namespace kvplane::metrics
