// src/observability.cpp
// Implementation of the metrics registry export paths

#include "stagewise/observability.hpp"

namespace stagewise {

std::string metric_type_to_string(MetricType type) {
    switch (type) {
        case MetricType::COUNTER: return "counter";
        case MetricType::GAUGE: return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
        default: return "unknown";
    }
}

std::shared_ptr<Metric> MetricsRegistry::get_or_create(const std::string& name, MetricType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        return it->second;
    }

    auto metric = std::make_shared<Metric>(name, type);
    metrics_[name] = metric;
    return metric;
}

Payload MetricsRegistry::export_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Payload result = Payload::object();

    for (const auto& [name, metric] : metrics_) {
        Payload entry{{"type", metric_type_to_string(metric->get_type())}};
        if (metric->get_type() == MetricType::HISTOGRAM) {
            entry["count"] = metric->get_count();
            entry["avg"] = metric->get_average();
            entry["max"] = metric->get_max();
        } else {
            entry["value"] = metric->get_value();
        }
        result[name] = std::move(entry);
    }
    return result;
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, metric] : metrics_) {
        metric->reset();
    }
}

} // namespace stagewise
