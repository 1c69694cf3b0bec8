// include/stagewise/observability.hpp
// Purpose: Lightweight metrics for pipeline execution
// Each Pipeline owns its own registry so independent pipelines never share counters

#pragma once

#include "types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace stagewise {

enum class MetricType {
    COUNTER = 0,        // Monotonically increasing (requests, failures)
    GAUGE = 1,          // Current value (in-flight contexts)
    HISTOGRAM = 2       // Value distribution (middleware latencies)
};

std::string metric_type_to_string(MetricType type);

class Metric {
public:
    Metric(const std::string& name, MetricType type)
        : name_(name), type_(type), value_(0.0), count_(0), sum_(0.0), max_(0.0) {}

    void increment(double delta = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ += delta;
        count_++;
    }

    void set(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = value;
    }

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (value > max_) {
            max_ = value;
        }
    }

    double get_value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }
    uint64_t get_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }
    double get_average() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / count_ : 0.0;
    }
    double get_max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    const std::string& get_name() const { return name_; }
    MetricType get_type() const { return type_; }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = 0.0;
        count_ = 0;
        sum_ = 0.0;
        max_ = 0.0;
    }

private:
    std::string name_;
    MetricType type_;
    mutable std::mutex mutex_;
    double value_;
    uint64_t count_;
    double sum_;
    double max_;
};

class MetricsRegistry {
public:
    std::shared_ptr<Metric> counter(const std::string& name) {
        return get_or_create(name, MetricType::COUNTER);
    }

    std::shared_ptr<Metric> gauge(const std::string& name) {
        return get_or_create(name, MetricType::GAUGE);
    }

    std::shared_ptr<Metric> histogram(const std::string& name) {
        return get_or_create(name, MetricType::HISTOGRAM);
    }

    std::shared_ptr<Metric> get(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics_.find(name);
        return it != metrics_.end() ? it->second : nullptr;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metrics_.size();
    }

    // {name: {type, value|count/avg/max}}
    Payload export_json() const;

    void reset_all();

private:
    std::shared_ptr<Metric> get_or_create(const std::string& name, MetricType type);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Metric>> metrics_;
};

// RAII timer observing elapsed microseconds into a histogram
class MetricTimer {
public:
    explicit MetricTimer(std::shared_ptr<Metric> metric)
        : metric_(std::move(metric)), start_(std::chrono::steady_clock::now()) {}

    ~MetricTimer() {
        finish();
    }

    MetricTimer(const MetricTimer&) = delete;
    MetricTimer& operator=(const MetricTimer&) = delete;

    // Manual finish
    void finish() {
        if (metric_) {
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_).count();
            metric_->observe(static_cast<double>(duration));
            metric_.reset();
        }
    }

private:
    std::shared_ptr<Metric> metric_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace stagewise
