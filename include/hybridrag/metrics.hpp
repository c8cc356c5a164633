#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace hybridrag {

using Labels = std::map<std::string, std::string>;

/**
 * Process-wide in-memory metrics registry with Prometheus text export.
 *
 * Series are keyed by name plus label set. Histograms keep a bounded window
 * of recent samples and export as a summary (quantiles, sum, count).
 */
class Metrics {
public:
    static Metrics& getInstance();

    // Counter operations
    void increment_counter(const std::string& name, const Labels& labels = {});
    void increment_counter(const std::string& name, const Labels& labels, std::int64_t value);
    std::int64_t counter_value(const std::string& name, const Labels& labels = {}) const;

    // Gauge operations
    void set_gauge(const std::string& name, double value, const Labels& labels = {});
    void increment_gauge(const std::string& name, double value, const Labels& labels = {});
    void decrement_gauge(const std::string& name, double value, const Labels& labels = {});
    double gauge_value(const std::string& name, const Labels& labels = {}) const;

    // Histogram operations
    void record_histogram(const std::string& name, double value, const Labels& labels = {});
    std::size_t histogram_count(const std::string& name, const Labels& labels = {}) const;

    // Records elapsed milliseconds into a histogram when stopped or destroyed.
    class Timer {
    public:
        explicit Timer(const std::string& name, const Labels& labels = {});
        ~Timer();

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

        double stop();

    private:
        std::string name_;
        Labels labels_;
        std::chrono::steady_clock::time_point start_;
        bool stopped_;
    };

    // Export metrics in Prometheus format
    std::string export_prometheus() const;

    // Drops every series. Used between tests.
    void reset();

private:
    Metrics();
    ~Metrics();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Convenience macro for scoped timers
#define HYBRIDRAG_METRICS_TIMER(name) ::hybridrag::Metrics::Timer timer_##name(#name)

} // namespace hybridrag
