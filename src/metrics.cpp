#include "hybridrag/metrics.hpp"

#include <algorithm>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace hybridrag {
namespace {

constexpr std::size_t kHistogramWindow = 2048;
constexpr const char* kPrefix = "hybridrag_";

using SeriesKey = std::pair<std::string, Labels>;

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

std::string format_labels(const Labels& labels, const std::string& extra = "") {
    if (labels.empty() && extra.empty()) {
        return "";
    }
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& label : labels) {
        if (!first) oss << ',';
        oss << label.first << "=\"" << escape_label(label.second) << '"';
        first = false;
    }
    if (!extra.empty()) {
        if (!first) oss << ',';
        oss << extra;
    }
    oss << '}';
    return oss.str();
}

double quantile(std::vector<double> sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    std::size_t index = static_cast<std::size_t>(q * static_cast<double>(sorted.size() - 1) + 0.5);
    return sorted[std::min(index, sorted.size() - 1)];
}

} // namespace

class Metrics::Impl {
public:
    std::map<SeriesKey, std::int64_t> counters;
    std::map<SeriesKey, double> gauges;
    std::map<SeriesKey, std::deque<double>> histograms;
    std::map<SeriesKey, std::uint64_t> histogram_totals;
    std::map<SeriesKey, double> histogram_sums;
    mutable std::mutex metrics_mutex;

    void increment_counter(const std::string& name, const Labels& labels, std::int64_t value);
    void add_gauge(const std::string& name, double delta, const Labels& labels);
    void set_gauge(const std::string& name, double value, const Labels& labels);
    void record_histogram(const std::string& name, double value, const Labels& labels);
    std::string export_prometheus() const;
};

Metrics::Metrics() : pImpl(std::make_unique<Impl>()) {}

Metrics::~Metrics() = default;

Metrics& Metrics::getInstance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment_counter(const std::string& name, const Labels& labels) {
    pImpl->increment_counter(name, labels, 1);
}

void Metrics::increment_counter(const std::string& name, const Labels& labels, std::int64_t value) {
    pImpl->increment_counter(name, labels, value);
}

std::int64_t Metrics::counter_value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->counters.find({name, labels});
    return it == pImpl->counters.end() ? 0 : it->second;
}

void Metrics::Impl::increment_counter(const std::string& name, const Labels& labels, std::int64_t value) {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    counters[{name, labels}] += value;
}

void Metrics::set_gauge(const std::string& name, double value, const Labels& labels) {
    pImpl->set_gauge(name, value, labels);
}

void Metrics::Impl::set_gauge(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    gauges[{name, labels}] = value;
}

void Metrics::Impl::add_gauge(const std::string& name, double delta, const Labels& labels) {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    gauges[{name, labels}] += delta;
}

void Metrics::increment_gauge(const std::string& name, double value, const Labels& labels) {
    pImpl->add_gauge(name, value, labels);
}

void Metrics::decrement_gauge(const std::string& name, double value, const Labels& labels) {
    pImpl->add_gauge(name, -value, labels);
}

double Metrics::gauge_value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->gauges.find({name, labels});
    return it == pImpl->gauges.end() ? 0.0 : it->second;
}

void Metrics::record_histogram(const std::string& name, double value, const Labels& labels) {
    pImpl->record_histogram(name, value, labels);
}

void Metrics::Impl::record_histogram(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    SeriesKey key{name, labels};
    auto& window = histograms[key];
    window.push_back(value);
    if (window.size() > kHistogramWindow) {
        window.pop_front();
    }
    histogram_totals[key] += 1;
    histogram_sums[key] += value;
}

std::size_t Metrics::histogram_count(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->histogram_totals.find({name, labels});
    return it == pImpl->histogram_totals.end() ? 0 : static_cast<std::size_t>(it->second);
}

Metrics::Timer::Timer(const std::string& name, const Labels& labels)
    : name_(name), labels_(labels), start_(std::chrono::steady_clock::now()), stopped_(false) {}

Metrics::Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

double Metrics::Timer::stop() {
    auto end = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start_).count();
    if (!stopped_) {
        Metrics::getInstance().record_histogram(name_, ms, labels_);
        stopped_ = true;
    }
    return ms;
}

std::string Metrics::export_prometheus() const {
    return pImpl->export_prometheus();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters.clear();
    pImpl->gauges.clear();
    pImpl->histograms.clear();
    pImpl->histogram_totals.clear();
    pImpl->histogram_sums.clear();
}

std::string Metrics::Impl::export_prometheus() const {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    std::ostringstream oss;
    std::string last_type;

    // Export counters
    for (const auto& pair : counters) {
        const std::string metric = kPrefix + pair.first.first + "_total";
        if (metric != last_type) {
            oss << "# TYPE " << metric << " counter\n";
            last_type = metric;
        }
        oss << metric << format_labels(pair.first.second) << ' ' << pair.second << '\n';
    }

    // Export gauges
    for (const auto& pair : gauges) {
        const std::string metric = kPrefix + pair.first.first;
        if (metric != last_type) {
            oss << "# TYPE " << metric << " gauge\n";
            last_type = metric;
        }
        oss << metric << format_labels(pair.first.second) << ' '
            << std::fixed << std::setprecision(6) << pair.second << '\n';
    }

    // Export histograms
    for (const auto& pair : histograms) {
        const std::string metric = kPrefix + pair.first.first;
        if (metric != last_type) {
            oss << "# TYPE " << metric << " summary\n";
            last_type = metric;
        }
        std::vector<double> sorted(pair.second.begin(), pair.second.end());
        std::sort(sorted.begin(), sorted.end());
        const Labels& labels = pair.first.second;
        oss << std::fixed << std::setprecision(3);
        oss << metric << format_labels(labels, "quantile=\"0.5\"") << ' ' << quantile(sorted, 0.5) << '\n';
        oss << metric << format_labels(labels, "quantile=\"0.9\"") << ' ' << quantile(sorted, 0.9) << '\n';
        oss << metric << format_labels(labels, "quantile=\"0.99\"") << ' ' << quantile(sorted, 0.99) << '\n';
        oss << metric << "_sum" << format_labels(labels) << ' ' << histogram_sums.at(pair.first) << '\n';
        oss << metric << "_count" << format_labels(labels) << ' ' << histogram_totals.at(pair.first) << '\n';
    }

    return oss.str();
}

} // namespace hybridrag
