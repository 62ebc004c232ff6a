#include "threnody/metrics.hpp"

#include <algorithm>
#include <deque>
#include <iomanip>
#include <map>
#include <mutex>
#include <numeric>
#include <sstream>
#include <vector>

namespace threnody {

namespace {
constexpr size_t kHistogramWindow = 1024;
}

class Metrics::Impl {
public:
    std::map<std::string, int64_t> counters;
    std::map<std::string, double> gauges;
    std::map<std::string, std::deque<double>> histograms;
    mutable std::mutex metrics_mutex;
};

Metrics::Metrics() : pImpl(std::make_unique<Impl>()) {}

Metrics::~Metrics() = default;

Metrics& Metrics::getInstance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment_counter(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters[name] += value;
}

int64_t Metrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->counters.find(name);
    return it == pImpl->counters.end() ? 0 : it->second;
}

void Metrics::set_gauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->gauges[name] = value;
}

double Metrics::gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->gauges.find(name);
    return it == pImpl->gauges.end() ? 0.0 : it->second;
}

void Metrics::record_histogram(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto& samples = pImpl->histograms[name];
    samples.push_back(value);
    if (samples.size() > kHistogramWindow) {
        samples.pop_front();
    }
}

Metrics::Timer::Timer(const std::string& name)
    : name_(name), start_(std::chrono::steady_clock::now()), stopped_(false) {}

Metrics::Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

void Metrics::Timer::stop() {
    if (!stopped_) {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        Metrics::getInstance().record_histogram(name_, static_cast<double>(duration));
        stopped_ = true;
    }
}

std::string Metrics::export_prometheus() const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    std::ostringstream oss;

    for (const auto& pair : pImpl->counters) {
        oss << "# TYPE threnody_" << pair.first << " counter\n";
        oss << "threnody_" << pair.first << " " << pair.second << "\n";
    }

    for (const auto& pair : pImpl->gauges) {
        oss << "# TYPE threnody_" << pair.first << " gauge\n";
        oss << "threnody_" << pair.first << " " << std::fixed << std::setprecision(6) << pair.second << "\n";
    }

    for (const auto& pair : pImpl->histograms) {
        std::vector<double> sorted(pair.second.begin(), pair.second.end());
        std::sort(sorted.begin(), sorted.end());
        auto quantile = [&sorted](double q) {
            if (sorted.empty()) return 0.0;
            size_t idx = std::min(sorted.size() - 1, static_cast<size_t>(q * sorted.size()));
            return sorted[idx];
        };
        oss << "# TYPE threnody_" << pair.first << " summary\n";
        oss << "threnody_" << pair.first << "{quantile=\"0.5\"} " << quantile(0.5) << "\n";
        oss << "threnody_" << pair.first << "{quantile=\"0.9\"} " << quantile(0.9) << "\n";
        oss << "threnody_" << pair.first << "{quantile=\"0.99\"} " << quantile(0.99) << "\n";
        oss << "threnody_" << pair.first << "_sum " << std::accumulate(sorted.begin(), sorted.end(), 0.0) << "\n";
        oss << "threnody_" << pair.first << "_count " << sorted.size() << "\n";
    }

    return oss.str();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters.clear();
    pImpl->gauges.clear();
    pImpl->histograms.clear();
}

} // namespace threnody
