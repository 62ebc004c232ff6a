#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace threnody {

class Metrics {
public:
    static Metrics& getInstance();

    // Counter operations
    void increment_counter(const std::string& name, int64_t value = 1);
    int64_t counter(const std::string& name) const;

    // Gauge operations
    void set_gauge(const std::string& name, double value);
    double gauge(const std::string& name) const;

    // Histogram operations; only a bounded window of recent samples is kept
    void record_histogram(const std::string& name, double value);

    class Timer {
    public:
        explicit Timer(const std::string& name);
        ~Timer();

        void stop();

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_;
        bool stopped_;
    };

    // Export metrics in Prometheus text format
    std::string export_prometheus() const;

    void reset();

private:
    Metrics();
    ~Metrics();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

#define METRICS_TIMER(name) threnody::Metrics::Timer timer_##name(#name)

} // namespace threnody
