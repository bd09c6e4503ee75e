#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace phub::common::metrics {

// Process-wide counters, gauges and operation timings for the feed pipeline.
class Registry {
private:
    class ScopedTimerImpl;

public:
    struct TimingSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimingSnapshot> timings;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;

        std::uint64_t counter(const std::string& key) const;
        double gauge(const std::string& key) const;
    };

    // Records the lifetime of the object as one sample of the named operation.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string operation);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void addGauge(const std::string& gaugeKey, double delta);
    Snapshot snapshot() const;

private:
    struct TimingMetrics {
        mutable std::mutex samplesMutex;
        std::vector<double> samplesMs;

        void addSample(double latencyMs);
        std::vector<double> copySamples() const;
    };

    struct CounterMetrics {
        std::uint64_t value{0};
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string operation);
        ~ScopedTimerImpl();

    private:
        TimingMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    TimingMetrics& ensureTimingMetrics(const std::string& operation);
    void storeGaugeLocked_(GaugeMetrics& gauge, double value);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<TimingMetrics>> timings_;
    std::unordered_map<std::string, CounterMetrics> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace phub::common::metrics
