#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace phub::common::metrics {
namespace {

// Samples kept per operation; older samples are discarded first.
constexpr std::size_t kMaxSamples = 4096;

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string operation)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(operation))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey].value += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    storeGaugeLocked_(gauges_[gaugeKey], value);
}

void Registry::addGauge(const std::string& gaugeKey, double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    storeGaugeLocked_(gauge, gauge.value + delta);
}

void Registry::storeGaugeLocked_(GaugeMetrics& gauge, double value) {
    const auto now = std::chrono::steady_clock::now();
    gauge.value = value;
    gauge.updatedAt = now;
    if (value == 0.0) {
        if (!gauge.zeroSince.has_value()) {
            gauge.zeroSince = now;
        }
    }
    else {
        gauge.zeroSince.reset();
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.timings.reserve(timings_.size());
    for (const auto& [operation, metricsPtr] : timings_) {
        TimingSnapshot timing;
        auto samples = metricsPtr->copySamples();
        timing.samples = samples.size();
        if (!samples.empty()) {
            std::sort(samples.begin(), samples.end());
            timing.p50Ms = computeQuantile(samples, 0.50);
            timing.p95Ms = computeQuantile(samples, 0.95);
            timing.maxMs = samples.back();
        }
        snapshot.timings.emplace(operation, std::move(timing));
    }

    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, counter] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{counter.value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(
            key,
            GaugeSnapshot{gauge.value, gauge.updatedAt, gauge.zeroSince});
    }

    return snapshot;
}

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it == counters.end() ? 0U : it->second.value;
}

double Registry::Snapshot::gauge(const std::string& key) const {
    const auto it = gauges.find(key);
    return it == gauges.end() ? 0.0 : it->second.value;
}

void Registry::TimingMetrics::addSample(double latencyMs) {
    std::lock_guard<std::mutex> lock(samplesMutex);
    if (samplesMs.size() >= kMaxSamples) {
        samplesMs.erase(samplesMs.begin());
    }
    samplesMs.push_back(latencyMs);
}

std::vector<double> Registry::TimingMetrics::copySamples() const {
    std::lock_guard<std::mutex> lock(samplesMutex);
    return samplesMs;
}

Registry::TimingMetrics& Registry::ensureTimingMetrics(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timings_.try_emplace(operation, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimingMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string operation)
    : metrics_(&registry.ensureTimingMetrics(operation)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->addSample(duration.count());
}

}  // namespace phub::common::metrics
