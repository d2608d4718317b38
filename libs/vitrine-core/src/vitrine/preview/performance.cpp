#include <vitrine/preview/performance.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace vitrine::preview {

namespace {

    Duration Percentile(std::span<const Duration> sorted, usize p) {
        const usize index = std::min(p * sorted.size() / 100, sorted.size() - 1);
        return sorted[index];
    }

} // namespace

const char *IndicatorName(Indicator indicator) {
    switch (indicator) {
    case Indicator::Unknown: return "Unknown";
    case Indicator::Healthy: return "Healthy";
    case Indicator::Degraded: return "Degraded";
    case Indicator::Severe: return "Severe";
    }
    return "Unknown";
}

Indicator Combine(Indicator lhs, Indicator rhs) {
    return std::max(lhs, rhs);
}

float64 Stats::SlowCallPercentage() const {
    if (count == 0) {
        return 0.0;
    }
    return static_cast<float64>(slowCallCount) / static_cast<float64>(count) * 100.0;
}

Indicator Stats::GetIndicator() const {
    if (!p90) {
        return Indicator::Unknown;
    }

    const float64 slowPercentage = SlowCallPercentage();
    if (*p90 <= kHealthyP90 && slowPercentage < kHealthySlowCallPercentage) {
        return Indicator::Healthy;
    }
    if (*p90 <= kDegradedP90 && slowPercentage < kDegradedSlowCallPercentage) {
        return Indicator::Degraded;
    }
    return Indicator::Severe;
}

Stats ComputeStats(std::span<const Duration> samples) {
    Stats stats{};
    stats.count = samples.size();
    if (samples.empty()) {
        return stats;
    }

    std::vector<Duration> sorted{samples.begin(), samples.end()};
    std::sort(sorted.begin(), sorted.end());

    const Duration total = std::accumulate(sorted.begin(), sorted.end(), Duration::zero());

    stats.last = samples.back();
    stats.avg = total / static_cast<Duration::rep>(sorted.size());
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.p50 = Percentile(sorted, 50);
    stats.p90 = Percentile(sorted, 90);
    stats.p99 = Percentile(sorted, 99);
    stats.slowCallCount = static_cast<usize>(
        std::count_if(sorted.begin(), sorted.end(), [](Duration d) { return d > kSlowCallThreshold; }));
    return stats;
}

std::string FormatDuration(std::optional<Duration> duration) {
    if (!duration) {
        return "-";
    }
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(*duration).count();
    if (micros < 1'000) {
        return fmt::format("{}\u00B5s", micros);
    }
    if (micros < 1'000'000) {
        return fmt::format("{:.2f}ms", static_cast<float64>(micros) / 1'000.0);
    }
    return fmt::format("{:.2f}s", static_cast<float64>(micros) / 1'000'000.0);
}

void Performance::Append(std::vector<Duration> &samples, Duration duration) {
    if (samples.size() < kMaxSamples) {
        samples.push_back(duration);
    }
}

void Performance::AddViewSample(Duration duration) const {
    Append(m_viewTimes, duration);
}

void Performance::AddUpdateSample(Duration duration) {
    Append(m_updateTimes, duration);
}

void Performance::Reset() {
    m_viewTimes.clear();
    m_updateTimes.clear();
}

Stats Performance::ViewStats() const {
    return ComputeStats(m_viewTimes);
}

Stats Performance::UpdateStats() const {
    return ComputeStats(m_updateTimes);
}

Indicator Performance::OverallIndicator() const {
    return Combine(ViewStats().GetIndicator(), UpdateStats().GetIndicator());
}

} // namespace vitrine::preview
