#pragma once

/**
@file
@brief Defines `vitrine::preview::Performance`, which samples view and update call durations.
*/

#include <vitrine/core/types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace vitrine::preview {

using Duration = std::chrono::nanoseconds;

/// @brief Maximum number of samples retained per sequence. Once reached, further samples are discarded.
inline constexpr usize kMaxSamples = 1'000'000;

/// @brief Calls taking longer than this are counted as slow. One frame at 120 Hz.
inline constexpr Duration kSlowCallThreshold = std::chrono::microseconds{8'333};

/// @brief Upper p90 bound for a healthy indicator.
inline constexpr Duration kHealthyP90 = std::chrono::microseconds{4'000};

/// @brief Upper p90 bound for a degraded indicator. Anything above is severe.
inline constexpr Duration kDegradedP90 = std::chrono::microseconds{8'000};

/// @brief Slow call percentage below which calls may be healthy.
inline constexpr float64 kHealthySlowCallPercentage = 1.0;

/// @brief Slow call percentage below which calls may be degraded. Anything above is severe.
inline constexpr float64 kDegradedSlowCallPercentage = 5.0;

/// @brief Health classification of a set of samples.
///
/// Ordered by severity; `Combine` relies on this ordering.
enum class Indicator : uint8 { Unknown, Healthy, Degraded, Severe };

const char *IndicatorName(Indicator indicator);

/// @brief Returns the worse of the two indicators.
Indicator Combine(Indicator lhs, Indicator rhs);

/// @brief Statistics derived from a sequence of samples.
struct Stats {
    usize count = 0;
    std::optional<Duration> last;
    std::optional<Duration> avg;
    std::optional<Duration> min;
    std::optional<Duration> max;
    std::optional<Duration> p50;
    std::optional<Duration> p90;
    std::optional<Duration> p99;
    usize slowCallCount = 0;

    /// @brief Percentage of samples exceeding `kSlowCallThreshold`, between 0 and 100.
    [[nodiscard]] float64 SlowCallPercentage() const;

    /// @brief Classifies these statistics.
    ///
    /// p90 is the primary signal with the slow call percentage as a secondary one:
    /// - Healthy: p90 <= 4 ms and less than 1% slow calls
    /// - Degraded: p90 <= 8 ms and less than 5% slow calls
    /// - Severe: anything else
    /// - Unknown: no samples
    [[nodiscard]] Indicator GetIndicator() const;
};

/// @brief Computes statistics over the given samples.
///
/// Percentiles are read from a sorted copy at index `floor(p * n / 100)`, clamped to the last index.
Stats ComputeStats(std::span<const Duration> samples);

/// @brief Formats a duration for display as whole microseconds below 1 ms, milliseconds below 1 s and seconds
/// otherwise, with two decimals for the latter two. Missing durations are shown as "-".
std::string FormatDuration(std::optional<Duration> duration);

/// @brief Records durations of view and update calls of a preview.
///
/// View calls are recorded from const contexts, so the view sequence is mutable.
class Performance {
public:
    /// @brief Times a view call and records its duration.
    /// @return the result of `fn`
    template <typename TFn>
    decltype(auto) RecordView(TFn &&fn) const {
        return Timed(m_viewTimes, std::forward<TFn>(fn));
    }

    /// @brief Times an update call and records its duration.
    /// @return the result of `fn`
    template <typename TFn>
    decltype(auto) RecordUpdate(TFn &&fn) {
        return Timed(m_updateTimes, std::forward<TFn>(fn));
    }

    void AddViewSample(Duration duration) const;
    void AddUpdateSample(Duration duration);

    /// @brief Clears both sequences.
    void Reset();

    [[nodiscard]] usize ViewCount() const {
        return m_viewTimes.size();
    }

    [[nodiscard]] usize UpdateCount() const {
        return m_updateTimes.size();
    }

    [[nodiscard]] Stats ViewStats() const;
    [[nodiscard]] Stats UpdateStats() const;

    /// @brief The worse of the view and update indicators.
    [[nodiscard]] Indicator OverallIndicator() const;

private:
    mutable std::vector<Duration> m_viewTimes;
    std::vector<Duration> m_updateTimes;

    static void Append(std::vector<Duration> &samples, Duration duration);

    /// Samples are recorded once `fn` returns. A throwing call records nothing.
    template <typename TFn>
    static decltype(auto) Timed(std::vector<Duration> &samples, TFn &&fn) {
        const auto start = std::chrono::steady_clock::now();
        const auto elapsed = [&] {
            return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        };
        if constexpr (std::is_void_v<std::invoke_result_t<TFn>>) {
            std::invoke(std::forward<TFn>(fn));
            Append(samples, elapsed());
        } else {
            decltype(auto) result = std::invoke(std::forward<TFn>(fn));
            Append(samples, elapsed());
            return result;
        }
    }
};

} // namespace vitrine::preview
