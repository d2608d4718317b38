#include <catch2/catch_test_macros.hpp>

#include <vitrine/preview/performance.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace vitrine;
using namespace vitrine::preview;
using namespace std::chrono_literals;

namespace performance {

TEST_CASE("Stats of no samples are unknown", "[performance][stats]") {
    const Stats stats = ComputeStats({});
    CHECK(stats.count == 0);
    CHECK_FALSE(stats.last.has_value());
    CHECK_FALSE(stats.avg.has_value());
    CHECK_FALSE(stats.p90.has_value());
    CHECK(stats.SlowCallPercentage() == 0.0);
    CHECK(stats.GetIndicator() == Indicator::Unknown);
}

TEST_CASE("Stats are computed from a sorted copy", "[performance][stats]") {
    std::vector<Duration> samples;
    for (int i = 10; i >= 1; --i) {
        samples.push_back(std::chrono::microseconds{i * 100});
    }
    const Stats stats = ComputeStats(samples);

    CHECK(stats.count == 10);
    CHECK(stats.last == Duration{100us});
    CHECK(stats.min == Duration{100us});
    CHECK(stats.max == Duration{1000us});
    CHECK(stats.avg == Duration{550us});
    CHECK(stats.p50 == Duration{600us}); // index 5
    CHECK(stats.p90 == Duration{1000us}); // index 9
    CHECK(stats.p99 == Duration{1000us}); // index 9, clamped
    CHECK(stats.slowCallCount == 0);
    CHECK(stats.GetIndicator() == Indicator::Healthy);
}

TEST_CASE("A single sample drives every percentile", "[performance][stats]") {
    const std::vector<Duration> samples{Duration{3ms}};
    const Stats stats = ComputeStats(samples);
    CHECK(stats.p50 == Duration{3ms});
    CHECK(stats.p90 == Duration{3ms});
    CHECK(stats.p99 == Duration{3ms});
}

TEST_CASE("Indicator bands follow p90 and slow call percentage", "[performance][indicator]") {
    SECTION("Degraded p90") {
        const std::vector<Duration> samples(10, Duration{6ms});
        CHECK(ComputeStats(samples).GetIndicator() == Indicator::Degraded);
    }
    SECTION("Severe p90") {
        const std::vector<Duration> samples(10, Duration{8'200us});
        CHECK(ComputeStats(samples).GetIndicator() == Indicator::Severe);
    }
    SECTION("Slow calls degrade an otherwise healthy p90") {
        // 2 of 100 slow calls: 2%
        std::vector<Duration> samples(98, Duration{1ms});
        samples.push_back(Duration{20ms});
        samples.push_back(Duration{20ms});
        const Stats stats = ComputeStats(samples);
        CHECK(stats.slowCallCount == 2);
        CHECK(stats.p90 == Duration{1ms});
        CHECK(stats.GetIndicator() == Indicator::Degraded);
    }
}

TEST_CASE("A single very slow call among few fast ones is not healthy", "[performance][indicator]") {
    Performance performance{};
    for (int i = 0; i < 10; ++i) {
        performance.AddUpdateSample(Duration{100us});
    }
    performance.AddUpdateSample(kSlowCallThreshold * 10);

    const Stats stats = performance.UpdateStats();
    CHECK(stats.count == 11);
    CHECK(stats.slowCallCount == 1);
    CHECK(stats.GetIndicator() != Indicator::Healthy);
    CHECK(stats.GetIndicator() == Indicator::Severe);
}

TEST_CASE("Combine yields the worse indicator", "[performance][indicator]") {
    CHECK(Combine(Indicator::Unknown, Indicator::Healthy) == Indicator::Healthy);
    CHECK(Combine(Indicator::Healthy, Indicator::Degraded) == Indicator::Degraded);
    CHECK(Combine(Indicator::Severe, Indicator::Degraded) == Indicator::Severe);
    CHECK(Combine(Indicator::Unknown, Indicator::Unknown) == Indicator::Unknown);
}

TEST_CASE("Performance records view and update calls separately", "[performance]") {
    Performance performance{};
    const int result = performance.RecordUpdate([] { return 5; });
    CHECK(result == 5);
    performance.RecordView([] {});
    performance.RecordView([] {});

    CHECK(performance.UpdateCount() == 1);
    CHECK(performance.ViewCount() == 2);
    CHECK(performance.OverallIndicator() != Indicator::Unknown);

    performance.Reset();
    CHECK(performance.UpdateCount() == 0);
    CHECK(performance.ViewCount() == 0);
    CHECK(performance.OverallIndicator() == Indicator::Unknown);
}

TEST_CASE("Performance records a call once it returns", "[performance]") {
    Performance performance{};
    std::unique_ptr<int> result = performance.RecordUpdate([] { return std::make_unique<int>(7); });
    REQUIRE(result != nullptr);
    CHECK(*result == 7);
    CHECK(performance.UpdateCount() == 1);

    CHECK_THROWS_AS(performance.RecordUpdate([]() -> int { throw std::runtime_error{"update failed"}; }),
                    std::runtime_error);
    CHECK_THROWS_AS(performance.RecordView([] { throw std::runtime_error{"view failed"}; }), std::runtime_error);
    CHECK(performance.UpdateCount() == 1);
    CHECK(performance.ViewCount() == 0);
}

TEST_CASE("Performance stops recording at the sample cap", "[performance]") {
    Performance performance{};
    for (usize i = 0; i < kMaxSamples; ++i) {
        performance.AddViewSample(Duration{1us});
    }
    performance.AddViewSample(Duration{1s});

    CHECK(performance.ViewCount() == kMaxSamples);
    CHECK(performance.ViewStats().max == Duration{1us});
}

TEST_CASE("Durations are formatted in the largest fitting unit", "[performance][format]") {
    CHECK(FormatDuration(std::nullopt) == "-");
    CHECK(FormatDuration(Duration{999us}) == "999\u00B5s");
    CHECK(FormatDuration(Duration{1500ns}) == "1\u00B5s");
    CHECK(FormatDuration(Duration{1ms}) == "1.00ms");
    CHECK(FormatDuration(Duration{8'333us}) == "8.33ms");
    CHECK(FormatDuration(Duration{2'500ms}) == "2.50s");
}

} // namespace performance
