#include <catch2/catch_test_macros.hpp>

#include <vitrine/util/dev_log.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dev_log {

namespace grp {

    struct test {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Test";
    };

    struct quiet : public test {
        static constexpr devlog::Level level = devlog::level::warn;
        static constexpr std::string_view name = "Test-Quiet";
    };

    struct disabled : public test {
        static constexpr bool enabled = false;
    };

} // namespace grp

namespace {

    using Lines = std::vector<std::pair<devlog::Level, std::string>>;

    void Capture(devlog::Level level, const char *message, void *user_data) {
        static_cast<Lines *>(user_data)->emplace_back(level, message);
    }

    // Captures log output for the lifetime of the fixture and restores the defaults afterwards
    struct CaptureFixture {
        CaptureFixture()
            : previousLevel(devlog::GetMinimumLevel()) {
            devlog::SetLogSink(&Capture, &lines);
            devlog::SetMinimumLevel(devlog::level::trace);
        }

        ~CaptureFixture() {
            devlog::SetLogSink(nullptr, nullptr);
            devlog::SetMinimumLevel(previousLevel);
        }

        Lines lines;
        devlog::Level previousLevel;
    };

} // namespace

TEST_CASE("Log lines reach the sink prefixed with the group name", "[devlog]") {
    CaptureFixture fixture;

    devlog::info<grp::test>("value is {}", 42);

    REQUIRE(fixture.lines.size() == 1);
    CHECK(fixture.lines[0].first == devlog::level::info);
    CHECK(fixture.lines[0].second == "[Test] value is 42");
}

TEST_CASE("Group levels and the runtime threshold filter log lines", "[devlog]") {
    CaptureFixture fixture;

    devlog::debug<grp::quiet>("dropped by the group level");
    devlog::error<grp::disabled>("dropped by the disabled group");
    devlog::warn<grp::quiet>("kept");
    REQUIRE(fixture.lines.size() == 1);
    CHECK(fixture.lines[0].second == "[Test-Quiet] kept");

    devlog::SetMinimumLevel(devlog::level::error);
    devlog::warn<grp::test>("dropped by the threshold");
    devlog::error<grp::test>("also kept");
    REQUIRE(fixture.lines.size() == 2);
    CHECK(fixture.lines[1].first == devlog::level::error);
    CHECK(fixture.lines[1].second == "[Test] also kept");
}

TEST_CASE("Level names parse back to their levels", "[devlog]") {
    for (devlog::Level level = devlog::level::trace; level <= devlog::level::off; ++level) {
        CHECK(devlog::ParseLevel(devlog::LevelName(level)) == level);
    }
    CHECK_FALSE(devlog::ParseLevel("verbose").has_value());
    CHECK(std::string_view{devlog::LevelName(200)} == "unknown");
}

TEST_CASE("Removing the sink forgets its user data", "[devlog]") {
    Lines lines;
    devlog::SetLogSink(&Capture, &lines);
    CHECK(devlog::GetLogSink().sink == &Capture);
    CHECK(devlog::GetLogSink().user_data == &lines);

    devlog::SetLogSink(nullptr, &lines);
    CHECK(devlog::GetLogSink().sink == nullptr);
    CHECK(devlog::GetLogSink().user_data == nullptr);
}

} // namespace dev_log
