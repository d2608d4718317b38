#include <vitrine/util/dev_log.hpp>

#include <array>
#include <cstdio>
#include <string>

namespace devlog {

namespace {

    LogSinkState g_sinkState{};
    Level g_minimumLevel = level::info;

    constexpr std::array<const char *, 6> kLevelNames{"trace", "debug", "info", "warn", "error", "off"};

} // namespace

void SetLogSink(LogSinkFn sink, void *user_data) {
    g_sinkState.sink = sink;
    g_sinkState.user_data = sink != nullptr ? user_data : nullptr;
}

LogSinkState GetLogSink() {
    return g_sinkState;
}

void SetMinimumLevel(Level level) {
    g_minimumLevel = level;
}

Level GetMinimumLevel() {
    return g_minimumLevel;
}

const char *LevelName(Level level) {
    if (level < kLevelNames.size()) {
        return kLevelNames[level];
    }
    return "unknown";
}

std::optional<Level> ParseLevel(std::string_view name) {
    for (usize i = 0; i < kLevelNames.size(); ++i) {
        if (name == kLevelNames[i]) {
            return static_cast<Level>(i);
        }
    }
    return std::nullopt;
}

namespace detail {

    void Emit(Level level, std::string_view group, std::string_view message) {
        const std::string line = fmt::format("[{}] {}", group, message);
        if (g_sinkState.sink != nullptr) {
            g_sinkState.sink(level, line.c_str(), g_sinkState.user_data);
            return;
        }
        fmt::print(stderr, "{:<5} {}\n", LevelName(level), line);
    }

} // namespace detail

} // namespace devlog
