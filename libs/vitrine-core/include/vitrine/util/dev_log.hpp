#pragma once

/**
@file
@brief Developer log.

Messages are routed through log groups declared next to the code that uses them:

```cpp
namespace grp {
    struct history {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "History";
    };
} // namespace grp

devlog::debug<grp::history>("Rewound to {} of {}", position, count);
```

A message is emitted only if its group is enabled, the group level admits it and the runtime threshold set with
`devlog::SetMinimumLevel` admits it. Disabled groups and levels compile down to nothing.
*/

#include <vitrine/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <optional>
#include <string_view>
#include <utility>

namespace devlog {

using Level = uint8;

namespace level {

    inline constexpr Level trace = 0;
    inline constexpr Level debug = 1;
    inline constexpr Level info = 2;
    inline constexpr Level warn = 3;
    inline constexpr Level error = 4;
    inline constexpr Level off = 5;

} // namespace level

/// @brief Receives every emitted log line.
/// @param[in] level the severity of the message
/// @param[in] message the formatted message, prefixed with the group name
/// @param[in] user_data the pointer given to `SetLogSink`
using LogSinkFn = void (*)(Level level, const char *message, void *user_data);

struct LogSinkState {
    LogSinkFn sink = nullptr;
    void *user_data = nullptr;
};

/// @brief Replaces the log sink. Passing `nullptr` restores output to `stderr`.
void SetLogSink(LogSinkFn sink, void *user_data);

/// @brief Retrieves the current log sink.
LogSinkState GetLogSink();

/// @brief Sets the runtime threshold below which messages are discarded.
void SetMinimumLevel(Level level);

/// @brief Retrieves the runtime threshold.
Level GetMinimumLevel();

/// @brief Returns the lowercase name of the level ("trace", "debug", ...).
const char *LevelName(Level level);

/// @brief Parses a level name as returned by `LevelName`.
std::optional<Level> ParseLevel(std::string_view name);

template <typename T>
concept log_group = requires {
    { T::enabled } -> std::convertible_to<bool>;
    { T::level } -> std::convertible_to<Level>;
    { T::name } -> std::convertible_to<std::string_view>;
};

namespace detail {

    void Emit(Level level, std::string_view group, std::string_view message);

    template <Level lv, log_group TGroup, typename... TArgs>
    void Log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        if constexpr (TGroup::enabled && lv >= TGroup::level) {
            if (lv < GetMinimumLevel()) {
                return;
            }
            Emit(lv, TGroup::name, fmt::format(fmt, std::forward<TArgs>(args)...));
        }
    }

} // namespace detail

template <log_group TGroup, typename... TArgs>
void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::trace, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <log_group TGroup, typename... TArgs>
void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::debug, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <log_group TGroup, typename... TArgs>
void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::info, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <log_group TGroup, typename... TArgs>
void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::warn, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <log_group TGroup, typename... TArgs>
void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::error, TGroup>(fmt, std::forward<TArgs>(args)...);
}

} // namespace devlog
