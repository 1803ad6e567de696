// log.hpp - leveled diagnostics on top of fmt
// default sink prints colored status lines to stderr, tests swap in their own sink

#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <string_view>
#include <utility>

namespace rexec::log
{

    enum class level : std::uint8_t
    {
        debug = 0,
        info,
        warning,
        error,
    };

    using sink = std::function<void(level, std::string_view)>;

    /// @brief Replace the active sink; an empty function restores the stderr sink
    void set_sink(sink s);

    void set_level(level min_level) noexcept;

    [[nodiscard]] auto current_level() noexcept -> level;

    void write(level lvl, std::string_view message);

    [[nodiscard]] auto to_string(level lvl) noexcept -> std::string_view;

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        if (current_level() <= level::debug)
        {
            write(level::debug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        if (current_level() <= level::info)
        {
            write(level::info, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> format, Args &&...args)
    {
        if (current_level() <= level::warning)
        {
            write(level::warning, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        write(level::error, fmt::format(format, std::forward<Args>(args)...));
    }

} // namespace rexec::log
