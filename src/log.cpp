// log.cpp - default stderr sink and sink registry

#include "rexec/log.hpp"

#include <cstdio>
#include <fmt/color.h>

namespace rexec::log
{

    namespace
    {

        // single-threaded by contract, same as the client itself
        sink g_sink{};
        level g_level{level::info};

        void print_to_stderr(level lvl, std::string_view message)
        {
            switch (lvl)
            {
            case level::debug:
                fmt::print(stderr, "[.] {}\n", message);
                break;
            case level::info:
                fmt::print(stderr, fmt::fg(fmt::color::green), "[*] {}\n", message);
                break;
            case level::warning:
                fmt::print(stderr, fmt::fg(fmt::color::yellow), "[~] {}\n", message);
                break;
            case level::error:
                fmt::print(stderr, fmt::fg(fmt::color::red), "[!] {}\n", message);
                break;
            }
        }

    } // namespace

    void set_sink(sink s)
    {
        g_sink = std::move(s);
    }

    void set_level(level min_level) noexcept
    {
        g_level = min_level;
    }

    auto current_level() noexcept -> level
    {
        return g_level;
    }

    void write(level lvl, std::string_view message)
    {
        if (g_sink)
        {
            g_sink(lvl, message);
            return;
        }
        print_to_stderr(lvl, message);
    }

    auto to_string(level lvl) noexcept -> std::string_view
    {
        switch (lvl)
        {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
        }
        return "unknown";
    }

} // namespace rexec::log
