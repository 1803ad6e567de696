// command_line.hpp - assembly of command strings sent to a remote shell or run locally

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace rexec
{

    /// @brief "<interpreter> [<option>] <script file name> [<args...>]"
    /// the script path is reduced to its final component, arguments are joined with single spaces
    [[nodiscard]] auto make_launch_command(std::string_view interpreter,
                                           std::optional<std::string> const &option,
                                           std::filesystem::path const &script_path,
                                           std::span<std::string const> args) -> std::string;

    /// @brief Wrap a value in single quotes for /bin/sh
    [[nodiscard]] auto shell_quote(std::string_view value) -> std::string;

} // namespace rexec
