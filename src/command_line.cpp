// command_line.cpp

#include "rexec/command_line.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rexec
{

    auto make_launch_command(std::string_view interpreter,
                             std::optional<std::string> const &option,
                             std::filesystem::path const &script_path,
                             std::span<std::string const> args) -> std::string
    {
        auto command = std::string{interpreter};

        if (option.has_value() && !option->empty())
        {
            command += fmt::format(" {}", *option);
        }

        command += fmt::format(" {}", script_path.filename().generic_string());

        if (!args.empty())
        {
            command += fmt::format(" {}", fmt::join(args, " "));
        }

        return command;
    }

    auto shell_quote(std::string_view value) -> std::string
    {
        std::string quoted;
        quoted.reserve(value.size() + 2);
        quoted.push_back('\'');
        for (auto const c : value)
        {
            if (c == '\'')
            {
                // close, escaped quote, reopen
                quoted += R"('\'')";
            }
            else
            {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

} // namespace rexec
