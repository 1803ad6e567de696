// auth_fallback.cpp

#include "rexec/auth_fallback.hpp"

#include "rexec/log.hpp"

#include <array>
#include <iostream>
#include <string>

#include <libssh/libssh.h>

namespace rexec
{

    auto no_auth_fallback::offer_password_retry(std::string_view host, std::string_view username)
        -> std::optional<ssh::secret>
    {
        log::debug("password fallback disabled for {}@{}", username, host);
        return std::nullopt;
    }

    console_auth_fallback::console_auth_fallback()
        : answers_(&std::cin), prompts_(stderr), reader_(read_password_from_terminal)
    {
    }

    console_auth_fallback::console_auth_fallback(std::istream &answers, std::FILE *prompts, password_reader reader)
        : answers_(&answers), prompts_(prompts), reader_(std::move(reader))
    {
    }

    auto console_auth_fallback::offer_password_retry(std::string_view host, std::string_view username)
        -> std::optional<ssh::secret>
    {
        fmt::print(prompts_, "Try password for {}@{}?  [y/n]: ", username, host);
        std::fflush(prompts_);

        std::string answer;
        if (!std::getline(*answers_, answer) || answer != "y")
        {
            return std::nullopt;
        }

        return reader_(fmt::format("Password for {}@{}: ", username, host));
    }

    auto read_password_from_terminal(std::string_view prompt) -> std::optional<ssh::secret>
    {
        std::array<char, 512> buffer{};
        std::string const prompt_text{prompt};

        // echo off, no verification
        if (ssh_getpass(prompt_text.c_str(), buffer.data(), buffer.size(), 0, 0) < 0)
        {
            return std::nullopt;
        }

        ssh::secret password{std::string{buffer.data()}};

        auto *p = static_cast<volatile char *>(buffer.data());
        for (std::size_t i = 0; i < buffer.size(); ++i)
        {
            p[i] = '\0';
        }

        return password;
    }

} // namespace rexec
