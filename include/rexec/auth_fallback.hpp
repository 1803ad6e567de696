// auth_fallback.hpp - what to do when key authentication is rejected
// the session asks a provider instead of talking to the terminal itself

#pragma once

#include "rexec/transport.hpp"

#include <cstdio>
#include <functional>
#include <istream>
#include <optional>
#include <string_view>

namespace rexec
{

    class auth_fallback_provider
    {
    public:
        virtual ~auth_fallback_provider() = default;

        /// @brief Ask whether to retry with a password; a value means "yes, with this password"
        [[nodiscard]] virtual auto offer_password_retry(std::string_view host, std::string_view username)
            -> std::optional<ssh::secret> = 0;
    };

    /// @brief Never retries, for batch use
    class no_auth_fallback final : public auth_fallback_provider
    {
    public:
        [[nodiscard]] auto offer_password_retry(std::string_view host, std::string_view username)
            -> std::optional<ssh::secret> override;
    };

    /// @brief Asks "Try password?  [y/n]: " on the terminal, reads the password without echo
    class console_auth_fallback final : public auth_fallback_provider
    {
    public:
        using password_reader = std::function<std::optional<ssh::secret>(std::string_view prompt)>;

        console_auth_fallback();
        console_auth_fallback(std::istream &answers, std::FILE *prompts, password_reader reader);

        [[nodiscard]] auto offer_password_retry(std::string_view host, std::string_view username)
            -> std::optional<ssh::secret> override;

    private:
        std::istream *answers_;
        std::FILE *prompts_;
        password_reader reader_;
    };

    /// @brief Terminal password prompt with echo disabled
    [[nodiscard]] auto read_password_from_terminal(std::string_view prompt) -> std::optional<ssh::secret>;

} // namespace rexec
