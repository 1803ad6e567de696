// keys.cpp

#include "rexec/keys.hpp"

#include "rexec/command_line.hpp"
#include "rexec/log.hpp"

#include <array>
#include <cstdlib>
#include <sys/wait.h>

namespace rexec::keys
{

    namespace
    {

        [[nodiscard]] auto run_with_system(std::string const &command) -> int
        {
            auto const status = std::system(command.c_str());
            if (status == -1)
            {
                return -1;
            }
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }

    } // namespace

    auto load_key(ssh::transport &transport, std::filesystem::path const &key_path) -> result<ssh::key_handle>
    {
        auto key = transport.load_key(key_path);
        if (!key.has_value())
        {
            log::error("could not load private key: check given path {}", key_path.string());
        }
        return key;
    }

    auto provision_command(std::filesystem::path const &key_file, std::string_view host, std::string_view username,
                           std::uint16_t port) -> std::string
    {
        return fmt::format("ssh-copy-id -i {} -p {} {} >/dev/null 2>&1", shell_quote(key_file.string()), port,
                           shell_quote(fmt::format("{}@{}", username, host)));
    }

    auto provision_key(std::filesystem::path const &key_path, std::string_view host, std::string_view username,
                       std::uint16_t port, command_runner const &run) -> void_result
    {
        std::error_code ec;
        if (!std::filesystem::exists(key_path, ec))
        {
            log::error("could not provision key: check given path {}", key_path.string());
            return std::unexpected(error::key_load_failed);
        }

        auto public_key = key_path;
        public_key += ".pub";

        std::array const key_files{key_path, public_key};
        for (auto const &key_file : key_files)
        {
            auto const command = provision_command(key_file, host, username, port);
            auto const status = run ? run(command) : run_with_system(command);
            if (status != 0)
            {
                log::error("ssh-copy-id of {} to {}@{} exited with {}", key_file.string(), username, host, status);
                return std::unexpected(error::key_provision_failed);
            }
        }

        log::info("key {} installed for {}@{}", key_path.string(), username, host);
        return {};
    }

} // namespace rexec::keys
