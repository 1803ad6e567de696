// keys.hpp - loading a private key and pushing it to a remote account

#pragma once

#include "rexec/common.hpp"
#include "rexec/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace rexec::keys
{

    /// @brief Load through the transport; failure is logged with the offending path
    [[nodiscard]] auto load_key(ssh::transport &transport, std::filesystem::path const &key_path)
        -> result<ssh::key_handle>;

    /// @brief ssh-copy-id invocation for one key file, output discarded
    [[nodiscard]] auto provision_command(std::filesystem::path const &key_file, std::string_view host,
                                         std::string_view username,
                                         std::uint16_t port = constants::default_ssh_port) -> std::string;

    /// @brief Runs a shell command and returns its exit status
    using command_runner = std::function<int(std::string const &command)>;

    /// @brief Install the key pair for username@host: the private key path and its ".pub" sibling
    [[nodiscard]] auto provision_key(std::filesystem::path const &key_path, std::string_view host,
                                     std::string_view username,
                                     std::uint16_t port = constants::default_ssh_port,
                                     command_runner const &run = {}) -> void_result;

} // namespace rexec::keys
