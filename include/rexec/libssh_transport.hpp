// libssh_transport.hpp - secure transport backed by libssh and libssh SFTP

#pragma once

#include "rexec/transport.hpp"

#include <memory>

namespace rexec::ssh
{

    class libssh_transport final : public transport
    {
    public:
        libssh_transport() = default;

        [[nodiscard]] auto load_key(std::filesystem::path const &path) -> result<key_handle> override;
        [[nodiscard]] auto connect(connect_request const &request) -> result<std::unique_ptr<connection>> override;
    };

    [[nodiscard]] auto make_libssh_transport() -> std::shared_ptr<transport>;

} // namespace rexec::ssh
