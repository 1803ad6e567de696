// transfer_tunnel.hpp - SFTP tunnel multiplexed over a transport session
// lives inside its session; opening it connects the session first

#pragma once

#include "rexec/common.hpp"
#include "rexec/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rexec
{

    class transport_session;

    enum class tunnel_state : std::uint8_t
    {
        closed,
        open,
    };

    class transfer_tunnel
    {
    public:
        explicit transfer_tunnel(transport_session &parent) noexcept;
        ~transfer_tunnel();

        transfer_tunnel(transfer_tunnel const &) = delete;
        auto operator=(transfer_tunnel const &) -> transfer_tunnel & = delete;
        transfer_tunnel(transfer_tunnel &&) = delete;
        auto operator=(transfer_tunnel &&) -> transfer_tunnel & = delete;

        // -------------------------------------------------------------------------
        // lifecycle
        // -------------------------------------------------------------------------

        /// @brief Open the tunnel once and hand back the same channel afterwards
        /// a missing initial_remote_dir is logged and leaves the tunnel open at the server's default directory
        [[nodiscard]] auto ensure_open(std::optional<std::string_view> initial_remote_dir = std::nullopt)
            -> result<ssh::transfer_channel *>;

        void close() noexcept;

        [[nodiscard]] auto state() const noexcept -> tunnel_state { return state_; }
        [[nodiscard]] auto is_open() const noexcept -> bool { return state_ == tunnel_state::open; }
        [[nodiscard]] auto current_directory() const noexcept -> std::optional<std::string> const & { return cwd_; }

        // -------------------------------------------------------------------------
        // transfers - failures propagate as-is
        // -------------------------------------------------------------------------

        [[nodiscard]] auto put(std::filesystem::path const &local_path, std::filesystem::path const &remote_path)
            -> result<ssh::file_attributes>;

        [[nodiscard]] auto put(std::istream &source, std::filesystem::path const &remote_path)
            -> result<ssh::file_attributes>;

        [[nodiscard]] auto get(std::filesystem::path const &remote_path, std::filesystem::path const &local_path)
            -> result<ssh::file_attributes>;

        [[nodiscard]] auto get(std::filesystem::path const &remote_path, std::ostream &sink)
            -> result<ssh::file_attributes>;

        [[nodiscard]] auto stat(std::filesystem::path const &remote_path) -> result<ssh::file_attributes>;

    private:
        [[nodiscard]] auto change_directory(ssh::transfer_channel &channel, std::string_view remote_dir) -> void_result;

        transport_session &parent_;
        std::unique_ptr<ssh::transfer_channel> channel_;
        tunnel_state state_{tunnel_state::closed};
        std::optional<std::string> cwd_;
    };

} // namespace rexec
