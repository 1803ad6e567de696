// transport_session.hpp - the one authenticated shell connection of a remote client

#pragma once

#include "rexec/auth_fallback.hpp"
#include "rexec/common.hpp"
#include "rexec/transfer_tunnel.hpp"
#include "rexec/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace rexec
{

    // =============================================================================
    // connection identity
    // =============================================================================

    struct connection_identity
    {
        std::string host;
        std::string username;
        std::filesystem::path key_path;
        std::uint16_t port{constants::default_ssh_port};
    };

    enum class session_state : std::uint8_t
    {
        disconnected,
        connected,
    };

    // =============================================================================
    // transport session
    // =============================================================================

    class transport_session
    {
    public:
        transport_session(connection_identity identity, ssh::key_handle key, std::shared_ptr<ssh::transport> transport,
                          std::shared_ptr<auth_fallback_provider> fallback, ssh::session_options options = {});
        ~transport_session();

        // the tunnel keeps a reference back to its session
        transport_session(transport_session const &) = delete;
        auto operator=(transport_session const &) -> transport_session & = delete;
        transport_session(transport_session &&) = delete;
        auto operator=(transport_session &&) -> transport_session & = delete;

        /// @brief Connect once, then keep returning the same connection
        /// key authentication first, then at most one password attempt if the fallback provider agrees
        [[nodiscard]] auto ensure_connected() -> result<ssh::connection *>;

        /// @brief Close the tunnel, then the connection; safe to call repeatedly
        void close() noexcept;

        /// @brief Only before the first successful connection
        [[nodiscard]] auto set_port(std::uint16_t port) -> void_result;

        [[nodiscard]] auto state() const noexcept -> session_state { return state_; }
        [[nodiscard]] auto is_connected() const noexcept -> bool { return state_ == session_state::connected; }
        [[nodiscard]] auto identity() const noexcept -> connection_identity const & { return identity_; }
        [[nodiscard]] auto options() const noexcept -> ssh::session_options const & { return options_; }

        /// @brief The live connection, nullptr while disconnected
        [[nodiscard]] auto live_connection() const noexcept -> ssh::connection * { return connection_.get(); }

        [[nodiscard]] auto tunnel() noexcept -> transfer_tunnel & { return tunnel_; }
        [[nodiscard]] auto tunnel() const noexcept -> transfer_tunnel const & { return tunnel_; }

    private:
        [[nodiscard]] auto dial(ssh::connect_request const &request) -> result<std::unique_ptr<ssh::connection>>;

        connection_identity identity_;
        ssh::key_handle key_;
        std::shared_ptr<ssh::transport> transport_;
        std::shared_ptr<auth_fallback_provider> fallback_;
        ssh::session_options options_;

        std::unique_ptr<ssh::connection> connection_;
        session_state state_{session_state::disconnected};
        bool ever_connected_{false}; // identity is frozen from the first connection on

        // declared last: destroyed before the connection it runs over
        transfer_tunnel tunnel_;
    };

} // namespace rexec
