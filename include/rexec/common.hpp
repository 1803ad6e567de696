// common.hpp - error handling and shared constants for the remote-execution client

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>

namespace rexec
{

    // ============================================================================
    // error handling - errors are values, nothing in here throws
    // ============================================================================

    enum class error : std::uint8_t
    {
        success = 0,

        // connection
        not_connected,
        already_connected,
        connection_failed,
        host_key_verification_failed,
        timeout,

        // authentication
        authentication_failed,

        // keys
        key_load_failed,
        key_provision_failed,

        // tunnel placement
        remote_directory_not_found,

        // transfer
        sftp_init_failed,
        sftp_open_failed,
        sftp_write_failed,
        sftp_read_failed,
        sftp_stat_failed,
        file_open_failed,
        file_read_failed,
        file_write_failed,
        stream_closed,

        // command dispatch
        channel_open_failed,
        channel_exec_failed,

        // payload
        payload_parse_failed,
    };

    /// @brief Coarse error families, one per failure policy
    enum class error_kind : std::uint8_t
    {
        none,
        connection,
        authentication,
        key,
        remote_directory,
        transfer,
        command_dispatch,
        payload,
    };

    [[nodiscard]] auto classify(error e) noexcept -> error_kind;

    [[nodiscard]] auto make_error_code(error e) noexcept -> std::error_code;

    /// @brief Convert error to human-readable string
    [[nodiscard]] auto to_string(error e) -> std::string;

    [[nodiscard]] auto to_string(error_kind kind) noexcept -> std::string_view;

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    namespace constants
    {
        inline constexpr std::uint16_t default_ssh_port = 22;
        inline constexpr std::chrono::milliseconds default_connect_timeout{5000};
        inline constexpr std::string_view default_interpreter = "python";
        inline constexpr std::string_view payload_extension = ".json";

        // SFTP chunk size - 32KB is safe for most servers
        inline constexpr std::size_t sftp_chunk_size = 32 * 1024;
    } // namespace constants

} // namespace rexec

// enable std::error_code integration
template <>
struct std::is_error_code_enum<rexec::error> : std::true_type
{
};

template <>
struct fmt::formatter<rexec::error> : fmt::formatter<std::string_view>
{
    auto format(rexec::error const e, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(rexec::to_string(e), ctx);
    }
};
