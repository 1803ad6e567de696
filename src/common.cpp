// common.cpp - error category and classification

#include "rexec/common.hpp"

namespace rexec
{

    namespace
    {

        // =============================================================================
        // error category for std::error_code integration
        // =============================================================================

        class rexec_error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "rexec"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error>(ev))
                {
                case error::success:
                    return "success";
                case error::not_connected:
                    return "SSH session not connected";
                case error::already_connected:
                    return "SSH session already connected";
                case error::connection_failed:
                    return "SSH connection failed";
                case error::host_key_verification_failed:
                    return "SSH host key verification failed";
                case error::timeout:
                    return "SSH operation timed out";
                case error::authentication_failed:
                    return "SSH authentication failed";
                case error::key_load_failed:
                    return "failed to load private key";
                case error::key_provision_failed:
                    return "failed to provision key on remote host";
                case error::remote_directory_not_found:
                    return "remote directory does not exist";
                case error::sftp_init_failed:
                    return "failed to initialize SFTP session";
                case error::sftp_open_failed:
                    return "failed to open remote file via SFTP";
                case error::sftp_write_failed:
                    return "failed to write to remote file via SFTP";
                case error::sftp_read_failed:
                    return "failed to read from remote file via SFTP";
                case error::sftp_stat_failed:
                    return "failed to stat remote file via SFTP";
                case error::file_open_failed:
                    return "failed to open local file";
                case error::file_read_failed:
                    return "failed to read local file";
                case error::file_write_failed:
                    return "failed to write to local file";
                case error::stream_closed:
                    return "remote stream closed";
                case error::channel_open_failed:
                    return "failed to open SSH channel";
                case error::channel_exec_failed:
                    return "failed to execute command on SSH channel";
                case error::payload_parse_failed:
                    return "failed to parse payload";
                default:
                    return fmt::format("unknown rexec error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto rexec_error_category() noexcept -> std::error_category const &
        {
            static rexec_error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto classify(error e) noexcept -> error_kind
    {
        switch (e)
        {
        case error::success:
            return error_kind::none;
        case error::not_connected:
        case error::already_connected:
        case error::connection_failed:
        case error::host_key_verification_failed:
        case error::timeout:
            return error_kind::connection;
        case error::authentication_failed:
            return error_kind::authentication;
        case error::key_load_failed:
        case error::key_provision_failed:
            return error_kind::key;
        case error::remote_directory_not_found:
            return error_kind::remote_directory;
        case error::sftp_init_failed:
        case error::sftp_open_failed:
        case error::sftp_write_failed:
        case error::sftp_read_failed:
        case error::sftp_stat_failed:
        case error::file_open_failed:
        case error::file_read_failed:
        case error::file_write_failed:
        case error::stream_closed:
            return error_kind::transfer;
        case error::channel_open_failed:
        case error::channel_exec_failed:
            return error_kind::command_dispatch;
        case error::payload_parse_failed:
            return error_kind::payload;
        }
        return error_kind::none;
    }

    auto make_error_code(error e) noexcept -> std::error_code
    {
        return {static_cast<int>(e), rexec_error_category()};
    }

    auto to_string(error e) -> std::string
    {
        return rexec_error_category().message(static_cast<int>(e));
    }

    auto to_string(error_kind kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case error_kind::none:
            return "none";
        case error_kind::connection:
            return "connection";
        case error_kind::authentication:
            return "authentication";
        case error_kind::key:
            return "key";
        case error_kind::remote_directory:
            return "remote_directory";
        case error_kind::transfer:
            return "transfer";
        case error_kind::command_dispatch:
            return "command_dispatch";
        case error_kind::payload:
            return "payload";
        }
        return "unknown";
    }

} // namespace rexec
