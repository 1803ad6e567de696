// remote_client.hpp - high-level uploads and remote script launches over one session

#pragma once

#include "rexec/auth_fallback.hpp"
#include "rexec/common.hpp"
#include "rexec/transport.hpp"
#include "rexec/transport_session.hpp"

#include <cstdint>
#include <filesystem>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rexec
{

    /// @brief What a failed transfer turns into
    enum class failure_policy : std::uint8_t
    {
        propagate,       // error reaches the caller
        log_and_discard, // error is logged, caller sees an empty result
    };

    enum class transfer_direction : std::uint8_t
    {
        upload,
        download,
    };

    struct script_launch
    {
        std::filesystem::path remote_script_path;
        std::optional<std::string> command_option;
        std::vector<std::string> script_args;
        std::optional<std::filesystem::path> local_script_path; // staged to remote_script_path first if set
        std::string interpreter_command{constants::default_interpreter};
    };

    class remote_client
    {
    public:
        /// @brief Load the key and build an unconnected client; a bad key path fails here
        [[nodiscard]] static auto create(connection_identity identity, std::shared_ptr<ssh::transport> transport,
                                         std::shared_ptr<auth_fallback_provider> fallback,
                                         ssh::session_options options = {}) -> result<remote_client>;

        ~remote_client() = default;

        remote_client(remote_client const &) = delete;
        auto operator=(remote_client const &) -> remote_client & = delete;
        remote_client(remote_client &&) noexcept = default;
        auto operator=(remote_client &&) noexcept -> remote_client & = default;

        // -------------------------------------------------------------------------
        // configuration
        // -------------------------------------------------------------------------

        [[nodiscard]] auto set_port(std::uint16_t port) -> void_result;

        /// @brief Empty for a moved-from client
        [[nodiscard]] auto host() const noexcept -> std::string_view
        {
            return session_ ? std::string_view{session_->identity().host} : std::string_view{};
        }

        /// @brief False once the client has been moved from; every operation then fails with not_connected
        [[nodiscard]] auto is_valid() const noexcept -> bool { return session_ != nullptr; }

        // -------------------------------------------------------------------------
        // best-effort transfers: never fail, an empty result means nothing was moved
        // -------------------------------------------------------------------------

        /// @brief Serialize data and store it as remote_dir/<filename stem>.json
        [[nodiscard]] auto upload_data(Json::Value const &data, std::string_view remote_dir, std::string_view filename,
                                       bool keep_connection = false) -> std::optional<ssh::file_attributes>;

        /// @brief remote_path without an extension is a directory and receives the local file name
        [[nodiscard]] auto upload_file(std::filesystem::path const &local_path, std::string_view remote_path,
                                       bool keep_connection = false) -> std::optional<ssh::file_attributes>;

        /// @brief local_path without an extension is a directory and receives the remote file name
        [[nodiscard]] auto download_file(std::string_view remote_path, std::filesystem::path const &local_path,
                                         bool keep_connection = false) -> std::optional<ssh::file_attributes>;

        // -------------------------------------------------------------------------
        // remote execution
        // -------------------------------------------------------------------------

        /// @brief Start the script and return its streams right away; the connection stays open
        [[nodiscard]] auto run_remote_script(script_launch const &launch) -> result<ssh::process_streams>;

        void close() noexcept;

        /// @brief Requires is_valid()
        [[nodiscard]] auto session() noexcept -> transport_session & { return *session_; }
        [[nodiscard]] auto session() const noexcept -> transport_session const & { return *session_; }

    private:
        explicit remote_client(std::unique_ptr<transport_session> session) noexcept;

        template <failure_policy Policy, typename Transfer>
        [[nodiscard]] auto run_transfer(transfer_direction direction, std::string_view filename, bool keep_connection,
                                        Transfer &&transfer);

        std::unique_ptr<transport_session> session_;
    };

} // namespace rexec
