// remote_client.cpp - operation sequencing and connection keep/close decisions

#include "rexec/remote_client.hpp"

#include "rexec/command_line.hpp"
#include "rexec/keys.hpp"
#include "rexec/log.hpp"
#include "rexec/payload.hpp"
#include "rexec/remote_path.hpp"

#include <sstream>
#include <type_traits>

namespace rexec
{

    remote_client::remote_client(std::unique_ptr<transport_session> session) noexcept : session_(std::move(session))
    {
    }

    auto remote_client::create(connection_identity identity, std::shared_ptr<ssh::transport> transport,
                               std::shared_ptr<auth_fallback_provider> fallback, ssh::session_options options)
        -> result<remote_client>
    {
        if (!transport)
        {
            return std::unexpected(error::connection_failed);
        }

        auto key = keys::load_key(*transport, identity.key_path);
        if (!key.has_value())
        {
            return std::unexpected(key.error());
        }

        return remote_client{std::make_unique<transport_session>(std::move(identity), std::move(*key),
                                                                 std::move(transport), std::move(fallback),
                                                                 std::move(options))};
    }

    auto remote_client::set_port(std::uint16_t port) -> void_result
    {
        if (!session_)
        {
            return std::unexpected(error::not_connected);
        }
        return session_->set_port(port);
    }

    // =============================================================================
    // failure policy
    // =============================================================================

    template <failure_policy Policy, typename Transfer>
    auto remote_client::run_transfer(transfer_direction direction, std::string_view filename, bool keep_connection,
                                     Transfer &&transfer)
    {
        auto const &host = session_->identity().host;
        auto const upload = direction == transfer_direction::upload;

        log::info("{} {} {} {}...", upload ? "Uploading" : "Downloading", filename, upload ? "to" : "from", host);
        result<ssh::file_attributes> outcome = std::forward<Transfer>(transfer)();
        if (outcome.has_value())
        {
            log::info("Done.");
        }
        else
        {
            log::error("error occurred {} {} {} {}: {}", upload ? "uploading" : "downloading", filename,
                       upload ? "to" : "from", host, outcome.error());
        }

        if (!keep_connection)
        {
            session_->close();
        }

        if constexpr (Policy == failure_policy::propagate)
        {
            return outcome;
        }
        else
        {
            return outcome.has_value() ? std::optional<ssh::file_attributes>{std::move(*outcome)} : std::nullopt;
        }
    }

    // =============================================================================
    // transfers
    // =============================================================================

    auto remote_client::upload_data(Json::Value const &data, std::string_view remote_dir, std::string_view filename,
                                    bool keep_connection) -> std::optional<ssh::file_attributes>
    {
        if (!session_)
        {
            log::error("upload of {} requested on a moved-from client", filename);
            return std::nullopt;
        }

        auto const payload_name = normalize_payload_filename(filename);
        auto const destination = as_path(remote_dir) / payload_name;

        std::istringstream stream{payload::serialize(data)};
        return run_transfer<failure_policy::log_and_discard>(
            transfer_direction::upload, payload_name, keep_connection,
            [&]() { return session_->tunnel().put(stream, destination); });
    }

    auto remote_client::upload_file(std::filesystem::path const &local_path, std::string_view remote_path,
                                    bool keep_connection) -> std::optional<ssh::file_attributes>
    {
        if (!session_)
        {
            log::error("upload of {} requested on a moved-from client", local_path.string());
            return std::nullopt;
        }

        auto const destination = resolve_destination(local_path, as_path(remote_path));
        auto const filename = destination.filename().string();

        return run_transfer<failure_policy::log_and_discard>(
            transfer_direction::upload, filename, keep_connection,
            [&]() { return session_->tunnel().put(local_path, destination); });
    }

    auto remote_client::download_file(std::string_view remote_path, std::filesystem::path const &local_path,
                                      bool keep_connection) -> std::optional<ssh::file_attributes>
    {
        if (!session_)
        {
            log::error("download of {} requested on a moved-from client", remote_path);
            return std::nullopt;
        }

        auto const source = as_path(remote_path);
        auto const destination = resolve_destination(source, local_path);
        auto const filename = source.filename().string();

        return run_transfer<failure_policy::log_and_discard>(
            transfer_direction::download, filename, keep_connection,
            [&]() { return session_->tunnel().get(source, destination); });
    }

    // =============================================================================
    // remote execution
    // =============================================================================

    auto remote_client::run_remote_script(script_launch const &launch) -> result<ssh::process_streams>
    {
        if (!session_)
        {
            return std::unexpected(error::not_connected);
        }

        auto script_path = launch.remote_script_path;

        if (launch.local_script_path.has_value())
        {
            auto const &local_script = *launch.local_script_path;
            script_path = resolve_destination(local_script, launch.remote_script_path);

            // the shell connection must survive the upload, only the tunnel goes away
            auto uploaded = run_transfer<failure_policy::propagate>(
                transfer_direction::upload, script_path.filename().string(), true,
                [&]() { return session_->tunnel().put(local_script, script_path); });
            session_->tunnel().close();

            if (!uploaded.has_value())
            {
                return std::unexpected(uploaded.error());
            }
        }
        else if (auto connected = session_->ensure_connected(); !connected.has_value())
        {
            return std::unexpected(connected.error());
        }

        auto const command =
            make_launch_command(launch.interpreter_command, launch.command_option, script_path, launch.script_args);

        auto streams = session_->live_connection()->exec(command);
        if (!streams.has_value())
        {
            log::error("could not launch `{}` on {}: {}", command, session_->identity().host, streams.error());
            return std::unexpected(streams.error());
        }

        log::info("launched `{}` on {}", command, session_->identity().host);
        return streams;
    }

    void remote_client::close() noexcept
    {
        if (session_)
        {
            session_->close();
        }
    }

} // namespace rexec
