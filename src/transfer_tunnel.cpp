// transfer_tunnel.cpp - lazily opened SFTP channel with optional working directory

#include "rexec/transfer_tunnel.hpp"

#include "rexec/log.hpp"
#include "rexec/remote_path.hpp"
#include "rexec/transport_session.hpp"

#include <fstream>

namespace rexec
{

    transfer_tunnel::transfer_tunnel(transport_session &parent) noexcept : parent_(parent) {}

    transfer_tunnel::~transfer_tunnel()
    {
        close();
    }

    auto transfer_tunnel::ensure_open(std::optional<std::string_view> initial_remote_dir)
        -> result<ssh::transfer_channel *>
    {
        if (state_ == tunnel_state::open)
        {
            return channel_.get();
        }

        // connect first if needed
        if (!parent_.is_connected())
        {
            if (auto connected = parent_.ensure_connected(); !connected.has_value())
            {
                return std::unexpected(connected.error());
            }
        }

        auto channel = parent_.live_connection()->open_transfer_channel();
        if (!channel.has_value())
        {
            log::error("could not open SFTP tunnel to {}: {}", parent_.identity().host, channel.error());
            return std::unexpected(channel.error());
        }

        channel_ = std::move(*channel);
        state_ = tunnel_state::open;
        cwd_.reset();

        if (initial_remote_dir.has_value() && !initial_remote_dir->empty())
        {
            if (auto moved = change_directory(*channel_, *initial_remote_dir); !moved.has_value())
            {
                // not fatal, the tunnel stays usable at the server's default directory
                log::error("{} on {}: {}", moved.error(), parent_.identity().host, *initial_remote_dir);
                log::error("check {} to make sure it exists", *initial_remote_dir);
            }
        }

        return channel_.get();
    }

    void transfer_tunnel::close() noexcept
    {
        if (state_ == tunnel_state::closed)
        {
            return;
        }

        channel_->close();
        channel_.reset();
        cwd_.reset();
        state_ = tunnel_state::closed;
    }

    auto transfer_tunnel::put(std::filesystem::path const &local_path, std::filesystem::path const &remote_path)
        -> result<ssh::file_attributes>
    {
        std::ifstream file(local_path, std::ios::binary);
        if (!file)
        {
            return std::unexpected(error::file_open_failed);
        }
        return put(file, remote_path);
    }

    auto transfer_tunnel::put(std::istream &source, std::filesystem::path const &remote_path)
        -> result<ssh::file_attributes>
    {
        auto channel = ensure_open();
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }
        return (*channel)->put(source, resolve_remote(cwd_, remote_path));
    }

    auto transfer_tunnel::get(std::filesystem::path const &remote_path, std::filesystem::path const &local_path)
        -> result<ssh::file_attributes>
    {
        auto channel = ensure_open();
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }

        std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            return std::unexpected(error::file_open_failed);
        }

        auto fetched = (*channel)->get(resolve_remote(cwd_, remote_path), file);
        if (fetched.has_value() && !file.flush())
        {
            fetched = std::unexpected(error::file_write_failed);
        }

        if (!fetched.has_value())
        {
            // no partial or truncated copy is left behind
            file.close();
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
        }
        return fetched;
    }

    auto transfer_tunnel::get(std::filesystem::path const &remote_path, std::ostream &sink)
        -> result<ssh::file_attributes>
    {
        auto channel = ensure_open();
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }
        return (*channel)->get(resolve_remote(cwd_, remote_path), sink);
    }

    auto transfer_tunnel::stat(std::filesystem::path const &remote_path) -> result<ssh::file_attributes>
    {
        auto channel = ensure_open();
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }
        return (*channel)->stat(resolve_remote(cwd_, remote_path));
    }

    auto transfer_tunnel::change_directory(ssh::transfer_channel &channel, std::string_view remote_dir) -> void_result
    {
        auto resolved = channel.canonicalize(remote_dir);
        if (!resolved.has_value())
        {
            return std::unexpected(error::remote_directory_not_found);
        }

        auto attrs = channel.stat(*resolved);
        if (!attrs.has_value() || !attrs->is_directory)
        {
            return std::unexpected(error::remote_directory_not_found);
        }

        cwd_ = std::move(*resolved);
        return {};
    }

} // namespace rexec
