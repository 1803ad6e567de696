// transport_session.cpp - connect, authentication fallback, ordered teardown

#include "rexec/transport_session.hpp"

#include "rexec/log.hpp"

namespace rexec
{

    transport_session::transport_session(connection_identity identity, ssh::key_handle key,
                                         std::shared_ptr<ssh::transport> transport,
                                         std::shared_ptr<auth_fallback_provider> fallback,
                                         ssh::session_options options)
        : identity_(std::move(identity)),
          key_(std::move(key)),
          transport_(std::move(transport)),
          fallback_(std::move(fallback)),
          options_(std::move(options)),
          tunnel_(*this)
    {
    }

    transport_session::~transport_session()
    {
        close();
    }

    auto transport_session::ensure_connected() -> result<ssh::connection *>
    {
        if (state_ == session_state::connected)
        {
            log::info("connection already established for {}", identity_.host);
            return connection_.get();
        }

        ssh::connect_request request{.host = identity_.host,
                                     .port = identity_.port,
                                     .username = identity_.username,
                                     .credential = key_,
                                     .options = &options_};

        auto connected = dial(request);
        if (!connected.has_value())
        {
            if (connected.error() != error::authentication_failed)
            {
                log::error("connection to {}:{} failed: {}", identity_.host, identity_.port, connected.error());
                return std::unexpected(connected.error());
            }

            log::warning("check your SSH key for host {}, username {}", identity_.host, identity_.username);

            auto password = fallback_ ? fallback_->offer_password_retry(identity_.host, identity_.username)
                                      : std::optional<ssh::secret>{};
            if (!password.has_value())
            {
                log::error("connection to {} as {} failed", identity_.host, identity_.username);
                return std::unexpected(error::authentication_failed);
            }

            request.credential = static_cast<ssh::secret const *>(&*password);
            connected = dial(request);
            if (!connected.has_value())
            {
                log::error("password authentication for {} as {} failed: {}", identity_.host, identity_.username,
                           connected.error());
                return std::unexpected(error::authentication_failed);
            }
        }

        connection_ = std::move(*connected);
        state_ = session_state::connected;
        ever_connected_ = true;
        log::debug("connected to {}:{} as {}", identity_.host, identity_.port, identity_.username);
        return connection_.get();
    }

    void transport_session::close() noexcept
    {
        if (state_ == session_state::disconnected)
        {
            log::debug("no SSH connection to {} to close", identity_.host);
            return;
        }

        // the tunnel runs over the connection, so it goes first
        tunnel_.close();

        connection_->close();
        connection_.reset();
        state_ = session_state::disconnected;
        log::debug("closed connection to {}", identity_.host);
    }

    auto transport_session::set_port(std::uint16_t port) -> void_result
    {
        if (ever_connected_)
        {
            log::error("cannot change port of {} after it has been connected", identity_.host);
            return std::unexpected(error::already_connected);
        }
        identity_.port = port;
        return {};
    }

    auto transport_session::dial(ssh::connect_request const &request) -> result<std::unique_ptr<ssh::connection>>
    {
        if (!transport_)
        {
            return std::unexpected(error::not_connected);
        }

        auto connected = transport_->connect(request);
        if (connected.has_value() && *connected == nullptr)
        {
            return std::unexpected(error::connection_failed);
        }
        return connected;
    }

} // namespace rexec
