// tests/unit/test_transport_session.cpp - connect once, password fallback, ordered teardown

#include "rexec/transport_session.hpp"
#include "test_helpers.hpp"

#include <array>
#include <fmt/format.h>
#include <doctest/doctest.h>

using namespace rexec;
using namespace rexec::testing;

TEST_SUITE("transport_session_connect")
{
    TEST_CASE("starts disconnected")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);

        CHECK(session->state() == session_state::disconnected);
        CHECK_FALSE(session->is_connected());
        CHECK(session->live_connection() == nullptr);
        CHECK(transport->state().dials() == 0);
    }

    TEST_CASE("second ensure_connected reuses the connection")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        log_capture logs;

        auto first = session->ensure_connected();
        auto second = session->ensure_connected();

        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(*first == *second);
        CHECK(transport->state().key_dials == 1);
        CHECK(transport->state().max_live_connections == 1);
        CHECK(logs.contains(log::level::info, "connection already established for node1"));
    }

    TEST_CASE("dials the identity's host, user and port")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);

        REQUIRE(session->set_port(2222).has_value());
        REQUIRE(session->ensure_connected().has_value());

        REQUIRE(transport->state().dialed_ports.size() == 1);
        CHECK(transport->state().dialed_ports.front() == 2222);
    }

    TEST_CASE("non-authentication failure does not offer a password")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().connect_error = error::host_key_verification_failed;
        auto fallback = std::make_shared<scripted_fallback>("hunter2");
        auto session = make_session(transport, fallback);

        auto connected = session->ensure_connected();

        REQUIRE_FALSE(connected.has_value());
        CHECK(connected.error() == error::host_key_verification_failed);
        CHECK(fallback->offers == 0);
        CHECK(transport->state().password_dials == 0);
        CHECK_FALSE(session->is_connected());
    }
}

TEST_SUITE("transport_session_password_fallback")
{
    TEST_CASE("declined fallback fails with authentication error")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        auto fallback = std::make_shared<scripted_fallback>();
        auto session = make_session(transport, fallback);
        log_capture logs;

        auto connected = session->ensure_connected();

        REQUIRE_FALSE(connected.has_value());
        CHECK(connected.error() == error::authentication_failed);
        CHECK(classify(connected.error()) == error_kind::authentication);
        CHECK(fallback->offers == 1);
        CHECK(fallback->last_host == "node1");
        CHECK(fallback->last_username == "alice");
        CHECK(transport->state().password_dials == 0);
        CHECK(session->state() == session_state::disconnected);
        CHECK(logs.contains(log::level::warning, "check your SSH key for host node1, username alice"));
    }

    TEST_CASE("accepted fallback dials once with the password")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        auto fallback = std::make_shared<scripted_fallback>("hunter2");
        auto session = make_session(transport, fallback);

        auto connected = session->ensure_connected();

        REQUIRE(connected.has_value());
        CHECK(session->is_connected());
        CHECK(transport->state().key_dials == 1);
        CHECK(transport->state().password_dials == 1);
        CHECK(transport->state().last_password == "hunter2");
    }

    TEST_CASE("rejected password is not retried")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        transport->state().password_auth_succeeds = false;
        auto fallback = std::make_shared<scripted_fallback>("wrong");
        auto session = make_session(transport, fallback);

        auto connected = session->ensure_connected();

        REQUIRE_FALSE(connected.has_value());
        CHECK(connected.error() == error::authentication_failed);
        CHECK(fallback->offers == 1);
        CHECK(transport->state().password_dials == 1);
        CHECK_FALSE(session->is_connected());
    }

    TEST_CASE("password retry failing for another reason reports an authentication error")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        transport->state().password_connect_error = error::timeout;
        auto fallback = std::make_shared<scripted_fallback>("hunter2");
        auto session = make_session(transport, fallback);
        log_capture logs;

        auto connected = session->ensure_connected();

        REQUIRE_FALSE(connected.has_value());
        CHECK(connected.error() == error::authentication_failed);
        CHECK(transport->state().password_dials == 1);
        CHECK_FALSE(session->is_connected());
        CHECK(logs.contains(log::level::error, fmt::format("password authentication for node1 as alice failed: {}",
                                                           error::timeout)));
    }

    TEST_CASE("missing provider behaves like a decline")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        auto session = std::make_unique<transport_session>(test_identity(), std::make_shared<mock_key const>(TEST_KEY),
                                                           transport, nullptr);

        auto connected = session->ensure_connected();

        REQUIRE_FALSE(connected.has_value());
        CHECK(connected.error() == error::authentication_failed);
    }
}

TEST_SUITE("transport_session_close")
{
    TEST_CASE("close on a disconnected session is a logged no-op")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        log_capture logs;

        session->close();

        CHECK(session->state() == session_state::disconnected);
        CHECK(logs.contains(log::level::debug, "no SSH connection to node1 to close"));
    }

    TEST_CASE("close tears down the tunnel and then the connection")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);

        REQUIRE(session->tunnel().ensure_open().has_value());
        REQUIRE(transport->state().live_channels == 1);
        REQUIRE(transport->state().live_connections == 1);

        session->close();

        CHECK(session->tunnel().state() == tunnel_state::closed);
        CHECK(session->state() == session_state::disconnected);
        CHECK(transport->state().live_channels == 0);
        CHECK(transport->state().live_connections == 0);
    }

    TEST_CASE("close twice is safe")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        REQUIRE(session->ensure_connected().has_value());

        session->close();
        session->close();

        CHECK(transport->state().live_connections == 0);
    }

    TEST_CASE("reconnects after close")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);

        REQUIRE(session->ensure_connected().has_value());
        session->close();
        REQUIRE(session->ensure_connected().has_value());

        CHECK(transport->state().key_dials == 2);
        CHECK(transport->state().max_live_connections == 1);
    }

    TEST_CASE("destruction closes the connection")
    {
        auto transport = std::make_shared<mock_transport>();
        {
            auto session = make_session(transport);
            REQUIRE(session->tunnel().ensure_open().has_value());
        }
        CHECK(transport->state().live_channels == 0);
        CHECK(transport->state().live_connections == 0);
    }

    TEST_CASE("closing the session invalidates process streams")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        auto connection = session->ensure_connected();
        REQUIRE(connection.has_value());

        auto streams = (*connection)->exec("true");
        REQUIRE(streams.has_value());

        session->close();

        std::array<char, 16> buffer{};
        auto read = streams->output->read(buffer);
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error() == error::stream_closed);
    }
}

TEST_SUITE("transport_session_port")
{
    TEST_CASE("set_port while disconnected updates the identity")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);

        CHECK(session->identity().port == constants::default_ssh_port);
        REQUIRE(session->set_port(2200).has_value());
        CHECK(session->identity().port == 2200);
    }

    TEST_CASE("set_port while connected is rejected")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        REQUIRE(session->ensure_connected().has_value());

        auto changed = session->set_port(2200);

        REQUIRE_FALSE(changed.has_value());
        CHECK(changed.error() == error::already_connected);
        CHECK(session->identity().port == constants::default_ssh_port);
    }

    TEST_CASE("set_port after a connection has been closed is rejected")
    {
        auto transport = std::make_shared<mock_transport>();
        auto session = make_session(transport);
        REQUIRE(session->ensure_connected().has_value());
        session->close();

        auto changed = session->set_port(2222);

        REQUIRE_FALSE(changed.has_value());
        CHECK(changed.error() == error::already_connected);
        CHECK(session->identity().port == constants::default_ssh_port);

        REQUIRE(session->ensure_connected().has_value());
        REQUIRE(transport->state().dialed_ports.size() == 2);
        CHECK(transport->state().dialed_ports.back() == constants::default_ssh_port);
    }

    TEST_CASE("a failed first dial still allows a port change")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().connect_error = error::connection_failed;
        auto session = make_session(transport);
        REQUIRE_FALSE(session->ensure_connected().has_value());

        CHECK(session->set_port(2222).has_value());
        CHECK(session->identity().port == 2222);
    }
}
