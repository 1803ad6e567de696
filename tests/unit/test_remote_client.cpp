// tests/unit/test_remote_client.cpp - transfers, script launch and connection keep/close decisions

#include "rexec/payload.hpp"
#include "rexec/remote_client.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace rexec;
using namespace rexec::testing;

namespace
{

    // scratch file removed on scope exit
    class temp_file
    {
    public:
        temp_file(std::string_view name, std::string_view contents)
            : path_(std::filesystem::temp_directory_path() / fmt::format("rexec_{}_{}", ::getpid(), name))
        {
            std::ofstream out(path_, std::ios::binary);
            out << contents;
        }

        ~temp_file()
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }

        temp_file(temp_file const &) = delete;
        auto operator=(temp_file const &) -> temp_file & = delete;
        temp_file(temp_file &&) = delete;
        auto operator=(temp_file &&) -> temp_file & = delete;

        [[nodiscard]] auto path() const noexcept -> std::filesystem::path const & { return path_; }

    private:
        std::filesystem::path path_;
    };

} // anonymous namespace

TEST_SUITE("remote_client_create")
{
    TEST_CASE("create loads the key without dialing")
    {
        auto transport = std::make_shared<mock_transport>();

        auto client = make_client(transport);

        CHECK(client.host() == "node1");
        CHECK_FALSE(client.session().is_connected());
        CHECK(transport->state().dials() == 0);
    }

    TEST_CASE("unloadable key fails creation with the path in the log")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_load_fails = true;
        log_capture logs;

        auto client = remote_client::create(test_identity(), transport, std::make_shared<scripted_fallback>());

        REQUIRE_FALSE(client.has_value());
        CHECK(client.error() == error::key_load_failed);
        CHECK(classify(client.error()) == error_kind::key);
        CHECK(logs.contains(log::level::error, "could not load private key: check given path /keys/id_rsa"));
    }

    TEST_CASE("missing transport fails creation")
    {
        auto client = remote_client::create(test_identity(), nullptr, std::make_shared<scripted_fallback>());

        REQUIRE_FALSE(client.has_value());
        CHECK(client.error() == error::connection_failed);
    }

    TEST_CASE("set_port is forwarded to the session")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        REQUIRE(client.set_port(2022).has_value());
        CHECK(client.session().identity().port == 2022);
    }
}

TEST_SUITE("remote_client_moved_from")
{
    TEST_CASE("moved-from client refuses every operation")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        auto other = std::move(client);
        log_capture logs;

        CHECK_FALSE(client.is_valid());
        CHECK(client.host().empty());

        auto port = client.set_port(2222);
        REQUIRE_FALSE(port.has_value());
        CHECK(port.error() == error::not_connected);

        Json::Value data;
        data["k"] = 1;
        CHECK_FALSE(client.upload_data(data, "/remote/dir", "out").has_value());
        CHECK(logs.contains(log::level::error, "upload of out requested on a moved-from client"));

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "run.py"});
        REQUIRE_FALSE(streams.has_value());
        CHECK(streams.error() == error::not_connected);

        client.close();
        CHECK(transport->state().dials() == 0);
    }

    TEST_CASE("moved-to client keeps the session")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        auto other = std::move(client);

        CHECK(other.is_valid());
        CHECK(other.host() == TEST_HOST);
        CHECK(other.session().ensure_connected().has_value());
        CHECK(transport->state().dials() == 1);
        other.close();
    }
}

TEST_SUITE("remote_client_upload_data")
{
    TEST_CASE("payload lands under the normalized json name")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        Json::Value data;
        data["a"] = 1;

        auto attrs = client.upload_data(data, "/tmp", "out.txt");

        REQUIRE(attrs.has_value());
        CHECK(attrs->name == "out.json");
        REQUIRE(transport->state().remote_files.contains("/tmp/out.json"));

        auto stored = payload::parse(transport->state().remote_files["/tmp/out.json"]);
        REQUIRE(stored.has_value());
        CHECK((*stored)["a"].asInt() == 1);
    }

    TEST_CASE("stored text uses four-space indentation")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        Json::Value data;
        data["chains"] = 4;

        REQUIRE(client.upload_data(data, "/tmp", "cfg").has_value());

        CHECK(transport->state().remote_files["/tmp/cfg.json"].find("\n    \"chains\" : 4") != std::string::npos);
    }

    TEST_CASE("session is closed afterwards by default")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        REQUIRE(client.upload_data(Json::Value{}, "/tmp", "x").has_value());

        CHECK_FALSE(client.session().is_connected());
        CHECK(transport->state().live_connections == 0);
    }

    TEST_CASE("keep_connection leaves the session and tunnel open")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        REQUIRE(client.upload_data(Json::Value{}, "/tmp", "x", true).has_value());
        REQUIRE(client.upload_data(Json::Value{}, "/tmp", "y", true).has_value());

        CHECK(client.session().is_connected());
        CHECK(client.session().tunnel().is_open());
        CHECK(transport->state().key_dials == 1);
        CHECK(transport->state().channel_opens == 1);
    }

    TEST_CASE("failure is logged and discarded")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().put_error = error::sftp_write_failed;
        auto client = make_client(transport);
        log_capture logs;

        auto attrs = client.upload_data(Json::Value{}, "/tmp", "out");

        CHECK_FALSE(attrs.has_value());
        CHECK_FALSE(client.session().is_connected());
        CHECK(logs.contains(log::level::error, "error occurred uploading out.json to node1"));
    }

    TEST_CASE("connection failure is discarded as well")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        auto client = make_client(transport);

        auto attrs = client.upload_data(Json::Value{}, "/tmp", "out");

        CHECK_FALSE(attrs.has_value());
        CHECK(transport->state().remote_files.empty());
    }

    TEST_CASE("progress lines are logged")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        log_capture logs;

        REQUIRE(client.upload_data(Json::Value{}, "/tmp", "out").has_value());

        CHECK(logs.contains(log::level::info, "Uploading out.json to node1..."));
        CHECK(logs.contains(log::level::info, "Done."));
    }
}

TEST_SUITE("remote_client_upload_file")
{
    TEST_CASE("directory destination receives the local file name")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        temp_file script{"run.py", "print(1)\n"};

        auto attrs = client.upload_file(script.path(), "/remote/dir");

        REQUIRE(attrs.has_value());
        auto const expected = fmt::format("/remote/dir/{}", script.path().filename().string());
        REQUIRE(transport->state().remote_files.contains(expected));
        CHECK(transport->state().remote_files[expected] == "print(1)\n");
    }

    TEST_CASE("destination with an extension is used verbatim")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        temp_file script{"run.py", "print(1)\n"};

        auto attrs = client.upload_file(script.path(), "/remote/dir/other.py");

        REQUIRE(attrs.has_value());
        CHECK(attrs->name == "other.py");
        CHECK(transport->state().remote_files.contains("/remote/dir/other.py"));
    }

    TEST_CASE("missing local file is discarded and closes the session")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        auto attrs = client.upload_file("/definitely/not/here.py", "/remote/dir");

        CHECK_FALSE(attrs.has_value());
        CHECK_FALSE(client.session().is_connected());
    }

    TEST_CASE("failed remote write is discarded and closes the session")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().put_error = error::sftp_write_failed;
        auto client = make_client(transport);
        temp_file script{"run.py", "print(1)\n"};
        log_capture logs;

        auto attrs = client.upload_file(script.path(), "/remote/dir");

        CHECK_FALSE(attrs.has_value());
        CHECK(transport->state().dials() == 1);
        CHECK(transport->state().put_paths.size() == 1);
        CHECK(transport->state().remote_files.empty());
        CHECK_FALSE(client.session().is_connected());
        CHECK(transport->state().live_connections == 0);
    }
}

TEST_SUITE("remote_client_download_file")
{
    TEST_CASE("directory destination receives the remote file name")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().remote_files["/tmp/result.json"] = R"({"ok": true})";
        auto client = make_client(transport);
        auto const local_dir = std::filesystem::temp_directory_path();
        auto const local_file = local_dir / "result.json";

        auto attrs = client.download_file("/tmp/result.json", local_dir);

        REQUIRE(attrs.has_value());
        std::ifstream in(local_file);
        std::string contents{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        CHECK(contents == R"({"ok": true})");

        std::error_code ec;
        std::filesystem::remove(local_file, ec);
    }

    TEST_CASE("missing remote file is discarded")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        log_capture logs;

        auto const local_file = std::filesystem::temp_directory_path() / "rexec_missing.json";

        auto attrs = client.download_file("/tmp/missing.json", local_file);

        CHECK_FALSE(attrs.has_value());
        std::error_code ec;
        std::filesystem::remove(local_file, ec);
        CHECK(logs.contains(log::level::error, "error occurred downloading missing.json from node1"));
    }
}

TEST_SUITE("remote_client_run_remote_script")
{
    TEST_CASE("dispatches the assembled command and stays connected")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r/run.py",
                                                              .command_option = "-u",
                                                              .script_args = {"--x", "1"},
                                                              .local_script_path = std::nullopt,
                                                              .interpreter_command = "python3"});

        REQUIRE(streams.has_value());
        REQUIRE(transport->state().commands.size() == 1);
        CHECK(transport->state().commands.front() == "python3 -u run.py --x 1");
        CHECK(client.session().is_connected());
    }

    TEST_CASE("defaults to the python interpreter")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        REQUIRE(client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"}).has_value());

        CHECK(transport->state().commands.front() == "python job.py");
    }

    TEST_CASE("returned streams carry the process output")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().exec_stdout = "hello\n";
        transport->state().exec_stderr = "warn\n";
        auto client = make_client(transport);

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"});
        REQUIRE(streams.has_value());

        REQUIRE(streams->input->write("in").has_value());
        REQUIRE(streams->input->close().has_value());
        auto out = streams->output->read_all();
        auto err = streams->error->read_all();

        REQUIRE(out.has_value());
        REQUIRE(err.has_value());
        CHECK(*out == "hello\n");
        CHECK(*err == "warn\n");
        CHECK(transport->state().stdin_received == "in");
    }

    TEST_CASE("local script is staged first and only the tunnel is closed")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        temp_file script{"fit.py", "pass\n"};
        auto const name = script.path().filename().string();

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r",
                                                              .local_script_path = script.path()});

        REQUIRE(streams.has_value());
        CHECK(transport->state().remote_files.contains(fmt::format("/r/{}", name)));
        CHECK(transport->state().commands.front() == fmt::format("python {}", name));
        CHECK(client.session().is_connected());
        CHECK_FALSE(client.session().tunnel().is_open());
        CHECK(transport->state().key_dials == 1);
    }

    TEST_CASE("staging failure propagates without dispatching")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().put_error = error::sftp_open_failed;
        auto client = make_client(transport);
        temp_file script{"fit.py", "pass\n"};

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r",
                                                              .local_script_path = script.path()});

        REQUIRE_FALSE(streams.has_value());
        CHECK(streams.error() == error::sftp_open_failed);
        CHECK(transport->state().commands.empty());
        CHECK_FALSE(client.session().tunnel().is_open());
    }

    TEST_CASE("dispatch failure propagates")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().exec_error = error::channel_exec_failed;
        auto client = make_client(transport);
        log_capture logs;

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"});

        REQUIRE_FALSE(streams.has_value());
        CHECK(streams.error() == error::channel_exec_failed);
        CHECK(classify(streams.error()) == error_kind::command_dispatch);
        CHECK(logs.contains(log::level::error, "could not launch `python job.py` on node1"));
    }

    TEST_CASE("connection failure propagates")
    {
        auto transport = std::make_shared<mock_transport>();
        transport->state().key_auth_succeeds = false;
        auto client = make_client(transport);

        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"});

        REQUIRE_FALSE(streams.has_value());
        CHECK(streams.error() == error::authentication_failed);
        CHECK(transport->state().commands.empty());
    }

    TEST_CASE("upload after a launch reuses the same connection")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);

        REQUIRE(client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"}).has_value());
        REQUIRE(client.upload_data(Json::Value{}, "/tmp", "cfg", true).has_value());

        CHECK(transport->state().key_dials == 1);
        CHECK(transport->state().max_live_connections == 1);
    }

    TEST_CASE("close ends the connection and the streams")
    {
        auto transport = std::make_shared<mock_transport>();
        auto client = make_client(transport);
        auto streams = client.run_remote_script(script_launch{.remote_script_path = "/r/job.py"});
        REQUIRE(streams.has_value());

        client.close();

        CHECK_FALSE(client.session().is_connected());
        auto out = streams->output->read_all();
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error() == error::stream_closed);
    }
}
