// rexec_app.cpp - command line front end for the remote-execution client
// one subcommand per client operation, connection closed before exit

#include "rexec/auth_fallback.hpp"
#include "rexec/keys.hpp"
#include "rexec/libssh_transport.hpp"
#include "rexec/log.hpp"
#include "rexec/payload.hpp"
#include "rexec/remote_client.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace
{

    struct app_config
    {
        // identity
        std::string host;
        std::string username;
        std::string key_path;
        std::uint16_t port{rexec::constants::default_ssh_port};

        // session
        rexec::ssh::session_options options{};
        bool password_fallback{true};
        bool verbose{false};

        // subcommand
        std::string command;
        std::vector<std::string> operands;

        // run
        std::optional<std::string> local_script;
        std::optional<std::string> command_option;
        std::string interpreter{rexec::constants::default_interpreter};
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] <command> [operands]

Commands:
  upload-data <json-file> <remote-dir> <name>   Upload a JSON payload as <remote-dir>/<name stem>.json
  upload-file <local-file> <remote-path>         Upload a file (remote-path without extension is a directory)
  download <remote-file> <local-path>            Download a file (local-path without extension is a directory)
  run <remote-script> [-- args...]               Launch a script remotely and stream its output
  provision-key                                  Install the key pair on the remote account with ssh-copy-id

Required:
  --host <host>             Remote host
  --user <user>             SSH username
  --key <path>              Path to SSH private key

Optional:
  --port <port>             SSH port (default: 22)
  --timeout-ms <ms>         Connect timeout in milliseconds (default: 5000)
  --strict-host-keys        Refuse hosts missing from known_hosts
  --known-hosts <path>      known_hosts file to use
  --no-password-fallback    Fail instead of offering password authentication
  --local-script <path>     run: upload this script to <remote-script> first
  --interpreter <cmd>       run: interpreter command (default: python)
  --option <token>          run: interpreter option, e.g. -u
  --verbose                 Debug output

Example:
  {} --host node1 --user alice --key ~/.ssh/id_rsa \
    --local-script ./fit.py --interpreter python3 --option -u \
    run /home/alice/jobs -- --chains 4

)",
                   program_name, program_name);
    }

    [[nodiscard]] auto parse_number(std::string_view text) -> std::optional<std::uint64_t>
    {
        std::uint64_t value{0};
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<app_config>
    {
        app_config config;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--host" && i + 1 < argc)
            {
                config.host = argv[++i];
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                config.username = argv[++i];
            }
            else if (arg == "--key" && i + 1 < argc)
            {
                config.key_path = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc)
            {
                auto const port = parse_number(argv[++i]);
                if (!port.has_value() || *port == 0 || *port > 65535)
                {
                    fmt::print(stderr, "Error: invalid port {}\n", argv[i]);
                    return std::nullopt;
                }
                config.port = static_cast<std::uint16_t>(*port);
            }
            else if (arg == "--timeout-ms" && i + 1 < argc)
            {
                auto const timeout = parse_number(argv[++i]);
                if (!timeout.has_value())
                {
                    fmt::print(stderr, "Error: invalid timeout {}\n", argv[i]);
                    return std::nullopt;
                }
                config.options.connect_timeout = std::chrono::milliseconds{*timeout};
            }
            else if (arg == "--strict-host-keys")
            {
                config.options.host_keys = rexec::ssh::host_key_policy::strict;
            }
            else if (arg == "--known-hosts" && i + 1 < argc)
            {
                config.options.known_hosts_file = argv[++i];
            }
            else if (arg == "--no-password-fallback")
            {
                config.password_fallback = false;
            }
            else if (arg == "--local-script" && i + 1 < argc)
            {
                config.local_script = argv[++i];
            }
            else if (arg == "--interpreter" && i + 1 < argc)
            {
                config.interpreter = argv[++i];
            }
            else if (arg == "--option" && i + 1 < argc)
            {
                config.command_option = argv[++i];
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
                config.options.verbosity = 1;
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else if (arg == "--")
            {
                // everything after is passed to the remote script
                for (++i; i < argc; ++i)
                {
                    config.operands.emplace_back(argv[i]);
                }
            }
            else if (!arg.starts_with("--"))
            {
                if (config.command.empty())
                {
                    config.command = arg;
                }
                else
                {
                    config.operands.emplace_back(arg);
                }
            }
            else
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
        }

        // validate required fields
        if (config.host.empty())
        {
            fmt::print(stderr, "Error: --host is required\n");
            return std::nullopt;
        }
        if (config.username.empty())
        {
            fmt::print(stderr, "Error: --user is required\n");
            return std::nullopt;
        }
        if (config.key_path.empty())
        {
            fmt::print(stderr, "Error: --key is required\n");
            return std::nullopt;
        }
        if (config.command.empty())
        {
            fmt::print(stderr, "Error: a command is required\n");
            return std::nullopt;
        }

        return config;
    }

    [[nodiscard]] auto require_operands(app_config const &config, std::size_t count) -> bool
    {
        if (config.operands.size() < count)
        {
            fmt::print(stderr, "Error: {} needs {} operand(s)\n", config.command, count);
            return false;
        }
        return true;
    }

    [[nodiscard]] auto read_text_file(std::string const &path) -> std::optional<std::string>
    {
        std::ifstream file(path);
        if (!file)
        {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    }

    // drains one stream to a local FILE, returns false if the stream broke
    [[nodiscard]] auto pump(rexec::ssh::remote_output &stream, std::FILE *sink) -> bool
    {
        auto text = stream.read_all();
        if (!text.has_value())
        {
            rexec::log::error("remote stream failed: {}", text.error());
            return false;
        }
        fmt::print(sink, "{}", *text);
        return true;
    }

    [[nodiscard]] auto run_command(rexec::remote_client &client, app_config const &config) -> int
    {
        if (config.command == "upload-data")
        {
            if (!require_operands(config, 3))
            {
                return 1;
            }
            auto const text = read_text_file(config.operands[0]);
            if (!text.has_value())
            {
                fmt::print(stderr, "Error: cannot read {}\n", config.operands[0]);
                return 1;
            }
            auto data = rexec::payload::parse(*text);
            if (!data.has_value())
            {
                fmt::print(stderr, "Error: {} is not valid JSON\n", config.operands[0]);
                return 1;
            }
            auto sent = client.upload_data(*data, config.operands[1], config.operands[2]);
            return sent.has_value() ? 0 : 1;
        }

        if (config.command == "upload-file")
        {
            if (!require_operands(config, 2))
            {
                return 1;
            }
            auto sent = client.upload_file(config.operands[0], config.operands[1]);
            return sent.has_value() ? 0 : 1;
        }

        if (config.command == "download")
        {
            if (!require_operands(config, 2))
            {
                return 1;
            }
            auto fetched = client.download_file(config.operands[0], config.operands[1]);
            return fetched.has_value() ? 0 : 1;
        }

        if (config.command == "run")
        {
            if (!require_operands(config, 1))
            {
                return 1;
            }

            rexec::script_launch launch{.remote_script_path = config.operands[0],
                                        .command_option = config.command_option,
                                        .script_args = std::vector<std::string>(config.operands.begin() + 1, config.operands.end()),
                                        .local_script_path = std::nullopt,
                                        .interpreter_command = config.interpreter};
            if (config.local_script.has_value())
            {
                launch.local_script_path = *config.local_script;
            }

            auto streams = client.run_remote_script(launch);
            if (!streams.has_value())
            {
                return 1;
            }

            // nothing to feed the script
            if (auto closed = streams->input->close(); !closed.has_value())
            {
                rexec::log::warning("could not close remote stdin: {}", closed.error());
            }

            auto const out_ok = pump(*streams->output, stdout);
            auto const err_ok = pump(*streams->error, stderr);
            client.close();
            return (out_ok && err_ok) ? 0 : 1;
        }

        if (config.command == "provision-key")
        {
            auto provisioned = rexec::keys::provision_key(config.key_path, config.host, config.username, config.port);
            return provisioned.has_value() ? 0 : 1;
        }

        fmt::print(stderr, "Unknown command: {}\n", config.command);
        return 1;
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto config_opt = parse_args(argc, argv);
    if (!config_opt.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }
    auto const &config = *config_opt;

    rexec::log::set_level(config.verbose ? rexec::log::level::debug : rexec::log::level::info);

    std::shared_ptr<rexec::auth_fallback_provider> fallback;
    if (config.password_fallback)
    {
        fallback = std::make_shared<rexec::console_auth_fallback>();
    }
    else
    {
        fallback = std::make_shared<rexec::no_auth_fallback>();
    }

    auto client = rexec::remote_client::create(
        rexec::connection_identity{.host = config.host, .username = config.username, .key_path = config.key_path},
        rexec::ssh::make_libssh_transport(), std::move(fallback), config.options);
    if (!client.has_value())
    {
        fmt::print(stderr, "Error: {}\n", client.error());
        return 1;
    }

    if (auto ported = client->set_port(config.port); !ported.has_value())
    {
        fmt::print(stderr, "Error: {}\n", ported.error());
        return 1;
    }

    auto const status = run_command(*client, config);
    client->close();
    return status;
}
