// bench/bench_session.cpp - client bookkeeping overhead over an in-memory transport
// measures reuse against reconnect per upload, no network involved

#include "mock_transport.hpp"
#include "rexec/auth_fallback.hpp"
#include "rexec/log.hpp"
#include "rexec/remote_client.hpp"

#include <fmt/format.h>
#include <memory>
#include <nanobench.h>
#include <optional>
#include <string_view>

namespace bench
{

    namespace
    {

        [[nodiscard]] auto make_client(std::shared_ptr<rexec::testing::mock_transport> const &transport)
            -> std::optional<rexec::remote_client>
        {
            auto client = rexec::remote_client::create(
                rexec::connection_identity{.host = "bench", .username = "bench", .key_path = "/keys/id_rsa"},
                transport, std::make_shared<rexec::no_auth_fallback>());
            if (!client.has_value())
            {
                fmt::print(stderr, "cannot create client: {}\n", client.error());
                return std::nullopt;
            }
            return std::move(*client);
        }

    } // namespace

    void run_session_benchmarks()
    {
        using namespace ankerl::nanobench;

        // progress lines would dominate the measurement
        rexec::log::set_sink([](rexec::log::level, std::string_view) {});

        auto transport = std::make_shared<rexec::testing::mock_transport>();
        auto client = make_client(transport);
        if (!client.has_value())
        {
            return;
        }

        Json::Value data;
        data["chains"] = 4;

        Bench().run("UploadData_KeepConnection",
                    [&]
                    {
                        auto attrs = client->upload_data(data, "/tmp", "cfg", true);
                        doNotOptimizeAway(attrs);
                    });

        Bench().run("UploadData_Reconnect",
                    [&]
                    {
                        auto attrs = client->upload_data(data, "/tmp", "cfg");
                        doNotOptimizeAway(attrs);
                    });

        Bench().run("RunRemoteScript",
                    [&]
                    {
                        auto streams = client->run_remote_script(rexec::script_launch{.remote_script_path = "/r/job.py"});
                        doNotOptimizeAway(streams);
                        transport->state().commands.clear();
                    });

        client->close();
        fmt::print("dials: {} key, {} password\n", transport->state().key_dials, transport->state().password_dials);

        rexec::log::set_sink({});
    }

} // namespace bench
