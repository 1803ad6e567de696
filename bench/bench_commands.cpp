// bench/bench_commands.cpp - pure string work done before every transfer and launch

#include "rexec/command_line.hpp"
#include "rexec/payload.hpp"
#include "rexec/remote_path.hpp"

#include <nanobench.h>
#include <string>
#include <vector>

namespace bench
{

    void run_command_benchmarks()
    {
        using namespace ankerl::nanobench;

        std::vector<std::string> const args{"--chains", "4", "--samples", "1000", "--seed", "42"};

        Bench().run("LaunchCommand",
                    [&]
                    {
                        auto command = rexec::make_launch_command("python3", std::string{"-u"},
                                                                  "/home/alice/jobs/fit.py", args);
                        doNotOptimizeAway(command);
                    });

        Bench().run("ShellQuote",
                    [&]
                    {
                        auto quoted = rexec::shell_quote("/home/alice/.ssh/it's_a_key");
                        doNotOptimizeAway(quoted);
                    });

        Bench().run("ResolveDestination",
                    [&]
                    {
                        auto path = rexec::resolve_destination("/local/scripts/fit.py", "/remote/jobs");
                        doNotOptimizeAway(path);
                    });

        Bench().run("NormalizePayloadName",
                    [&]
                    {
                        auto name = rexec::normalize_payload_filename("posterior.2024.txt");
                        doNotOptimizeAway(name);
                    });

        Json::Value data;
        for (int i = 0; i < 64; ++i)
        {
            data["samples"].append(i * 0.5);
        }
        data["model"]["name"] = "hierarchical";
        data["model"]["chains"] = 4;

        Bench().run("PayloadSerialize",
                    [&]
                    {
                        auto text = rexec::payload::serialize(data);
                        doNotOptimizeAway(text);
                    });

        auto const text = rexec::payload::serialize(data);
        Bench().run("PayloadParse",
                    [&]
                    {
                        auto parsed = rexec::payload::parse(text);
                        doNotOptimizeAway(parsed);
                    });
    }

} // namespace bench
