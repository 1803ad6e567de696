// bench/main.cpp - benchmark entry point
// nanobench needs implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

// nanobench has no auto-registration, each file exposes a runner
namespace bench
{
    void run_command_benchmarks();
    void run_session_benchmarks();
} // namespace bench

int main()
{
    bench::run_command_benchmarks();
    bench::run_session_benchmarks();
    return 0;
}
