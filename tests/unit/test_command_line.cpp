// tests/unit/test_command_line.cpp - launch command assembly and shell quoting

#include "rexec/command_line.hpp"

#include <doctest/doctest.h>
#include <string>
#include <vector>

using namespace rexec;

TEST_SUITE("launch_command")
{
    TEST_CASE("interpreter, option, script name and arguments")
    {
        std::vector<std::string> const args{"--x", "1"};

        CHECK(make_launch_command("python3", std::string{"-u"}, "/r/run.py", args) == "python3 -u run.py --x 1");
    }

    TEST_CASE("only the script file name is used")
    {
        CHECK(make_launch_command("python", std::nullopt, "/very/deep/dir/job.py", {}) == "python job.py");
    }

    TEST_CASE("empty option is skipped")
    {
        CHECK(make_launch_command("python", std::string{}, "job.py", {}) == "python job.py");
    }

    TEST_CASE("arguments keep their order")
    {
        std::vector<std::string> const args{"a", "b", "c"};

        CHECK(make_launch_command("Rscript", std::nullopt, "fit.R", args) == "Rscript fit.R a b c");
    }
}

TEST_SUITE("shell_quote")
{
    TEST_CASE("plain text is wrapped in single quotes")
    {
        CHECK(shell_quote("alice@node1") == "'alice@node1'");
    }

    TEST_CASE("embedded single quote is escaped")
    {
        CHECK(shell_quote("it's") == R"('it'\''s')");
    }

    TEST_CASE("empty string stays a word")
    {
        CHECK(shell_quote("") == "''");
    }
}
