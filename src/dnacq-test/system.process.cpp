#include <dnacq-test/util.h>

#include <dnacq/base/system.process.h>

using namespace dnacq;

TEST_CASE ("command lines escape their arguments", "[system.process]")
{
    Command cmd{"/opt/dnacq/scripts/dotnet-install.sh"};
    cmd.string_arg("-InstallDir").string_arg("/home/some user/.dotnet").string_arg("-Version").string_arg("8.0.100");
    CHECK(cmd.command_line() ==
          R"(/opt/dnacq/scripts/dotnet-install.sh -InstallDir "/home/some user/.dotnet" -Version 8.0.100)");

    Command raw;
    raw.raw_arg("echo").raw_arg("$HOME");
    CHECK(raw.command_line() == "echo $HOME");

    raw.clear();
    CHECK(raw.empty());
}

TEST_CASE ("append_shell_escaped quotes shell metacharacters", "[system.process]")
{
    std::string target;
    append_shell_escaped(target, "plain");
    CHECK(target == "plain");
    target.clear();
    append_shell_escaped(target, "a $b \"c\"");
    CHECK(target == R"("a \$b \"c\"")");
}

TEST_CASE ("captures merged output and exit code", "[system.process]")
{
    Command cmd;
    cmd.raw_arg("echo out; echo err 1>&2; exit 3");
    auto run = cmd_execute_and_capture_output(cmd, RedirectedProcessLaunchSettings{});
    auto output = run.get();
    REQUIRE(output);
    CHECK(output->exit_code == 3);
    CHECK(output->output == "out\nerr\n");
}

TEST_CASE ("captures split output", "[system.process]")
{
    Command cmd;
    cmd.raw_arg("echo out; echo err 1>&2");
    auto run = cmd_execute_and_capture_split_output(cmd, RedirectedProcessLaunchSettings{});
    auto output = run.get();
    REQUIRE(output);
    CHECK(output->exit_code == 0);
    CHECK(output->standard_output == "out\n");
    CHECK(output->standard_error == "err\n");
}

TEST_CASE ("stdin is the null device", "[system.process]")
{
    Command cmd;
    cmd.raw_arg("cat");
    auto run = cmd_execute_and_capture_output(cmd, RedirectedProcessLaunchSettings{});
    auto output = run.get();
    REQUIRE(output);
    CHECK(output->exit_code == 0);
    CHECK(output->output.empty());
}

TEST_CASE ("missing programs report the shell's exit code", "[system.process]")
{
    Command cmd{"/this/program/does/not/exist"};
    auto run = cmd_execute_and_capture_split_output(cmd, RedirectedProcessLaunchSettings{});
    auto output = run.get();
    REQUIRE(output);
    CHECK(output->exit_code == 127);
    CHECK_FALSE(output->standard_error.empty());
}

TEST_CASE ("output larger than a pipe buffer is drained before reaping", "[system.process]")
{
    Command cmd;
    cmd.raw_arg("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done; echo done 1>&2");
    auto run = cmd_execute_and_capture_split_output(cmd, RedirectedProcessLaunchSettings{});
    auto output = run.get();
    REQUIRE(output);
    CHECK(output->exit_code == 0);
    CHECK(output->standard_output.size() == 20000u * 11u);
    CHECK(output->standard_error == "done\n");
}
