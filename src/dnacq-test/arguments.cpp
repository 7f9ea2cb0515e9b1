#include <dnacq-test/util.h>

#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>

#include <dnacq/commands.acquire.h>
#include <dnacq/contractual-constants.h>
#include <dnacq/dnacqcmdarguments.h>

#include <map>
#include <string>
#include <vector>

using namespace dnacq;

namespace
{
    DnacqCmdArguments from_sequence(const std::vector<std::string>& t)
    {
        return DnacqCmdArguments::create_from_arg_sequence(t.data(), t.data() + t.size());
    }
}

TEST_CASE ("DnacqCmdArguments from lowercase argument sequence", "[arguments]")
{
    auto v = from_sequence({"--install-root",
                            "/opt/dnacq",
                            "--install-script=/opt/scripts/dotnet-install.sh",
                            "--runtime=aspnetcore",
                            "--architecture=arm64",
                            "--log-file=/var/log/dnacq.log",
                            "--debug",
                            "acquire",
                            "8.0.100"});

    REQUIRE(v.install_root_dir.value_or_exit(DNACQ_LINE_INFO) == "/opt/dnacq");
    REQUIRE(v.install_script.value_or_exit(DNACQ_LINE_INFO) == "/opt/scripts/dotnet-install.sh");
    REQUIRE(v.runtime.value_or_exit(DNACQ_LINE_INFO) == "aspnetcore");
    REQUIRE(v.architecture.value_or_exit(DNACQ_LINE_INFO) == "arm64");
    REQUIRE(v.log_file.value_or_exit(DNACQ_LINE_INFO) == "/var/log/dnacq.log");
    REQUIRE(v.debug);
    REQUIRE(v.get_command() == "acquire");
    REQUIRE(v.parse_arguments(CommandAcquireMetadata).command_arguments ==
            std::vector<std::string>{"8.0.100"});
}

TEST_CASE ("DnacqCmdArguments from uppercase argument sequence", "[arguments]")
{
    auto v = from_sequence({"--INSTALL-ROOT=/Opt/Dnacq", "--RUNTIME", "DotNet", "--DEBUG", "UNINSTALL-ALL"});

    REQUIRE(v.install_root_dir.value_or_exit(DNACQ_LINE_INFO) == "/Opt/Dnacq");
    REQUIRE(v.runtime.value_or_exit(DNACQ_LINE_INFO) == "DotNet");
    REQUIRE(v.debug);
    REQUIRE(v.get_command() == "uninstall-all");
}

TEST_CASE ("DnacqCmdArguments without a command", "[arguments]")
{
    auto v = from_sequence({"--debug"});
    REQUIRE(v.get_command().empty());

    auto help = from_sequence({"--help"});
    REQUIRE(help.get_command() == "help");
}

TEST_CASE ("DnacqCmdArguments fall back to the environment", "[arguments]")
{
    std::map<StringLiteral, std::string, std::less<>> envmap = {
        {EnvironmentVariableDnacqInstallRoot, "/env/root"},
        {EnvironmentVariableDnacqInstallScript, "/env/install.sh"},
        {EnvironmentVariableDnacqRuntime, "aspnetcore"},
        {EnvironmentVariableDnacqArchitecture, "x64"},
        {EnvironmentVariableDnacqLogFile, "/env/dnacq.log"},
        {EnvironmentVariableDnacqDebug, "true"},
    };

    auto v = from_sequence({"--install-root=/cli/root", "acquire", "8.0.100"});
    v.imbue_from_fake_environment(envmap);

    // the command line wins
    REQUIRE(v.install_root_dir.value_or_exit(DNACQ_LINE_INFO) == "/cli/root");
    REQUIRE(v.install_script.value_or_exit(DNACQ_LINE_INFO) == "/env/install.sh");
    REQUIRE(v.runtime.value_or_exit(DNACQ_LINE_INFO) == "aspnetcore");
    REQUIRE(v.architecture.value_or_exit(DNACQ_LINE_INFO) == "x64");
    REQUIRE(v.log_file.value_or_exit(DNACQ_LINE_INFO) == "/env/dnacq.log");
    REQUIRE(v.debug);
}

TEST_CASE ("DNACQ_DEBUG only enables debugging for truthy values", "[arguments]")
{
    for (auto&& truthy : {"1", "TRUE", "on"})
    {
        auto v = from_sequence({});
        v.imbue_from_fake_environment({{EnvironmentVariableDnacqDebug, truthy}});
        CHECK(v.debug);
    }

    for (auto&& falsy : {"0", "false", "yes-please", ""})
    {
        auto v = from_sequence({});
        v.imbue_from_fake_environment({{EnvironmentVariableDnacqDebug, falsy}});
        CHECK_FALSE(v.debug);
    }

    auto v = from_sequence({});
    v.imbue_from_fake_environment({});
    CHECK_FALSE(v.debug);
    CHECK_FALSE(v.install_root_dir.has_value());
}

TEST_CASE ("install root resolution", "[arguments]")
{
    {
        auto v = from_sequence({"--install-root=/opt/dnacq"});
        auto root = v.resolve_install_root(real_filesystem);
        REQUIRE(root.get());
        CHECK(*root.get() == Path("/opt/dnacq"));
    }

    {
        auto v = from_sequence({"--install-root=relative/root"});
        auto root = v.resolve_install_root(real_filesystem);
        REQUIRE(root.get());
        CHECK(root.get()->is_absolute());
        CHECK(*root.get() == real_filesystem.current_path(DNACQ_LINE_INFO) / "relative/root");
    }
}

TEST_CASE ("installer settings resolution", "[arguments]")
{
    const Path root("/opt/dnacq");
    {
        auto v = from_sequence({});
        auto settings = v.resolve_installer_settings(root);
        CHECK(settings.install_script == root / FileScripts / FileInstallScript);
        CHECK(settings.runtime == "dotnet");
        CHECK_FALSE(settings.architecture.has_value());
        CHECK_FALSE(v.resolve_log_file().has_value());
    }

    {
        auto v = from_sequence({"--install-script=/custom/install.sh",
                                "--runtime=aspnetcore",
                                "--architecture=arm64",
                                "--log-file=a.log"});
        auto settings = v.resolve_installer_settings(root);
        CHECK(settings.install_script == Path("/custom/install.sh"));
        CHECK(settings.runtime == "aspnetcore");
        CHECK(settings.architecture == "arm64");
        CHECK(v.resolve_log_file() == Path("a.log"));
    }
}

TEST_CASE ("usage for a command", "[arguments]")
{
    auto usage = usage_for_command(CommandAcquireMetadata);
    CHECK(Strings::search(usage, "dnacq acquire 8.0.100") != StringView{usage}.end());
}
