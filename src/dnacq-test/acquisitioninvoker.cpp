#include <dnacq-test/util.h>

#include <dnacq/base/files.h>
#include <dnacq/base/system.process.h>

#include <dnacq/acquisitioninvoker.h>
#include <dnacq/eventstream.h>

#include <vector>

using namespace dnacq;

namespace
{
    struct EventLog final : IEventStreamObserver
    {
        virtual void post(const AcquisitionEvent& event) override { events.push_back(event); }

        std::vector<AcquisitionEvent> events;
    };

    struct InvokerFixture
    {
        explicit InvokerFixture(StringView name)
            : dir(Test::make_clean_temporary_directory(name)), script(dir / "scripts" / "dotnet-install.sh")
        {
            events.subscribe(log);
        }

        ~InvokerFixture()
        {
            events.unsubscribe(log);
            real_filesystem.remove_all(dir, DNACQ_LINE_INFO);
        }

        InstallContext context(StringView version) const
        {
            return InstallContext{dir / ".dotnet", version.to_string(), dir / ".dotnet" / "dotnet"};
        }

        ScriptAcquisitionInvoker make_invoker(Optional<std::string> architecture = nullopt)
        {
            return ScriptAcquisitionInvoker(real_filesystem, events, InstallerSettings{script, "dotnet", architecture});
        }

        Path dir;
        Path script;
        EventLog log;
        EventStream events;
    };
}

TEST_CASE ("install command line", "[acquisitioninvoker]")
{
    EventStream events;
    InstallerSettings settings{"/opt/scripts/dotnet-install.sh", "aspnetcore", nullopt};
    ScriptAcquisitionInvoker uut(real_filesystem, events, settings);
    InstallContext context{"/opt/dnacq/.dotnet", "8.0.100", "/opt/dnacq/.dotnet/dotnet"};
    CHECK(uut.make_install_command(context).command_line() ==
          "/opt/scripts/dotnet-install.sh -InstallDir /opt/dnacq/.dotnet -Runtime aspnetcore -Version 8.0.100");

    settings.architecture = std::string("arm64");
    ScriptAcquisitionInvoker with_architecture(real_filesystem, events, settings);
    CHECK(with_architecture.make_install_command(context).command_line() ==
          "/opt/scripts/dotnet-install.sh -InstallDir /opt/dnacq/.dotnet -Runtime aspnetcore -Version 8.0.100 "
          "-Architecture arm64");
}

TEST_CASE ("successful install", "[acquisitioninvoker]")
{
    InvokerFixture fixture("invoker-success");
    Test::write_executable_script(fixture.script,
                                  "mkdir -p \"$2\"\n"
                                  "echo \"$@\" > \"$2/arguments\"\n"
                                  "touch \"$2/dotnet\"\n"
                                  "echo installed\n");
    auto uut = fixture.make_invoker();
    auto context = fixture.context("8.0.100");

    auto result = uut.install_dotnet(context);
    REQUIRE(result.has_value());
    CHECK(real_filesystem.is_regular_file(context.dotnet_path));
    CHECK(real_filesystem.read_contents(context.installation_directory / "arguments", DNACQ_LINE_INFO) ==
          Strings::concat("-InstallDir ", context.installation_directory, " -Runtime dotnet -Version 8.0.100\n"));

    REQUIRE(fixture.log.events.size() == 1);
    CHECK(fixture.log.events[0].kind == AcquisitionEventKind::Completed);
    CHECK(fixture.log.events[0].version == "8.0.100");
    CHECK(fixture.log.events[0].path == context.dotnet_path);
}

TEST_CASE ("installer exiting with non-zero is an install process error", "[acquisitioninvoker]")
{
    InvokerFixture fixture("invoker-exit-code");
    Test::write_executable_script(fixture.script,
                                  "echo \"checking version\"\n"
                                  "echo \"no such version\" 1>&2\n"
                                  "exit 2\n");
    auto uut = fixture.make_invoker();

    auto result = uut.install_dotnet(fixture.context("0.0.0"));
    REQUIRE_FALSE(result.has_value());
    const auto& error = result.error();
    CHECK(error.kind == AcquisitionErrorKind::InstallProcessError);
    CHECK(error.exit_code == 2);
    CHECK(StringView{error.message}.contains("exited with code 2"));
    CHECK(StringView{error.message}.contains("no such version"));
    CHECK(StringView{error.message}.contains("checking version"));

    REQUIRE(fixture.log.events.size() == 1);
    CHECK(fixture.log.events[0].kind == AcquisitionEventKind::InstallError);
    CHECK(fixture.log.events[0].detail == error.message.data());
}

TEST_CASE ("installer writing to stderr is a script error", "[acquisitioninvoker]")
{
    InvokerFixture fixture("invoker-stderr");
    Test::write_executable_script(fixture.script, "echo \"download was slow\" 1>&2\n");
    auto uut = fixture.make_invoker();

    auto result = uut.install_dotnet(fixture.context("8.0.100"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == AcquisitionErrorKind::InstallScriptError);
    CHECK(result.error().message.data() == "download was slow\n");
    CHECK_FALSE(result.error().exit_code.has_value());

    REQUIRE(fixture.log.events.size() == 1);
    CHECK(fixture.log.events[0].kind == AcquisitionEventKind::ScriptError);
    CHECK(fixture.log.events[0].detail == "download was slow\n");
}

TEST_CASE ("missing install script is an unexpected error", "[acquisitioninvoker]")
{
    InvokerFixture fixture("invoker-missing");
    auto uut = fixture.make_invoker();

    auto result = uut.install_dotnet(fixture.context("8.0.100"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == AcquisitionErrorKind::UnexpectedError);
    CHECK(StringView{result.error().message}.contains(fixture.script));

    REQUIRE(fixture.log.events.size() == 1);
    CHECK(fixture.log.events[0].kind == AcquisitionEventKind::UnexpectedError);
}

TEST_CASE ("architecture is forwarded to the installer", "[acquisitioninvoker]")
{
    InvokerFixture fixture("invoker-architecture");
    Test::write_executable_script(fixture.script, "mkdir -p \"$2\"\necho \"$@\" > \"$2/arguments\"\n");
    auto uut = fixture.make_invoker(std::string("x64"));
    auto context = fixture.context("3.1.0");

    REQUIRE(uut.install_dotnet(context).has_value());
    CHECK(real_filesystem.read_contents(context.installation_directory / "arguments", DNACQ_LINE_INFO) ==
          Strings::concat(
              "-InstallDir ", context.installation_directory, " -Runtime dotnet -Version 3.1.0 -Architecture x64\n"));
}
