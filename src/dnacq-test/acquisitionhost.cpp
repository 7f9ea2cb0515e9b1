#include <dnacq-test/util.h>

#include <dnacq/base/files.h>

#include <dnacq/acquisitionhost.h>
#include <dnacq/dnacqcmdarguments.h>

#include <string>
#include <vector>

using namespace dnacq;

TEST_CASE ("host acquires through the configured script and logs events", "[acquisitionhost]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("host");
    auto root = dir / "root";
    auto log_file = dir / "dnacq.log";
    // default script location below the install root
    Test::write_executable_script(root / "scripts" / "dotnet-install.sh", "mkdir -p \"$2\"\ntouch \"$2/dotnet\"\n");

    std::vector<std::string> t = {"--log-file", log_file.native(), "acquire", "8.0.100"};
    auto args = DnacqCmdArguments::create_from_arg_sequence(t.data(), t.data() + t.size());

    {
        AcquisitionHost host(args, fs, root);
        auto result = host.coordinator().acquire_and_wait("8.0.100");
        REQUIRE(result.has_value());
        CHECK(*result.get() == root / ".dotnet" / "dotnet");
        CHECK(fs.is_regular_file(*result.get()));
    }

    auto lines = Strings::split_lines(fs.read_contents(log_file, DNACQ_LINE_INFO));
    REQUIRE(lines.size() == 7);
    CHECK(StringView{lines[0]}.contains("AcquisitionStarted"));
    CHECK(StringView{lines[3]}.contains("AcquisitionCompleted"));
    CHECK(lines[5] == (root / ".dotnet" / "dotnet").native());

    {
        AcquisitionHost host(args, fs, root);
        REQUIRE(host.coordinator().uninstall_all());
    }

    CHECK_FALSE(fs.exists(root / ".dotnet", DNACQ_LINE_INFO));
    CHECK_FALSE(fs.exists(root / "install.lock", DNACQ_LINE_INFO));
    // the script is not part of the install state
    CHECK(fs.is_regular_file(root / "scripts" / "dotnet-install.sh"));

    fs.remove_all(dir, DNACQ_LINE_INFO);
}
