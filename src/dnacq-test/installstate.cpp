#include <dnacq-test/util.h>

#include <dnacq/base/files.h>

#include <dnacq/installpaths.h>
#include <dnacq/installstate.h>

#include <string>
#include <vector>

using namespace dnacq;

TEST_CASE ("install paths layout", "[installstate]")
{
    InstallPaths paths(Path("/opt/dnacq"));
    CHECK(paths.root() == Path("/opt/dnacq"));
    CHECK(paths.installation_directory() == Path("/opt/dnacq/.dotnet"));
    CHECK(paths.lock_file() == Path("/opt/dnacq/install.lock"));
    CHECK(paths.begin_marker() == Path("/opt/dnacq/install.begin"));
    CHECK(paths.dotnet_executable() == Path("/opt/dnacq/.dotnet/dotnet"));
}

TEST_CASE ("empty install root", "[installstate]")
{
    const auto& fs = real_filesystem;
    // the root itself need not exist
    auto dir = Test::make_clean_temporary_directory("installstate-empty") / "root";
    InstallStateStore uut(fs, InstallPaths(dir));

    auto installed = uut.read_installed_versions();
    REQUIRE(installed.get());
    CHECK(installed.get()->empty());
    CHECK_FALSE(uut.has_begin_marker());
    CHECK_FALSE(uut.has_lock_file());
    CHECK_FALSE(uut.has_installation_directory());
    CHECK(uut.read_begin_marker() == "");
    CHECK(uut.reset());

    fs.remove_all(dir.parent_path(), DNACQ_LINE_INFO);
}

TEST_CASE ("recording installed versions", "[installstate]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("installstate-record");
    InstallStateStore uut(fs, InstallPaths(dir));

    REQUIRE(uut.mark_installed("3.1.0"));
    REQUIRE(uut.mark_installed("8.0.100"));
    REQUIRE(uut.mark_installed("3.1.0"));

    CHECK(fs.read_contents(uut.paths().lock_file(), DNACQ_LINE_INFO) == "3.1.0|8.0.100");
    auto installed = uut.read_installed_versions();
    REQUIRE(installed.get());
    CHECK(*installed.get() == std::vector<std::string>{"3.1.0", "8.0.100"});
    CHECK(uut.has_lock_file());
    CHECK_FALSE(fs.exists(uut.paths().lock_file() + ".tmp", DNACQ_LINE_INFO));

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("lock files tolerate stray separators", "[installstate]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("installstate-separators");
    InstallStateStore uut(fs, InstallPaths(dir));
    fs.write_contents(uut.paths().lock_file(), "|3.1.0||8.0.100|", DNACQ_LINE_INFO);

    auto installed = uut.read_installed_versions();
    REQUIRE(installed.get());
    CHECK(*installed.get() == std::vector<std::string>{"3.1.0", "8.0.100"});

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("begin marker lifecycle", "[installstate]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("installstate-begin");
    InstallStateStore uut(fs, InstallPaths(dir));

    REQUIRE(uut.begin_install("8.0.100"));
    CHECK(uut.has_begin_marker());
    CHECK(uut.read_begin_marker() == "8.0.100");
    CHECK(fs.read_contents(uut.paths().begin_marker(), DNACQ_LINE_INFO) == "8.0.100");
    CHECK_FALSE(fs.exists(uut.paths().begin_marker() + ".tmp", DNACQ_LINE_INFO));

    REQUIRE(uut.clear_begin_marker());
    CHECK_FALSE(uut.has_begin_marker());
    CHECK(uut.read_begin_marker() == "");
    // clearing twice is fine
    REQUIRE(uut.clear_begin_marker());

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("markers are written below a root that does not exist yet", "[installstate]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("installstate-fresh-root");
    InstallStateStore uut(fs, InstallPaths(dir / "nested" / "root"));

    REQUIRE(uut.begin_install("3.1.0"));
    REQUIRE(uut.mark_installed("3.1.0"));
    REQUIRE(uut.clear_begin_marker());

    CHECK(fs.read_contents(uut.paths().lock_file(), DNACQ_LINE_INFO) == "3.1.0");
    CHECK_FALSE(uut.has_begin_marker());
    CHECK_FALSE(fs.exists(uut.paths().lock_file() + ".tmp", DNACQ_LINE_INFO));
    CHECK_FALSE(fs.exists(uut.paths().begin_marker() + ".tmp", DNACQ_LINE_INFO));

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("reset removes everything", "[installstate]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("installstate-reset");
    InstallStateStore uut(fs, InstallPaths(dir));
    fs.write_contents_and_dirs(uut.paths().dotnet_executable(), "#!/bin/sh\n", DNACQ_LINE_INFO);
    REQUIRE(uut.mark_installed("8.0.100"));
    REQUIRE(uut.begin_install("9.0.100"));
    CHECK(uut.has_installation_directory());

    REQUIRE(uut.reset());
    CHECK_FALSE(uut.has_installation_directory());
    CHECK_FALSE(uut.has_begin_marker());
    CHECK_FALSE(uut.has_lock_file());
    CHECK(fs.is_directory(dir));

    auto installed = uut.read_installed_versions();
    REQUIRE(installed.get());
    CHECK(installed.get()->empty());

    fs.remove_all(dir, DNACQ_LINE_INFO);
}
