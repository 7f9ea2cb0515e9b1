#include <dnacq-test/util.h>

#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>

#include <string>

using namespace dnacq;

TEST_CASE ("path composition", "[files]")
{
    Path root("/tmp/dnacq");
    CHECK((root / ".dotnet").native() == "/tmp/dnacq/.dotnet");
    CHECK((Path("/tmp/dnacq/") / "install.lock").native() == "/tmp/dnacq/install.lock");
    CHECK((root / "/absolute").native() == "/absolute");
    CHECK((root + ".tmp").native() == "/tmp/dnacq.tmp");
    CHECK(Path("/tmp/dnacq/install.lock").filename() == "install.lock");
    CHECK(Path("/tmp/dnacq/install.lock").parent_path() == "/tmp/dnacq");
    CHECK(Path("/tmp/dnacq/dotnet-install.sh").extension() == ".sh");
    CHECK(Path("/tmp").is_absolute());
    CHECK_FALSE(Path("relative/dir").is_absolute());
}

TEST_CASE ("write_rename_contents replaces the target", "[files]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("files-write-rename");
    auto target = dir / "install.lock";

    // the temporary name replaces the file name of target
    REQUIRE(fs.try_write_rename_contents(target, "install.lock.tmp", "3.1.0"));
    CHECK(fs.read_contents(target, DNACQ_LINE_INFO) == "3.1.0");
    REQUIRE(fs.try_write_rename_contents(target, "install.lock.tmp", "3.1.0|8.0.100"));
    CHECK(fs.read_contents(target, DNACQ_LINE_INFO) == "3.1.0|8.0.100");
    CHECK_FALSE(fs.exists(dir / "install.lock.tmp", DNACQ_LINE_INFO));
    CHECK_FALSE(fs.exists(target + ".tmp", DNACQ_LINE_INFO));

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("remove reports whether anything was removed", "[files]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("files-remove");
    auto file = dir / "install.begin";
    fs.write_contents(file, "8.0.100", DNACQ_LINE_INFO);

    auto removed = fs.try_remove(file);
    REQUIRE(removed.get());
    CHECK(*removed.get());

    auto removed_again = fs.try_remove(file);
    REQUIRE(removed_again.get());
    CHECK_FALSE(*removed_again.get());

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("remove_all deletes trees and tolerates absence", "[files]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("files-remove-all");
    auto tree = dir / ".dotnet";
    fs.write_contents_and_dirs(tree / "shared" / "Microsoft.NETCore.App" / "8.0.0" / "marker", "x", DNACQ_LINE_INFO);
    REQUIRE(fs.is_directory(tree));

    CHECK(fs.try_remove_all(tree).has_value());
    CHECK_FALSE(fs.exists(tree, DNACQ_LINE_INFO));
    CHECK(fs.try_remove_all(tree).has_value());

    fs.remove_all(dir, DNACQ_LINE_INFO);
}

TEST_CASE ("reading a missing file is an error", "[files]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("files-missing");
    auto missing = fs.try_read_contents(dir / "does-not-exist");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().data().find("does-not-exist") != std::string::npos);

    std::error_code ec;
    CHECK_FALSE(fs.exists(dir / "does-not-exist", ec));
    CHECK_EC(ec);

    fs.remove_all(dir, DNACQ_LINE_INFO);
}
