#include <dnacq-test/util.h>

#include <dnacq/base/files.h>
#include <dnacq/base/message_sinks.h>
#include <dnacq/base/strings.h>

#include <dnacq/eventstream.h>
#include <dnacq/loggingobserver.h>
#include <dnacq/outputchannelobserver.h>

#include <string>
#include <vector>

using namespace dnacq;

namespace
{
    struct CapturingSink final : MessageSink
    {
        virtual void println(const MessageLine& line) override { lines.push_back(line.to_string()); }
        using MessageSink::println;

        std::vector<std::string> lines;
    };
}

TEST_CASE ("output channel reports a single successful acquisition", "[observers]")
{
    CapturingSink sink;
    OutputChannelObserver uut(sink);
    uut.post(AcquisitionEvent::started("8.0.100"));
    CHECK(uut.in_progress_versions() == std::vector<std::string>{"8.0.100"});
    uut.post(AcquisitionEvent::completed("8.0.100", "/root/.dotnet/dotnet"));
    CHECK(uut.in_progress_versions().empty());

    CHECK(sink.lines == std::vector<std::string>{
                            "Downloading .NET version(s) 8.0.100 ...",
                            "Done!",
                            ".NET executable for version 8.0.100 is located at /root/.dotnet/dotnet",
                        });
}

TEST_CASE ("output channel reports overlapping acquisitions", "[observers]")
{
    CapturingSink sink;
    OutputChannelObserver uut(sink);
    uut.post(AcquisitionEvent::started("3.1.0"));
    uut.post(AcquisitionEvent::started("8.0.100"));
    CHECK(uut.in_progress_versions() == std::vector<std::string>{"3.1.0", "8.0.100"});
    uut.post(AcquisitionEvent::install_error("3.1.0", "the install script exited with code 1:"));
    uut.post(AcquisitionEvent::completed("8.0.100", "/root/.dotnet/dotnet"));

    CHECK(sink.lines == std::vector<std::string>{
                            "Downloading .NET version(s) 3.1.0 ...",
                            "Starting a concurrent acquisition of .NET 8.0.100",
                            "Downloading .NET version(s) 3.1.0, 8.0.100 ...",
                            "Error!",
                            "Failed to download .NET 3.1.0:",
                            "the install script exited with code 1:",
                            "Still downloading .NET version(s) '8.0.100' ...",
                            "Done!",
                            ".NET executable for version 8.0.100 is located at /root/.dotnet/dotnet",
                        });
}

TEST_CASE ("output channel reports script and unexpected errors", "[observers]")
{
    CapturingSink sink;
    OutputChannelObserver uut(sink);
    uut.post(AcquisitionEvent::started("8.0.100"));
    uut.post(AcquisitionEvent::script_error("8.0.100", "warning: low disk space"));
    uut.post(AcquisitionEvent::unexpected_error("9.0.100", "the install script was not found"));

    CHECK(sink.lines == std::vector<std::string>{
                            "Downloading .NET version(s) 8.0.100 ...",
                            "Error!",
                            "Failed to download .NET 8.0.100:",
                            "warning: low disk space",
                            "Error!",
                            "Failed to download .NET 9.0.100:",
                            "the install script was not found",
                        });
    CHECK(uut.in_progress_versions().empty());
}

TEST_CASE ("logging observer records every event", "[observers]")
{
    const auto& fs = real_filesystem;
    auto dir = Test::make_clean_temporary_directory("logging-observer");
    auto log_path = dir / "logs" / "dnacq.log";

    {
        LoggingObserver uut(fs, log_path);
        CHECK(uut.log_file_path() == log_path);
        // nothing recorded, nothing written
        REQUIRE(uut.flush());
        CHECK_FALSE(fs.exists(log_path, DNACQ_LINE_INFO));

        EventStream stream;
        stream.subscribe(uut);
        stream.post(AcquisitionEvent::started("8.0.100"));
        stream.post(AcquisitionEvent::install_error("8.0.100", "exited with code 1"));
        stream.unsubscribe(uut);

        auto lines = Strings::split_lines(uut.contents());
        REQUIRE(lines.size() == 7);
        CHECK(Strings::search(lines[0], " AcquisitionStarted") != StringView{lines[0]}.end());
        CHECK(lines[1] == "8.0.100");
        CHECK(lines[2] == "");
        CHECK(Strings::search(lines[3], " AcquisitionInstallError") != StringView{lines[3]}.end());
        CHECK(lines[4] == "8.0.100");
        CHECK(lines[5] == "exited with code 1");
        CHECK(lines[6] == "");

        REQUIRE(uut.flush());
        CHECK(fs.read_contents(log_path, DNACQ_LINE_INFO) == uut.contents());

        uut.post(AcquisitionEvent::completed("8.0.100", "/root/.dotnet/dotnet"));
        // written again on destruction
    }

    auto final_lines = Strings::split_lines(fs.read_contents(log_path, DNACQ_LINE_INFO));
    REQUIRE(final_lines.size() == 11);
    CHECK(Strings::search(final_lines[7], " AcquisitionCompleted") != StringView{final_lines[7]}.end());
    CHECK(final_lines[8] == "8.0.100");
    CHECK(final_lines[9] == "/root/.dotnet/dotnet");

    fs.remove_all(dir, DNACQ_LINE_INFO);
}
