#include <dnacq-test/util.h>

#include <dnacq/eventstream.h>

#include <string>
#include <vector>

using namespace dnacq;

namespace
{
    struct RecordingObserver final : IEventStreamObserver
    {
        explicit RecordingObserver(std::string name, std::vector<std::string>& journal)
            : m_name(std::move(name)), m_journal(journal)
        {
        }

        virtual void post(const AcquisitionEvent& event) override
        {
            m_journal.push_back(fmt::format("{}:{}:{}", m_name, event.kind, event.version));
        }

    private:
        std::string m_name;
        std::vector<std::string>& m_journal;
    };
}

TEST_CASE ("event factories", "[eventstream]")
{
    auto started = AcquisitionEvent::started("8.0.100");
    CHECK(started.kind == AcquisitionEventKind::Started);
    CHECK(started.version == "8.0.100");
    CHECK_FALSE(started.is_terminal());
    CHECK_FALSE(started.is_error());

    auto completed = AcquisitionEvent::completed("8.0.100", "/root/.dotnet/dotnet");
    CHECK(completed.kind == AcquisitionEventKind::Completed);
    CHECK(completed.path == Path("/root/.dotnet/dotnet"));
    CHECK(completed.is_terminal());
    CHECK_FALSE(completed.is_error());

    auto install = AcquisitionEvent::install_error("8.0.100", "exited with 1");
    CHECK(install.is_terminal());
    CHECK(install.is_error());
    CHECK(install.detail == "exited with 1");
    CHECK(install.path.empty());

    CHECK(AcquisitionEvent::script_error("8.0.100", "warning").is_error());
    CHECK(AcquisitionEvent::unexpected_error("8.0.100", "boom").is_error());
}

TEST_CASE ("event kinds have stable names", "[eventstream]")
{
    CHECK(fmt::format("{}", AcquisitionEventKind::Started) == "AcquisitionStarted");
    CHECK(fmt::format("{}", AcquisitionEventKind::Completed) == "AcquisitionCompleted");
    CHECK(fmt::format("{}", AcquisitionEventKind::InstallError) == "AcquisitionInstallError");
    CHECK(fmt::format("{}", AcquisitionEventKind::ScriptError) == "AcquisitionScriptError");
    CHECK(fmt::format("{}", AcquisitionEventKind::UnexpectedError) == "AcquisitionUnexpectedError");
}

TEST_CASE ("event stream fans out in subscription order", "[eventstream]")
{
    std::vector<std::string> journal;
    RecordingObserver first("first", journal);
    RecordingObserver second("second", journal);

    EventStream stream;
    stream.post(AcquisitionEvent::started("3.1.0"));
    CHECK(journal.empty());

    stream.subscribe(first);
    stream.subscribe(second);
    stream.post(AcquisitionEvent::started("3.1.0"));
    stream.post(AcquisitionEvent::completed("3.1.0", "/x/dotnet"));

    stream.unsubscribe(first);
    stream.post(AcquisitionEvent::started("8.0.100"));

    CHECK(journal == std::vector<std::string>{"first:AcquisitionStarted:3.1.0",
                                              "second:AcquisitionStarted:3.1.0",
                                              "first:AcquisitionCompleted:3.1.0",
                                              "second:AcquisitionCompleted:3.1.0",
                                              "second:AcquisitionStarted:8.0.100"});
}
