#include <dnacq-test/util.h>

#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>

#include <dnacq/acquisitioncoordinator.h>
#include <dnacq/acquisitioninvoker.h>
#include <dnacq/eventstream.h>
#include <dnacq/installstate.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace dnacq;

namespace
{
    // Installs by creating the executable directly. Records every call and whether two calls ever overlapped.
    struct FakeInvoker final : IAcquisitionInvoker
    {
        explicit FakeInvoker(EventStream& events) : m_events(events) { }

        virtual ExpectedT<Unit, AcquisitionError> install_dotnet(const InstallContext& context) override
        {
            {
                std::lock_guard<std::mutex> lock(m_mtx);
                m_calls.push_back(context.version);
                if (++m_active > 1)
                {
                    m_overlapped = true;
                }
            }

            std::this_thread::sleep_for(delay);
            const bool fail = failing_versions.count(context.version) != 0;
            if (!fail)
            {
                real_filesystem.write_contents_and_dirs(context.dotnet_path, "", DNACQ_LINE_INFO);
            }

            {
                std::lock_guard<std::mutex> lock(m_mtx);
                --m_active;
            }

            if (fail)
            {
                auto message = LocalizedString::from_raw(Strings::concat("cannot install ", context.version));
                m_events.post(AcquisitionEvent::install_error(context.version, message));
                return AcquisitionError::install_process_error(1, std::move(message));
            }

            m_events.post(AcquisitionEvent::completed(context.version, context.dotnet_path));
            return Unit{};
        }

        std::vector<std::string> calls() const
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            return m_calls;
        }

        bool overlapped() const
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            return m_overlapped;
        }

        std::set<std::string> failing_versions;
        std::chrono::milliseconds delay{0};

    private:
        EventStream& m_events;
        mutable std::mutex m_mtx;
        std::vector<std::string> m_calls;
        int m_active = 0;
        bool m_overlapped = false;
    };

    struct EventJournal final : IEventStreamObserver
    {
        virtual void post(const AcquisitionEvent& event) override
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            m_entries.push_back(fmt::format("{} {}", event.kind, event.version));
        }

        std::vector<std::string> entries() const
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            return m_entries;
        }

    private:
        mutable std::mutex m_mtx;
        std::vector<std::string> m_entries;
    };

    struct CoordinatorFixture
    {
        explicit CoordinatorFixture(StringView name)
            : root(Test::make_clean_temporary_directory(name))
            , state(real_filesystem, InstallPaths(root))
            , invoker(events)
        {
            events.subscribe(journal);
        }

        ~CoordinatorFixture()
        {
            events.unsubscribe(journal);
            real_filesystem.remove_all(root, DNACQ_LINE_INFO);
        }

        std::vector<std::string> installed_versions() const
        {
            return state.read_installed_versions().value_or_exit(DNACQ_LINE_INFO);
        }

        Path root;
        InstallStateStore state;
        EventJournal journal;
        EventStream events;
        FakeInvoker invoker;
    };
}

TEST_CASE ("version validation", "[acquisitioncoordinator]")
{
    CHECK(validate_version("8.0.100").has_value());
    CHECK(validate_version("8.0.100-preview.1").has_value());

    for (auto&& bad : {"", "8.0|9.0", "8.0\n9.0", "8.0\r"})
    {
        auto result = validate_version(bad);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind == AcquisitionErrorKind::UsageError);
    }
}

TEST_CASE ("acquire installs once and memoizes", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-once");
    const auto expected_path = fixture.state.paths().dotnet_executable();
    {
        AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
        auto first = uut.acquire_and_wait("8.0.100");
        REQUIRE(first.has_value());
        CHECK(*first.get() == expected_path);

        auto second = uut.acquire_and_wait("8.0.100");
        REQUIRE(second.has_value());
        CHECK(*second.get() == expected_path);
        CHECK(uut.ledger_size() == 1);
    }

    CHECK(fixture.invoker.calls() == std::vector<std::string>{"8.0.100"});
    CHECK(fixture.installed_versions() == std::vector<std::string>{"8.0.100"});
    CHECK_FALSE(fixture.state.has_begin_marker());
    CHECK(fixture.journal.entries() ==
          std::vector<std::string>{"AcquisitionStarted 8.0.100", "AcquisitionCompleted 8.0.100"});

    // a later run finds the recorded install without invoking the installer or posting events
    {
        AcquisitionCoordinator later(fixture.state, fixture.invoker, fixture.events);
        auto again = later.acquire_and_wait("8.0.100");
        REQUIRE(again.has_value());
        CHECK(*again.get() == expected_path);
    }

    CHECK(fixture.invoker.calls().size() == 1);
    CHECK(fixture.journal.entries().size() == 2);
}

TEST_CASE ("concurrent requests for one version share one install", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-shared");
    fixture.invoker.delay = std::chrono::milliseconds(50);
    std::vector<AcquisitionResult> results;
    {
        AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
        std::vector<std::future<AcquisitionResult>> requests;
        for (int idx = 0; idx < 8; ++idx)
        {
            requests.push_back(std::async(std::launch::async, [&uut] { return uut.acquire_and_wait("8.0.100"); }));
        }

        for (auto&& request : requests)
        {
            results.push_back(request.get());
        }
    }

    CHECK(fixture.invoker.calls().size() == 1);
    for (auto&& result : results)
    {
        REQUIRE(result.has_value());
        CHECK(*result.get() == fixture.state.paths().dotnet_executable());
    }
}

TEST_CASE ("installs of different versions never overlap", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-serial");
    fixture.invoker.delay = std::chrono::milliseconds(30);
    {
        AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
        std::vector<std::future<AcquisitionResult>> requests;
        for (auto&& version : {"3.1.0", "6.0.100", "8.0.100"})
        {
            std::string v = version;
            requests.push_back(std::async(std::launch::async, [&uut, v] { return uut.acquire_and_wait(v); }));
        }

        for (auto&& request : requests)
        {
            CHECK(request.get().has_value());
        }
    }

    CHECK_FALSE(fixture.invoker.overlapped());
    CHECK(fixture.invoker.calls().size() == 3);
    auto installed = fixture.installed_versions();
    std::sort(installed.begin(), installed.end());
    CHECK(installed == std::vector<std::string>{"3.1.0", "6.0.100", "8.0.100"});

    // every Started is immediately followed by its own terminal event
    auto entries = fixture.journal.entries();
    REQUIRE(entries.size() == 6);
    for (size_t idx = 0; idx < entries.size(); idx += 2)
    {
        REQUIRE(StringView{entries[idx]}.starts_with("AcquisitionStarted "));
        auto version = entries[idx].substr(StringLiteral{"AcquisitionStarted "}.size());
        CHECK(entries[idx + 1] == "AcquisitionCompleted " + version);
    }
}

TEST_CASE ("work is served in request order", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-order");
    fixture.invoker.delay = std::chrono::milliseconds(10);
    std::vector<std::shared_future<AcquisitionResult>> outcomes;
    {
        AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
        outcomes.push_back(uut.acquire("3.1.0"));
        outcomes.push_back(uut.acquire("8.0.100"));
        outcomes.push_back(uut.acquire("3.1.0"));
        // destruction finishes the queued work
    }

    for (auto&& outcome : outcomes)
    {
        REQUIRE(outcome.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        CHECK(outcome.get().has_value());
    }

    CHECK(fixture.invoker.calls() == std::vector<std::string>{"3.1.0", "8.0.100"});
    CHECK(fixture.journal.entries() == std::vector<std::string>{"AcquisitionStarted 3.1.0",
                                                                "AcquisitionCompleted 3.1.0",
                                                                "AcquisitionStarted 8.0.100",
                                                                "AcquisitionCompleted 8.0.100"});
}

TEST_CASE ("failures are memoized", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-failure");
    fixture.invoker.failing_versions.insert("0.0.0");
    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);

    auto first = uut.acquire_and_wait("0.0.0");
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().kind == AcquisitionErrorKind::InstallProcessError);
    CHECK(first.error().exit_code == 1);

    auto second = uut.acquire_and_wait("0.0.0");
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error() == first.error());
    CHECK(fixture.invoker.calls().size() == 1);

    // the interrupted install is left for the next acquisition to clean up
    CHECK(fixture.state.has_begin_marker());
    CHECK(fixture.state.read_begin_marker() == "0.0.0");
    CHECK(fixture.installed_versions().empty());
    CHECK(fixture.journal.entries() ==
          std::vector<std::string>{"AcquisitionStarted 0.0.0", "AcquisitionInstallError 0.0.0"});
}

TEST_CASE ("an interrupted install is cleaned up before the next one", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-recovery");
    const auto& paths = fixture.state.paths();
    real_filesystem.write_contents_and_dirs(paths.installation_directory() / "half-extracted", "", DNACQ_LINE_INFO);
    REQUIRE(fixture.state.mark_installed("3.1.0"));
    REQUIRE(fixture.state.begin_install("8.0.100"));

    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
    // 3.1.0 was recorded, but the interrupted install may have damaged it
    auto result = uut.acquire_and_wait("3.1.0");
    REQUIRE(result.has_value());

    CHECK(fixture.invoker.calls() == std::vector<std::string>{"3.1.0"});
    CHECK_FALSE(real_filesystem.exists(paths.installation_directory() / "half-extracted", DNACQ_LINE_INFO));
    CHECK_FALSE(fixture.state.has_begin_marker());
    CHECK(fixture.installed_versions() == std::vector<std::string>{"3.1.0"});
}

TEST_CASE ("a failed install is retried after recovery", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-retry");
    fixture.invoker.failing_versions.insert("8.0.100");
    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);

    REQUIRE_FALSE(uut.acquire_and_wait("8.0.100").has_value());
    CHECK(uut.ledger_size() == 1);

    // the next acquisition finds the begin marker, resets, and forgets the settled failure
    fixture.invoker.failing_versions.clear();
    REQUIRE(uut.acquire_and_wait("3.1.0").has_value());
    CHECK(uut.ledger_size() == 1);

    REQUIRE(uut.acquire_and_wait("8.0.100").has_value());
    CHECK(fixture.invoker.calls() == std::vector<std::string>{"8.0.100", "3.1.0", "8.0.100"});
    CHECK(fixture.installed_versions() == std::vector<std::string>{"3.1.0", "8.0.100"});
}

TEST_CASE ("versions in the lock file are settled at construction", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-seed");
    const auto& paths = fixture.state.paths();
    real_filesystem.write_contents_and_dirs(paths.dotnet_executable(), "", DNACQ_LINE_INFO);
    REQUIRE(fixture.state.mark_installed("3.1.0"));
    fixture.invoker.delay = std::chrono::milliseconds(300);

    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
    CHECK(uut.ledger_size() == 1);

    auto slow = uut.acquire("8.0.100");
    // answered from the ledger while the worker is still busy with 8.0.100
    auto recorded = uut.acquire("3.1.0");
    REQUIRE(recorded.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    auto result = recorded.get();
    REQUIRE(result.has_value());
    CHECK(*result.get() == paths.dotnet_executable());

    REQUIRE(slow.get().has_value());
    CHECK(uut.ledger_size() == 2);
    CHECK(fixture.invoker.calls() == std::vector<std::string>{"8.0.100"});
    CHECK(fixture.installed_versions() == std::vector<std::string>{"3.1.0", "8.0.100"});
}

TEST_CASE ("an inconsistent lock file is not used to seed the ledger", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-no-seed");
    REQUIRE(fixture.state.mark_installed("3.1.0"));
    REQUIRE_FALSE(fixture.state.has_installation_directory());
    {
        AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
        CHECK(uut.ledger_size() == 0);
    }

    real_filesystem.create_directories(fixture.state.paths().installation_directory(), DNACQ_LINE_INFO);
    REQUIRE(fixture.state.begin_install("8.0.100"));
    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
    CHECK(uut.ledger_size() == 0);
}

TEST_CASE ("a missing installation directory invalidates the lock file", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-tamper");
    REQUIRE(fixture.state.mark_installed("8.0.100"));
    REQUIRE_FALSE(fixture.state.has_installation_directory());

    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
    auto result = uut.acquire_and_wait("8.0.100");
    REQUIRE(result.has_value());
    CHECK(fixture.invoker.calls() == std::vector<std::string>{"8.0.100"});
    CHECK(real_filesystem.is_regular_file(fixture.state.paths().dotnet_executable()));
}

TEST_CASE ("uninstall_all removes everything and forgets outcomes", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-uninstall");
    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);
    REQUIRE(uut.acquire_and_wait("8.0.100").has_value());
    REQUIRE(fixture.state.has_installation_directory());

    REQUIRE(uut.uninstall_all());
    CHECK(uut.ledger_size() == 0);
    CHECK_FALSE(fixture.state.has_installation_directory());
    CHECK_FALSE(fixture.state.has_lock_file());
    CHECK_FALSE(fixture.state.has_begin_marker());

    REQUIRE(uut.acquire_and_wait("8.0.100").has_value());
    CHECK(fixture.invoker.calls() == std::vector<std::string>{"8.0.100", "8.0.100"});

    // nothing installed is fine too
    REQUIRE(uut.uninstall_all());
    REQUIRE(uut.uninstall_all());
}

TEST_CASE ("invalid versions are rejected without side effects", "[acquisitioncoordinator]")
{
    CoordinatorFixture fixture("coordinator-usage");
    AcquisitionCoordinator uut(fixture.state, fixture.invoker, fixture.events);

    auto empty = uut.acquire_and_wait("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().kind == AcquisitionErrorKind::UsageError);

    auto piped = uut.acquire_and_wait("8.0|9.0");
    REQUIRE_FALSE(piped.has_value());
    CHECK(piped.error().kind == AcquisitionErrorKind::UsageError);

    CHECK(uut.ledger_size() == 0);
    CHECK(fixture.invoker.calls().empty());
    CHECK(fixture.journal.entries().empty());
    CHECK_FALSE(fixture.state.has_begin_marker());
}

TEST_CASE ("state store failures are unexpected errors", "[acquisitioncoordinator]")
{
    auto dir = Test::make_clean_temporary_directory("coordinator-broken-root");
    // the install root is a regular file, so no marker can be written below it
    auto root = dir / "root";
    real_filesystem.write_contents(root, "not a directory", DNACQ_LINE_INFO);

    EventStream events;
    EventJournal journal;
    events.subscribe(journal);
    FakeInvoker invoker(events);
    InstallStateStore state(real_filesystem, InstallPaths(root));
    {
        AcquisitionCoordinator uut(state, invoker, events);
        auto result = uut.acquire_and_wait("8.0.100");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind == AcquisitionErrorKind::UnexpectedError);
    }

    CHECK(invoker.calls().empty());
    CHECK(journal.entries().empty());
    events.unsubscribe(journal);
    real_filesystem.remove_all(dir, DNACQ_LINE_INFO);
}
