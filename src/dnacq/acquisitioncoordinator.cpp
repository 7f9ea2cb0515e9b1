#include <dnacq/base/chrono.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>

#include <dnacq/acquisitioncoordinator.h>
#include <dnacq/acquisitioninvoker.h>
#include <dnacq/eventstream.h>
#include <dnacq/installstate.h>

#include <algorithm>
#include <chrono>

namespace
{
    using namespace dnacq;

    std::shared_future<AcquisitionResult> make_settled(AcquisitionResult&& result)
    {
        std::promise<AcquisitionResult> promise;
        promise.set_value(std::move(result));
        return promise.get_future().share();
    }

    bool is_settled(const std::shared_future<AcquisitionResult>& outcome)
    {
        return outcome.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
}

namespace dnacq
{
    ExpectedT<Unit, AcquisitionError> validate_version(StringView version)
    {
        if (version.empty())
        {
            return AcquisitionError::usage_error(msg::format(msgVersionRequired));
        }

        if (Strings::find_first_of(version, "|\r\n") != version.end())
        {
            return AcquisitionError::usage_error(msg::format(msgVersionInvalidCharacters, msg::version = version));
        }

        return Unit{};
    }

    AcquisitionCoordinator::AcquisitionCoordinator(const InstallStateStore& state,
                                                   IAcquisitionInvoker& invoker,
                                                   EventStream& events)
        : m_state(state), m_invoker(invoker), m_events(events)
    {
        seed_ledger_from_lock_file();
        m_worker = std::thread([this] { worker_main(); });
    }

    AcquisitionCoordinator::~AcquisitionCoordinator()
    {
        m_queue.stop();
        m_worker.join();
    }

    std::shared_future<AcquisitionResult> AcquisitionCoordinator::acquire(StringView version)
    {
        auto valid = validate_version(version);
        if (!valid)
        {
            Debug::println("rejected acquire(", version, "): ", valid.error().message);
            return make_settled(std::move(valid).error());
        }

        std::lock_guard<std::mutex> lock(m_ledger_mtx);
        auto version_string = version.to_string();
        auto it = m_ledger.find(version_string);
        if (it != m_ledger.end())
        {
            Debug::println("acquire(", version, ") found in ledger");
            return it->second;
        }

        std::promise<AcquisitionResult> promise;
        auto outcome = promise.get_future().share();
        m_ledger.emplace(version_string, outcome);
        // queued while holding the ledger lock so that queue order matches ledger order
        m_queue.push(WorkItem{std::move(version_string), std::move(promise)});
        return outcome;
    }

    AcquisitionResult AcquisitionCoordinator::acquire_and_wait(StringView version) { return acquire(version).get(); }

    ExpectedL<Unit> AcquisitionCoordinator::uninstall_all()
    {
        {
            std::lock_guard<std::mutex> lock(m_ledger_mtx);
            m_ledger.clear();
        }

        Debug::println("uninstalling everything under ", m_state.paths().root());
        return m_state.reset();
    }

    std::size_t AcquisitionCoordinator::ledger_size() const
    {
        std::lock_guard<std::mutex> lock(m_ledger_mtx);
        return m_ledger.size();
    }

    void AcquisitionCoordinator::seed_ledger_from_lock_file()
    {
        // an interrupted or half-deleted install is left for the worker to recover
        if (m_state.has_begin_marker() || !m_state.has_installation_directory())
        {
            return;
        }

        auto maybe_installed = m_state.read_installed_versions();
        auto installed = maybe_installed.get();
        if (!installed)
        {
            Debug::println("not seeding the ledger: ", maybe_installed.error());
            return;
        }

        const auto dotnet_path = m_state.paths().dotnet_executable();
        std::lock_guard<std::mutex> lock(m_ledger_mtx);
        for (auto&& version : *installed)
        {
            m_ledger.emplace(version, make_settled(AcquisitionResult{dotnet_path}));
        }

        Debug::println("seeded the ledger with ", m_ledger.size(), " installed versions");
    }

    void AcquisitionCoordinator::worker_main()
    {
        std::vector<WorkItem> items;
        while (m_queue.get_work(items))
        {
            for (auto&& item : items)
            {
                const ElapsedTimer timer;
                auto result = acquire_core(item.version);
                Debug::println("acquire(",
                               item.version,
                               ") ",
                               result.has_value() ? StringLiteral{"succeeded"} : StringLiteral{"failed"},
                               " after ",
                               timer);
                item.promise.set_value(std::move(result));
            }
        }
    }

    void AcquisitionCoordinator::forget_settled_outcomes()
    {
        std::lock_guard<std::mutex> lock(m_ledger_mtx);
        for (auto it = m_ledger.begin(); it != m_ledger.end();)
        {
            if (is_settled(it->second))
            {
                it = m_ledger.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    Optional<AcquisitionError> AcquisitionCoordinator::recover_if_inconsistent()
    {
        const auto& paths = m_state.paths();
        if (m_state.has_begin_marker())
        {
            msg::println_warning(msgRecoveringInterruptedInstall,
                                 msg::version = m_state.read_begin_marker(),
                                 msg::path = paths.installation_directory());
        }
        else if (m_state.has_lock_file() && !m_state.has_installation_directory())
        {
            msg::println_warning(msgRecoveringMissingInstallationDirectory,
                                 msg::path = paths.installation_directory());
        }
        else
        {
            return nullopt;
        }

        auto reset = m_state.reset();
        if (!reset)
        {
            return AcquisitionError::unexpected_error(std::move(reset).error());
        }

        forget_settled_outcomes();
        return nullopt;
    }

    AcquisitionResult AcquisitionCoordinator::acquire_core(const std::string& version)
    {
        auto maybe_recovery_error = recover_if_inconsistent();
        if (auto recovery_error = maybe_recovery_error.get())
        {
            return std::move(*recovery_error);
        }

        const auto& paths = m_state.paths();
        auto dotnet_path = paths.dotnet_executable();
        auto maybe_installed = m_state.read_installed_versions();
        auto installed = maybe_installed.get();
        if (!installed)
        {
            return AcquisitionError::unexpected_error(std::move(maybe_installed).error());
        }

        if (std::find(installed->begin(), installed->end(), version) != installed->end())
        {
            Debug::println(version, " is already installed");
            return dotnet_path;
        }

        auto began = m_state.begin_install(version);
        if (!began)
        {
            return AcquisitionError::unexpected_error(std::move(began).error());
        }

        m_events.post(AcquisitionEvent::started(version));
        auto installed_now =
            m_invoker.install_dotnet(InstallContext{paths.installation_directory(), version, dotnet_path});
        if (!installed_now)
        {
            // the begin marker stays, so the next acquisition starts from a clean slate
            return std::move(installed_now).error();
        }

        auto marked = m_state.mark_installed(version);
        if (!marked)
        {
            return AcquisitionError::unexpected_error(std::move(marked).error());
        }

        auto cleared = m_state.clear_begin_marker();
        if (!cleared)
        {
            return AcquisitionError::unexpected_error(std::move(cleared).error());
        }

        return dotnet_path;
    }
}
