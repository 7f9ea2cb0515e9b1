#pragma once

#include <dnacq/fwd/acquisition.h>

#include <dnacq/base/background-work-queue.h>
#include <dnacq/base/expected.h>
#include <dnacq/base/path.h>
#include <dnacq/base/stringview.h>

#include <dnacq/acquisitionerror.h>

#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace dnacq
{
    // Rejects versions that cannot be recorded in the lock file: empty, or containing '|' or a line break.
    ExpectedT<Unit, AcquisitionError> validate_version(StringView version);

    // Turns concurrent acquire() calls into at most one installer invocation per version.
    //
    // Every version that is not yet in the ledger is queued behind all previously queued work and handled by a single
    // worker thread, so installer invocations never overlap. Outcomes (including failures) are memoized per version
    // until uninstall_all(). Versions recorded in a consistent lock file start out as settled successes.
    struct AcquisitionCoordinator
    {
        AcquisitionCoordinator(const InstallStateStore& state, IAcquisitionInvoker& invoker, EventStream& events);
        AcquisitionCoordinator(const AcquisitionCoordinator&) = delete;
        AcquisitionCoordinator& operator=(const AcquisitionCoordinator&) = delete;
        // Finishes all queued work before returning.
        ~AcquisitionCoordinator();

        std::shared_future<AcquisitionResult> acquire(StringView version);
        AcquisitionResult acquire_and_wait(StringView version);

        // Forgets every memoized outcome and deletes all installed state. Work that is already queued still runs.
        ExpectedL<Unit> uninstall_all();

        std::size_t ledger_size() const;

    private:
        struct WorkItem
        {
            std::string version;
            std::promise<AcquisitionResult> promise;
        };

        void seed_ledger_from_lock_file();
        AcquisitionResult acquire_core(const std::string& version);
        Optional<AcquisitionError> recover_if_inconsistent();
        void forget_settled_outcomes();
        void worker_main();

        const InstallStateStore& m_state;
        IAcquisitionInvoker& m_invoker;
        EventStream& m_events;

        mutable std::mutex m_ledger_mtx;
        std::map<std::string, std::shared_future<AcquisitionResult>> m_ledger;

        BackgroundWorkQueue<WorkItem> m_queue;
        // started last, after everything it touches is constructed
        std::thread m_worker;
    };
}
