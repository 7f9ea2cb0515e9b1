#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/acquisitioncoordinator.h>
#include <dnacq/acquisitioninvoker.h>
#include <dnacq/eventstream.h>
#include <dnacq/installstate.h>
#include <dnacq/loggingobserver.h>
#include <dnacq/outputchannelobserver.h>

#include <memory>

namespace dnacq
{
    struct DnacqCmdArguments;

    // The objects one dnacq invocation needs, wired together: progress goes to stderr, events are optionally logged to
    // a file, and installs run the configured script.
    struct AcquisitionHost
    {
        AcquisitionHost(const DnacqCmdArguments& args, const Filesystem& fs, const Path& install_root);
        AcquisitionHost(const AcquisitionHost&) = delete;
        AcquisitionHost& operator=(const AcquisitionHost&) = delete;

        AcquisitionCoordinator& coordinator() noexcept { return m_coordinator; }

    private:
        InstallStateStore m_state;
        EventStream m_events;
        OutputChannelObserver m_console;
        std::unique_ptr<LoggingObserver> m_log;
        ScriptAcquisitionInvoker m_invoker;
        // declared last so that it is destroyed, and its queue drained, first
        AcquisitionCoordinator m_coordinator;
    };
}
