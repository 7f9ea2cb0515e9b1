#include <dnacq/base/files.h>
#include <dnacq/base/message_sinks.h>

#include <dnacq/acquisitionhost.h>
#include <dnacq/dnacqcmdarguments.h>

namespace dnacq
{
    AcquisitionHost::AcquisitionHost(const DnacqCmdArguments& args, const Filesystem& fs, const Path& install_root)
        : m_state(fs, InstallPaths{install_root})
        , m_events()
        , m_console(stderr_sink)
        , m_log()
        , m_invoker(fs, m_events, args.resolve_installer_settings(install_root))
        , m_coordinator(m_state, m_invoker, m_events)
    {
        m_events.subscribe(m_console);
        auto maybe_log_file = args.resolve_log_file();
        if (auto log_file = maybe_log_file.get())
        {
            m_log = std::make_unique<LoggingObserver>(fs, std::move(*log_file));
            m_events.subscribe(*m_log);
        }
    }
}
