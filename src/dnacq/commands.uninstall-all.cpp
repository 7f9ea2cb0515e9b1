#include <dnacq/base/files.h>
#include <dnacq/base/message_sinks.h>

#include <dnacq/acquisitionhost.h>
#include <dnacq/commands.uninstall-all.h>

namespace dnacq
{
    const CommandMetadata CommandUninstallAllMetadata{
        "uninstall-all",
        msgHelpUninstallAllCommand,
        "dnacq uninstall-all",
        0,
        0,
    };

    void command_uninstall_all_and_exit(const DnacqCmdArguments& args, const Filesystem& fs)
    {
        (void)args.parse_arguments(CommandUninstallAllMetadata);
        const auto install_root = args.resolve_install_root(fs).value_or_exit(DNACQ_LINE_INFO);
        auto uninstalled = [&] {
            AcquisitionHost host(args, fs, install_root);
            return host.coordinator().uninstall_all();
        }();

        if (!uninstalled)
        {
            msg::println_error(uninstalled.error());
            Checks::exit_fail(DNACQ_LINE_INFO);
        }

        stdout_sink.println(msgUninstalledAll, msg::path = install_root);
        Checks::exit_success(DNACQ_LINE_INFO);
    }
}
